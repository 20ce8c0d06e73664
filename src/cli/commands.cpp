//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "commands.hpp"

#include <iecmms/sdk/client.hpp>
#include <iecmms/sdk/control.hpp>
#include <iecmms/sdk/data_model.hpp>
#include <iecmms/sdk/errors.hpp>
#include <iecmms/sdk/report.hpp>
#include <iecmms/sdk/typed_value.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace iecmms
{
namespace cli
{
namespace
{

using sdk::Client;
using sdk::TypedValue;
using sdk::TypeKind;
namespace value = sdk::value;

using Args = std::vector<std::string>;

constexpr std::uint8_t DoubleBitWidth = 64;
constexpr std::uint8_t SingleBitWidth = 32;

template <typename Result>
bool reportFailure(const CommandContext& context, const Result& result)
{
    if (const auto* const failure = cetl::get_if<sdk::Error>(&result))
    {
        context.err << "Error: " << sdk::describe(*failure) << "\n";
        spdlog::warn("Command failed: {}", sdk::describe(*failure));
        return true;
    }
    return false;
}

void printNode(std::ostream& out, const sdk::DataModelNode& node, const std::size_t depth)
{
    out << std::string(depth * 2, ' ') << (node.path.empty() ? std::string{"<server>"} : node.name());
    if (node.fc)
    {
        out << " [" << sdk::toString(*node.fc) << "]";
    }
    if (node.type && (node.kind == sdk::DataModelNode::Kind::DataAttribute))
    {
        out << " : " << sdk::toString(node.type->kind);
    }
    if (node.value)
    {
        out << " = " << node.value->toString();
    }
    out << "\n";
    for (const auto& child : node.children)
    {
        printNode(out, child, depth + 1);
    }
}

/// Finds the type of an attribute (like `D1/GGIO1.SPCSO1.Oper.ctlVal[CO]`) and parses a value of it.
///
cetl::optional<TypedValue> resolveValue(const CommandContext& context,
                                        const std::string&    reference,
                                        const std::string&    text)
{
    auto node = context.client.resolve(reference);
    if (reportFailure(context, node))
    {
        return cetl::nullopt;
    }
    const auto& resolved = cetl::get<sdk::DataModelNode>(node);
    if (!resolved.type)
    {
        context.err << "Error: '" << reference << "' has no type.\n";
        return cetl::nullopt;
    }

    auto parsed = parseValueText(text, *resolved.type);
    if (!parsed)
    {
        context.err << "Error: '" << text << "' is not a valid " << sdk::toString(resolved.type->kind) << " value.\n";
    }
    return parsed;
}

cetl::optional<sdk::ControlCommand> makeControlCommand(const CommandContext& context,
                                                       const std::string&    reference,
                                                       const std::string&    attribute,
                                                       const std::string&    text)
{
    auto ctl_val = resolveValue(context, reference + "." + attribute + ".ctlVal[CO]", text);
    if (!ctl_val)
    {
        return cetl::nullopt;
    }

    sdk::ControlCommand command;
    command.ctl_val  = std::move(*ctl_val);
    command.or_cat   = sdk::OriginatorCategory::RemoteControl;
    command.or_ident = "iecmms-cli";
    return command;
}

int printControl(const CommandContext& context, const Client::Control::Result& result)
{
    if (reportFailure(context, result))
    {
        if (const auto feedback = context.client.lastApplError())
        {
            context.err << "LastApplError: " << feedback->control_object << " error=" << feedback->error
                        << " ctlNum=" << static_cast<unsigned>(feedback->ctl_num)
                        << " addCause=" << sdk::toString(feedback->add_cause) << "\n";
        }
        return EXIT_FAILURE;
    }
    const auto& done = cetl::get<sdk::ControlResult>(result);
    context.out << done.reference << " (" << sdk::toString(done.model)
                << ", ctlNum=" << static_cast<unsigned>(done.ctl_num) << ")\n";
    return EXIT_SUCCESS;
}

// MARK: Commands

int runIdentify(const CommandContext& context, const Args&)
{
    const auto result = context.client.identify();
    if (reportFailure(context, result))
    {
        return EXIT_FAILURE;
    }
    const auto& identity = cetl::get<Client::Identify::Success>(result);
    context.out << "vendor:   " << identity.vendor << "\n";
    context.out << "model:    " << identity.model << "\n";
    context.out << "revision: " << identity.revision << "\n";
    return EXIT_SUCCESS;
}

int runStatus(const CommandContext& context, const Args&)
{
    const auto result = context.client.status();
    if (reportFailure(context, result))
    {
        return EXIT_FAILURE;
    }
    const auto& vmd_status = cetl::get<Client::Status::Success>(result);
    context.out << "logical:  " << vmd_status.logical << "\n";
    context.out << "physical: " << vmd_status.physical << "\n";
    return EXIT_SUCCESS;
}

int runRead(const CommandContext& context, const Args& args)
{
    const auto fc = sdk::parseFunctionalConstraint(args[1]);
    if (!fc)
    {
        context.err << "Error: unknown functional constraint '" << args[1] << "'.\n";
        return EXIT_FAILURE;
    }

    const auto result = context.client.read(args[0], *fc);
    if (reportFailure(context, result))
    {
        return EXIT_FAILURE;
    }
    context.out << cetl::get<TypedValue>(result).toString() << "\n";
    return EXIT_SUCCESS;
}

int runWrite(const CommandContext& context, const Args& args)
{
    auto typed = resolveValue(context, args[0], args[1]);
    if (!typed)
    {
        return EXIT_FAILURE;
    }
    const auto result = context.client.write(args[0], std::move(*typed));
    return reportFailure(context, result) ? EXIT_FAILURE : EXIT_SUCCESS;
}

int runBrowse(const CommandContext& context, const Args& args)
{
    const auto result = context.client.browse(args.empty() ? std::string{} : args[0]);
    if (reportFailure(context, result))
    {
        return EXIT_FAILURE;
    }
    for (const auto& child : cetl::get<Client::Browse::Success>(result))
    {
        context.out << child.reference();
        if (child.fc)
        {
            context.out << " [" << sdk::toString(*child.fc) << "]";
        }
        context.out << "  (" << sdk::toString(child.kind) << ")\n";
    }
    return EXIT_SUCCESS;
}

int runDiscover(const CommandContext& context, const Args& args)
{
    const bool full  = (args.size() > 1) && (args[1] == "full");
    const auto depth = full ? Client::Depth::Full : Client::Depth::Shallow;

    const auto result = context.client.discover(args.empty() ? std::string{} : args[0], depth);
    if (reportFailure(context, result))
    {
        return EXIT_FAILURE;
    }
    printNode(context.out, cetl::get<sdk::DataModelNode>(result), 0);
    return EXIT_SUCCESS;
}

int runSelect(const CommandContext& context, const Args& args)
{
    return printControl(context, context.client.controlSelect(args[0]));
}

int runSelectWithValue(const CommandContext& context, const Args& args)
{
    const auto command = makeControlCommand(context, args[0], "SBOw", args[1]);
    if (!command)
    {
        return EXIT_FAILURE;
    }
    return printControl(context, context.client.controlSelectWithValue(args[0], *command));
}

int runOperate(const CommandContext& context, const Args& args)
{
    const auto command = makeControlCommand(context, args[0], "Oper", args[1]);
    if (!command)
    {
        return EXIT_FAILURE;
    }
    return printControl(context, context.client.controlOperate(args[0], *command, context.request_timeout));
}

int runCancel(const CommandContext& context, const Args& args)
{
    const auto command = makeControlCommand(context, args[0], "Cancel", args[1]);
    if (!command)
    {
        return EXIT_FAILURE;
    }
    return printControl(context, context.client.controlCancel(args[0], *command));
}

int runReadDataSet(const CommandContext& context, const Args& args)
{
    const auto result = context.client.readDataSet(args[0]);
    if (reportFailure(context, result))
    {
        return EXIT_FAILURE;
    }
    const auto& entries = cetl::get<Client::ReadDataSet::Success>(result);
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        context.out << i << ": ";
        cetl::visit(cetl::make_overloaded(
                        [&context](const TypedValue& typed) {
                            //
                            context.out << typed.toString() << "\n";
                        },
                        [&context](const sdk::DataAccessError code) {
                            //
                            context.out << "<" << sdk::toString(code) << ">\n";
                        }),
                    entries[i]);
    }
    return EXIT_SUCCESS;
}

int runGetDataSetDirectory(const CommandContext& context, const Args& args)
{
    const auto result = context.client.getDataSetDirectory(args[0]);
    if (reportFailure(context, result))
    {
        return EXIT_FAILURE;
    }
    const auto& directory = cetl::get<Client::DataSetDirectory::Success>(result);
    context.out << "deletable: " << (directory.deletable ? "yes" : "no") << "\n";
    for (const auto& member : directory.members)
    {
        context.out << "  " << member << "\n";
    }
    return EXIT_SUCCESS;
}

int runCreateDataSet(const CommandContext& context, const Args& args)
{
    const std::vector<std::string> members(args.begin() + 1, args.end());
    const auto                     result = context.client.createDataSet(args[0], members);
    return reportFailure(context, result) ? EXIT_FAILURE : EXIT_SUCCESS;
}

int runDeleteDataSet(const CommandContext& context, const Args& args)
{
    const auto result = context.client.deleteDataSet(args[0]);
    return reportFailure(context, result) ? EXIT_FAILURE : EXIT_SUCCESS;
}

int runReadReportControlBlock(const CommandContext& context, const Args& args)
{
    const auto result = context.client.getReportControlBlock(args[0]);
    if (reportFailure(context, result))
    {
        return EXIT_FAILURE;
    }
    const auto& rcb = cetl::get<sdk::ReportControlBlock>(result);
    context.out << "reference: " << rcb.reference << (rcb.buffered ? " (buffered)" : "") << "\n";
    context.out << "RptID:     " << rcb.rpt_id << "\n";
    context.out << "RptEna:    " << (rcb.rpt_ena ? "true" : "false") << "\n";
    context.out << "DatSet:    " << rcb.data_set << "\n";
    context.out << "ConfRev:   " << rcb.conf_rev << "\n";
    context.out << "OptFlds:   0x" << std::hex << rcb.opt_flds << "\n";
    context.out << "TrgOps:    0x" << static_cast<unsigned>(rcb.trg_ops) << std::dec << "\n";
    context.out << "BufTm:     " << rcb.buf_tm << "\n";
    context.out << "IntgPd:    " << rcb.intg_pd << "\n";
    context.out << "SqNum:     " << rcb.sq_num << "\n";
    return EXIT_SUCCESS;
}

struct CommandEntry final
{
    const char* name;
    const char* usage;
    std::size_t min_args;
    int (*handler)(const CommandContext&, const Args&);
};

const std::array<CommandEntry, 15>& commands()
{
    static const std::array<CommandEntry, 15> entries{{
        {"identify", "identify", 0, &runIdentify},
        {"status", "status", 0, &runStatus},
        {"read", "read <reference> <FC>", 2, &runRead},
        {"write", "write <reference>[FC] <value>", 2, &runWrite},
        {"browse", "browse [path]", 0, &runBrowse},
        {"discover", "discover [path [full]]", 0, &runDiscover},
        {"select", "select <LD/LN.DO>", 1, &runSelect},
        {"select-with-value", "select-with-value <LD/LN.DO> <ctlVal>", 2, &runSelectWithValue},
        {"operate", "operate <LD/LN.DO> <ctlVal>", 2, &runOperate},
        {"cancel", "cancel <LD/LN.DO> <ctlVal>", 2, &runCancel},
        {"dataset-read", "dataset-read <LD/LN.DS | @DS>", 1, &runReadDataSet},
        {"dataset-dir", "dataset-dir <LD/LN.DS | @DS>", 1, &runGetDataSetDirectory},
        {"dataset-create", "dataset-create <LD/LN.DS | @DS> <member[FC]>...", 2, &runCreateDataSet},
        {"dataset-delete", "dataset-delete <LD/LN.DS | @DS>", 1, &runDeleteDataSet},
        {"rcb-read", "rcb-read <LD/LN.RCB[RP|BR]>", 1, &runReadReportControlBlock},
    }};
    return entries;
}

const CommandEntry* findCommand(const std::string& command)
{
    for (const auto& entry : commands())
    {
        if (command == entry.name)
        {
            return &entry;
        }
    }
    return nullptr;
}

bool isHexDigit(const char ch)
{
    return std::isxdigit(static_cast<unsigned char>(ch)) != 0;
}

}  // namespace

cetl::optional<TypedValue> parseValueText(const std::string& text, const sdk::TypeDescriptor& type)
{
    try
    {
        std::size_t parsed = 0;
        switch (type.kind)
        {
        case TypeKind::Boolean:
            if ((text == "true") || (text == "1"))
            {
                return TypedValue{value::Boolean{true}};
            }
            if ((text == "false") || (text == "0"))
            {
                return TypedValue{value::Boolean{false}};
            }
            return cetl::nullopt;

        case TypeKind::Integer: {
            const auto number = std::stoll(text, &parsed, 0);
            if (parsed != text.size())
            {
                return cetl::nullopt;
            }
            return TypedValue{value::Integer{number, static_cast<std::uint8_t>(type.size)}};
        }
        case TypeKind::Unsigned: {
            if (text.empty() || (text.front() == '-'))
            {
                return cetl::nullopt;
            }
            const auto number = std::stoull(text, &parsed, 0);
            if (parsed != text.size())
            {
                return cetl::nullopt;
            }
            return TypedValue{value::Unsigned{number, static_cast<std::uint8_t>(type.size)}};
        }
        case TypeKind::Float: {
            const auto number = std::stod(text, &parsed);
            if (parsed != text.size())
            {
                return cetl::nullopt;
            }
            const auto bit_width = (type.size == DoubleBitWidth) ? DoubleBitWidth : SingleBitWidth;
            return TypedValue{value::Float{number, bit_width}};
        }
        case TypeKind::BitString: {
            value::BitString bit_string;
            for (const char ch : text)
            {
                if ((ch != '0') && (ch != '1'))
                {
                    return cetl::nullopt;
                }
                bit_string.bits.push_back(ch == '1');
            }
            return TypedValue{std::move(bit_string)};
        }
        case TypeKind::OctetString: {
            if ((text.size() % 2) != 0)
            {
                return cetl::nullopt;
            }
            value::OctetString octet_string;
            for (std::size_t i = 0; i < text.size(); i += 2)
            {
                if (!isHexDigit(text[i]) || !isHexDigit(text[i + 1]))
                {
                    return cetl::nullopt;
                }
                octet_string.octets.push_back(static_cast<std::uint8_t>(std::stoul(text.substr(i, 2), nullptr, 16)));
            }
            return TypedValue{std::move(octet_string)};
        }
        case TypeKind::VisibleString:
            return TypedValue{value::VisibleString{text}};
        case TypeKind::MmsString:
            return TypedValue{value::MmsString{text}};
        case TypeKind::UtcTime: {
            const auto seconds = std::stoul(text, &parsed, 10);
            if (parsed != text.size())
            {
                return cetl::nullopt;
            }
            return TypedValue{value::UtcTime{static_cast<std::uint32_t>(seconds), 0, 0}};
        }
        case TypeKind::Structure:
        case TypeKind::Array:
        default:
            return cetl::nullopt;
        }

    } catch (const std::logic_error&)
    {
        // Either `std::invalid_argument` or `std::out_of_range` of the number conversions.
        return cetl::nullopt;
    }
}

void printUsage(std::ostream& out)
{
    out << "Usage: iecmms-cli [--config <file.toml>] [SPDLOG_LEVEL=<levels>] <command> [args...]\n\n"
        << "Commands:\n";
    for (const auto& entry : commands())
    {
        out << "  " << entry.usage << "\n";
    }
    out << "\nEnvironment: IECMMS_CONFIG (configuration file), IECMMS_ENDPOINT (host[:port]).\n";
}

bool isValidCommand(const std::string& command, const std::vector<std::string>& args)
{
    const auto* const entry = findCommand(command);
    return (entry != nullptr) && (args.size() >= entry->min_args);
}

int runCommand(const CommandContext& context, const std::string& command, const std::vector<std::string>& args)
{
    const auto* const entry = findCommand(command);
    if ((entry == nullptr) || (args.size() < entry->min_args))
    {
        printUsage(context.err);
        return EXIT_FAILURE;
    }

    spdlog::debug("Running '{}' command (args={}).", command, args.size());
    return entry->handler(context, args);
}

}  // namespace cli
}  // namespace iecmms
