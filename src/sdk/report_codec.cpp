//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "report_codec.hpp"

#include "ber/ber_value.hpp"
#include "mms/mms_types.hpp"
#include "model/object_reference.hpp"
#include "model/value_codec.hpp"
#include "sdk_helpers.hpp"

#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/report.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace iecmms
{
namespace sdk
{
namespace
{

constexpr std::uint64_t MsPerDay        = 86400000ULL;
constexpr std::uint64_t EpochOf1984InMs = 441763200000ULL;  // 1984-01-01T00:00:00Z

const char* const ReportListName = "RPT";

/// Flags of a bit string whose bit 0 is reserved: bit N maps to flag `1 << (N - 1)`.
///
std::uint32_t flagsOf(const std::vector<bool>& bits)
{
    std::uint32_t flags = 0;
    for (std::size_t index = 1; (index < bits.size()) && (index <= 32); ++index)
    {
        if (bits[index])
        {
            flags |= 1UL << (index - 1);
        }
    }
    return flags;
}

std::vector<bool> bitsOf(const std::uint32_t flags, const TypeDescriptor& type)
{
    const auto count = static_cast<std::size_t>((type.size < 0) ? -static_cast<std::int64_t>(type.size) : type.size);

    std::vector<bool> bits(count, false);
    for (std::size_t index = 1; (index < count) && (index <= 32); ++index)
    {
        bits[index] = (flags & (1UL << (index - 1))) != 0;
    }
    return bits;
}

TypedValue makeNumber(const std::uint64_t number, const TypeDescriptor& type)
{
    const auto bit_width = static_cast<std::uint8_t>(type.size);
    if (type.kind == TypeKind::Integer)
    {
        return value::Integer{static_cast<std::int64_t>(number), bit_width};
    }
    return value::Unsigned{number, bit_width};
}

cetl::optional<std::uint64_t> asNumber(const TypedValue& typed)
{
    if (const auto* const natural = typed.as<value::Unsigned>())
    {
        return natural->value;
    }
    const auto* const integer = typed.as<value::Integer>();
    if ((integer != nullptr) && (integer->value >= 0))
    {
        return static_cast<std::uint64_t>(integer->value);
    }
    return cetl::nullopt;
}

/// Converts a 4 (time of day) or 6 (time of day and days since 1984) octets MMS `binary-time`.
///
cetl::optional<std::uint64_t> binaryTimeToMs(const std::vector<std::uint8_t>& octets)
{
    if ((octets.size() != 4) && (octets.size() != 6))
    {
        return cetl::nullopt;
    }
    std::uint64_t ms_of_day = 0;
    for (std::size_t index = 0; index < 4; ++index)
    {
        ms_of_day = (ms_of_day << 8U) | octets[index];
    }
    if (octets.size() == 4)
    {
        return ms_of_day;
    }
    const std::uint64_t days = (static_cast<std::uint64_t>(octets[4]) << 8U) | octets[5];
    return EpochOf1984InMs + (days * MsPerDay) + ms_of_day;
}

/// `LD/LN$FC$DO$DA` of a data reference becomes `LD/LN.DO.DA[FC]`.
///
std::string referenceFromMmsText(const std::string& text)
{
    const auto slash = text.find('/');
    if (slash == std::string::npos)
    {
        return text;
    }
    const auto name      = common::mms::ObjectName::domainSpecific(text.substr(0, slash), text.substr(slash + 1));
    const auto reference = common::model::ObjectReference::fromMmsName(name);
    return reference ? reference->toString() : text;
}

bool readText(const TypedValue& typed, std::string& text)
{
    const auto* const visible = typed.as<value::VisibleString>();
    if (visible == nullptr)
    {
        return false;
    }
    text = visible->text;
    return true;
}

bool readBoolean(const TypedValue& typed, bool& flag)
{
    const auto* const boolean = typed.as<value::Boolean>();
    if (boolean == nullptr)
    {
        return false;
    }
    flag = boolean->value;
    return true;
}

template <typename Number>
bool readNumber(const TypedValue& typed, Number& number)
{
    const auto parsed = asNumber(typed);
    if (!parsed.has_value())
    {
        return false;
    }
    number = static_cast<Number>(*parsed);
    return true;
}

template <typename Flags>
bool readFlags(const TypedValue& typed, Flags& flags)
{
    const auto* const bit_string = typed.as<value::BitString>();
    if (bit_string == nullptr)
    {
        return false;
    }
    flags = static_cast<Flags>(flagsOf(bit_string->bits));
    return true;
}

bool readOptionalBoolean(const TypedValue& typed, cetl::optional<bool>& flag)
{
    bool value = false;
    if (!readBoolean(typed, value))
    {
        return false;
    }
    flag = value;
    return true;
}

/// Collects the attribute writes of a report control block update.
///
class ReportControlWriter final
{
public:
    explicit ReportControlWriter(const TypeDescriptor& rcb_type)
        : rcb_type_{rcb_type}
    {
    }

    template <typename Field, typename Make>
    void add(const char* const name, const cetl::optional<Field>& field, Make&& make)
    {
        if (!field.has_value() || failure_.has_value())
        {
            return;
        }
        const auto* const component = rcb_type_.findComponent(name);
        if ((component == nullptr) || !component->type)
        {
            failure_ = Error{error::TypeMismatch{fmt::format("report control block has no '{}'", name)}};
            return;
        }
        writes_.push_back(ReportControlWrite{name, std::forward<Make>(make)(*field, *component->type)});
    }

    Outcome<std::vector<ReportControlWrite>> take()
    {
        if (failure_.has_value())
        {
            return std::move(*failure_);
        }
        return std::move(writes_);
    }

private:
    const TypeDescriptor&           rcb_type_;
    std::vector<ReportControlWrite> writes_;
    cetl::optional<Error>           failure_;

};  // ReportControlWriter

/// Sequential reader of the access results of a report.
///
/// Once an element is missing or unexpected, all further reads fail too.
///
class ReportReader final
{
public:
    explicit ReportReader(const std::vector<common::mms::AccessResult>& results)
        : results_{results}
    {
    }

    cetl::optional<TypedValue> next(const char* const what)
    {
        if (failure_.has_value())
        {
            return cetl::nullopt;
        }
        if (index_ >= results_.size())
        {
            fail(fmt::format("report ends before its {}", what));
            return cetl::nullopt;
        }
        const auto* const data = cetl::get_if<ber::BerValue>(&results_[index_++]);
        if (data == nullptr)
        {
            fail(fmt::format("report {} is an access failure", what));
            return cetl::nullopt;
        }
        auto decoded = common::model::decodeData(*data);
        if (auto* const failure = cetl::get_if<Error>(&decoded))
        {
            failure_ = std::move(*failure);
            return cetl::nullopt;
        }
        return cetl::get<TypedValue>(std::move(decoded));
    }

    template <typename Alternative>
    cetl::optional<Alternative> nextAs(const char* const what)
    {
        const auto typed = next(what);
        if (!typed.has_value())
        {
            return cetl::nullopt;
        }
        const auto* const alternative = typed->as<Alternative>();
        if (alternative == nullptr)
        {
            fail(fmt::format("unexpected {} as report {}", toString(typed->kind()), what));
            return cetl::nullopt;
        }
        return *alternative;
    }

    template <typename Number>
    cetl::optional<Number> nextNumber(const char* const what)
    {
        const auto typed = next(what);
        if (!typed.has_value())
        {
            return cetl::nullopt;
        }
        const auto number = asNumber(*typed);
        if (!number.has_value())
        {
            fail(fmt::format("unexpected {} as report {}", toString(typed->kind()), what));
            return cetl::nullopt;
        }
        return static_cast<Number>(*number);
    }

    const cetl::optional<Error>& failure() const
    {
        return failure_;
    }

private:
    void fail(std::string detail)
    {
        failure_ = Error{error::MalformedEncoding{std::move(detail)}};
    }

    const std::vector<common::mms::AccessResult>& results_;
    std::size_t                                   index_{0};
    cetl::optional<Error>                         failure_;

};  // ReportReader

}  // namespace

Outcome<ReportControlBlock> parseReportControlBlock(std::string reference, const bool buffered, const TypedValue& value)
{
    const auto* const rcb = value.as<value::Structure>();
    if ((rcb == nullptr) || (rcb->names.size() != rcb->members.size()))
    {
        return error::TypeMismatch{fmt::format("'{}' is not a report control block", reference)};
    }

    ReportControlBlock result;
    result.reference = std::move(reference);
    result.buffered  = buffered;
    for (std::size_t index = 0; index < rcb->members.size(); ++index)
    {
        const auto& name   = rcb->names[index];
        const auto& member = rcb->members[index];

        bool valid = true;
        if (name == "RptID")
        {
            valid = readText(member, result.rpt_id);
        }
        else if (name == "RptEna")
        {
            valid = readBoolean(member, result.rpt_ena);
        }
        else if (name == "Resv")
        {
            valid = readOptionalBoolean(member, result.resv);
        }
        else if (name == "DatSet")
        {
            valid = readText(member, result.data_set);
            if (valid)
            {
                result.data_set = dataSetFromMmsText(result.data_set);
            }
        }
        else if (name == "ConfRev")
        {
            valid = readNumber(member, result.conf_rev);
        }
        else if (name == "OptFlds")
        {
            valid = readFlags(member, result.opt_flds);
        }
        else if (name == "BufTm")
        {
            valid = readNumber(member, result.buf_tm);
        }
        else if (name == "SqNum")
        {
            valid = readNumber(member, result.sq_num);
        }
        else if (name == "TrgOps")
        {
            valid = readFlags(member, result.trg_ops);
        }
        else if (name == "IntgPd")
        {
            valid = readNumber(member, result.intg_pd);
        }
        else if (name == "GI")
        {
            valid = readBoolean(member, result.gi);
        }
        else if (name == "PurgeBuf")
        {
            valid = readOptionalBoolean(member, result.purge_buf);
        }
        else if (name == "EntryID")
        {
            const auto* const octets = member.as<value::OctetString>();
            valid                    = (octets != nullptr);
            if (valid)
            {
                result.entry_id = octets->octets;
            }
        }

        if (!valid)
        {
            return error::MalformedEncoding{fmt::format("unexpected {} as '{}'", toString(member.kind()), name)};
        }
    }
    return result;
}

Outcome<std::vector<ReportControlWrite>> buildReportControlWrites(const TypeDescriptor&           rcb_type,
                                                                  const ReportControlBlockUpdate& update)
{
    if (rcb_type.kind != TypeKind::Structure)
    {
        return error::TypeMismatch{"report control block is not a structure"};
    }

    cetl::optional<std::string> data_set;
    if (update.data_set.has_value())
    {
        auto text = dataSetToMmsText(*update.data_set);
        if (auto* const failure = cetl::get_if<Error>(&text))
        {
            return std::move(*failure);
        }
        data_set = cetl::get<std::string>(std::move(text));
    }

    const auto boolean = [](const bool flag, const TypeDescriptor&) -> TypedValue { return value::Boolean{flag}; };
    const auto text    = [](const std::string& str, const TypeDescriptor&) -> TypedValue {
        //
        return value::VisibleString{str};
    };
    const auto number = [](const std::uint32_t num, const TypeDescriptor& type) { return makeNumber(num, type); };
    const auto flags  = [](const std::uint32_t bits, const TypeDescriptor& type) -> TypedValue {
        //
        return value::BitString{bitsOf(bits, type)};
    };

    ReportControlWriter writer{rcb_type};
    writer.add("Resv", update.resv, boolean);
    writer.add("RptID", update.rpt_id, text);
    writer.add("DatSet", data_set, text);
    writer.add("EntryID", update.entry_id, [](const std::vector<std::uint8_t>& octets, const TypeDescriptor&) {
        //
        return TypedValue{value::OctetString{octets}};
    });
    writer.add("OptFlds", update.opt_flds, flags);
    writer.add("BufTm", update.buf_tm, number);
    writer.add("TrgOps", update.trg_ops, flags);
    writer.add("IntgPd", update.intg_pd, number);
    writer.add("PurgeBuf", update.purge_buf, boolean);
    writer.add("RptEna", update.rpt_ena, boolean);
    writer.add("GI", update.gi, boolean);
    return writer.take();
}

bool isReport(const common::mms::InformationReport& report)
{
    return report.access.list_name.has_value() &&
           (*report.access.list_name == common::mms::ObjectName::vmdSpecific(ReportListName));
}

Outcome<Report> parseReport(const common::mms::InformationReport& report)
{
    ReportReader reader{report.results};

    Report result;
    if (const auto rpt_id = reader.nextAs<value::VisibleString>("RptID"))
    {
        result.rpt_id = rpt_id->text;
    }
    if (const auto opt_flds = reader.nextAs<value::BitString>("OptFlds"))
    {
        result.opt_flds = static_cast<std::uint16_t>(flagsOf(opt_flds->bits));
    }
    const auto has = [&result](const std::uint16_t option) { return (result.opt_flds & option) != 0; };

    if (has(ReportOptions::SeqNum))
    {
        result.seq_num = reader.nextNumber<std::uint32_t>("SeqNum");
    }
    if (has(ReportOptions::TimeStamp))
    {
        if (const auto time = reader.nextAs<value::OctetString>("TimeOfEntry"))
        {
            result.time_of_entry_ms = binaryTimeToMs(time->octets);
            if (!result.time_of_entry_ms.has_value())
            {
                return error::MalformedEncoding{fmt::format("TimeOfEntry of {} octets", time->octets.size())};
            }
        }
    }
    if (has(ReportOptions::DataSet))
    {
        if (const auto data_set = reader.nextAs<value::VisibleString>("DatSet"))
        {
            result.data_set = dataSetFromMmsText(data_set->text);
        }
    }
    if (has(ReportOptions::BufferOverflow))
    {
        if (const auto overflow = reader.nextAs<value::Boolean>("BufOvfl"))
        {
            result.buffer_overflow = overflow->value;
        }
    }
    if (has(ReportOptions::EntryId))
    {
        if (const auto entry_id = reader.nextAs<value::OctetString>("EntryID"))
        {
            result.entry_id = entry_id->octets;
        }
    }
    if (has(ReportOptions::ConfRev))
    {
        result.conf_rev = reader.nextNumber<std::uint32_t>("ConfRev");
    }
    if (has(ReportOptions::Segmentation))
    {
        result.sub_seq_num = reader.nextNumber<std::uint32_t>("SubSeqNum");
        if (const auto more = reader.nextAs<value::Boolean>("MoreSegmentsFollow"))
        {
            result.more_segments_follow = more->value;
        }
    }

    if (const auto inclusion = reader.nextAs<value::BitString>("inclusion bit string"))
    {
        for (std::size_t index = 0; index < inclusion->bits.size(); ++index)
        {
            if (inclusion->bits[index])
            {
                Report::Entry entry;
                entry.index = index;
                result.entries.push_back(std::move(entry));
            }
        }
    }
    if (has(ReportOptions::DataReference))
    {
        for (auto& entry : result.entries)
        {
            if (const auto reference = reader.nextAs<value::VisibleString>("data reference"))
            {
                entry.data_reference = referenceFromMmsText(reference->text);
            }
        }
    }
    for (auto& entry : result.entries)
    {
        if (auto member = reader.next("data value"))
        {
            entry.value = std::move(*member);
        }
    }
    if (has(ReportOptions::ReasonForInclusion))
    {
        for (auto& entry : result.entries)
        {
            if (const auto reason = reader.nextAs<value::BitString>("reason code"))
            {
                entry.reason = static_cast<std::uint8_t>(flagsOf(reason->bits));
            }
        }
    }

    if (reader.failure().has_value())
    {
        return *reader.failure();
    }
    return result;
}

Outcome<std::string> dataSetToMmsText(const std::string& reference)
{
    if (reference.empty())
    {
        return std::string{};
    }
    auto name = common::model::parseDataSetReference(reference);
    if (auto* const failure = cetl::get_if<common::model::DataSetReference::Failure>(&name))
    {
        return Error{std::move(*failure)};
    }
    const auto& list_name = cetl::get<common::mms::ObjectName>(name);
    if (list_name.scope == common::mms::ObjectName::Scope::DomainSpecific)
    {
        return list_name.domain + '/' + list_name.item;
    }
    return '@' + list_name.item;
}

std::string dataSetFromMmsText(const std::string& text)
{
    if (text.empty() || (text.front() == '@'))
    {
        return text;
    }
    auto reference = text;
    std::replace(reference.begin(), reference.end(), '$', '.');
    return reference;
}

}  // namespace sdk
}  // namespace iecmms
