//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "control_codec.hpp"

#include "common_helpers.hpp"
#include "mms/mms_types.hpp"
#include "model/value_codec.hpp"
#include "sdk_helpers.hpp"

#include "iecmms/sdk/control.hpp"
#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace iecmms
{
namespace sdk
{
namespace
{

constexpr std::uint8_t TimeQuality   = 0x0A;  // 10 bits of accuracy, clock synchronized
constexpr std::uint8_t MaxAddCause   = static_cast<std::uint8_t>(ControlAddCause::LockedByOtherClient);
constexpr std::uint8_t MaxOriginator = static_cast<std::uint8_t>(OriginatorCategory::Process);

const char* const LastApplErrorName = "LastApplError";

TypedValue makeNumber(const TypeDescriptor& type, const std::int64_t number)
{
    const auto bit_width = static_cast<std::uint8_t>(type.size);
    if (type.kind == TypeKind::Unsigned)
    {
        return value::Unsigned{static_cast<std::uint64_t>(number), bit_width};
    }
    return value::Integer{number, bit_width};
}

cetl::optional<std::int64_t> asNumber(const TypedValue& typed)
{
    if (const auto* const integer = typed.as<value::Integer>())
    {
        return integer->value;
    }
    if (const auto* const natural = typed.as<value::Unsigned>())
    {
        return static_cast<std::int64_t>(natural->value);
    }
    return cetl::nullopt;
}

std::string asText(const TypedValue& typed)
{
    if (const auto* const text = typed.as<value::VisibleString>())
    {
        return text->text;
    }
    if (const auto* const octets = typed.as<value::OctetString>())
    {
        return {octets->octets.begin(), octets->octets.end()};
    }
    return {};
}

Outcome<TypedValue> buildOrigin(const TypeDescriptor& type, const ControlCommand& command)
{
    value::Structure origin;
    for (const auto& component : type.components)
    {
        if (component.name == "orCat")
        {
            origin.members.push_back(makeNumber(*component.type, static_cast<std::int64_t>(command.or_cat)));
        }
        else if (component.name == "orIdent")
        {
            origin.members.push_back(value::OctetString{{command.or_ident.begin(), command.or_ident.end()}});
        }
        else
        {
            return error::TypeMismatch{"unexpected origin component '" + component.name + "'"};
        }
        origin.names.push_back(component.name);
    }
    return TypedValue{std::move(origin)};
}

}  // namespace

Outcome<TypedValue> buildControlValue(const TypeDescriptor& type,
                                      const ControlCommand& command,
                                      const std::uint8_t    ctl_num,
                                      const value::UtcTime& now)
{
    if (type.kind != TypeKind::Structure)
    {
        return error::TypeMismatch{"control attribute is not a structure"};
    }

    value::Structure result;
    for (const auto& component : type.components)
    {
        const auto& name = component.name;
        if (name == "ctlVal")
        {
            result.members.push_back(command.ctl_val);
        }
        else if (name == "operTm")
        {
            result.members.push_back(command.oper_time.has_value() ? *command.oper_time : value::UtcTime{0, 0, 0});
        }
        else if (name == "origin")
        {
            auto origin = buildOrigin(*component.type, command);
            if (auto* const failure = cetl::get_if<Error>(&origin))
            {
                return std::move(*failure);
            }
            result.members.push_back(cetl::get<TypedValue>(std::move(origin)));
        }
        else if (name == "ctlNum")
        {
            result.members.push_back(makeNumber(*component.type, ctl_num));
        }
        else if (name == "T")
        {
            result.members.push_back(now);
        }
        else if (name == "Test")
        {
            result.members.push_back(value::Boolean{command.test});
        }
        else if (name == "Check")
        {
            result.members.push_back(value::BitString{{command.synchro_check, command.interlock_check}});
        }
        else
        {
            return error::TypeMismatch{"unexpected control component '" + name + "'"};
        }
        result.names.push_back(name);
    }
    return TypedValue{std::move(result)};
}

value::UtcTime toUtcTime(const std::chrono::system_clock::time_point time_point)
{
    using std::chrono::duration_cast;
    using std::chrono::nanoseconds;
    using std::chrono::seconds;

    const auto since_epoch = time_point.time_since_epoch();
    const auto whole       = duration_cast<seconds>(since_epoch);
    const auto nanos       = static_cast<std::uint64_t>(duration_cast<nanoseconds>(since_epoch - whole).count());

    value::UtcTime utc{};
    utc.seconds  = static_cast<std::uint32_t>(whole.count());
    utc.fraction = static_cast<std::uint32_t>((nanos << 24U) / 1000000000ULL);
    utc.quality  = TimeQuality;
    return utc;
}

cetl::optional<LastApplError> parseLastApplError(const common::mms::InformationReport& report)
{
    const auto& variables = report.access.variables;
    if ((variables.size() != 1) || (variables.front() != common::mms::ObjectName::vmdSpecific(LastApplErrorName)) ||
        (report.results.size() != 1))
    {
        return cetl::nullopt;
    }

    const auto* const data = cetl::get_if<ber::BerValue>(&report.results.front());
    if (data == nullptr)
    {
        return cetl::nullopt;
    }
    auto decoded = common::model::decodeData(*data);
    if (cetl::get_if<Error>(&decoded) != nullptr)
    {
        return cetl::nullopt;
    }
    const auto* const structure = cetl::get<TypedValue>(decoded).as<value::Structure>();
    if ((structure == nullptr) || (structure->members.size() != 5))
    {
        return cetl::nullopt;
    }
    const auto& members = structure->members;

    LastApplError result;
    result.control_object = asText(members[0]);

    const auto error_code = asNumber(members[1]);
    if (!error_code.has_value())
    {
        return cetl::nullopt;
    }
    result.error = static_cast<std::int32_t>(*error_code);

    if (const auto* const origin = members[2].as<value::Structure>())
    {
        if (!origin->members.empty())
        {
            const auto category = asNumber(origin->members[0]).value_or(0);
            if ((category >= 0) && (category <= MaxOriginator))
            {
                result.or_cat = static_cast<OriginatorCategory>(category);
            }
        }
        if (origin->members.size() > 1)
        {
            result.or_ident = asText(origin->members[1]);
        }
    }

    result.ctl_num = static_cast<std::uint8_t>(asNumber(members[3]).value_or(0));

    const auto add_cause = asNumber(members[4]).value_or(0);
    if ((add_cause >= 0) && (add_cause <= MaxAddCause))
    {
        result.add_cause = static_cast<ControlAddCause>(add_cause);
    }
    return result;
}

std::string controlObjectName(const std::string&              logical_device,
                              const std::string&              logical_node,
                              const std::vector<std::string>& names)
{
    return logical_device + '/' + logical_node + "$CO$" + common::joinStrings(names, '$');
}

}  // namespace sdk
}  // namespace iecmms
