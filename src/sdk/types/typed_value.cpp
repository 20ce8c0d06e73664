//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace iecmms
{
namespace sdk
{
namespace
{

template <typename Items>
std::string joinRendered(const Items& items, const std::vector<std::string>& names)
{
    std::string result;
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
        {
            result += ", ";
        }
        if (i < names.size())
        {
            result += names[i];
            result += '=';
        }
        result += items[i].toString();
    }
    return result;
}

}  // namespace

const char* toString(const TypeKind kind) noexcept
{
    switch (kind)
    {
    case TypeKind::Boolean:
        return "boolean";
    case TypeKind::Integer:
        return "integer";
    case TypeKind::Unsigned:
        return "unsigned";
    case TypeKind::Float:
        return "float";
    case TypeKind::BitString:
        return "bit-string";
    case TypeKind::OctetString:
        return "octet-string";
    case TypeKind::VisibleString:
        return "visible-string";
    case TypeKind::MmsString:
        return "mms-string";
    case TypeKind::UtcTime:
        return "utc-time";
    case TypeKind::Structure:
        return "structure";
    case TypeKind::Array:
        return "array";
    default:
        return "?";
    }
}

namespace value
{

const TypedValue* Structure::find(const std::string& name) const
{
    for (std::size_t i = 0; (i < names.size()) && (i < members.size()); ++i)
    {
        if (names[i] == name)
        {
            return &members[i];
        }
    }
    return nullptr;
}

bool operator==(const Boolean& lhs, const Boolean& rhs)
{
    return lhs.value == rhs.value;
}

bool operator==(const Integer& lhs, const Integer& rhs)
{
    return (lhs.value == rhs.value) && (lhs.bit_width == rhs.bit_width);
}

bool operator==(const Unsigned& lhs, const Unsigned& rhs)
{
    return (lhs.value == rhs.value) && (lhs.bit_width == rhs.bit_width);
}

bool operator==(const Float& lhs, const Float& rhs)
{
    return (lhs.value == rhs.value) && (lhs.bit_width == rhs.bit_width);
}

bool operator==(const BitString& lhs, const BitString& rhs)
{
    return lhs.bits == rhs.bits;
}

bool operator==(const OctetString& lhs, const OctetString& rhs)
{
    return lhs.octets == rhs.octets;
}

bool operator==(const VisibleString& lhs, const VisibleString& rhs)
{
    return lhs.text == rhs.text;
}

bool operator==(const MmsString& lhs, const MmsString& rhs)
{
    return lhs.text == rhs.text;
}

bool operator==(const UtcTime& lhs, const UtcTime& rhs)
{
    return (lhs.seconds == rhs.seconds) && (lhs.fraction == rhs.fraction) && (lhs.quality == rhs.quality);
}

/// Names take part in the comparison only when both sides carry them.
///
bool operator==(const Structure& lhs, const Structure& rhs)
{
    if (!lhs.names.empty() && !rhs.names.empty() && (lhs.names != rhs.names))
    {
        return false;
    }
    return lhs.members == rhs.members;
}

bool operator==(const Array& lhs, const Array& rhs)
{
    return lhs.elements == rhs.elements;
}

}  // namespace value

bool operator==(const TypedValue& lhs, const TypedValue& rhs)
{
    if (lhs.kind() != rhs.kind())
    {
        return false;
    }
    return cetl::visit(
        [&rhs](const auto& lhs_alternative) {
            //
            using Alternative = std::decay_t<decltype(lhs_alternative)>;
            return lhs_alternative == *rhs.as<Alternative>();
        },
        lhs.var());
}

std::string TypedValue::toString() const
{
    return cetl::visit(  //
        cetl::make_overloaded(
            [](const value::Boolean& val) { return std::string{val.value ? "true" : "false"}; },
            [](const value::Integer& val) { return fmt::format("{}", val.value); },
            [](const value::Unsigned& val) { return fmt::format("{}", val.value); },
            [](const value::Float& val) { return fmt::format("{}", val.value); },
            [](const value::BitString& val) {
                //
                std::string bits{"b'"};
                for (const bool bit : val.bits)
                {
                    bits += bit ? '1' : '0';
                }
                return bits + '\'';
            },
            [](const value::OctetString& val) {
                //
                std::string hex{"h'"};
                for (const auto octet : val.octets)
                {
                    hex += fmt::format("{:02X}", octet);
                }
                return hex + '\'';
            },
            [](const value::VisibleString& val) { return fmt::format("\"{}\"", val.text); },
            [](const value::MmsString& val) { return fmt::format("\"{}\"", val.text); },
            [](const value::UtcTime& val) {
                //
                return fmt::format("utc({}.{:06X}, q=0x{:02X})", val.seconds, val.fraction, val.quality);
            },
            [](const value::Structure& val) { return "{" + joinRendered(val.members, val.names) + "}"; },
            [](const value::Array& val) { return "[" + joinRendered(val.elements, {}) + "]"; }),
        var_);
}

}  // namespace sdk
}  // namespace iecmms
