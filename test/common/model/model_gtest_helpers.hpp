//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_MODEL_GTEST_HELPERS_HPP_INCLUDED
#define IECMMS_MODEL_GTEST_HELPERS_HPP_INCLUDED

#include "ber/ber_value.hpp"
#include "model/type_descriptor.hpp"

#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

// MARK: - GTest Printers:

namespace iecmms
{
namespace sdk
{

inline void PrintTo(const TypedValue& value, std::ostream* os)
{
    *os << "TypedValue{" << toString(value.kind()) << ", " << value.toString() << "}";
}

}  // namespace sdk

// MARK: - Test helpers:

/// Builders of MMS `TypeDescription` elements, as a server reports them.
///
namespace type_desc
{

using common::ber::BerValue;
using common::ber::TagClass;

inline BerValue boolean()
{
    return common::ber::makeNull(TagClass::ContextSpecific, 3);
}

inline BerValue integer(const std::int64_t bits)
{
    return common::ber::makeInteger(TagClass::ContextSpecific, 5, bits);
}

inline BerValue unsignedInteger(const std::int64_t bits)
{
    return common::ber::makeInteger(TagClass::ContextSpecific, 6, bits);
}

inline BerValue floatingPoint(const std::int64_t format = 32, const std::int64_t exponent = 8)
{
    return BerValue::contextOf(7,
                               {
                                   common::ber::makeInteger(TagClass::Universal, 2, format),
                                   common::ber::makeInteger(TagClass::Universal, 2, exponent),
                               });
}

inline BerValue bitString(const std::int64_t size)
{
    return common::ber::makeInteger(TagClass::ContextSpecific, 4, size);
}

inline BerValue octetString(const std::int64_t size)
{
    return common::ber::makeInteger(TagClass::ContextSpecific, 9, size);
}

inline BerValue visibleString(const std::int64_t size)
{
    return common::ber::makeInteger(TagClass::ContextSpecific, 10, size);
}

inline BerValue utcTime()
{
    return common::ber::makeNull(TagClass::ContextSpecific, 17);
}

inline BerValue structure(const std::vector<std::pair<std::string, BerValue>>& components)
{
    std::vector<BerValue> list;
    list.reserve(components.size());
    for (const auto& component : components)
    {
        list.push_back(BerValue::sequenceOf({
            common::ber::makeString(TagClass::ContextSpecific, 0, component.first),
            BerValue::contextOf(1, {component.second}),
        }));
    }
    return BerValue::contextOf(2, {BerValue::contextOf(1, std::move(list))});
}

inline BerValue array(const std::int64_t count, const BerValue& element)
{
    return BerValue::contextOf(1,
                               {
                                   common::ber::makeInteger(TagClass::ContextSpecific, 1, count),
                                   BerValue::contextOf(2, {element}),
                               });
}

/// Parses a type description, failing the test if it is malformed.
///
inline sdk::TypeDescriptor::Ptr parseOrFail(const BerValue& description)
{
    auto result = common::model::parseTypeDescription(description);
    if (auto* const descriptor = cetl::get_if<sdk::TypeDescriptor::Ptr>(&result))
    {
        return std::move(*descriptor);
    }
    ADD_FAILURE() << "Malformed type description: " << cetl::get<sdk::error::MalformedEncoding>(result).detail;
    return nullptr;
}

/// Type of a `GGIO`-like logical node with a status and a controllable data object.
///
inline BerValue someLogicalNodeType()
{
    const auto quality = bitString(13);
    return structure({
        {"ST",
         structure({
             {"Mod", structure({{"stVal", integer(8)}, {"q", quality}, {"t", utcTime()}})},
             {"Ind1", structure({{"stVal", boolean()}, {"q", quality}})},
         })},
        {"MX", structure({{"AnIn1", structure({{"mag", structure({{"f", floatingPoint()}})}, {"q", quality}})}})},
        {"CF", structure({{"Mod", structure({{"ctlModel", integer(8)}})}})},
        {"DC", structure({{"NamPlt", structure({{"vendor", visibleString(-255)}})}})},
    });
}

}  // namespace type_desc
}  // namespace iecmms

#endif  // IECMMS_MODEL_GTEST_HELPERS_HPP_INCLUDED
