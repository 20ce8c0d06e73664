//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_BER_GTEST_HELPERS_HPP_INCLUDED
#define IECMMS_BER_GTEST_HELPERS_HPP_INCLUDED

#include "ber/ber_codec.hpp"
#include "ber/ber_value.hpp"

#include <gmock/gmock.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iomanip>
#include <ios>
#include <ostream>

// MARK: - GTest Printers:

namespace iecmms
{
namespace common
{
namespace ber
{

inline void PrintTo(const BerValue& value, std::ostream* os)
{
    const auto flags = os->flags();
    *os << "BerValue{tag=" << value.describeTag() << ", encoded=[";
    for (const auto octet : encode(value))
    {
        *os << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << static_cast<int>(octet) << ' ';
    }
    *os << "]}";
    os->flags(flags);
}

}  // namespace ber
}  // namespace common

// MARK: - Test helpers:

/// Shorthand for spelling expected octets in tests.
///
inline common::ber::Bytes bytes(std::initializer_list<std::uint8_t> octets)
{
    return common::ber::Bytes{octets};
}

/// Decodes a complete value, failing the test on malformed input.
///
inline common::ber::BerValue decodeOrFail(const common::ber::Bytes& encoded)
{
    auto result = common::ber::decode(common::ber::view(encoded));
    if (const auto* const success = cetl::get_if<common::ber::DecodeResult::Success>(&result))
    {
        EXPECT_EQ(success->consumed, encoded.size());
        return success->value;
    }
    ADD_FAILURE() << "Malformed BER: " << cetl::get<common::ber::DecodeResult::Failure>(result).detail;
    return {};
}

}  // namespace iecmms

#endif  // IECMMS_BER_GTEST_HELPERS_HPP_INCLUDED
