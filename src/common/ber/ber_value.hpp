//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_BER_BER_VALUE_HPP_INCLUDED
#define IECMMS_COMMON_BER_BER_VALUE_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{
namespace ber
{

using Bytes     = std::vector<std::uint8_t>;
using BytesView = cetl::span<const std::uint8_t>;

inline BytesView view(const Bytes& bytes) noexcept
{
    return {bytes.data(), bytes.size()};
}

enum class TagClass : std::uint8_t
{
    Universal       = 0,
    Application     = 1,
    ContextSpecific = 2,
    Private         = 3,

};  // TagClass

/// Universal tag numbers used by MMS and the ISO upper layers.
///
namespace universal
{
constexpr std::uint32_t Boolean          = 1;
constexpr std::uint32_t Integer          = 2;
constexpr std::uint32_t BitString        = 3;
constexpr std::uint32_t OctetString      = 4;
constexpr std::uint32_t Null             = 5;
constexpr std::uint32_t ObjectIdentifier = 6;
constexpr std::uint32_t External         = 8;
constexpr std::uint32_t Sequence         = 16;
constexpr std::uint32_t VisibleString    = 26;
}  // namespace universal

/// One ASN.1 BER node.
///
/// A primitive value keeps its content octets; a constructed one keeps its children (which it owns).
/// `indefinite_length` records (or requests) the indefinite form of a constructed value's length.
///
struct BerValue final
{
    TagClass              tag_class{TagClass::Universal};
    std::uint32_t         tag_number{0};
    bool                  constructed{false};
    bool                  indefinite_length{false};
    Bytes                 content;
    std::vector<BerValue> children;

    static BerValue primitive(const TagClass tag_class, const std::uint32_t tag_number, Bytes content = {});
    static BerValue constructedOf(const TagClass        tag_class,
                                  const std::uint32_t   tag_number,
                                  std::vector<BerValue> children = {});

    static BerValue context(const std::uint32_t tag_number, Bytes content = {})
    {
        return primitive(TagClass::ContextSpecific, tag_number, std::move(content));
    }
    static BerValue contextOf(const std::uint32_t tag_number, std::vector<BerValue> children = {})
    {
        return constructedOf(TagClass::ContextSpecific, tag_number, std::move(children));
    }
    static BerValue sequenceOf(std::vector<BerValue> children = {})
    {
        return constructedOf(TagClass::Universal, universal::Sequence, std::move(children));
    }

    bool is(const TagClass cls, const std::uint32_t number) const noexcept
    {
        return (tag_class == cls) && (tag_number == number);
    }
    bool isContext(const std::uint32_t number) const noexcept
    {
        return is(TagClass::ContextSpecific, number);
    }

    /// Finds the first child with the given tag.
    ///
    const BerValue* find(const TagClass cls, const std::uint32_t number) const noexcept;
    const BerValue* findContext(const std::uint32_t number) const noexcept
    {
        return find(TagClass::ContextSpecific, number);
    }

    /// Identifier octet(s) rendered as hex, e.g. `A1` or `BF 20` (for diagnostics).
    ///
    std::string describeTag() const;

};  // BerValue

bool operator==(const BerValue& lhs, const BerValue& rhs);

inline bool operator!=(const BerValue& lhs, const BerValue& rhs)
{
    return !(lhs == rhs);
}

// MARK: - Content builders:

BerValue makeBoolean(const TagClass cls, const std::uint32_t number, const bool value);
BerValue makeInteger(const TagClass cls, const std::uint32_t number, const std::int64_t value);
BerValue makeUnsigned(const TagClass cls, const std::uint32_t number, const std::uint64_t value);
BerValue makeString(const TagClass cls, const std::uint32_t number, const std::string& value);
BerValue makeOctets(const TagClass cls, const std::uint32_t number, const Bytes& value);
BerValue makeBitString(const TagClass cls, const std::uint32_t number, const std::vector<bool>& bits);
BerValue makeObjectIdentifier(const TagClass cls, const std::uint32_t number, const std::vector<std::uint32_t>& arcs);
BerValue makeNull(const TagClass cls, const std::uint32_t number);

/// Minimal two's complement encoding of a signed integer.
Bytes encodeIntegerContent(const std::int64_t value);
/// Minimal encoding of an unsigned integer (with a leading zero octet if the top bit is set).
Bytes encodeUnsignedContent(const std::uint64_t value);

// MARK: - Content decoders (nullopt when the content is malformed):

cetl::optional<bool>                       decodeBoolean(const BerValue& value);
cetl::optional<std::int64_t>               decodeInteger(const BerValue& value);
cetl::optional<std::uint64_t>              decodeUnsigned(const BerValue& value);
cetl::optional<std::string>                decodeString(const BerValue& value);
cetl::optional<std::vector<bool>>          decodeBitString(const BerValue& value);
cetl::optional<std::vector<std::uint32_t>> decodeObjectIdentifier(const BerValue& value);

}  // namespace ber
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_BER_BER_VALUE_HPP_INCLUDED
