//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "ber_value.hpp"

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
namespace common
{
namespace ber
{

BerValue BerValue::primitive(const TagClass tag_class, const std::uint32_t tag_number, Bytes content)
{
    BerValue value;
    value.tag_class  = tag_class;
    value.tag_number = tag_number;
    value.content    = std::move(content);
    return value;
}

BerValue BerValue::constructedOf(const TagClass        tag_class,
                                 const std::uint32_t   tag_number,
                                 std::vector<BerValue> children)
{
    BerValue value;
    value.tag_class   = tag_class;
    value.tag_number  = tag_number;
    value.constructed = true;
    value.children    = std::move(children);
    return value;
}

const BerValue* BerValue::find(const TagClass cls, const std::uint32_t number) const noexcept
{
    const auto it = std::find_if(children.begin(), children.end(), [cls, number](const BerValue& child) {
        //
        return child.is(cls, number);
    });
    return (it != children.end()) ? &*it : nullptr;
}

std::string BerValue::describeTag() const
{
    const auto first = static_cast<std::uint8_t>((static_cast<std::uint8_t>(tag_class) << 6U) |  //
                                                 (constructed ? 0x20U : 0x00U));
    if (tag_number < 0x1FU)
    {
        return fmt::format("{:02X}", first | tag_number);
    }
    return fmt::format("{:02X} #{}", first | 0x1FU, tag_number);
}

bool operator==(const BerValue& lhs, const BerValue& rhs)
{
    return (lhs.tag_class == rhs.tag_class) && (lhs.tag_number == rhs.tag_number) &&
           (lhs.constructed == rhs.constructed) && (lhs.indefinite_length == rhs.indefinite_length) &&
           (lhs.content == rhs.content) && (lhs.children == rhs.children);
}

// MARK: - Content builders:

Bytes encodeIntegerContent(const std::int64_t value)
{
    Bytes content;
    content.reserve(sizeof(value));
    for (std::size_t i = sizeof(value); i > 0; --i)
    {
        content.push_back(static_cast<std::uint8_t>(static_cast<std::uint64_t>(value) >> ((i - 1) * 8U)));
    }

    // Drop redundant leading octets: 0x00 followed by a clear top bit, or 0xFF followed by a set one.
    //
    std::size_t skip = 0;
    while ((skip + 1) < content.size())
    {
        const auto head = content[skip];
        const auto next = content[skip + 1];
        if (((head == 0x00) && ((next & 0x80U) == 0)) || ((head == 0xFF) && ((next & 0x80U) != 0)))
        {
            ++skip;
            continue;
        }
        break;
    }
    content.erase(content.begin(), content.begin() + static_cast<std::ptrdiff_t>(skip));
    return content;
}

Bytes encodeUnsignedContent(const std::uint64_t value)
{
    Bytes content;
    content.reserve(sizeof(value) + 1);
    content.push_back(0);
    for (std::size_t i = sizeof(value); i > 0; --i)
    {
        content.push_back(static_cast<std::uint8_t>(value >> ((i - 1) * 8U)));
    }

    std::size_t skip = 0;
    while (((skip + 1) < content.size()) && (content[skip] == 0x00) && ((content[skip + 1] & 0x80U) == 0))
    {
        ++skip;
    }
    content.erase(content.begin(), content.begin() + static_cast<std::ptrdiff_t>(skip));
    return content;
}

BerValue makeBoolean(const TagClass cls, const std::uint32_t number, const bool value)
{
    return BerValue::primitive(cls, number, {static_cast<std::uint8_t>(value ? 0xFF : 0x00)});
}

BerValue makeInteger(const TagClass cls, const std::uint32_t number, const std::int64_t value)
{
    return BerValue::primitive(cls, number, encodeIntegerContent(value));
}

BerValue makeUnsigned(const TagClass cls, const std::uint32_t number, const std::uint64_t value)
{
    return BerValue::primitive(cls, number, encodeUnsignedContent(value));
}

BerValue makeString(const TagClass cls, const std::uint32_t number, const std::string& value)
{
    return BerValue::primitive(cls, number, Bytes{value.begin(), value.end()});
}

BerValue makeOctets(const TagClass cls, const std::uint32_t number, const Bytes& value)
{
    return BerValue::primitive(cls, number, value);
}

BerValue makeBitString(const TagClass cls, const std::uint32_t number, const std::vector<bool>& bits)
{
    const std::size_t octets = (bits.size() + 7) / 8;

    Bytes content(octets + 1, 0);
    content[0] = static_cast<std::uint8_t>((octets * 8) - bits.size());
    for (std::size_t i = 0; i < bits.size(); ++i)
    {
        if (bits[i])
        {
            content[1 + (i / 8)] |= static_cast<std::uint8_t>(0x80U >> (i % 8));
        }
    }
    return BerValue::primitive(cls, number, std::move(content));
}

BerValue makeObjectIdentifier(const TagClass cls, const std::uint32_t number, const std::vector<std::uint32_t>& arcs)
{
    Bytes content;
    if (arcs.size() >= 2)
    {
        std::vector<std::uint32_t> sub_ids;
        sub_ids.reserve(arcs.size() - 1);
        sub_ids.push_back((arcs[0] * 40) + arcs[1]);
        sub_ids.insert(sub_ids.end(), arcs.begin() + 2, arcs.end());

        for (const auto sub_id : sub_ids)
        {
            Bytes base128;
            auto  rest = sub_id;
            do
            {
                base128.insert(base128.begin(), static_cast<std::uint8_t>(rest & 0x7FU));
                rest >>= 7U;
            } while (rest != 0);
            for (std::size_t i = 0; (i + 1) < base128.size(); ++i)
            {
                base128[i] |= 0x80U;
            }
            content.insert(content.end(), base128.begin(), base128.end());
        }
    }
    return BerValue::primitive(cls, number, std::move(content));
}

BerValue makeNull(const TagClass cls, const std::uint32_t number)
{
    return BerValue::primitive(cls, number);
}

// MARK: - Content decoders:

cetl::optional<bool> decodeBoolean(const BerValue& value)
{
    if (value.constructed || (value.content.size() != 1))
    {
        return cetl::nullopt;
    }
    return value.content[0] != 0;
}

cetl::optional<std::int64_t> decodeInteger(const BerValue& value)
{
    const auto& content = value.content;
    if (value.constructed || content.empty() || (content.size() > sizeof(std::int64_t)))
    {
        return cetl::nullopt;
    }

    // Sign extension from the top bit of the first octet.
    std::uint64_t raw = ((content[0] & 0x80U) != 0) ? ~std::uint64_t{0} : 0;
    for (const auto octet : content)
    {
        raw = (raw << 8U) | octet;
    }
    return static_cast<std::int64_t>(raw);
}

cetl::optional<std::uint64_t> decodeUnsigned(const BerValue& value)
{
    const auto& content = value.content;
    if (value.constructed || content.empty())
    {
        return cetl::nullopt;
    }

    std::size_t offset = 0;
    if (content.size() > sizeof(std::uint64_t))
    {
        if ((content.size() != (sizeof(std::uint64_t) + 1)) || (content[0] != 0))
        {
            return cetl::nullopt;
        }
        offset = 1;
    }

    std::uint64_t result = 0;
    for (std::size_t i = offset; i < content.size(); ++i)
    {
        result = (result << 8U) | content[i];
    }
    return result;
}

cetl::optional<std::string> decodeString(const BerValue& value)
{
    if (value.constructed)
    {
        return cetl::nullopt;
    }
    return std::string{value.content.begin(), value.content.end()};
}

cetl::optional<std::vector<bool>> decodeBitString(const BerValue& value)
{
    const auto& content = value.content;
    if (value.constructed || content.empty())
    {
        return cetl::nullopt;
    }
    const std::size_t unused = content[0];
    if ((unused > 7) || ((content.size() == 1) && (unused != 0)))
    {
        return cetl::nullopt;
    }

    const std::size_t bit_count = ((content.size() - 1) * 8) - unused;
    std::vector<bool> bits(bit_count, false);
    for (std::size_t i = 0; i < bit_count; ++i)
    {
        bits[i] = (content[1 + (i / 8)] & (0x80U >> (i % 8))) != 0;
    }
    return bits;
}

cetl::optional<std::vector<std::uint32_t>> decodeObjectIdentifier(const BerValue& value)
{
    const auto& content = value.content;
    if (value.constructed || content.empty() || ((content.back() & 0x80U) != 0))
    {
        return cetl::nullopt;
    }

    std::vector<std::uint32_t> arcs;
    std::uint64_t              sub_id = 0;
    for (const auto octet : content)
    {
        sub_id = (sub_id << 7U) | (octet & 0x7FU);
        if (sub_id > 0xFFFFFFFFU)
        {
            return cetl::nullopt;
        }
        if ((octet & 0x80U) != 0)
        {
            continue;
        }

        if (arcs.empty())
        {
            const auto first = std::min<std::uint64_t>(sub_id / 40, 2);
            arcs.push_back(static_cast<std::uint32_t>(first));
            arcs.push_back(static_cast<std::uint32_t>(sub_id - (first * 40)));
        }
        else
        {
            arcs.push_back(static_cast<std::uint32_t>(sub_id));
        }
        sub_id = 0;
    }
    return arcs;
}

}  // namespace ber
}  // namespace common
}  // namespace iecmms
