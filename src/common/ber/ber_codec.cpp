//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "ber_codec.hpp"

#include "ber_value.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{
namespace ber
{
namespace
{

using Malformed = sdk::error::MalformedEncoding;

constexpr std::uint8_t  ConstructedBit  = 0x20;
constexpr std::uint8_t  HighTagNumber   = 0x1F;
constexpr std::uint8_t  LongLengthForm  = 0x80;
constexpr std::size_t   MaxLengthOctets = 4;
constexpr std::uint32_t MaxTagNumber    = 0x0FFFFFFF;

void encodeIdentifier(const TagClass tag_class, const std::uint32_t tag_number, const bool constructed, Bytes& out)
{
    auto first = static_cast<std::uint8_t>(static_cast<std::uint8_t>(tag_class) << 6U);
    if (constructed)
    {
        first |= ConstructedBit;
    }

    if (tag_number < HighTagNumber)
    {
        out.push_back(static_cast<std::uint8_t>(first | tag_number));
        return;
    }

    out.push_back(static_cast<std::uint8_t>(first | HighTagNumber));

    std::uint8_t groups[5]{};  // NOLINT(*-avoid-c-arrays)
    std::size_t  count = 0;
    auto         rest  = tag_number;
    do
    {
        groups[count++] = static_cast<std::uint8_t>(rest & 0x7FU);  // NOLINT(*-constant-array-index)
        rest >>= 7U;
    } while (rest != 0);
    while (count > 0)
    {
        --count;
        // NOLINTNEXTLINE(*-constant-array-index)
        out.push_back(static_cast<std::uint8_t>(groups[count] | ((count > 0) ? 0x80U : 0x00U)));
    }
}

void encodeLength(const std::size_t length, Bytes& out)
{
    if (length < LongLengthForm)
    {
        out.push_back(static_cast<std::uint8_t>(length));
        return;
    }

    std::size_t octets = 0;
    for (auto rest = length; rest != 0; rest >>= 8U)
    {
        ++octets;
    }
    out.push_back(static_cast<std::uint8_t>(LongLengthForm | octets));
    for (std::size_t i = octets; i > 0; --i)
    {
        out.push_back(static_cast<std::uint8_t>(length >> ((i - 1) * 8U)));
    }
}

class Decoder final
{
public:
    explicit Decoder(const BytesView data)
        : data_{data}
    {
    }

    DecodeHeaderResult::Var header(const std::size_t offset,
                                   const std::size_t limit,
                                   const bool        check_content = true) const
    {
        std::size_t pos = offset;
        if (pos >= limit)
        {
            return Malformed{fmt::format("missing identifier at offset {}", offset)};
        }

        const std::uint8_t first = data_[pos++];

        Header hdr{};
        hdr.tag_class   = static_cast<TagClass>(first >> 6U);
        hdr.constructed = (first & ConstructedBit) != 0;
        hdr.tag_number  = first & HighTagNumber;
        if (hdr.tag_number == HighTagNumber)
        {
            hdr.tag_number = 0;
            while (true)
            {
                if (pos >= limit)
                {
                    return Malformed{fmt::format("truncated tag number at offset {}", offset)};
                }
                const std::uint8_t octet = data_[pos++];
                if (hdr.tag_number > (MaxTagNumber >> 7U))
                {
                    return Malformed{fmt::format("tag number is too large at offset {}", offset)};
                }
                hdr.tag_number = (hdr.tag_number << 7U) | (octet & 0x7FU);
                if ((octet & 0x80U) == 0)
                {
                    break;
                }
            }
        }

        if (pos >= limit)
        {
            return Malformed{fmt::format("missing length at offset {}", offset)};
        }
        const std::uint8_t length_octet = data_[pos++];
        if (length_octet == LongLengthForm)
        {
            if (!hdr.constructed)
            {
                return Malformed{fmt::format("indefinite length of primitive value at offset {}", offset)};
            }
            hdr.indefinite_length = true;
        }
        else if ((length_octet & LongLengthForm) != 0)
        {
            const std::size_t octets = length_octet & 0x7FU;
            if ((octets > MaxLengthOctets) || (octets > (limit - pos)))
            {
                return Malformed{fmt::format("invalid long form length at offset {}", offset)};
            }
            for (std::size_t i = 0; i < octets; ++i)
            {
                hdr.content_size = (hdr.content_size << 8U) | data_[pos++];
            }
        }
        else
        {
            hdr.content_size = length_octet;
        }

        hdr.header_size = pos - offset;
        if (check_content && !hdr.indefinite_length && (hdr.content_size > (limit - pos)))
        {
            return Malformed{fmt::format("declared length {} exceeds remaining {} octets at offset {}",
                                         hdr.content_size,
                                         limit - pos,
                                         offset)};
        }
        return hdr;
    }

    /// Decodes one value starting at `offset`, not reading at or beyond `limit`.
    ///
    DecodeResult::Var value(const std::size_t offset, const std::size_t limit, const std::size_t depth) const
    {
        if (depth > MaxDecodeDepth)
        {
            return Malformed{fmt::format("nesting is too deep at offset {}", offset)};
        }

        auto maybe_header = header(offset, limit);
        if (auto* const failure = cetl::get_if<Malformed>(&maybe_header))
        {
            return std::move(*failure);
        }
        const auto& hdr = cetl::get<Header>(maybe_header);

        DecodeResult::Success result{};
        result.value.tag_class         = hdr.tag_class;
        result.value.tag_number        = hdr.tag_number;
        result.value.constructed       = hdr.constructed;
        result.value.indefinite_length = hdr.indefinite_length;

        const std::size_t content_begin = offset + hdr.header_size;
        if (!hdr.constructed)
        {
            result.value.content.assign(data_.begin() + content_begin,
                                        data_.begin() + content_begin + hdr.content_size);
            result.consumed = hdr.header_size + hdr.content_size;
            return result;
        }

        if (hdr.indefinite_length)
        {
            // Children up to the end-of-contents marker (two zero octets).
            std::size_t pos = content_begin;
            while (true)
            {
                if ((limit - pos) < 2)
                {
                    return Malformed{fmt::format("missing end-of-contents of value at offset {}", offset)};
                }
                if ((data_[pos] == 0) && (data_[pos + 1] == 0))
                {
                    pos += 2;
                    break;
                }
                auto maybe_child = value(pos, limit, depth + 1);
                if (auto* const failure = cetl::get_if<Malformed>(&maybe_child))
                {
                    return std::move(*failure);
                }
                auto& child = cetl::get<DecodeResult::Success>(maybe_child);
                pos += child.consumed;
                result.value.children.push_back(std::move(child.value));
            }
            result.consumed = pos - offset;
            return result;
        }

        const std::size_t content_end = content_begin + hdr.content_size;
        std::size_t       pos         = content_begin;
        while (pos < content_end)
        {
            auto maybe_child = value(pos, content_end, depth + 1);
            if (auto* const failure = cetl::get_if<Malformed>(&maybe_child))
            {
                return std::move(*failure);
            }
            auto& child = cetl::get<DecodeResult::Success>(maybe_child);
            pos += child.consumed;
            result.value.children.push_back(std::move(child.value));
        }
        result.consumed = content_end - offset;
        return result;
    }

private:
    const BytesView data_;

};  // Decoder

}  // namespace

void encodeHeaderTo(const TagClass      tag_class,
                    const std::uint32_t tag_number,
                    const bool          constructed,
                    const std::size_t   content_size,
                    Bytes&              out)
{
    encodeIdentifier(tag_class, tag_number, constructed, out);
    encodeLength(content_size, out);
}

Bytes wrap(const TagClass tag_class, const std::uint32_t tag_number, const BytesView content)
{
    Bytes out;
    out.reserve(content.size() + 8);
    encodeHeaderTo(tag_class, tag_number, true, content.size(), out);
    out.insert(out.end(), content.begin(), content.end());
    return out;
}

void encodeTo(const BerValue& value, Bytes& out)
{
    encodeIdentifier(value.tag_class, value.tag_number, value.constructed, out);

    if (!value.constructed)
    {
        encodeLength(value.content.size(), out);
        out.insert(out.end(), value.content.begin(), value.content.end());
        return;
    }

    if (value.indefinite_length)
    {
        out.push_back(LongLengthForm);
        for (const auto& child : value.children)
        {
            encodeTo(child, out);
        }
        out.push_back(0);
        out.push_back(0);
        return;
    }

    Bytes nested;
    for (const auto& child : value.children)
    {
        encodeTo(child, nested);
    }
    encodeLength(nested.size(), out);
    out.insert(out.end(), nested.begin(), nested.end());
}

Bytes encode(const BerValue& value)
{
    Bytes out;
    encodeTo(value, out);
    return out;
}

DecodeResult::Var decode(const BytesView data)
{
    const Decoder decoder{data};
    return decoder.value(0, data.size(), 0);
}

DecodeHeaderResult::Var decodeHeader(const BytesView data)
{
    const Decoder decoder{data};
    return decoder.header(0, data.size(), false);
}

}  // namespace ber
}  // namespace common
}  // namespace iecmms
