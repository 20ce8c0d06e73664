//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_BER_BER_CODEC_HPP_INCLUDED
#define IECMMS_COMMON_BER_BER_CODEC_HPP_INCLUDED

#include "ber_value.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <cstddef>
#include <cstdint>

namespace iecmms
{
namespace common
{
namespace ber
{

/// Maximum nesting of constructed values accepted by the decoder.
constexpr std::size_t MaxDecodeDepth = 64;

/// Encodes a value tree (definite lengths in the shortest form, unless `indefinite_length` is requested).
///
Bytes encode(const BerValue& value);

/// Appends the encoding of a value to the given buffer.
///
void encodeTo(const BerValue& value, Bytes& out);

/// Appends identifier and (definite) length octets.
///
void encodeHeaderTo(const TagClass      tag_class,
                    const std::uint32_t tag_number,
                    const bool          constructed,
                    const std::size_t   content_size,
                    Bytes&              out);

/// Wraps already encoded content octets into a constructed value.
///
Bytes wrap(const TagClass tag_class, const std::uint32_t tag_number, const BytesView content);

struct DecodeResult
{
    struct Success
    {
        BerValue    value;
        std::size_t consumed;
    };
    using Failure = sdk::error::MalformedEncoding;
    using Var     = cetl::variant<Success, Failure>;
};
/// Decodes one value from the front of the buffer.
///
/// Decoding never reads beyond `data`; every declared length is checked against the enclosing value
/// and against the remaining buffer.
///
DecodeResult::Var decode(const BytesView data);

/// Identifier and length octets of an encoded value.
///
struct Header final
{
    TagClass      tag_class;
    std::uint32_t tag_number;
    bool          constructed;
    bool          indefinite_length;
    std::size_t   header_size;
    std::size_t   content_size;  // zero for indefinite length
};

struct DecodeHeaderResult
{
    using Success = Header;
    using Failure = sdk::error::MalformedEncoding;
    using Var     = cetl::variant<Success, Failure>;
};
/// Decodes only the identifier and length octets (the content is not required to be present).
///
DecodeHeaderResult::Var decodeHeader(const BytesView data);

}  // namespace ber
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_BER_BER_CODEC_HPP_INCLUDED
