//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_ISO_SESSION_LAYER_HPP_INCLUDED
#define IECMMS_COMMON_ISO_SESSION_LAYER_HPP_INCLUDED

#include "ber/ber_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>

namespace iecmms
{
namespace common
{
namespace iso
{

/// ISO 8327 (kernel, full duplex) session protocol data units.
///
namespace session_layer
{

using ber::Bytes;
using ber::BytesView;

enum class SpduType : std::uint8_t
{
    GiveTokens = 0x01,  // also the data transfer SPDU (category 0 concatenation)
    Finish     = 0x09,
    Disconnect = 0x0A,
    Refuse     = 0x0C,
    Connect    = 0x0D,
    Accept     = 0x0E,
    Abort      = 0x19,
};

/// Builds a Connect SPDU carrying the given presentation user data.
///
Bytes buildConnect(const BytesView user_data);

/// Builds the Give Tokens + Data Transfer SPDU pair around a presentation PDU.
///
Bytes buildData(const BytesView ppdu);

Bytes buildFinish(const BytesView user_data);
Bytes buildAbort();

struct Spdu final
{
    SpduType type;
    Bytes    user_data;
};

struct ParseResult
{
    using Success = Spdu;
    using Failure = int;  // EPROTO
    using Var     = cetl::variant<Success, Failure>;
};
ParseResult::Var parseSpdu(const BytesView spdu);

}  // namespace session_layer
}  // namespace iso
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_ISO_SESSION_LAYER_HPP_INCLUDED
