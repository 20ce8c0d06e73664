//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_ISO_COTP_HPP_INCLUDED
#define IECMMS_COMMON_ISO_COTP_HPP_INCLUDED

#include "ber/ber_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace iecmms
{
namespace common
{
namespace iso
{

using ber::Bytes;
using ber::BytesView;

/// RFC 1006 TPKT framing and ISO 8073 (class 0) transport protocol data units.
///
namespace cotp
{

constexpr std::size_t  TpktHeaderSize = 4;
constexpr std::uint8_t TpktVersion    = 3;

/// TPDU size code proposed by the client (2^13 = 8192 octets).
constexpr std::uint8_t DefaultTpduSizeCode = 0x0D;

/// Prepends the TPKT header to a TPDU.
///
Bytes wrapTpkt(const BytesView tpdu);

/// Reassembles TPKTs out of the received byte stream.
///
class TpktReassembler final
{
public:
    void feed(const BytesView data);

    struct Next
    {
        using Success = cetl::optional<Bytes>;  // TPDU (without TPKT header), if complete
        using Failure = int;                    // EPROTO on a framing violation
        using Var     = cetl::variant<Success, Failure>;
    };
    Next::Var next();

private:
    Bytes buffer_;

};  // TpktReassembler

struct ConnectParams final
{
    std::uint16_t source_reference{1};
    std::uint8_t  tpdu_size_code{DefaultTpduSizeCode};
    Bytes         calling_tsap{0x00, 0x01};
    Bytes         called_tsap{0x00, 0x01};
};

/// Builds a Connection Request TPDU.
///
Bytes buildConnectionRequest(const ConnectParams& params);

struct Tpdu final
{
    enum class Type : std::uint8_t
    {
        ConnectionRequest = 0xE0,
        ConnectionConfirm = 0xD0,
        DisconnectRequest = 0x80,
        Data              = 0xF0,
        Error             = 0x70,
    };

    Type                         type;
    bool                         end_of_transmission{false};
    cetl::optional<std::uint8_t> tpdu_size_code;  // CC only
    std::uint8_t                 reason{0};       // DR only
    Bytes                        user_data;       // DT only
};

struct ParseResult
{
    using Success = Tpdu;
    using Failure = int;  // EPROTO
    using Var     = cetl::variant<Success, Failure>;
};
ParseResult::Var parseTpdu(const BytesView tpdu);

/// Splits a payload into Data TPDUs (each already TPKT-wrapped) limited by the negotiated TPDU size.
///
std::vector<Bytes> buildDataTpkts(const BytesView payload, const std::size_t max_tpdu_size);

/// Converts a TPDU size code to the size in octets.
///
std::size_t tpduSize(const std::uint8_t size_code) noexcept;

}  // namespace cotp
}  // namespace iso
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_ISO_COTP_HPP_INCLUDED
