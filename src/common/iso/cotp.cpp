//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cotp.hpp"

#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{
namespace iso
{
namespace cotp
{
namespace
{

constexpr std::uint8_t ParamTpduSize    = 0xC0;
constexpr std::uint8_t ParamCallingTsap = 0xC1;
constexpr std::uint8_t ParamCalledTsap  = 0xC2;
constexpr std::uint8_t EotFlag          = 0x80;
constexpr std::uint8_t MinTpduSizeCode  = 0x07;
constexpr std::uint8_t MaxTpduSizeCode  = 0x0D;

/// Fixed part of a DT TPDU: length indicator, code and EOT/number.
constexpr std::size_t DataHeaderSize = 3;

}  // namespace

Bytes wrapTpkt(const BytesView tpdu)
{
    const std::size_t total = tpdu.size() + TpktHeaderSize;

    Bytes out;
    out.reserve(total);
    out.push_back(TpktVersion);
    out.push_back(0);
    out.push_back(static_cast<std::uint8_t>(total >> 8U));
    out.push_back(static_cast<std::uint8_t>(total));
    out.insert(out.end(), tpdu.begin(), tpdu.end());
    return out;
}

void TpktReassembler::feed(const BytesView data)
{
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

TpktReassembler::Next::Var TpktReassembler::next()
{
    if (buffer_.size() < TpktHeaderSize)
    {
        return Next::Success{};
    }
    if ((buffer_[0] != TpktVersion) || (buffer_[1] != 0))
    {
        getLogger("iso")->warn("Invalid TPKT header (version={}).", buffer_[0]);
        return EPROTO;
    }
    const std::size_t total = (static_cast<std::size_t>(buffer_[2]) << 8U) | buffer_[3];
    if (total <= TpktHeaderSize)
    {
        getLogger("iso")->warn("Invalid TPKT length (len={}).", total);
        return EPROTO;
    }
    if (buffer_.size() < total)
    {
        return Next::Success{};
    }

    Bytes tpdu{buffer_.begin() + TpktHeaderSize, buffer_.begin() + static_cast<std::ptrdiff_t>(total)};
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(total));
    return Next::Success{std::move(tpdu)};
}

Bytes buildConnectionRequest(const ConnectParams& params)
{
    Bytes tpdu{0,  // length indicator - patched below
               static_cast<std::uint8_t>(Tpdu::Type::ConnectionRequest),
               0x00,
               0x00,  // destination reference
               static_cast<std::uint8_t>(params.source_reference >> 8U),
               static_cast<std::uint8_t>(params.source_reference),
               0x00};  // class 0, no options

    tpdu.push_back(ParamTpduSize);
    tpdu.push_back(1);
    tpdu.push_back(params.tpdu_size_code);

    tpdu.push_back(ParamCallingTsap);
    tpdu.push_back(static_cast<std::uint8_t>(params.calling_tsap.size()));
    tpdu.insert(tpdu.end(), params.calling_tsap.begin(), params.calling_tsap.end());

    tpdu.push_back(ParamCalledTsap);
    tpdu.push_back(static_cast<std::uint8_t>(params.called_tsap.size()));
    tpdu.insert(tpdu.end(), params.called_tsap.begin(), params.called_tsap.end());

    tpdu[0] = static_cast<std::uint8_t>(tpdu.size() - 1);
    return tpdu;
}

ParseResult::Var parseTpdu(const BytesView tpdu)
{
    if (tpdu.size() < 2)
    {
        return EPROTO;
    }
    const std::size_t header_len = tpdu[0];
    if ((header_len + 1) > tpdu.size())
    {
        return EPROTO;
    }

    Tpdu result{};
    switch (tpdu[1] & 0xF0U)
    {
    case static_cast<std::uint8_t>(Tpdu::Type::Data): {
        if (header_len != 2)
        {
            return EPROTO;
        }
        result.type                = Tpdu::Type::Data;
        result.end_of_transmission = (tpdu[2] & EotFlag) != 0;
        result.user_data.assign(tpdu.begin() + DataHeaderSize, tpdu.end());
        return result;
    }
    case static_cast<std::uint8_t>(Tpdu::Type::ConnectionConfirm): {
        // LI, code, dst-ref(2), src-ref(2), class, then variable part.
        constexpr std::size_t fixed_part = 7;
        if ((header_len + 1) < fixed_part)
        {
            return EPROTO;
        }
        result.type = Tpdu::Type::ConnectionConfirm;

        std::size_t pos = fixed_part;
        while ((pos + 2) <= (header_len + 1))
        {
            const std::uint8_t code = tpdu[pos];
            const std::size_t  len  = tpdu[pos + 1];
            if ((pos + 2 + len) > (header_len + 1))
            {
                return EPROTO;
            }
            if ((code == ParamTpduSize) && (len == 1))
            {
                result.tpdu_size_code = tpdu[pos + 2];
            }
            pos += 2 + len;
        }
        return result;
    }
    case static_cast<std::uint8_t>(Tpdu::Type::DisconnectRequest): {
        result.type   = Tpdu::Type::DisconnectRequest;
        result.reason = (header_len >= 6) ? tpdu[6] : 0;
        return result;
    }
    case static_cast<std::uint8_t>(Tpdu::Type::Error): {
        result.type = Tpdu::Type::Error;
        return result;
    }
    case static_cast<std::uint8_t>(Tpdu::Type::ConnectionRequest): {
        result.type = Tpdu::Type::ConnectionRequest;
        return result;
    }
    default: {
        getLogger("iso")->warn("Unknown TPDU code (code=0x{:02X}).", tpdu[1]);
        return EPROTO;
    }
    }
}

std::vector<Bytes> buildDataTpkts(const BytesView payload, const std::size_t max_tpdu_size)
{
    const std::size_t chunk_size = std::max<std::size_t>(max_tpdu_size, DataHeaderSize + 1) - DataHeaderSize;

    std::vector<Bytes> tpkts;
    std::size_t        offset = 0;
    do
    {
        const std::size_t chunk = std::min(chunk_size, payload.size() - offset);
        const bool        last  = (offset + chunk) == payload.size();

        Bytes tpdu{2, static_cast<std::uint8_t>(Tpdu::Type::Data), static_cast<std::uint8_t>(last ? EotFlag : 0)};
        tpdu.insert(tpdu.end(), payload.begin() + offset, payload.begin() + offset + chunk);
        tpkts.push_back(wrapTpkt(ber::view(tpdu)));

        offset += chunk;
    } while (offset < payload.size());

    return tpkts;
}

std::size_t tpduSize(const std::uint8_t size_code) noexcept
{
    const auto code = std::min(std::max(size_code, MinTpduSizeCode), MaxTpduSizeCode);
    return std::size_t{1} << code;
}

}  // namespace cotp
}  // namespace iso
}  // namespace common
}  // namespace iecmms
