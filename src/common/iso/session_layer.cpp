//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "session_layer.hpp"

#include "logging.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>

namespace iecmms
{
namespace common
{
namespace iso
{
namespace session_layer
{
namespace
{

constexpr std::uint8_t PgiConnectAcceptItem = 0x05;
constexpr std::uint8_t PiProtocolOptions    = 0x13;
constexpr std::uint8_t PiVersionNumber      = 0x16;
constexpr std::uint8_t PiSessionRequirement = 0x14;
constexpr std::uint8_t PiCallingSsap        = 0x33;
constexpr std::uint8_t PiCalledSsap         = 0x34;
constexpr std::uint8_t PiUserData           = 0xC1;
constexpr std::uint8_t PiExtendedUserData   = 0xC2;
constexpr std::uint8_t PiTransportDisc      = 0x11;

constexpr std::uint8_t ExtendedLength = 0xFF;
constexpr std::size_t  MaxShortLength = 254;

void appendLength(const std::size_t length, Bytes& out)
{
    if (length > MaxShortLength)
    {
        out.push_back(ExtendedLength);
        out.push_back(static_cast<std::uint8_t>(length >> 8U));
        out.push_back(static_cast<std::uint8_t>(length));
    }
    else
    {
        out.push_back(static_cast<std::uint8_t>(length));
    }
}

void appendParameter(const std::uint8_t code, const BytesView value, Bytes& out)
{
    out.push_back(code);
    appendLength(value.size(), out);
    out.insert(out.end(), value.begin(), value.end());
}

Bytes makeSpdu(const SpduType type, const Bytes& parameters)
{
    Bytes spdu{static_cast<std::uint8_t>(type)};
    appendLength(parameters.size(), spdu);
    spdu.insert(spdu.end(), parameters.begin(), parameters.end());
    return spdu;
}

struct LengthResult
{
    std::size_t value;
    std::size_t size;
};

/// Reads a one or three octet length indicator at `pos`.
///
cetl::optional<LengthResult> readLength(const BytesView data, const std::size_t pos)
{
    if (pos >= data.size())
    {
        return cetl::nullopt;
    }
    if (data[pos] != ExtendedLength)
    {
        return LengthResult{data[pos], 1};
    }
    if ((pos + 3) > data.size())
    {
        return cetl::nullopt;
    }
    return LengthResult{(static_cast<std::size_t>(data[pos + 1]) << 8U) | data[pos + 2], 3};
}

/// Searches the (possibly PGI nested) parameters for the user data.
///
bool findUserData(const BytesView params, Bytes& user_data)
{
    std::size_t pos = 0;
    while (pos < params.size())
    {
        const std::uint8_t code   = params[pos];
        const auto         length = readLength(params, pos + 1);
        if (!length)
        {
            return false;
        }
        const std::size_t value_pos = pos + 1 + length->size;
        if ((value_pos + length->value) > params.size())
        {
            return false;
        }
        const BytesView value{params.data() + value_pos, length->value};

        if ((code == PiUserData) || (code == PiExtendedUserData))
        {
            user_data.assign(value.begin(), value.end());
            return true;
        }
        pos = value_pos + length->value;
    }
    return true;
}

}  // namespace

Bytes buildConnect(const BytesView user_data)
{
    Bytes params;

    // Connect/Accept item: protocol options and version 2.
    const Bytes accept_item{PiProtocolOptions, 1, 0x00, PiVersionNumber, 1, 0x02};
    appendParameter(PgiConnectAcceptItem, ber::view(accept_item), params);

    const Bytes requirement{0x00, 0x02};  // duplex
    appendParameter(PiSessionRequirement, ber::view(requirement), params);

    const Bytes ssap{0x00, 0x01};
    appendParameter(PiCallingSsap, ber::view(ssap), params);
    appendParameter(PiCalledSsap, ber::view(ssap), params);

    appendParameter(PiUserData, user_data, params);

    return makeSpdu(SpduType::Connect, params);
}

Bytes buildData(const BytesView ppdu)
{
    Bytes spdu{static_cast<std::uint8_t>(SpduType::GiveTokens), 0x00, 0x01, 0x00};
    spdu.insert(spdu.end(), ppdu.begin(), ppdu.end());
    return spdu;
}

Bytes buildFinish(const BytesView user_data)
{
    Bytes params;
    const Bytes disc{0x01};  // release transport connection
    appendParameter(PiTransportDisc, ber::view(disc), params);
    if (!user_data.empty())
    {
        appendParameter(PiUserData, user_data, params);
    }
    return makeSpdu(SpduType::Finish, params);
}

Bytes buildAbort()
{
    Bytes params;
    const Bytes disc{0x03};  // release transport, user abort
    appendParameter(PiTransportDisc, ber::view(disc), params);
    return makeSpdu(SpduType::Abort, params);
}

ParseResult::Var parseSpdu(const BytesView spdu)
{
    if (spdu.size() < 2)
    {
        return EPROTO;
    }

    const auto type = spdu[0];
    switch (type)
    {
    case static_cast<std::uint8_t>(SpduType::GiveTokens): {
        // Give Tokens (length 0) followed by Data Transfer (01 00) and the user data.
        if ((spdu.size() < 4) || (spdu[1] != 0) || (spdu[2] != 0x01) || (spdu[3] != 0))
        {
            getLogger("iso")->warn("Unexpected data transfer SPDU layout.");
            return EPROTO;
        }
        return Spdu{SpduType::GiveTokens, Bytes{spdu.begin() + 4, spdu.end()}};
    }
    case static_cast<std::uint8_t>(SpduType::Accept):
    case static_cast<std::uint8_t>(SpduType::Refuse):
    case static_cast<std::uint8_t>(SpduType::Finish):
    case static_cast<std::uint8_t>(SpduType::Disconnect):
    case static_cast<std::uint8_t>(SpduType::Abort):
    case static_cast<std::uint8_t>(SpduType::Connect): {
        const auto length = readLength(spdu, 1);
        if (!length || ((1 + length->size + length->value) > spdu.size()))
        {
            return EPROTO;
        }
        Spdu result{static_cast<SpduType>(type), {}};
        const BytesView params{spdu.data() + 1 + length->size, length->value};
        if (!findUserData(params, result.user_data))
        {
            return EPROTO;
        }
        return result;
    }
    default: {
        getLogger("iso")->warn("Unsupported SPDU (type=0x{:02X}).", type);
        return EPROTO;
    }
    }
}

}  // namespace session_layer
}  // namespace iso
}  // namespace common
}  // namespace iecmms
