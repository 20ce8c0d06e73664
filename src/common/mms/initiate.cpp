//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "initiate.hpp"

#include "mms_types.hpp"
#include "pdu.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{
namespace mms
{
namespace
{

using ber::TagClass;

constexpr std::uint32_t LocalDetail          = 0;
constexpr std::uint32_t MaxServCalling       = 1;
constexpr std::uint32_t MaxServCalled        = 2;
constexpr std::uint32_t NestingLevel         = 3;
constexpr std::uint32_t InitDetail           = 4;
constexpr std::uint32_t VersionNumber        = 0;
constexpr std::uint32_t ParameterCbb         = 1;
constexpr std::uint32_t ServicesSupported    = 2;
constexpr std::size_t   ServicesBitCount     = 85;
constexpr std::size_t   ParameterCbbBitCount = 11;
constexpr std::size_t   InformationReportBit = 79;

/// Services the client may request (bit numbers of `ServiceSupportOptions`).
///
std::vector<bool> servicesSupported()
{
    std::vector<bool> bits(ServicesBitCount, false);
    for (const std::size_t service : {0U, 1U, 2U, 4U, 5U, 6U, 11U, 12U, 13U})
    {
        bits[service] = true;
    }
    bits[InformationReportBit] = true;
    return bits;
}

/// `ParameterSupportOptions`: str1, str2, vnam, valt, vlis.
///
std::vector<bool> parameterCbb()
{
    std::vector<bool> bits(ParameterCbbBitCount, false);
    for (const std::size_t option : {0U, 1U, 2U, 3U, 7U})
    {
        bits[option] = true;
    }
    return bits;
}

template <typename T>
cetl::optional<T> decodeBounded(const BerValue* const value)
{
    if (value == nullptr)
    {
        return cetl::nullopt;
    }
    const auto decoded = ber::decodeInteger(*value);
    if (!decoded.has_value() || (*decoded < std::numeric_limits<T>::min()) ||
        (*decoded > std::numeric_limits<T>::max()))
    {
        return cetl::nullopt;
    }
    return static_cast<T>(*decoded);
}

}  // namespace

BerValue buildInitiateRequest(const InitiateRequest& request)
{
    return BerValue::contextOf(  //
        static_cast<std::uint32_t>(PduType::InitiateRequest),
        {
            ber::makeInteger(TagClass::ContextSpecific, LocalDetail, request.local_detail_calling),
            ber::makeInteger(TagClass::ContextSpecific, MaxServCalling, request.max_serv_outstanding_calling),
            ber::makeInteger(TagClass::ContextSpecific, MaxServCalled, request.max_serv_outstanding_called),
            ber::makeInteger(TagClass::ContextSpecific, NestingLevel, request.data_structure_nesting_level),
            BerValue::contextOf(InitDetail,
                                {
                                    ber::makeInteger(TagClass::ContextSpecific, VersionNumber, 1),
                                    ber::makeBitString(TagClass::ContextSpecific, ParameterCbb, parameterCbb()),
                                    ber::makeBitString(TagClass::ContextSpecific,
                                                       ServicesSupported,
                                                       servicesSupported()),
                                }),
        });
}

Initiate::Var parseInitiateResponse(const BerValue& pdu)
{
    const auto type = pduType(pdu);
    if (type.has_value() && (*type == PduType::InitiateError))
    {
        auto parsed = parseServiceError(pdu, sdk::Service::Initiate, 0);
        if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&parsed))
        {
            return std::move(*failure);
        }
        return cetl::get<sdk::error::ServiceError>(std::move(parsed));
    }
    if (!type.has_value() || (*type != PduType::InitiateResponse))
    {
        return sdk::error::MalformedEncoding{"unexpected answer to initiate (tag=" + pdu.describeTag() + ")"};
    }

    InitiateResponse response{};

    // `localDetailCalled` is optional.
    if (const auto* const local_detail = pdu.findContext(LocalDetail))
    {
        const auto value = decodeBounded<std::int32_t>(local_detail);
        if (!value.has_value())
        {
            return sdk::error::MalformedEncoding{"initiate response with malformed local detail"};
        }
        response.local_detail_called = *value;
    }

    const auto calling = decodeBounded<std::int16_t>(pdu.findContext(MaxServCalling));
    const auto called  = decodeBounded<std::int16_t>(pdu.findContext(MaxServCalled));
    if (!calling.has_value() || !called.has_value() || (*calling < 1) || (*called < 1))
    {
        return sdk::error::MalformedEncoding{"initiate response with invalid outstanding services"};
    }
    response.max_serv_outstanding_calling = *calling;
    response.max_serv_outstanding_called  = *called;

    if (const auto* const nesting = pdu.findContext(NestingLevel))
    {
        response.data_structure_nesting_level = decodeBounded<std::int8_t>(nesting).value_or(0);
    }

    const auto* const detail = pdu.findContext(InitDetail);
    if (detail == nullptr)
    {
        return sdk::error::MalformedEncoding{"initiate response without detail"};
    }
    const auto version = decodeBounded<std::int16_t>(detail->findContext(VersionNumber));
    if (!version.has_value())
    {
        return sdk::error::MalformedEncoding{"initiate response without version"};
    }
    response.version = *version;

    return response;
}

BerValue buildConcludeRequest()
{
    return ber::makeNull(TagClass::ContextSpecific, static_cast<std::uint32_t>(PduType::ConcludeRequest));
}

Conclude::Var parseConcludeResponse(const BerValue& pdu)
{
    const auto type = pduType(pdu);
    if (type.has_value() && (*type == PduType::ConcludeResponse))
    {
        return sdk::Done{};
    }
    if (type.has_value() && (*type == PduType::ConcludeError))
    {
        auto parsed = parseServiceError(pdu, sdk::Service::Conclude, 0);
        if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&parsed))
        {
            return std::move(*failure);
        }
        return cetl::get<sdk::error::ServiceError>(std::move(parsed));
    }
    return sdk::error::MalformedEncoding{"unexpected answer to conclude (tag=" + pdu.describeTag() + ")"};
}

}  // namespace mms
}  // namespace common
}  // namespace iecmms
