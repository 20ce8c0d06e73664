//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "pdu.hpp"

#include "mms_types.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <limits>
#include <utility>

namespace iecmms
{
namespace common
{
namespace mms
{
namespace
{

using ber::TagClass;
namespace universal = ber::universal;

constexpr std::uint32_t ServiceErrorClass  = 0;  // errorClass [0]
constexpr std::uint8_t  LastErrorClassCode = static_cast<std::uint8_t>(sdk::ErrorClass::Others);

cetl::optional<std::uint32_t> toInvokeId(const BerValue& value)
{
    const auto id = ber::decodeUnsigned(value);
    if (!id.has_value() || (*id > std::numeric_limits<std::uint32_t>::max()))
    {
        return cetl::nullopt;
    }
    return static_cast<std::uint32_t>(*id);
}

sdk::error::MalformedEncoding malformed(const char* const what, const BerValue& pdu)
{
    return sdk::error::MalformedEncoding{fmt::format("{} (tag={})", what, pdu.describeTag())};
}

}  // namespace

cetl::optional<PduType> pduType(const BerValue& pdu) noexcept
{
    if (pdu.tag_class != TagClass::ContextSpecific)
    {
        return cetl::nullopt;
    }
    switch (pdu.tag_number)
    {
    case static_cast<std::uint32_t>(PduType::ConfirmedRequest):
    case static_cast<std::uint32_t>(PduType::ConfirmedResponse):
    case static_cast<std::uint32_t>(PduType::ConfirmedError):
    case static_cast<std::uint32_t>(PduType::Unconfirmed):
    case static_cast<std::uint32_t>(PduType::Reject):
    case static_cast<std::uint32_t>(PduType::InitiateRequest):
    case static_cast<std::uint32_t>(PduType::InitiateResponse):
    case static_cast<std::uint32_t>(PduType::InitiateError):
    case static_cast<std::uint32_t>(PduType::ConcludeRequest):
    case static_cast<std::uint32_t>(PduType::ConcludeResponse):
    case static_cast<std::uint32_t>(PduType::ConcludeError):
        return static_cast<PduType>(pdu.tag_number);
    default:
        return cetl::nullopt;
    }
}

cetl::optional<std::uint32_t> peekInvokeId(const BerValue& pdu)
{
    const auto type = pduType(pdu);
    if (!type.has_value() || pdu.children.empty())
    {
        return cetl::nullopt;
    }
    switch (*type)
    {
    case PduType::ConfirmedRequest:
    case PduType::ConfirmedResponse: {
        const auto& id = pdu.children.front();
        return id.is(TagClass::Universal, universal::Integer) ? toInvokeId(id) : cetl::nullopt;
    }
    case PduType::ConfirmedError:
    case PduType::Reject: {
        const auto* const id = pdu.findContext(0);
        return (id != nullptr) ? toInvokeId(*id) : cetl::nullopt;
    }
    default:
        return cetl::nullopt;
    }
}

sdk::Service toService(const std::uint32_t tag_number) noexcept
{
    switch (tag_number)
    {
    case static_cast<std::uint32_t>(sdk::Service::Status):
    case static_cast<std::uint32_t>(sdk::Service::GetNameList):
    case static_cast<std::uint32_t>(sdk::Service::Identify):
    case static_cast<std::uint32_t>(sdk::Service::Read):
    case static_cast<std::uint32_t>(sdk::Service::Write):
    case static_cast<std::uint32_t>(sdk::Service::GetVariableAccessAttributes):
    case static_cast<std::uint32_t>(sdk::Service::DefineNamedVariableList):
    case static_cast<std::uint32_t>(sdk::Service::GetNamedVariableListAttributes):
    case static_cast<std::uint32_t>(sdk::Service::DeleteNamedVariableList):
        return static_cast<sdk::Service>(tag_number);
    default:
        return sdk::Service::Unknown;
    }
}

BerValue buildConfirmedRequest(const std::uint32_t invoke_id, BerValue service_request)
{
    return BerValue::contextOf(  //
        static_cast<std::uint32_t>(PduType::ConfirmedRequest),
        {ber::makeInteger(TagClass::Universal, universal::Integer, invoke_id), std::move(service_request)});
}

ConfirmedResponse::Var parseConfirmedResponse(const BerValue&     pdu,
                                              const sdk::Service  expected,
                                              const std::uint32_t invoke_id)
{
    const auto type = pduType(pdu);
    if (!type.has_value() || !pdu.constructed)
    {
        return malformed("unexpected MMS PDU", pdu);
    }

    switch (*type)
    {
    case PduType::ConfirmedResponse: {
        if (pdu.children.size() < 2)
        {
            return malformed("confirmed response without service", pdu);
        }
        const auto& service = pdu.children[1];
        if ((service.tag_class != TagClass::ContextSpecific) || (toService(service.tag_number) != expected))
        {
            return sdk::error::UnsupportedService{toService(service.tag_number), invoke_id};
        }
        return service;
    }
    case PduType::ConfirmedError: {
        const auto* const service_error = pdu.findContext(2);
        if (service_error == nullptr)
        {
            return malformed("confirmed error without service error", pdu);
        }
        auto parsed = parseServiceError(*service_error, expected, invoke_id);
        if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&parsed))
        {
            return std::move(*failure);
        }
        return cetl::get<sdk::error::ServiceError>(std::move(parsed));
    }
    case PduType::Reject: {
        sdk::error::Reject reject{};
        for (const auto& child : pdu.children)
        {
            if (child.tag_class != TagClass::ContextSpecific)
            {
                continue;
            }
            if (child.tag_number == 0)
            {
                reject.invoke_id = toInvokeId(child);
                continue;
            }
            const auto code = ber::decodeInteger(child);
            if (!code.has_value())
            {
                return malformed("reject with malformed reason", pdu);
            }
            reject.reject_class = static_cast<std::uint8_t>(child.tag_number);
            reject.code         = *code;
        }
        if (reject.reject_class == 0)
        {
            return malformed("reject without reason", pdu);
        }
        return reject;
    }
    default:
        return malformed("unexpected MMS PDU", pdu);
    }
}

Parsed<sdk::error::ServiceError> parseServiceError(const BerValue&     service_error,
                                                   const sdk::Service  service,
                                                   const std::uint32_t invoke_id)
{
    const auto* const error_class = service_error.findContext(ServiceErrorClass);
    if ((error_class == nullptr) || error_class->children.empty())
    {
        return malformed("service error without class", service_error);
    }
    const auto& class_choice = error_class->children.front();
    if ((class_choice.tag_class != TagClass::ContextSpecific) || (class_choice.tag_number > LastErrorClassCode))
    {
        return malformed("service error with unknown class", class_choice);
    }
    const auto code = ber::decodeInteger(class_choice);
    if (!code.has_value())
    {
        return malformed("service error with malformed code", class_choice);
    }

    const auto cls = static_cast<sdk::ErrorClass>(class_choice.tag_number);
    return sdk::error::ServiceError{service, invoke_id, cls, *code, sdk::categorize(cls, *code)};
}

}  // namespace mms
}  // namespace common
}  // namespace iecmms
