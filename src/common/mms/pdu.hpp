//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_MMS_PDU_HPP_INCLUDED
#define IECMMS_COMMON_MMS_PDU_HPP_INCLUDED

#include "mms_types.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>

namespace iecmms
{
namespace common
{
namespace mms
{

/// Alternatives of `MMSpdu` (their context tag numbers).
///
enum class PduType : std::uint8_t
{
    ConfirmedRequest  = 0,
    ConfirmedResponse = 1,
    ConfirmedError    = 2,
    Unconfirmed       = 3,
    Reject            = 4,
    InitiateRequest   = 8,
    InitiateResponse  = 9,
    InitiateError     = 10,
    ConcludeRequest   = 11,
    ConcludeResponse  = 12,
    ConcludeError     = 13,
};

cetl::optional<PduType> pduType(const BerValue& pdu) noexcept;

/// Gets the invoke-ID of a confirmed response, confirmed error or reject PDU (if it has one).
///
cetl::optional<std::uint32_t> peekInvokeId(const BerValue& pdu);

/// Maps a confirmed service tag number to the known service (or `Service::Unknown`).
///
sdk::Service toService(const std::uint32_t tag_number) noexcept;

/// Builds a `confirmed-RequestPDU` around a service request.
///
BerValue buildConfirmedRequest(const std::uint32_t invoke_id, BerValue service_request);

struct ConfirmedResponse
{
    using Success = BerValue;  // the service response element
    using Failure = sdk::Error;
    using Var     = cetl::variant<Success, Failure>;
};
/// Interprets the answer to a confirmed request.
///
/// Confirmed errors become `ServiceError`, rejects become `Reject`, a response of another service
/// becomes `UnsupportedService`, and anything undecodable `MalformedEncoding`.
///
ConfirmedResponse::Var parseConfirmedResponse(const BerValue&     pdu,
                                              const sdk::Service  expected,
                                              const std::uint32_t invoke_id);

/// Decodes a `ServiceError` (as carried by confirmed, initiate and conclude errors).
///
Parsed<sdk::error::ServiceError> parseServiceError(const BerValue&     service_error,
                                                   const sdk::Service  service,
                                                   const std::uint32_t invoke_id);

}  // namespace mms
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_MMS_PDU_HPP_INCLUDED
