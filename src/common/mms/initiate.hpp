//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_MMS_INITIATE_HPP_INCLUDED
#define IECMMS_COMMON_MMS_INITIATE_HPP_INCLUDED

#include "mms_types.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

namespace iecmms
{
namespace common
{
namespace mms
{

/// Builds an `initiate-RequestPDU` proposing version 1, the IEC 61850 parameter CBBs
/// and the services used by the client.
///
BerValue buildInitiateRequest(const InitiateRequest& request);

struct Initiate
{
    using Success = InitiateResponse;
    using Failure = sdk::Error;  // `ServiceError` for an initiate-ErrorPDU, otherwise `MalformedEncoding`
    using Var     = cetl::variant<Success, Failure>;
};
Initiate::Var parseInitiateResponse(const BerValue& pdu);

BerValue buildConcludeRequest();

struct Conclude
{
    using Success = sdk::Done;
    using Failure = sdk::Error;
    using Var     = cetl::variant<Success, Failure>;
};
Conclude::Var parseConcludeResponse(const BerValue& pdu);

}  // namespace mms
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_MMS_INITIATE_HPP_INCLUDED
