//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_MMS_SERVICES_HPP_INCLUDED
#define IECMMS_COMMON_MMS_SERVICES_HPP_INCLUDED

#include "mms_types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <vector>

namespace iecmms
{
namespace common
{
namespace mms
{

// MARK: - Common productions

BerValue               encodeObjectName(const ObjectName& name);
Parsed<ObjectName>     decodeObjectName(const BerValue& value);
BerValue               encodeVariableAccess(const VariableAccess& access);
Parsed<VariableAccess> decodeVariableAccess(const BerValue& value);

/// Decodes a `SEQUENCE OF AccessResult`.
///
Parsed<std::vector<AccessResult>> decodeAccessResults(const BerValue& list);

// MARK: - Service requests (the `ConfirmedServiceRequest` element)

BerValue buildStatusRequest();
BerValue buildGetNameListRequest(const GetNameListRequest& request);
BerValue buildIdentifyRequest();
BerValue buildReadRequest(const ReadRequest& request);
BerValue buildWriteRequest(const WriteRequest& request);
BerValue buildGetVariableAccessAttributesRequest(const ObjectName& name);
BerValue buildDefineNamedVariableListRequest(const DefineNamedVariableListRequest& request);
BerValue buildGetNamedVariableListAttributesRequest(const ObjectName& name);
BerValue buildDeleteNamedVariableListRequest(const ObjectName& name);

// MARK: - Service responses (the `ConfirmedServiceResponse` element)

Parsed<StatusResponse>                         parseStatusResponse(const BerValue& response);
Parsed<GetNameListResponse>                    parseGetNameListResponse(const BerValue& response);
Parsed<IdentifyResponse>                       parseIdentifyResponse(const BerValue& response);
Parsed<ReadResponse>                           parseReadResponse(const BerValue& response);
Parsed<WriteResponse>                          parseWriteResponse(const BerValue& response);
Parsed<GetVariableAccessAttributesResponse>    parseGetVariableAccessAttributesResponse(const BerValue& response);
Parsed<GetNamedVariableListAttributesResponse> parseGetNamedVariableListAttributesResponse(const BerValue& response);
Parsed<DeleteNamedVariableListResponse>        parseDeleteNamedVariableListResponse(const BerValue& response);

// MARK: - Unconfirmed services

/// Parses an `unconfirmed-PDU` carrying an information report.
///
Parsed<InformationReport> parseInformationReport(const BerValue& pdu);

}  // namespace mms
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_MMS_SERVICES_HPP_INCLUDED
