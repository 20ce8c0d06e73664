//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_ISO_PRESENTATION_HPP_INCLUDED
#define IECMMS_COMMON_ISO_PRESENTATION_HPP_INCLUDED

#include "ber/ber_value.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>

namespace iecmms
{
namespace common
{
namespace iso
{

/// ISO 8823 presentation layer (normal mode, BER transfer syntax).
///
namespace presentation
{

using ber::BerValue;
using ber::Bytes;
using ber::BytesView;

/// Presentation context of the ACSE PDUs.
constexpr std::int64_t AcseContextId = 1;
/// Presentation context of the MMS PDUs.
constexpr std::int64_t MmsContextId = 3;

/// Builds the CP-type PPDU which proposes the ACSE and MMS contexts and carries the AARQ.
///
Bytes buildConnectPpdu(const BerValue& aarq);

struct ConnectAccept
{
    using Success = BerValue;  // the AARE APDU
    using Failure = sdk::error::Connect;
    using Var     = cetl::variant<Success, Failure>;
};
/// Parses a CPA-type PPDU (or reports the CPR-type rejection).
///
ConnectAccept::Var parseConnectAccept(const BytesView ppdu);

/// Wraps an encoded MMS PDU into the fully encoded user data of the MMS presentation context.
///
Bytes wrapUserData(const BytesView mms_pdu);

struct UserData
{
    using Success = Bytes;  // the encoded MMS PDU
    using Failure = sdk::error::MalformedEncoding;
    using Var     = cetl::variant<Success, Failure>;
};
/// Extracts the (still encoded) MMS PDU from a P-DATA user data.
///
UserData::Var extractUserData(const BytesView ppdu);

}  // namespace presentation
}  // namespace iso
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_ISO_PRESENTATION_HPP_INCLUDED
