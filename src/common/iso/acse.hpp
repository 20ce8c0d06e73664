//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_ISO_ACSE_HPP_INCLUDED
#define IECMMS_COMMON_ISO_ACSE_HPP_INCLUDED

#include "ber/ber_value.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace iecmms
{
namespace common
{
namespace iso
{

/// ISO 8650 association control (AARQ / AARE).
///
namespace acse
{

using ber::BerValue;

/// Builds an AARQ APDU for the MMS application context.
///
/// @param initiate The MMS initiate-RequestPDU carried as the user information.
/// @param password Password for the authentication functional unit (omitted when empty).
///
BerValue buildAarq(const BerValue& initiate, const std::string& password);

struct Aare
{
    using Success = BerValue;  // the MMS initiate-ResponsePDU (or initiate-ErrorPDU)
    using Failure = sdk::error::Connect;
    using Var     = cetl::variant<Success, Failure>;
};
/// Checks the association result of an AARE APDU and extracts its user information.
///
Aare::Var parseAare(const BerValue& aare);

}  // namespace acse
}  // namespace iso
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_ISO_ACSE_HPP_INCLUDED
