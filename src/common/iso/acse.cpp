//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "acse.hpp"

#include "iso/presentation.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{
namespace iso
{
namespace acse
{
namespace
{

using ber::Bytes;
using ber::TagClass;
namespace universal = ber::universal;

constexpr std::uint32_t AarqTag            = 0;   // [APPLICATION 0]
constexpr std::uint32_t AareTag            = 1;   // [APPLICATION 1]
constexpr std::uint32_t ApplicationContext = 1;   // [1]
constexpr std::uint32_t Result             = 2;   // [2]
constexpr std::uint32_t ResultDiagnostic   = 3;   // [3]
constexpr std::uint32_t SenderRequirements = 10;  // [10]
constexpr std::uint32_t MechanismName      = 11;  // [11]
constexpr std::uint32_t CallingAuthValue   = 12;  // [12]
constexpr std::uint32_t UserInformation    = 30;  // [30]

sdk::error::Connect rejected(std::string detail)
{
    return sdk::error::Connect{sdk::ConnectError::AssociationRejected, std::move(detail)};
}

}  // namespace

BerValue buildAarq(const BerValue& initiate, const std::string& password)
{
    std::vector<BerValue> fields;
    fields.push_back(BerValue::contextOf(  //
        ApplicationContext,
        {ber::makeObjectIdentifier(TagClass::Universal, universal::ObjectIdentifier, {1, 0, 9506, 2, 3})}));

    if (!password.empty())
    {
        // authentication functional unit, password mechanism (2.2.3.1)
        fields.push_back(ber::makeBitString(TagClass::ContextSpecific, SenderRequirements, {true}));
        fields.push_back(ber::makeObjectIdentifier(TagClass::ContextSpecific, MechanismName, {2, 2, 3, 1}));
        fields.push_back(
            BerValue::contextOf(CallingAuthValue, {ber::makeString(TagClass::ContextSpecific, 0, password)}));
    }

    fields.push_back(BerValue::contextOf(  //
        UserInformation,
        {BerValue::constructedOf(TagClass::Universal,
                                 universal::External,
                                 {
                                     ber::makeInteger(TagClass::Universal,
                                                      universal::Integer,
                                                      presentation::MmsContextId),  // indirect-reference
                                     BerValue::contextOf(0, {initiate}),            // single-ASN1-type
                                 })}));

    return BerValue::constructedOf(TagClass::Application, AarqTag, std::move(fields));
}

Aare::Var parseAare(const BerValue& aare)
{
    if (!aare.is(TagClass::Application, AareTag) || !aare.constructed)
    {
        return rejected(fmt::format("unexpected ACSE APDU (tag={})", aare.describeTag()));
    }

    const auto* const result = aare.findContext(Result);
    if ((result == nullptr) || result->children.empty())
    {
        return rejected("AARE without result");
    }
    const auto code = ber::decodeInteger(result->children.front());
    if (!code.has_value())
    {
        return rejected("AARE with malformed result");
    }
    if (*code != 0)
    {
        std::int64_t diagnostic = -1;
        if (const auto* const source = aare.findContext(ResultDiagnostic))
        {
            if (!source->children.empty() && !source->children.front().children.empty())
            {
                diagnostic = ber::decodeInteger(source->children.front().children.front()).value_or(-1);
            }
        }
        return rejected(fmt::format("association rejected (result={}, diagnostic={})", *code, diagnostic));
    }

    const auto* const user_info = aare.findContext(UserInformation);
    if ((user_info == nullptr) || user_info->children.empty())
    {
        return rejected("AARE without user information");
    }
    const auto* const single_type = user_info->children.front().findContext(0);
    if ((single_type == nullptr) || single_type->children.empty())
    {
        return rejected("AARE without MMS initiate response");
    }
    return single_type->children.front();
}

}  // namespace acse
}  // namespace iso
}  // namespace common
}  // namespace iecmms
