//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_MODEL_TYPE_DESCRIPTOR_HPP_INCLUDED
#define IECMMS_COMMON_MODEL_TYPE_DESCRIPTOR_HPP_INCLUDED

#include "ber/ber_value.hpp"
#include "mms/mms_types.hpp"

#include "iecmms/sdk/data_model.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <string>
#include <vector>

namespace iecmms
{
namespace common
{
namespace model
{

/// Builds a type descriptor from an MMS `TypeDescription` (as returned by GetVariableAccessAttributes).
///
mms::Parsed<sdk::TypeDescriptor::Ptr> parseTypeDescription(const ber::BerValue& description);

/// Finds the descriptor of a data object / attribute inside the type of a logical node.
///
/// @param ln_type Type of the whole logical node (components are functional constraints).
/// @param names Data object name followed by (sub)attribute names.
/// @return Null if there is no such component.
///
sdk::TypeDescriptor::Ptr findDescriptor(const sdk::TypeDescriptor::Ptr& ln_type,
                                        const sdk::FunctionalConstraint fc,
                                        const std::vector<std::string>& names);

/// Lists the functional constraints under which the given data object / attribute path exists.
///
std::vector<sdk::FunctionalConstraint> functionalConstraintsOf(const sdk::TypeDescriptor::Ptr& ln_type,
                                                               const std::vector<std::string>& names);

}  // namespace model
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_MODEL_TYPE_DESCRIPTOR_HPP_INCLUDED
