//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_MODEL_DATA_MODEL_BUILDER_HPP_INCLUDED
#define IECMMS_COMMON_MODEL_DATA_MODEL_BUILDER_HPP_INCLUDED

#include "iecmms/sdk/data_model.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <vector>

namespace iecmms
{
namespace common
{
namespace model
{

/// Makes a node which is not walked yet.
///
sdk::DataModelNode makeNode(const sdk::DataModelNode::Kind kind, std::vector<std::string> path);

/// Builds the fully expanded node of a logical node from its MMS type.
///
/// The components of the LN type are functional constraints; data objects are merged across them,
/// and each data attribute is tagged with its functional constraint and type.
///
sdk::DataModelNode buildLogicalNode(const std::string&              logical_device,
                                    const std::string&              logical_node,
                                    const sdk::TypeDescriptor::Ptr& ln_type);

/// Walks the tree by name segments (relative to the root), optionally matching the FC of the last one.
///
const sdk::DataModelNode* findNode(const sdk::DataModelNode&                        root,
                                   const std::vector<std::string>&                  segments,
                                   const cetl::optional<sdk::FunctionalConstraint>& fc = cetl::nullopt);
sdk::DataModelNode*       findNode(sdk::DataModelNode&                              root,
                                   const std::vector<std::string>&                  segments,
                                   const cetl::optional<sdk::FunctionalConstraint>& fc = cetl::nullopt);

}  // namespace model
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_MODEL_DATA_MODEL_BUILDER_HPP_INCLUDED
