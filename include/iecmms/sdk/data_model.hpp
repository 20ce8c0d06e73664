//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_DATA_MODEL_HPP_INCLUDED
#define IECMMS_SDK_DATA_MODEL_HPP_INCLUDED

#include "typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace iecmms
{
namespace sdk
{

/// IEC 61850 functional constraints.
///
enum class FunctionalConstraint : std::uint8_t
{
    ST = 0,   // status information
    MX = 1,   // measurands
    SP = 2,   // setpoint
    SV = 3,   // substitution
    CF = 4,   // configuration
    DC = 5,   // description
    SG = 6,   // setting group
    SE = 7,   // setting group editable
    SR = 8,   // service response
    OR = 9,   // operate received
    BL = 10,  // blocking
    EX = 11,  // extended definition
    CO = 12,  // control
    US = 13,  // unicode string
    MS = 14,  // multicast sampled value control
    RP = 15,  // unbuffered report control
    BR = 16,  // buffered report control
    LG = 17,  // log control
    GO = 18,  // goose control

};  // FunctionalConstraint

const char*                          toString(const FunctionalConstraint fc) noexcept;
cetl::optional<FunctionalConstraint> parseFunctionalConstraint(const std::string& str) noexcept;

/// One node of the Server / LD / LN / DO / DA hierarchy.
///
/// Parent owns its children. Nodes produced by lazy discovery which were not walked yet
/// have `expanded == false` and no children.
///
struct DataModelNode final
{
    enum class Kind : std::uint8_t
    {
        Server,
        LogicalDevice,
        LogicalNode,
        DataObject,
        DataAttribute,
    };

    Kind kind{Kind::Server};

    /// Qualified name segments, e.g. `{"D1", "LLN0", "Mod", "stVal"}`.
    std::vector<std::string> path;

    /// Only for data attributes.
    cetl::optional<FunctionalConstraint> fc;
    TypeDescriptor::Ptr                  type;

    std::vector<DataModelNode> children;

    /// Last value read through the client (if any).
    cetl::optional<TypedValue> value;

    bool expanded{false};

    std::string name() const
    {
        return path.empty() ? std::string{} : path.back();
    }

    /// IEC 61850 object reference of the node, e.g. `D1/LLN0.Mod.stVal`.
    ///
    std::string reference() const;

    /// Finds a direct child by name, optionally restricted to a functional constraint.
    ///
    const DataModelNode* findChild(const std::string&                          child_name,
                                   const cetl::optional<FunctionalConstraint>& child_fc = cetl::nullopt) const;
    DataModelNode*       findChild(const std::string&                          child_name,
                                   const cetl::optional<FunctionalConstraint>& child_fc = cetl::nullopt);

};  // DataModelNode

const char* toString(const DataModelNode::Kind kind) noexcept;

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_DATA_MODEL_HPP_INCLUDED
