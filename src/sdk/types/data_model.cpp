//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "iecmms/sdk/data_model.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cstddef>
#include <string>

namespace iecmms
{
namespace sdk
{
namespace
{

constexpr std::array<const char*, 19> FcNames{
    {"ST", "MX", "SP", "SV", "CF", "DC", "SG", "SE", "SR", "OR", "BL", "EX", "CO", "US", "MS", "RP", "BR", "LG", "GO"}};

template <typename Node>
Node* findChildImpl(Node& node, const std::string& child_name, const cetl::optional<FunctionalConstraint>& child_fc)
{
    for (auto& child : node.children)
    {
        if (child.name() != child_name)
        {
            continue;
        }
        if (child_fc.has_value() && child.fc.has_value() && (*child.fc != *child_fc))
        {
            continue;
        }
        return &child;
    }
    return nullptr;
}

}  // namespace

const char* toString(const FunctionalConstraint fc) noexcept
{
    const auto index = static_cast<std::size_t>(fc);
    return (index < FcNames.size()) ? FcNames[index] : "??";
}

cetl::optional<FunctionalConstraint> parseFunctionalConstraint(const std::string& str) noexcept
{
    for (std::size_t i = 0; i < FcNames.size(); ++i)
    {
        if (str == FcNames[i])
        {
            return static_cast<FunctionalConstraint>(i);
        }
    }
    return cetl::nullopt;
}

std::string DataModelNode::reference() const
{
    std::string result;
    for (std::size_t i = 0; i < path.size(); ++i)
    {
        if (i == 1)
        {
            result += '/';
        }
        else if (i > 1)
        {
            result += '.';
        }
        result += path[i];
    }
    return result;
}

const DataModelNode* DataModelNode::findChild(const std::string&                          child_name,
                                              const cetl::optional<FunctionalConstraint>& child_fc) const
{
    return findChildImpl(*this, child_name, child_fc);
}

DataModelNode* DataModelNode::findChild(const std::string&                          child_name,
                                        const cetl::optional<FunctionalConstraint>& child_fc)
{
    return findChildImpl(*this, child_name, child_fc);
}

const char* toString(const DataModelNode::Kind kind) noexcept
{
    switch (kind)
    {
    case DataModelNode::Kind::Server:
        return "server";
    case DataModelNode::Kind::LogicalDevice:
        return "LD";
    case DataModelNode::Kind::LogicalNode:
        return "LN";
    case DataModelNode::Kind::DataObject:
        return "DO";
    case DataModelNode::Kind::DataAttribute:
        return "DA";
    default:
        return "?";
    }
}

}  // namespace sdk
}  // namespace iecmms
