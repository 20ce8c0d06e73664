//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "data_model_builder.hpp"

#include "iecmms/sdk/data_model.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{
namespace model
{
namespace
{

using sdk::DataModelNode;
using sdk::TypeDescriptor;
using sdk::TypeKind;

std::vector<std::string> childPath(const std::vector<std::string>& parent, const std::string& name)
{
    auto path = parent;
    path.push_back(name);
    return path;
}

DataModelNode buildAttribute(std::vector<std::string>        path,
                             const sdk::FunctionalConstraint fc,
                             const TypeDescriptor::Ptr&      type)
{
    auto node     = makeNode(DataModelNode::Kind::DataAttribute, std::move(path));
    node.fc       = fc;
    node.type     = type;
    node.expanded = true;
    if (type && (type->kind == TypeKind::Structure))
    {
        node.children.reserve(type->components.size());
        for (const auto& component : type->components)
        {
            node.children.push_back(buildAttribute(childPath(node.path, component.name), fc, component.type));
        }
    }
    return node;
}

template <typename Node>
Node* findNodeImpl(Node&                                            root,
                   const std::vector<std::string>&                  segments,
                   const cetl::optional<sdk::FunctionalConstraint>& fc)
{
    Node* current = &root;
    for (std::size_t i = 0; (current != nullptr) && (i < segments.size()); ++i)
    {
        const bool last = (i + 1) == segments.size();
        current = current->findChild(segments[i], last ? fc : cetl::optional<sdk::FunctionalConstraint>{});
    }
    return current;
}

}  // namespace

DataModelNode makeNode(const DataModelNode::Kind kind, std::vector<std::string> path)
{
    DataModelNode node;
    node.kind = kind;
    node.path = std::move(path);
    return node;
}

DataModelNode buildLogicalNode(const std::string&         logical_device,
                               const std::string&         logical_node,
                               const TypeDescriptor::Ptr& ln_type)
{
    auto ln     = makeNode(DataModelNode::Kind::LogicalNode, {logical_device, logical_node});
    ln.type     = ln_type;
    ln.expanded = true;
    if (!ln_type || (ln_type->kind != TypeKind::Structure))
    {
        return ln;
    }

    for (const auto& fc_component : ln_type->components)
    {
        const auto fc = sdk::parseFunctionalConstraint(fc_component.name);
        if (!fc.has_value() || !fc_component.type || (fc_component.type->kind != TypeKind::Structure))
        {
            continue;
        }

        for (const auto& do_component : fc_component.type->components)
        {
            auto* data_object = ln.findChild(do_component.name);
            if (data_object == nullptr)
            {
                auto node     = makeNode(DataModelNode::Kind::DataObject, childPath(ln.path, do_component.name));
                node.expanded = true;
                ln.children.push_back(std::move(node));
                data_object = &ln.children.back();
            }

            const auto& do_type = do_component.type;
            if (!do_type || (do_type->kind != TypeKind::Structure))
            {
                continue;
            }
            for (const auto& da_component : do_type->components)
            {
                data_object->children.push_back(
                    buildAttribute(childPath(data_object->path, da_component.name), *fc, da_component.type));
            }
        }
    }
    return ln;
}

const DataModelNode* findNode(const DataModelNode&                             root,
                              const std::vector<std::string>&                  segments,
                              const cetl::optional<sdk::FunctionalConstraint>& fc)
{
    return findNodeImpl(root, segments, fc);
}

DataModelNode* findNode(DataModelNode&                                   root,
                        const std::vector<std::string>&                  segments,
                        const cetl::optional<sdk::FunctionalConstraint>& fc)
{
    return findNodeImpl(root, segments, fc);
}

}  // namespace model
}  // namespace common
}  // namespace iecmms
