//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "discovery.hpp"

#include "ber/ber_value.hpp"
#include "logging.hpp"
#include "mms/mms_types.hpp"
#include "mms/services.hpp"
#include "model/data_model_builder.hpp"
#include "model/object_reference.hpp"
#include "model/type_descriptor.hpp"
#include "sdk_helpers.hpp"

#include "iecmms/sdk/client.hpp"
#include "iecmms/sdk/data_model.hpp"
#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <iterator>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace iecmms
{
namespace sdk
{
namespace
{

using common::model::ObjectReference;
using Kind = DataModelNode::Kind;

constexpr char MmsSeparator = '$';

/// Adds nodes for the names not present yet, keeping the (possibly expanded) existing ones.
///
void mergeChildren(DataModelNode& parent, const Kind kind, const std::vector<std::string>& names)
{
    for (const auto& name : names)
    {
        if (parent.findChild(name) == nullptr)
        {
            auto path = parent.path;
            path.push_back(name);
            parent.children.push_back(common::model::makeNode(kind, std::move(path)));
        }
    }
}

std::vector<std::string> childNames(const DataModelNode& node)
{
    std::vector<std::string> names;
    names.reserve(node.children.size());
    for (const auto& child : node.children)
    {
        names.push_back(child.name());
    }
    return names;
}

}  // namespace

Discovery::Discovery(Transact transact)
    : transact_{std::move(transact)}
    , logger_{common::getLogger("sdk")}
{
    root_ = common::model::makeNode(Kind::Server, {});
}

void Discovery::reset()
{
    const std::lock_guard<std::mutex> lock{mutex_};
    root_ = common::model::makeNode(Kind::Server, {});
    ln_types_.clear();
}

Outcome<TypeDescriptor::Ptr> Discovery::logicalNodeType(const std::string& logical_device,
                                                        const std::string& logical_node)
{
    const auto key = logical_device + '/' + logical_node;
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        const auto                        it = ln_types_.find(key);
        if (it != ln_types_.end())
        {
            return it->second;
        }
    }

    logger_->debug("Discovering logical node '{}'...", key);
    auto attributes = transactAndParse<common::mms::GetVariableAccessAttributesResponse>(
        transact_,
        Service::GetVariableAccessAttributes,
        common::mms::buildGetVariableAccessAttributesRequest(
            common::mms::ObjectName::domainSpecific(logical_device, logical_node)),
        common::mms::parseGetVariableAccessAttributesResponse);
    if (auto* const failure = cetl::get_if<Error>(&attributes))
    {
        if (isMissingObject(*failure))
        {
            return error::PathNotFound{key};
        }
        return std::move(*failure);
    }

    auto ln_type = fromParsed(common::model::parseTypeDescription(
        cetl::get<common::mms::GetVariableAccessAttributesResponse>(attributes).type_description));
    if (auto* const failure = cetl::get_if<Error>(&ln_type))
    {
        logger_->warn("Unusable type of logical node '{}': {}.", key, describe(*failure));
        return std::move(*failure);
    }
    const auto& type = cetl::get<TypeDescriptor::Ptr>(ln_type);
    if (type->kind != TypeKind::Structure)
    {
        return error::TypeMismatch{"logical node '" + key + "' is not a structure"};
    }

    auto ln_node = common::model::buildLogicalNode(logical_device, logical_node, type);
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        auto&                             ld = logicalDeviceNode(logical_device);
        if (auto* const existing = ld.findChild(logical_node))
        {
            *existing = std::move(ln_node);
        }
        else
        {
            ld.children.push_back(std::move(ln_node));
        }
        ln_types_[key] = type;
    }
    logger_->debug("Discovered logical node '{}' ({} FCs).", key, type->components.size());
    return type;
}

Client::Browse::Result Discovery::browse(const std::string& path)
{
    auto node = resolve(path);
    if (auto* const failure = cetl::get_if<Error>(&node))
    {
        return std::move(*failure);
    }
    auto& resolved = cetl::get<DataModelNode>(node);
    if ((resolved.kind == Kind::LogicalDevice) && !resolved.expanded)
    {
        auto expanded = discover(path, Client::Depth::Shallow);
        if (auto* const failure = cetl::get_if<Error>(&expanded))
        {
            return std::move(*failure);
        }
        return std::move(cetl::get<DataModelNode>(expanded).children);
    }
    return std::move(resolved.children);
}

Client::Discover::Result Discovery::discover(const std::string& path, const Client::Depth depth)
{
    const bool full = depth == Client::Depth::Full;

    if (path.empty())
    {
        if (auto failure = expandServer())
        {
            return std::move(*failure);
        }
        if (full)
        {
            std::vector<std::string> lds;
            {
                const std::lock_guard<std::mutex> lock{mutex_};
                lds = childNames(root_);
            }
            for (const auto& ld : lds)
            {
                auto walked = discover(ld, depth);
                if (auto* const failure = cetl::get_if<Error>(&walked))
                {
                    return std::move(*failure);
                }
            }
        }
        const std::lock_guard<std::mutex> lock{mutex_};
        return root_;
    }

    auto reference = parseReference(path);
    if (auto* const failure = cetl::get_if<Error>(&reference))
    {
        return std::move(*failure);
    }
    const auto& ref = cetl::get<ObjectReference>(reference);

    if (ref.logical_node.empty())
    {
        if (auto failure = expandLogicalDevice(ref.logical_device))
        {
            return std::move(*failure);
        }
        if (full)
        {
            std::vector<std::string> lns;
            {
                const std::lock_guard<std::mutex> lock{mutex_};
                lns = childNames(logicalDeviceNode(ref.logical_device));
            }
            for (const auto& ln : lns)
            {
                auto ln_type = logicalNodeType(ref.logical_device, ln);
                if (auto* const failure = cetl::get_if<Error>(&ln_type))
                {
                    return std::move(*failure);
                }
            }
        }
        const std::lock_guard<std::mutex> lock{mutex_};
        return logicalDeviceNode(ref.logical_device);
    }

    // Logical nodes are always discovered as a whole.
    return resolve(path);
}

Client::Discover::Result Discovery::resolve(const std::string& path)
{
    if (path.empty())
    {
        if (auto failure = expandServer())
        {
            return std::move(*failure);
        }
        const std::lock_guard<std::mutex> lock{mutex_};
        return root_;
    }

    auto reference = parseReference(path);
    if (auto* const failure = cetl::get_if<Error>(&reference))
    {
        return std::move(*failure);
    }
    const auto& ref = cetl::get<ObjectReference>(reference);

    if (ref.logical_node.empty())
    {
        if (auto failure = expandServer())
        {
            return std::move(*failure);
        }
        const std::lock_guard<std::mutex> lock{mutex_};
        const auto* const                 ld = root_.findChild(ref.logical_device);
        if (ld == nullptr)
        {
            return error::PathNotFound{path};
        }
        return *ld;
    }

    auto ln_type = logicalNodeType(ref.logical_device, ref.logical_node);
    if (auto* const failure = cetl::get_if<Error>(&ln_type))
    {
        if (cetl::get_if<error::PathNotFound>(failure) != nullptr)
        {
            return error::PathNotFound{path};
        }
        return std::move(*failure);
    }

    const std::lock_guard<std::mutex> lock{mutex_};
    const auto* const                 node = common::model::findNode(root_, ref.segments(), ref.fc);
    if (node == nullptr)
    {
        return error::PathNotFound{path};
    }
    return *node;
}

void Discovery::storeValue(const ObjectReference& reference, const FunctionalConstraint fc, const TypedValue& value)
{
    const std::lock_guard<std::mutex> lock{mutex_};
    if (auto* const node = common::model::findNode(root_, reference.segments(), fc))
    {
        node->value = value;
    }
}

Outcome<std::vector<std::string>> Discovery::getNameList(const common::mms::ObjectClass     object_class,
                                                         const cetl::optional<std::string>& domain)
{
    std::vector<std::string> names;

    common::mms::GetNameListRequest request;
    request.object_class = object_class;
    request.domain       = domain;
    for (;;)
    {
        auto response = transactAndParse<common::mms::GetNameListResponse>(  //
            transact_,
            Service::GetNameList,
            common::mms::buildGetNameListRequest(request),
            common::mms::parseGetNameListResponse);
        if (auto* const failure = cetl::get_if<Error>(&response))
        {
            return std::move(*failure);
        }
        auto& page = cetl::get<common::mms::GetNameListResponse>(response);
        if (page.identifiers.empty())
        {
            break;
        }
        if (request.continue_after.has_value() && (page.identifiers.back() == *request.continue_after))
        {
            logger_->warn("GetNameList continuation does not advance past '{}'.", *request.continue_after);
            return Error{error::MalformedEncoding{"name list continuation does not advance"}};
        }
        request.continue_after = page.identifiers.back();
        std::move(page.identifiers.begin(), page.identifiers.end(), std::back_inserter(names));
        if (!page.more_follows)
        {
            break;
        }
    }
    return names;
}

cetl::optional<Error> Discovery::expandServer()
{
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        if (root_.expanded)
        {
            return cetl::nullopt;
        }
    }

    auto domains = getNameList(common::mms::ObjectClass::Domain, cetl::nullopt);
    if (auto* const failure = cetl::get_if<Error>(&domains))
    {
        return std::move(*failure);
    }
    const auto& names = cetl::get<std::vector<std::string>>(domains);
    logger_->debug("Discovered {} logical devices.", names.size());

    const std::lock_guard<std::mutex> lock{mutex_};
    mergeChildren(root_, Kind::LogicalDevice, names);
    root_.expanded = true;
    return cetl::nullopt;
}

cetl::optional<Error> Discovery::expandLogicalDevice(const std::string& logical_device)
{
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        const auto* const                 ld = root_.findChild(logical_device);
        if ((ld != nullptr) && ld->expanded)
        {
            return cetl::nullopt;
        }
    }

    auto variables = getNameList(common::mms::ObjectClass::NamedVariable, logical_device);
    if (auto* const failure = cetl::get_if<Error>(&variables))
    {
        if (isMissingObject(*failure))
        {
            return Error{error::PathNotFound{logical_device}};
        }
        return std::move(*failure);
    }

    // Every functional constraint and attribute is a variable too (`LN$FC$DO...`), only plain names are nodes.
    std::vector<std::string> lns;
    for (auto& name : cetl::get<std::vector<std::string>>(variables))
    {
        if (name.find(MmsSeparator) == std::string::npos)
        {
            lns.push_back(std::move(name));
        }
    }
    logger_->debug("Discovered {} logical nodes in '{}'.", lns.size(), logical_device);

    const std::lock_guard<std::mutex> lock{mutex_};
    auto&                             ld = logicalDeviceNode(logical_device);
    mergeChildren(ld, Kind::LogicalNode, lns);
    ld.expanded = true;
    return cetl::nullopt;
}

DataModelNode& Discovery::logicalDeviceNode(const std::string& logical_device)
{
    if (auto* const ld = root_.findChild(logical_device))
    {
        return *ld;
    }
    root_.children.push_back(common::model::makeNode(Kind::LogicalDevice, {logical_device}));
    return root_.children.back();
}

Outcome<ObjectReference> Discovery::parseReference(const std::string& path) const
{
    auto parsed = ObjectReference::parse(path);
    if (auto* const failure = cetl::get_if<ObjectReference::Parse::Failure>(&parsed))
    {
        return Error{std::move(*failure)};
    }
    return cetl::get<ObjectReference>(std::move(parsed));
}

}  // namespace sdk
}  // namespace iecmms
