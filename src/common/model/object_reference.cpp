//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "object_reference.hpp"

#include "common_helpers.hpp"
#include "mms/mms_types.hpp"

#include "iecmms/sdk/data_model.hpp"
#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
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

constexpr char        LdSeparator         = '/';
constexpr char        NameSeparator       = '.';
constexpr char        MmsSeparator        = '$';
constexpr char        VmdPrefix           = '@';
constexpr std::size_t MaxIdentifierLength = 64;

bool isIdentifier(const std::string& name)
{
    if (name.empty() || (name.size() > MaxIdentifierLength))
    {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](const char ch) {
        //
        return (std::isalnum(static_cast<unsigned char>(ch)) != 0) || (ch == '_');
    });
}

}  // namespace

ObjectReference::Parse::Var ObjectReference::parse(const std::string& reference)
{
    const sdk::error::PathNotFound not_found{reference};

    ObjectReference result;
    std::string     path = reference;

    // Optional `[FC]` suffix.
    if (!path.empty() && (path.back() == ']'))
    {
        const auto open = path.rfind('[');
        if (open == std::string::npos)
        {
            return not_found;
        }
        result.fc = sdk::parseFunctionalConstraint(path.substr(open + 1, path.size() - open - 2));
        if (!result.fc.has_value())
        {
            return not_found;
        }
        path.resize(open);
    }

    const auto parts = splitString(path, LdSeparator);
    if ((parts.size() > 2) || !isIdentifier(parts.front()))
    {
        return not_found;
    }
    result.logical_device = parts.front();

    if (parts.size() == 2)
    {
        auto names = splitString(parts.back(), NameSeparator);
        if (!std::all_of(names.begin(), names.end(), isIdentifier))
        {
            return not_found;
        }
        result.logical_node = std::move(names.front());
        result.names.assign(std::make_move_iterator(names.begin() + 1), std::make_move_iterator(names.end()));
    }
    return result;
}

std::vector<std::string> ObjectReference::segments() const
{
    std::vector<std::string> result{logical_device};
    if (!logical_node.empty())
    {
        result.push_back(logical_node);
        result.insert(result.end(), names.begin(), names.end());
    }
    return result;
}

std::string ObjectReference::toString() const
{
    std::string result = logical_device;
    if (!logical_node.empty())
    {
        result += LdSeparator;
        result += logical_node;
        for (const auto& name : names)
        {
            result += NameSeparator;
            result += name;
        }
    }
    if (fc.has_value())
    {
        result += '[';
        result += sdk::toString(*fc);
        result += ']';
    }
    return result;
}

mms::ObjectName ObjectReference::toMmsName(const sdk::FunctionalConstraint with_fc) const
{
    std::string item = logical_node;
    item += MmsSeparator;
    item += sdk::toString(with_fc);
    for (const auto& name : names)
    {
        item += MmsSeparator;
        item += name;
    }
    return mms::ObjectName::domainSpecific(logical_device, std::move(item));
}

cetl::optional<ObjectReference> ObjectReference::fromMmsName(const mms::ObjectName& name)
{
    if (name.scope != mms::ObjectName::Scope::DomainSpecific)
    {
        return cetl::nullopt;
    }

    auto parts = splitString(name.item, MmsSeparator);
    if (!std::all_of(parts.begin(), parts.end(), isIdentifier))
    {
        return cetl::nullopt;
    }

    ObjectReference result;
    result.logical_device = name.domain;
    result.logical_node   = parts.front();
    if (parts.size() > 1)
    {
        result.fc = sdk::parseFunctionalConstraint(parts[1]);
        if (!result.fc.has_value())
        {
            return cetl::nullopt;
        }
        result.names.assign(std::make_move_iterator(parts.begin() + 2), std::make_move_iterator(parts.end()));
    }
    return result;
}

DataSetReference::Var parseDataSetReference(const std::string& reference)
{
    if (!reference.empty() && (reference.front() == VmdPrefix))
    {
        auto name = reference.substr(1);
        if (!isIdentifier(name))
        {
            return sdk::error::PathNotFound{reference};
        }
        return mms::ObjectName::vmdSpecific(std::move(name));
    }

    const auto parts = splitString(reference, LdSeparator);
    if ((parts.size() != 2) || !isIdentifier(parts.front()))
    {
        return sdk::error::PathNotFound{reference};
    }

    // `LN.DS` and `LN$DS` are equivalent.
    auto names = splitString(parts.back(), NameSeparator);
    if (names.size() == 1)
    {
        names = splitString(parts.back(), MmsSeparator);
    }
    if ((names.size() != 2) || !std::all_of(names.begin(), names.end(), isIdentifier))
    {
        return sdk::error::PathNotFound{reference};
    }
    return mms::ObjectName::domainSpecific(parts.front(), names[0] + MmsSeparator + names[1]);
}

}  // namespace model
}  // namespace common
}  // namespace iecmms
