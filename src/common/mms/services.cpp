//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "services.hpp"

#include "mms_types.hpp"
#include "pdu.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{
namespace mms
{
namespace
{

using ber::TagClass;
namespace universal = ber::universal;

constexpr std::uint32_t ListOfVariable   = 0;  // VariableAccessSpecification.listOfVariable
constexpr std::uint32_t VariableListName = 1;  // VariableAccessSpecification.variableListName
constexpr std::uint32_t AccessFailure    = 0;  // AccessResult.failure
constexpr std::uint32_t WriteSuccess     = 1;  // Write-Response success

sdk::error::MalformedEncoding malformed(const char* const what, const BerValue& value)
{
    return sdk::error::MalformedEncoding{fmt::format("{} (tag={})", what, value.describeTag())};
}

sdk::DataAccessError toDataAccessError(const std::int64_t code) noexcept
{
    if ((code < 0) || (code > static_cast<std::int64_t>(sdk::DataAccessError::ObjectValueInvalid)))
    {
        return sdk::DataAccessError::Unknown;
    }
    return static_cast<sdk::DataAccessError>(code);
}

BerValue makeIdentifier(const std::string& identifier)
{
    return ber::makeString(TagClass::Universal, universal::VisibleString, identifier);
}

cetl::optional<std::string> decodeIdentifier(const BerValue& value)
{
    if (!value.is(TagClass::Universal, universal::VisibleString) || value.constructed)
    {
        return cetl::nullopt;
    }
    return ber::decodeString(value);
}

/// `SEQUENCE { variableSpecification name [0] ObjectName }` of a list of variables.
///
BerValue makeVariableEntry(const ObjectName& name)
{
    return BerValue::sequenceOf({BerValue::contextOf(0, {encodeObjectName(name)})});
}

Parsed<std::vector<ObjectName>> decodeVariableEntries(const BerValue& list)
{
    std::vector<ObjectName> names;
    names.reserve(list.children.size());
    for (const auto& entry : list.children)
    {
        const auto* const spec = entry.findContext(0);
        if (!entry.is(TagClass::Universal, universal::Sequence) || (spec == nullptr) || spec->children.empty())
        {
            return malformed("unsupported variable specification", entry);
        }
        auto name = decodeObjectName(spec->children.front());
        if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&name))
        {
            return std::move(*failure);
        }
        names.push_back(cetl::get<ObjectName>(std::move(name)));
    }
    return names;
}

cetl::optional<bool> decodeFlag(const BerValue* const value, const bool default_value)
{
    if (value == nullptr)
    {
        return default_value;
    }
    return ber::decodeBoolean(*value);
}

cetl::optional<std::uint32_t> decodeCount(const BerValue* const value)
{
    if (value == nullptr)
    {
        return cetl::nullopt;
    }
    const auto count = ber::decodeUnsigned(*value);
    if (!count.has_value() || (*count > std::numeric_limits<std::uint32_t>::max()))
    {
        return cetl::nullopt;
    }
    return static_cast<std::uint32_t>(*count);
}

}  // namespace

// MARK: - Common productions

BerValue encodeObjectName(const ObjectName& name)
{
    switch (name.scope)
    {
    case ObjectName::Scope::DomainSpecific:
        return BerValue::contextOf(static_cast<std::uint32_t>(name.scope),
                                   {makeIdentifier(name.domain), makeIdentifier(name.item)});
    case ObjectName::Scope::VmdSpecific:
    case ObjectName::Scope::AaSpecific:
    default:
        return ber::makeString(TagClass::ContextSpecific, static_cast<std::uint32_t>(name.scope), name.item);
    }
}

Parsed<ObjectName> decodeObjectName(const BerValue& value)
{
    if (value.tag_class != TagClass::ContextSpecific)
    {
        return malformed("invalid object name", value);
    }
    switch (value.tag_number)
    {
    case static_cast<std::uint32_t>(ObjectName::Scope::DomainSpecific): {
        if (!value.constructed || (value.children.size() != 2))
        {
            return malformed("invalid domain specific name", value);
        }
        auto domain = decodeIdentifier(value.children[0]);
        auto item   = decodeIdentifier(value.children[1]);
        if (!domain.has_value() || !item.has_value())
        {
            return malformed("invalid domain specific name", value);
        }
        return ObjectName::domainSpecific(std::move(*domain), std::move(*item));
    }
    case static_cast<std::uint32_t>(ObjectName::Scope::VmdSpecific):
    case static_cast<std::uint32_t>(ObjectName::Scope::AaSpecific): {
        auto item = value.constructed ? cetl::optional<std::string>{} : ber::decodeString(value);
        if (!item.has_value())
        {
            return malformed("invalid object name", value);
        }
        return ObjectName{static_cast<ObjectName::Scope>(value.tag_number), {}, std::move(*item)};
    }
    default:
        return malformed("invalid object name", value);
    }
}

BerValue encodeVariableAccess(const VariableAccess& access)
{
    if (access.list_name.has_value())
    {
        return BerValue::contextOf(VariableListName, {encodeObjectName(*access.list_name)});
    }

    std::vector<BerValue> entries;
    entries.reserve(access.variables.size());
    for (const auto& name : access.variables)
    {
        entries.push_back(makeVariableEntry(name));
    }
    return BerValue::contextOf(ListOfVariable, std::move(entries));
}

Parsed<VariableAccess> decodeVariableAccess(const BerValue& value)
{
    VariableAccess access;
    if (value.isContext(VariableListName) && (value.children.size() == 1))
    {
        auto name = decodeObjectName(value.children.front());
        if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&name))
        {
            return std::move(*failure);
        }
        access.list_name = cetl::get<ObjectName>(std::move(name));
        return access;
    }
    if (value.isContext(ListOfVariable) && value.constructed)
    {
        auto names = decodeVariableEntries(value);
        if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&names))
        {
            return std::move(*failure);
        }
        access.variables = cetl::get<std::vector<ObjectName>>(std::move(names));
        return access;
    }
    return malformed("invalid variable access specification", value);
}

Parsed<std::vector<AccessResult>> decodeAccessResults(const BerValue& list)
{
    std::vector<AccessResult> results;
    results.reserve(list.children.size());
    for (const auto& result : list.children)
    {
        if (result.isContext(AccessFailure) && !result.constructed)
        {
            const auto code = ber::decodeInteger(result);
            if (!code.has_value())
            {
                return malformed("access failure with malformed code", result);
            }
            results.emplace_back(toDataAccessError(*code));
        }
        else
        {
            results.emplace_back(result);
        }
    }
    return results;
}

// MARK: - Service requests

BerValue buildStatusRequest()
{
    // extendedDerivation FALSE
    return ber::makeBoolean(TagClass::ContextSpecific, static_cast<std::uint32_t>(sdk::Service::Status), false);
}

BerValue buildGetNameListRequest(const GetNameListRequest& request)
{
    std::vector<BerValue> fields;
    fields.push_back(BerValue::contextOf(  //
        0,
        {ber::makeInteger(TagClass::ContextSpecific, 0, static_cast<std::int64_t>(request.object_class))}));

    if (request.domain.has_value())
    {
        fields.push_back(BerValue::contextOf(1, {ber::makeString(TagClass::ContextSpecific, 1, *request.domain)}));
    }
    else
    {
        fields.push_back(BerValue::contextOf(1, {ber::makeNull(TagClass::ContextSpecific, 0)}));
    }

    if (request.continue_after.has_value())
    {
        fields.push_back(ber::makeString(TagClass::ContextSpecific, 2, *request.continue_after));
    }
    return BerValue::contextOf(static_cast<std::uint32_t>(sdk::Service::GetNameList), std::move(fields));
}

BerValue buildIdentifyRequest()
{
    return ber::makeNull(TagClass::ContextSpecific, static_cast<std::uint32_t>(sdk::Service::Identify));
}

BerValue buildReadRequest(const ReadRequest& request)
{
    std::vector<BerValue> fields;
    if (request.specification_with_result)
    {
        fields.push_back(ber::makeBoolean(TagClass::ContextSpecific, 0, true));
    }
    fields.push_back(BerValue::contextOf(1, {encodeVariableAccess(request.access)}));
    return BerValue::contextOf(static_cast<std::uint32_t>(sdk::Service::Read), std::move(fields));
}

BerValue buildWriteRequest(const WriteRequest& request)
{
    VariableAccess access;
    access.variables = request.variables;
    return BerValue::contextOf(static_cast<std::uint32_t>(sdk::Service::Write),
                               {encodeVariableAccess(access), BerValue::contextOf(0, request.data)});
}

BerValue buildGetVariableAccessAttributesRequest(const ObjectName& name)
{
    return BerValue::contextOf(static_cast<std::uint32_t>(sdk::Service::GetVariableAccessAttributes),
                               {BerValue::contextOf(0, {encodeObjectName(name)})});
}

BerValue buildDefineNamedVariableListRequest(const DefineNamedVariableListRequest& request)
{
    std::vector<BerValue> entries;
    entries.reserve(request.members.size());
    for (const auto& member : request.members)
    {
        entries.push_back(makeVariableEntry(member));
    }
    return BerValue::contextOf(static_cast<std::uint32_t>(sdk::Service::DefineNamedVariableList),
                               {encodeObjectName(request.name), BerValue::contextOf(0, std::move(entries))});
}

BerValue buildGetNamedVariableListAttributesRequest(const ObjectName& name)
{
    return BerValue::contextOf(static_cast<std::uint32_t>(sdk::Service::GetNamedVariableListAttributes),
                               {encodeObjectName(name)});
}

BerValue buildDeleteNamedVariableListRequest(const ObjectName& name)
{
    return BerValue::contextOf(static_cast<std::uint32_t>(sdk::Service::DeleteNamedVariableList),
                               {
                                   ber::makeInteger(TagClass::ContextSpecific, 0, 0),  // scopeOfDelete: specific
                                   BerValue::contextOf(1, {encodeObjectName(name)}),
                               });
}

// MARK: - Service responses

Parsed<StatusResponse> parseStatusResponse(const BerValue& response)
{
    const auto* const logical  = response.findContext(0);
    const auto* const physical = response.findContext(1);
    if ((logical == nullptr) || (physical == nullptr))
    {
        return malformed("incomplete status response", response);
    }
    const auto logical_value  = ber::decodeInteger(*logical);
    const auto physical_value = ber::decodeInteger(*physical);
    if (!logical_value.has_value() || !physical_value.has_value())
    {
        return malformed("malformed status response", response);
    }
    return StatusResponse{*logical_value, *physical_value};
}

Parsed<GetNameListResponse> parseGetNameListResponse(const BerValue& response)
{
    const auto* const list = response.findContext(0);
    if ((list == nullptr) || !list->constructed)
    {
        return malformed("name list response without identifiers", response);
    }

    GetNameListResponse result;
    result.identifiers.reserve(list->children.size());
    for (const auto& identifier : list->children)
    {
        auto name = decodeIdentifier(identifier);
        if (!name.has_value())
        {
            return malformed("invalid identifier", identifier);
        }
        result.identifiers.push_back(std::move(*name));
    }

    const auto more_follows = decodeFlag(response.findContext(1), true);
    if (!more_follows.has_value())
    {
        return malformed("invalid more follows flag", response);
    }
    result.more_follows = *more_follows;
    return result;
}

Parsed<IdentifyResponse> parseIdentifyResponse(const BerValue& response)
{
    const auto* const vendor   = response.findContext(0);
    const auto* const model    = response.findContext(1);
    const auto* const revision = response.findContext(2);
    if ((vendor == nullptr) || (model == nullptr) || (revision == nullptr))
    {
        return malformed("incomplete identify response", response);
    }
    auto vendor_str   = ber::decodeString(*vendor);
    auto model_str    = ber::decodeString(*model);
    auto revision_str = ber::decodeString(*revision);
    if (!vendor_str.has_value() || !model_str.has_value() || !revision_str.has_value())
    {
        return malformed("malformed identify response", response);
    }
    return IdentifyResponse{std::move(*vendor_str), std::move(*model_str), std::move(*revision_str)};
}

Parsed<ReadResponse> parseReadResponse(const BerValue& response)
{
    ReadResponse result;
    if (const auto* const spec = response.findContext(0))
    {
        if (spec->children.size() != 1)
        {
            return malformed("invalid read response specification", *spec);
        }
        auto access = decodeVariableAccess(spec->children.front());
        if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&access))
        {
            return std::move(*failure);
        }
        result.access = cetl::get<VariableAccess>(std::move(access));
    }

    const auto* const list = response.findContext(1);
    if ((list == nullptr) || !list->constructed)
    {
        return malformed("read response without results", response);
    }
    auto results = decodeAccessResults(*list);
    if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&results))
    {
        return std::move(*failure);
    }
    result.results = cetl::get<std::vector<AccessResult>>(std::move(results));
    return result;
}

Parsed<WriteResponse> parseWriteResponse(const BerValue& response)
{
    WriteResponse result;
    result.results.reserve(response.children.size());
    for (const auto& item : response.children)
    {
        if (item.isContext(WriteSuccess))
        {
            result.results.emplace_back(cetl::nullopt);
            continue;
        }
        if (!item.isContext(AccessFailure))
        {
            return malformed("invalid write result", item);
        }
        const auto code = ber::decodeInteger(item);
        if (!code.has_value())
        {
            return malformed("write failure with malformed code", item);
        }
        result.results.emplace_back(toDataAccessError(*code));
    }
    return result;
}

Parsed<GetVariableAccessAttributesResponse> parseGetVariableAccessAttributesResponse(const BerValue& response)
{
    const auto        deletable = decodeFlag(response.findContext(0), false);
    const auto* const type      = response.findContext(2);
    if (!deletable.has_value() || (type == nullptr) || (type->children.size() != 1))
    {
        return malformed("invalid variable access attributes", response);
    }
    return GetVariableAccessAttributesResponse{*deletable, type->children.front()};
}

Parsed<GetNamedVariableListAttributesResponse> parseGetNamedVariableListAttributesResponse(const BerValue& response)
{
    const auto        deletable = decodeFlag(response.findContext(0), false);
    const auto* const list      = response.findContext(1);
    if (!deletable.has_value() || (list == nullptr))
    {
        return malformed("invalid named variable list attributes", response);
    }
    auto members = decodeVariableEntries(*list);
    if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&members))
    {
        return std::move(*failure);
    }
    return GetNamedVariableListAttributesResponse{*deletable, cetl::get<std::vector<ObjectName>>(std::move(members))};
}

Parsed<DeleteNamedVariableListResponse> parseDeleteNamedVariableListResponse(const BerValue& response)
{
    const auto matched = decodeCount(response.findContext(0));
    const auto deleted = decodeCount(response.findContext(1));
    if (!matched.has_value() || !deleted.has_value())
    {
        return malformed("invalid delete named variable list response", response);
    }
    return DeleteNamedVariableListResponse{*matched, *deleted};
}

// MARK: - Unconfirmed services

Parsed<InformationReport> parseInformationReport(const BerValue& pdu)
{
    if (!pdu.isContext(static_cast<std::uint32_t>(PduType::Unconfirmed)) || pdu.children.empty())
    {
        return malformed("not an unconfirmed PDU", pdu);
    }
    const auto& report = pdu.children.front();
    if (!report.isContext(0) || (report.children.size() != 2))
    {
        return malformed("unsupported unconfirmed service", report);
    }

    auto access = decodeVariableAccess(report.children[0]);
    if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&access))
    {
        return std::move(*failure);
    }
    const auto& list = report.children[1];
    if (!list.isContext(0) || !list.constructed)
    {
        return malformed("information report without results", report);
    }
    auto results = decodeAccessResults(list);
    if (auto* const failure = cetl::get_if<sdk::error::MalformedEncoding>(&results))
    {
        return std::move(*failure);
    }
    return InformationReport{cetl::get<VariableAccess>(std::move(access)),
                             cetl::get<std::vector<AccessResult>>(std::move(results))};
}

}  // namespace mms
}  // namespace common
}  // namespace iecmms
