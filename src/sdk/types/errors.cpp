//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <string>

namespace iecmms
{
namespace sdk
{

const char* toString(const Service service) noexcept
{
    switch (service)
    {
    case Service::Status:
        return "status";
    case Service::GetNameList:
        return "getNameList";
    case Service::Identify:
        return "identify";
    case Service::Read:
        return "read";
    case Service::Write:
        return "write";
    case Service::GetVariableAccessAttributes:
        return "getVariableAccessAttributes";
    case Service::DefineNamedVariableList:
        return "defineNamedVariableList";
    case Service::GetNamedVariableListAttributes:
        return "getNamedVariableListAttributes";
    case Service::DeleteNamedVariableList:
        return "deleteNamedVariableList";
    case Service::Initiate:
        return "initiate";
    case Service::Conclude:
        return "conclude";
    case Service::InformationReport:
        return "informationReport";
    default:
        return "unknown";
    }
}

const char* toString(const DataAccessError code) noexcept
{
    switch (code)
    {
    case DataAccessError::ObjectInvalidated:
        return "object-invalidated";
    case DataAccessError::HardwareFault:
        return "hardware-fault";
    case DataAccessError::TemporarilyUnavailable:
        return "temporarily-unavailable";
    case DataAccessError::ObjectAccessDenied:
        return "object-access-denied";
    case DataAccessError::ObjectUndefined:
        return "object-undefined";
    case DataAccessError::InvalidAddress:
        return "invalid-address";
    case DataAccessError::TypeUnsupported:
        return "type-unsupported";
    case DataAccessError::TypeInconsistent:
        return "type-inconsistent";
    case DataAccessError::ObjectAttributeInconsistent:
        return "object-attribute-inconsistent";
    case DataAccessError::ObjectAccessUnsupported:
        return "object-access-unsupported";
    case DataAccessError::ObjectNonExistent:
        return "object-non-existent";
    case DataAccessError::ObjectValueInvalid:
        return "object-value-invalid";
    default:
        return "unknown";
    }
}

const char* toString(const ErrorClass error_class) noexcept
{
    switch (error_class)
    {
    case ErrorClass::VmdState:
        return "vmd-state";
    case ErrorClass::ApplicationReference:
        return "application-reference";
    case ErrorClass::Definition:
        return "definition";
    case ErrorClass::Resource:
        return "resource";
    case ErrorClass::Service:
        return "service";
    case ErrorClass::ServicePreempt:
        return "service-preempt";
    case ErrorClass::TimeResolution:
        return "time-resolution";
    case ErrorClass::Access:
        return "access";
    case ErrorClass::Initiate:
        return "initiate";
    case ErrorClass::Conclude:
        return "conclude";
    case ErrorClass::Cancel:
        return "cancel";
    case ErrorClass::File:
        return "file";
    default:
        return "others";
    }
}

const char* toString(const ConnectError reason) noexcept
{
    switch (reason)
    {
    case ConnectError::Timeout:
        return "timeout";
    case ConnectError::Refused:
        return "refused";
    case ConnectError::AssociationRejected:
        return "association rejected";
    default:
        return "?";
    }
}

std::string describe(const Error& failure)
{
    return cetl::visit(  //
        cetl::make_overloaded(
            [](const error::MalformedEncoding& err) {
                //
                return fmt::format("malformed encoding ({})", err.detail);
            },
            [](const error::UnsupportedService& err) {
                return fmt::format("unsupported service (service={}, invoke_id={})",
                                   toString(err.service),
                                   err.invoke_id);
            },
            [](const error::Reject& err) {
                const std::string invoke_id = err.invoke_id.has_value() ? std::to_string(*err.invoke_id) : "none";
                return fmt::format("rejected (class={}, code={}, invoke_id={})",
                                   err.reject_class,
                                   err.code,
                                   invoke_id);
            },
            [](const error::ServiceError& err) {
                return fmt::format("service error (service={}, invoke_id={}, class={}, code={}{}{})",
                                   toString(err.service),
                                   err.invoke_id,
                                   toString(err.error_class),
                                   err.code,
                                   err.category.has_value() ? ", category=" : "",
                                   err.category.has_value() ? toString(*err.category) : "");
            },
            [](const error::DataAccess& err) {
                return fmt::format("data access error {} (service={}, invoke_id={}, index={})",
                                   toString(err.code),
                                   toString(err.service),
                                   err.invoke_id,
                                   err.index);
            },
            [](const error::Connect& err) {
                return err.detail.empty() ? fmt::format("connect failed: {}", toString(err.reason))
                                          : fmt::format("connect failed: {} ({})", toString(err.reason), err.detail);
            },
            [](const error::RequestTimeout& err) {
                return fmt::format("request timed out (service={}, invoke_id={})",
                                   toString(err.service),
                                   err.invoke_id);
            },
            [](const error::ConnectionLost& err) {
                return fmt::format("connection lost (service={}, invoke_id={})", toString(err.service), err.invoke_id);
            },
            [](const error::NotConnected&) { return std::string{"not connected"}; },
            [](const error::TooManyPending& err) {
                return fmt::format("too many pending requests (limit={})", err.limit);
            },
            [](const error::TypeMismatch& err) { return fmt::format("type mismatch ({})", err.detail); },
            [](const error::PathNotFound& err) { return fmt::format("path not found: '{}'", err.path); },
            [](const error::Cancelled& err) {
                return fmt::format("cancelled (service={}, invoke_id={})", toString(err.service), err.invoke_id);
            },
            [](const error::SelectionRequired& err) {
                return err.add_cause.has_value()
                           ? fmt::format("selection required: '{}' (add_cause={})", err.path, *err.add_cause)
                           : fmt::format("selection required: '{}'", err.path);
            }),
        failure);
}

cetl::optional<DataAccessError> categorize(const ErrorClass error_class, const std::int64_t code) noexcept
{
    switch (error_class)
    {
    case ErrorClass::VmdState:
        if (code == 2)  // vmd-operational-problem
        {
            return DataAccessError::HardwareFault;
        }
        break;

    case ErrorClass::Definition:
        switch (code)
        {
        case 1:
            return DataAccessError::ObjectUndefined;
        case 2:
            return DataAccessError::InvalidAddress;
        case 3:
            return DataAccessError::TypeUnsupported;
        case 4:
            return DataAccessError::TypeInconsistent;
        case 6:
            return DataAccessError::ObjectAttributeInconsistent;
        default:
            break;
        }
        break;

    case ErrorClass::Resource:
        if ((code >= 1) && (code <= 4))  // memory, processor, mass storage or capability unavailable
        {
            return DataAccessError::TemporarilyUnavailable;
        }
        break;

    case ErrorClass::Access:
        switch (code)
        {
        case 1:
            return DataAccessError::ObjectAccessUnsupported;
        case 2:
            return DataAccessError::ObjectNonExistent;
        case 3:
            return DataAccessError::ObjectAccessDenied;
        case 4:
            return DataAccessError::ObjectInvalidated;
        default:
            break;
        }
        break;

    default:
        break;
    }
    return cetl::nullopt;
}

}  // namespace sdk
}  // namespace iecmms
