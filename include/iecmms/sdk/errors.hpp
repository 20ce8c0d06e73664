//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_ERRORS_HPP_INCLUDED
#define IECMMS_SDK_ERRORS_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace iecmms
{
namespace sdk
{

/// MMS services known to the client.
///
/// Values of the confirmed services are their `ConfirmedServiceRequest` context tag numbers.
///
enum class Service : std::uint8_t
{
    Status                         = 0,
    GetNameList                    = 1,
    Identify                       = 2,
    Read                           = 4,
    Write                          = 5,
    GetVariableAccessAttributes    = 6,
    DefineNamedVariableList        = 11,
    GetNamedVariableListAttributes = 12,
    DeleteNamedVariableList        = 13,
    Initiate                       = 0xF0,
    Conclude                       = 0xF1,
    InformationReport              = 0xF2,
    Unknown                        = 0xFF,

};  // Service

/// Data access error codes as reported per variable by the server (ISO 9506 `DataAccessError`).
///
enum class DataAccessError : std::uint8_t
{
    ObjectInvalidated           = 0,
    HardwareFault               = 1,
    TemporarilyUnavailable      = 2,
    ObjectAccessDenied          = 3,
    ObjectUndefined             = 4,
    InvalidAddress              = 5,
    TypeUnsupported             = 6,
    TypeInconsistent            = 7,
    ObjectAttributeInconsistent = 8,
    ObjectAccessUnsupported     = 9,
    ObjectNonExistent           = 10,
    ObjectValueInvalid          = 11,
    Unknown                     = 0xFF,

};  // DataAccessError

/// Classes of the confirmed-error `ServiceError.errorClass` choice.
///
enum class ErrorClass : std::uint8_t
{
    VmdState             = 0,
    ApplicationReference = 1,
    Definition           = 2,
    Resource             = 3,
    Service              = 4,
    ServicePreempt       = 5,
    TimeResolution       = 6,
    Access               = 7,
    Initiate             = 8,
    Conclude             = 9,
    Cancel               = 10,
    File                 = 11,
    Others               = 12,

};  // ErrorClass

enum class ConnectError : std::uint8_t
{
    Timeout,
    Refused,
    AssociationRejected,

};  // ConnectError

/// Defines the individual failure kinds of the client stack.
///
namespace error
{

/// A BER or MMS structure could not be decoded.
struct MalformedEncoding final
{
    std::string detail;
};

/// The server answered with a service the request did not ask for (or one the client does not know).
struct UnsupportedService final
{
    Service       service;
    std::uint32_t invoke_id;
};

/// The server rejected a PDU (`RejectPDU`).
struct Reject final
{
    cetl::optional<std::uint32_t> invoke_id;
    std::uint8_t                  reject_class;  // `rejectReason` context tag
    std::int64_t                  code;
};

/// The server answered with a confirmed-error PDU.
struct ServiceError final
{
    Service                         service;
    std::uint32_t                   invoke_id;
    ErrorClass                      error_class;
    std::int64_t                    code;
    cetl::optional<DataAccessError> category;
};

/// The server reported a data access error for one variable of a read or write.
struct DataAccess final
{
    DataAccessError code;
    Service         service;
    std::uint32_t   invoke_id;
    std::size_t     index;
};

struct Connect final
{
    ConnectError reason;
    std::string  detail;
};

struct RequestTimeout final
{
    Service       service;
    std::uint32_t invoke_id;
};

struct ConnectionLost final
{
    Service       service;
    std::uint32_t invoke_id;
};

struct NotConnected final
{};

struct TooManyPending final
{
    std::size_t limit;
};

struct TypeMismatch final
{
    std::string detail;
};

struct PathNotFound final
{
    std::string path;
};

struct Cancelled final
{
    Service       service;
    std::uint32_t invoke_id;
};

/// Operate on a select-before-operate control point that is not selected.
struct SelectionRequired final
{
    std::string                  path;
    cetl::optional<std::uint8_t> add_cause;
};

}  // namespace error

using Error = cetl::variant<error::MalformedEncoding,
                            error::UnsupportedService,
                            error::Reject,
                            error::ServiceError,
                            error::DataAccess,
                            error::Connect,
                            error::RequestTimeout,
                            error::ConnectionLost,
                            error::NotConnected,
                            error::TooManyPending,
                            error::TypeMismatch,
                            error::PathNotFound,
                            error::Cancelled,
                            error::SelectionRequired>;

/// Successful completion of an operation without a payload.
///
struct Done final
{};

const char* toString(const Service service) noexcept;
const char* toString(const DataAccessError code) noexcept;
const char* toString(const ErrorClass error_class) noexcept;
const char* toString(const ConnectError reason) noexcept;

/// Renders a human readable, single line description of the failure.
///
std::string describe(const Error& failure);

/// Maps a confirmed-error class and code to the data access taxonomy (if there is a matching category).
///
cetl::optional<DataAccessError> categorize(const ErrorClass error_class, const std::int64_t code) noexcept;

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_ERRORS_HPP_INCLUDED
