//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_SDK_HELPERS_HPP_INCLUDED
#define IECMMS_SDK_SDK_HELPERS_HPP_INCLUDED

#include "ber/ber_value.hpp"
#include "mms/mms_types.hpp"
#include "session/pending_table.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace iecmms
{
namespace sdk
{

template <typename T>
using Outcome = cetl::variant<T, Error>;

/// Completed confirmed request.
///
struct Reply final
{
    std::uint32_t             invoke_id;
    common::session::Response response;
};

/// Synchronously performs one confirmed request over the session.
///
using Transact = std::function<Reply(const Service service, ber::BerValue request)>;

template <typename T>
Outcome<T> fromParsed(common::mms::Parsed<T>&& parsed)
{
    if (auto* const malformed = cetl::get_if<error::MalformedEncoding>(&parsed))
    {
        return Error{std::move(*malformed)};
    }
    return cetl::get<T>(std::move(parsed));
}

/// Performs a request and parses its service response element.
///
template <typename T, typename Parser>
Outcome<T> transactAndParse(const Transact& transact, const Service service, ber::BerValue request, Parser&& parser)
{
    auto reply = transact(service, std::move(request));
    if (auto* const failure = cetl::get_if<Error>(&reply.response))
    {
        return std::move(*failure);
    }
    return fromParsed<T>(std::forward<Parser>(parser)(cetl::get<ber::BerValue>(reply.response)));
}

/// Servers report missing objects as `ServiceError`s of the definition or access class.
///
inline bool isMissingObject(const Error& failure)
{
    const auto* const service_error = cetl::get_if<error::ServiceError>(&failure);
    if ((service_error == nullptr) || !service_error->category.has_value())
    {
        return false;
    }
    const auto category = *service_error->category;
    return (category == DataAccessError::ObjectNonExistent) || (category == DataAccessError::ObjectUndefined);
}

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_SDK_HELPERS_HPP_INCLUDED
