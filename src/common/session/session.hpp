//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_SESSION_SESSION_HPP_INCLUDED
#define IECMMS_COMMON_SESSION_SESSION_HPP_INCLUDED

#include "ber/ber_value.hpp"
#include "iso/iso_link.hpp"
#include "pending_table.hpp"

#include "iecmms/sdk/client.hpp"
#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/events.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace iecmms
{
namespace common
{
namespace session
{

/// Makes a fresh (not yet associated) ISO link for every connection attempt.
using LinkFactory = std::function<iso::IsoLink::Ptr()>;

/// Receives every unconfirmed PDU, on the reader thread, before any later PDU is processed.
using UnconfirmedHandler = std::function<void(const ber::BerValue& pdu)>;

/// Defines the MMS association of one connection: invoke-ID correlation, timeouts and the inbound reader.
///
/// Every request sent by `sendRequest` is completed exactly once: by its response, its timeout,
/// its cancellation, or the loss of the connection. Completions run on the internal threads,
/// never while internal locks are held.
///
class Session
{
public:
    using Ptr   = std::shared_ptr<Session>;
    using State = sdk::Client::State;

    CETL_NODISCARD static Ptr make(const sdk::ClientOptions& options,
                                   LinkFactory               link_factory,
                                   sdk::EventSink::Ptr       event_sink);

    Session(Session&&)                 = delete;
    Session(const Session&)            = delete;
    Session& operator=(Session&&)      = delete;
    Session& operator=(const Session&) = delete;

    virtual ~Session() = default;

    struct Connect
    {
        using Success = sdk::Done;
        using Failure = sdk::Error;  // `Connect` failures
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Establishes the association (transport, ISO layers and MMS initiate).
    ///
    /// Any failure tears the transport down fully.
    ///
    virtual Connect::Var connect(const std::string& endpoint, const std::chrono::milliseconds timeout) = 0;

    struct Send
    {
        using Success = std::uint32_t;  // invoke-ID
        using Failure = sdk::Error;     // `NotConnected` or `TooManyPending`
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Sends a confirmed request.
    ///
    /// On success the completion is called later, exactly once, with the service response element.
    /// On failure the completion is never called.
    ///
    virtual Send::Var sendRequest(const sdk::Service              service,
                                  ber::BerValue                   service_request,
                                  const std::chrono::milliseconds timeout,
                                  Completion                      completion) = 0;

    /// Completes a still pending request with `Cancelled`. A late response to it is then unexpected.
    ///
    virtual void cancel(const std::uint32_t invoke_id) = 0;

    struct Release
    {
        using Success = sdk::Done;
        using Failure = sdk::Error;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Sends MMS conclude, waits (bounded) for its response, and closes the connection.
    ///
    virtual Release::Var release(const std::chrono::milliseconds timeout) = 0;

    /// Closes the connection immediately; pending requests fail with `ConnectionLost`.
    ///
    virtual void abort() = 0;

    CETL_NODISCARD virtual State state() const = 0;

    virtual void setUnconfirmedHandler(UnconfirmedHandler handler) = 0;

protected:
    Session() = default;

};  // Session

}  // namespace session
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_SESSION_SESSION_HPP_INCLUDED
