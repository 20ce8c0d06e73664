//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_EVENTS_HPP_INCLUDED
#define IECMMS_SDK_EVENTS_HPP_INCLUDED

#include "errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace iecmms
{
namespace sdk
{

/// Structured events emitted by a session for observability.
///
struct SessionEvent final
{
    struct AssociationEstablished final
    {
        std::string   endpoint;
        std::uint32_t max_pending_requests;
    };
    struct AssociationLost final
    {
        std::string reason;
    };
    /// A response whose invoke-ID matches no pending request (including late responses).
    struct UnexpectedResponse final
    {
        std::uint32_t invoke_id;
    };
    struct RequestTimedOut final
    {
        Service       service;
        std::uint32_t invoke_id;
    };
    struct MalformedPdu final
    {
        std::string detail;
    };

    using Var = cetl::variant<AssociationEstablished,  //
                              AssociationLost,
                              UnexpectedResponse,
                              RequestTimedOut,
                              MalformedPdu>;

};  // SessionEvent

/// Observer of session events.
///
/// Called from the session's internal threads, never while internal locks are held.
///
class EventSink
{
public:
    using Ptr = std::shared_ptr<EventSink>;

    /// Makes a sink which writes every event into the `session` logger.
    ///
    static Ptr makeLogging();

    EventSink(const EventSink&)                = delete;
    EventSink(EventSink&&) noexcept            = delete;
    EventSink& operator=(const EventSink&)     = delete;
    EventSink& operator=(EventSink&&) noexcept = delete;

    virtual ~EventSink() = default;

    virtual void onEvent(const SessionEvent::Var& event) = 0;

protected:
    EventSink() = default;

};  // EventSink

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_EVENTS_HPP_INCLUDED
