//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "iecmms/sdk/events.hpp"

#include "logging.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <memory>

namespace iecmms
{
namespace sdk
{
namespace
{

class LoggingEventSink final : public EventSink
{
public:
    LoggingEventSink()
        : logger_{common::getLogger("session")}
    {
    }

    void onEvent(const SessionEvent::Var& event) override
    {
        cetl::visit(  //
            cetl::make_overloaded(
                [this](const SessionEvent::AssociationEstablished& evt) {
                    logger_->info("Event: association established (endpoint='{}', max_pending={}).",
                                  evt.endpoint,
                                  evt.max_pending_requests);
                },
                [this](const SessionEvent::AssociationLost& evt) {
                    //
                    logger_->warn("Event: association lost ({}).", evt.reason);
                },
                [this](const SessionEvent::UnexpectedResponse& evt) {
                    logger_->warn("Event: unexpected response discarded (invoke_id={}).", evt.invoke_id);
                },
                [this](const SessionEvent::RequestTimedOut& evt) {
                    logger_->warn("Event: request timed out (service={}, invoke_id={}).",
                                  toString(evt.service),
                                  evt.invoke_id);
                },
                [this](const SessionEvent::MalformedPdu& evt) {
                    //
                    logger_->error("Event: malformed PDU ({}).", evt.detail);
                }),
            event);
    }

private:
    common::LoggerPtr logger_;

};  // LoggingEventSink

}  // namespace

EventSink::Ptr EventSink::makeLogging()
{
    return std::make_shared<LoggingEventSink>();
}

}  // namespace sdk
}  // namespace iecmms
