//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_REQUEST_SENDER_HPP_INCLUDED
#define IECMMS_SDK_REQUEST_SENDER_HPP_INCLUDED

#include "ber/ber_value.hpp"
#include "logging.hpp"
#include "session/pending_table.hpp"
#include "session/session.hpp"

#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/execution.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace iecmms
{
namespace sdk
{

/// One confirmed request, ready to be sent, plus the interpretation of its response.
///
template <typename Result>
struct PreparedRequest final
{
    using Interpret = std::function<Result(const std::uint32_t invoke_id, const ber::BerValue& response)>;

    Service                   service;
    ber::BerValue             request;
    std::chrono::milliseconds timeout;
    Interpret                 interpret;
};

/// Adapter of a session request to be used as a cancellable sender.
///
/// The request is prepared (and sent) only when a receiver is submitted,
/// so resolving its target may block the submitting thread.
///
template <typename Result>
class RequestSender final : public SenderOf<Result>
{
public:
    using Prepared = cetl::variant<PreparedRequest<Result>, Error>;
    using Prepare  = std::function<Prepared()>;

    RequestSender(const Service                 service,
                  common::session::Session::Ptr session,
                  Prepare                       prepare,
                  common::LoggerPtr             logger)
        : service_{service}
        , session_{std::move(session)}
        , prepare_{std::move(prepare)}
        , logger_{std::move(logger)}
        , control_{std::make_shared<Control>()}
    {
    }

    void cancel() override
    {
        cetl::optional<std::uint32_t> invoke_id;
        {
            const std::lock_guard<std::mutex> lock{control_->mutex};
            control_->cancel_requested = true;
            invoke_id                  = control_->invoke_id;
        }
        if (invoke_id.has_value())
        {
            session_->cancel(*invoke_id);
        }
    }

protected:
    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        auto shared_receiver = std::make_shared<std::function<void(Result&&)>>(std::move(receiver));

        {
            const std::lock_guard<std::mutex> lock{control_->mutex};
            if (control_->cancel_requested)
            {
                logger_->debug("Operation `{}` cancelled before sending.", toString(service_));
                (*shared_receiver)(Result{error::Cancelled{service_, 0}});
                return;
            }
        }

        auto prepared = prepare_();
        if (auto* const failure = cetl::get_if<Error>(&prepared))
        {
            (*shared_receiver)(Result{std::move(*failure)});
            return;
        }
        auto& request = cetl::get<PreparedRequest<Result>>(prepared);

        logger_->trace("Submitting `{}` operation.", toString(request.service));
        auto sent = session_->sendRequest(  //
            request.service,
            std::move(request.request),
            request.timeout,
            [shared_receiver, interpret = std::move(request.interpret)](const std::uint32_t         invoke_id,
                                                                        common::session::Response&& response) {
                //
                if (auto* const failure = cetl::get_if<Error>(&response))
                {
                    (*shared_receiver)(Result{std::move(*failure)});
                    return;
                }
                (*shared_receiver)(interpret(invoke_id, cetl::get<ber::BerValue>(response)));
            });
        if (auto* const failure = cetl::get_if<common::session::Session::Send::Failure>(&sent))
        {
            (*shared_receiver)(Result{std::move(*failure)});
            return;
        }

        const auto invoke_id        = cetl::get<common::session::Session::Send::Success>(sent);
        bool       cancel_requested = false;
        {
            const std::lock_guard<std::mutex> lock{control_->mutex};
            control_->invoke_id = invoke_id;
            cancel_requested    = control_->cancel_requested;
        }
        if (cancel_requested)
        {
            session_->cancel(invoke_id);
        }
    }

private:
    struct Control final
    {
        std::mutex                    mutex;
        bool                          cancel_requested{false};
        cetl::optional<std::uint32_t> invoke_id;
    };

    const Service                       service_;
    const common::session::Session::Ptr session_;
    const Prepare                       prepare_;
    common::LoggerPtr                   logger_;
    std::shared_ptr<Control>            control_;

};  // RequestSender

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_REQUEST_SENDER_HPP_INCLUDED
