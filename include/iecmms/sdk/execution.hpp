//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_EXECUTION_HPP_INCLUDED
#define IECMMS_SDK_EXECUTION_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace iecmms
{
namespace sdk
{

/// Internal implementation details.
/// Not supposed to be used directly by the users of the SDK.
///
namespace detail
{

template <typename Result>
class StateOf;

template <typename Result>
class ReceiverOf final
{
public:
    explicit ReceiverOf(std::shared_ptr<StateOf<Result>> state)
        : state_{std::move(state)}
    {
    }

    template <typename... Args>
    void operator()(Args&&... args)
    {
        state_->complete(std::forward<Args>(args)...);
    }

private:
    std::shared_ptr<StateOf<Result>> state_;

};  // ReceiverOf

/// Completion slot shared between a receiver (completing on any thread) and a waiting caller.
///
template <typename Result>
class StateOf final : public std::enable_shared_from_this<StateOf<Result>>
{
public:
    bool completed() const
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        return maybe_result_.has_value();
    }

    void wait()
    {
        std::unique_lock<std::mutex> lock{mutex_};
        condition_.wait(lock, [this] { return maybe_result_.has_value(); });
    }

    Result get()
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        CETL_DEBUG_ASSERT(maybe_result_, "");
        return std::move(*maybe_result_);
    }

    ReceiverOf<Result> makeReceiver()
    {
        return ReceiverOf<Result>{this->shared_from_this()};
    }

private:
    friend class ReceiverOf<Result>;

    template <typename... Args>
    void complete(Args&&... args)
    {
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            if (maybe_result_.has_value())
            {
                return;
            }
            maybe_result_.emplace(std::forward<Args>(args)...);
        }
        condition_.notify_all();
    }

    mutable std::mutex      mutex_;
    std::condition_variable condition_;
    cetl::optional<Result>  maybe_result_;

};  // StateOf

}  // namespace detail

/// Abstract interface of a result sender.
///
template <typename Result_>
class SenderOf
{
public:
    using Ptr    = std::unique_ptr<SenderOf>;
    using Result = Result_;

    SenderOf(SenderOf&&)                 = delete;
    SenderOf(const SenderOf&)            = delete;
    SenderOf& operator=(SenderOf&&)      = delete;
    SenderOf& operator=(const SenderOf&) = delete;

    virtual ~SenderOf() = default;

    /// Initiates an operation execution by submitting a given receiver to this sender.
    ///
    /// The submit "consumes" the receiver (no longer usable after this call).
    /// The receiver is called exactly once, possibly from an internal thread of the client.
    ///
    template <typename Receiver>
    void submit(Receiver&& receiver)
    {
        submitImpl([receive = std::forward<Receiver>(receiver)](Result&& result) mutable {
            //
            receive(std::move(result));
        });
    }

    /// Cancels the submitted operation.
    ///
    /// If the operation is still pending, its receiver is completed with the `Cancelled` failure.
    /// Other operations of the same connection are not affected. No-op after completion.
    ///
    virtual void cancel() = 0;

protected:
    SenderOf() = default;

    virtual void submitImpl(std::function<void(Result&&)>&& receiver) = 0;

};  // SenderOf

/// Initiates an operation execution by submitting a given receiver to the sender.
///
/// Submit "consumes" the receiver (no longer usable after this call).
///
template <typename Sender, typename Receiver>
void submit(Sender& sender, Receiver&& receiver)
{
    sender.submit(std::forward<Receiver>(receiver));
}

/// Initiates an operation execution by submitting a given receiver to the sender.
///
/// The submit "consumes" the receiver (no longer usable after this call).
///
template <typename Sender, typename Receiver>
void submit(std::unique_ptr<Sender>& sender_ptr, Receiver&& receiver)
{
    sender_ptr->submit(std::forward<Receiver>(receiver));
}

/// Algorithm that synchronously waits for the sender to emit result.
///
/// This algorithm "consumes" the sender, meaning that the sender is no longer usable after this call.
/// The calling thread blocks on its own completion signal only.
///
template <typename Result, typename Sender>
Result sync_wait(Sender&& sender)
{
    auto state = std::make_shared<detail::StateOf<Result>>();

    // Keep the sender alive until its result is delivered.
    auto local_sender = std::forward<Sender>(sender);
    submit(local_sender, state->makeReceiver());

    state->wait();
    return state->get();
}

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_EXECUTION_HPP_INCLUDED
