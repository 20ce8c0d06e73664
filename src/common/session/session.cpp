//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "session.hpp"

#include "ber/ber_codec.hpp"
#include "ber/ber_value.hpp"
#include "iso/iso_link.hpp"
#include "logging.hpp"
#include "mms/initiate.hpp"
#include "mms/pdu.hpp"
#include "pending_table.hpp"

#include "iecmms/sdk/client.hpp"
#include "iecmms/sdk/errors.hpp"
#include "iecmms/sdk/events.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{
namespace session
{
namespace
{

using ber::BerValue;

class SessionImpl final : public Session
{
    using Clock = PendingTable::Clock;

public:
    SessionImpl(const sdk::ClientOptions& options, LinkFactory link_factory, sdk::EventSink::Ptr event_sink)
        : options_{options}
        , link_factory_{std::move(link_factory)}
        , event_sink_{std::move(event_sink)}
        , logger_{getLogger("session")}
        , state_{State::Disconnected}
        , table_{options.max_pending_requests}
    {
        CETL_DEBUG_ASSERT(link_factory_, "");
    }

    SessionImpl(SessionImpl&&)                 = delete;
    SessionImpl(const SessionImpl&)            = delete;
    SessionImpl& operator=(SessionImpl&&)      = delete;
    SessionImpl& operator=(const SessionImpl&) = delete;

    ~SessionImpl() override
    {
        abort();
        joinThreads();
    }

    // MARK: Session

    Connect::Var connect(const std::string& endpoint, const std::chrono::milliseconds timeout) override
    {
        {
            std::unique_lock<std::mutex> lock{mutex_};
            if (state_ != State::Disconnected)
            {
                return sdk::error::Connect{sdk::ConnectError::Refused, "session is already connected"};
            }
            state_ = State::Connecting;
        }
        // Threads of a previous connection (if any) are finishing - wait for them before reusing the members.
        awaitThreads();

        logger_->info("Connecting to '{}'...", endpoint);

        std::shared_ptr<iso::IsoLink> link{link_factory_()};
        if (!link)
        {
            setState(State::Disconnected);
            return sdk::error::Connect{sdk::ConnectError::Refused, "no link"};
        }

        mms::InitiateRequest initiate;
        initiate.max_serv_outstanding_calling = clampOutstanding(options_.max_pending_requests);
        initiate.max_serv_outstanding_called  = initiate.max_serv_outstanding_calling;

        auto associated = link->associate({endpoint, options_.password}, mms::buildInitiateRequest(initiate), timeout);
        if (auto* const failure = cetl::get_if<iso::IsoLink::Associate::Failure>(&associated))
        {
            link->close();
            setState(State::Disconnected);
            return std::move(*failure);
        }

        auto negotiated = mms::parseInitiateResponse(cetl::get<iso::IsoLink::Associate::Success>(associated));
        if (const auto* const failure = cetl::get_if<sdk::Error>(&negotiated))
        {
            logger_->warn("MMS initiate with '{}' failed: {}.", endpoint, sdk::describe(*failure));
            link->close();
            setState(State::Disconnected);
            return sdk::error::Connect{sdk::ConnectError::AssociationRejected, sdk::describe(*failure)};
        }
        const auto& response = cetl::get<mms::InitiateResponse>(negotiated);

        const auto limit = std::min<std::size_t>(options_.max_pending_requests,
                                                 static_cast<std::size_t>(response.max_serv_outstanding_calling));
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            link_ = link;
            table_.setLimit(limit);
            state_     = State::Associated;
            stopping_  = false;
            releasing_ = false;
            ++generation_;
            const auto generation = generation_;

            const std::lock_guard<std::mutex> threads_lock{threads_mutex_};
            threads_generation_ = generation;
            reader_             = std::thread([this, link, generation] {
                //
                readerLoop(link, generation);
            });
            timer_ = std::thread([this, generation] {
                //
                timerLoop(generation);
            });
        }

        logger_->info("Associated with '{}' (max_pending={}, version={}).", endpoint, limit, response.version);
        emit(sdk::SessionEvent::AssociationEstablished{endpoint, static_cast<std::uint32_t>(limit)});
        return sdk::Done{};
    }

    Send::Var sendRequest(const sdk::Service              service,
                          BerValue                        service_request,
                          const std::chrono::milliseconds timeout,
                          Completion                      completion) override
    {
        std::shared_ptr<iso::IsoLink> link;
        std::uint32_t                 invoke_id{};
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            if (state_ != State::Associated)
            {
                return sdk::error::NotConnected{};
            }
            const auto now      = Clock::now();
            auto       inserted = table_.insert(service, now, now + timeout, std::move(completion));
            if (const auto* const failure = cetl::get_if<PendingTable::Insert::Failure>(&inserted))
            {
                logger_->debug("Too many pending requests (limit={}).", failure->limit);
                return *failure;
            }
            invoke_id = cetl::get<PendingTable::Insert::Success>(inserted);
            link      = link_;
        }
        timer_condition_.notify_all();

        logger_->trace("Sending request (service={}, invoke_id={}).", sdk::toString(service), invoke_id);
        const auto bytes = ber::encode(mms::buildConfirmedRequest(invoke_id, std::move(service_request)));

        int err = 0;
        {
            const std::lock_guard<std::mutex> write_lock{write_mutex_};
            err = link->send(bytes);
        }
        if (err != 0)
        {
            logger_->warn("Failed to send request (service={}, invoke_id={}, err={}).",
                          sdk::toString(service),
                          invoke_id,
                          err);
            link->close();  // the reader fails all the other pending requests
            if (auto entry = takeEntry(invoke_id))
            {
                entry->completion(invoke_id, sdk::error::ConnectionLost{service, invoke_id});
            }
        }
        return invoke_id;
    }

    void cancel(const std::uint32_t invoke_id) override
    {
        if (auto entry = takeEntry(invoke_id))
        {
            logger_->debug("Request cancelled (service={}, invoke_id={}).", sdk::toString(entry->service), invoke_id);
            entry->completion(invoke_id, sdk::error::Cancelled{entry->service, invoke_id});
        }
    }

    Release::Var release(const std::chrono::milliseconds timeout) override
    {
        std::shared_ptr<iso::IsoLink> link;
        auto                          promise = std::make_shared<std::promise<Response>>();
        auto                          future  = promise->get_future();
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            if (state_ != State::Associated)
            {
                return sdk::error::NotConnected{};
            }
            link                 = link_;
            releasing_           = true;
            conclude_completion_ = [promise](const std::uint32_t, Response&& response) {
                //
                promise->set_value(std::move(response));
            };
        }

        logger_->info("Releasing the association...");
        int err = 0;
        {
            const std::lock_guard<std::mutex> write_lock{write_mutex_};
            err = link->send(ber::encode(mms::buildConcludeRequest()));
        }

        Release::Var result = sdk::Done{};
        if (err != 0)
        {
            result = sdk::error::ConnectionLost{sdk::Service::Conclude, 0};
        }
        else if (future.wait_for(timeout) != std::future_status::ready)
        {
            result = sdk::error::RequestTimeout{sdk::Service::Conclude, 0};
        }
        else
        {
            auto response = future.get();
            if (auto* const failure = cetl::get_if<sdk::Error>(&response))
            {
                result = std::move(*failure);
            }
            else
            {
                auto concluded = mms::parseConcludeResponse(cetl::get<BerValue>(response));
                if (auto* const failure = cetl::get_if<sdk::Error>(&concluded))
                {
                    result = std::move(*failure);
                }
            }
        }

        // Closing is unconditional - a refused conclude still ends this client's use of the association.
        shutdown();
        logger_->info("Association released.");
        return result;
    }

    void abort() override
    {
        std::shared_ptr<iso::IsoLink> link;
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            link = link_;
            if (state_ == State::Associated)
            {
                state_ = State::Disconnected;
            }
        }
        if (link)
        {
            std::unique_lock<std::mutex> write_lock{write_mutex_, std::try_to_lock};
            if (write_lock.owns_lock())
            {
                link->abort();
            }
        }
        shutdown();
    }

    State state() const override
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        return state_;
    }

    void setUnconfirmedHandler(UnconfirmedHandler handler) override
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        unconfirmed_handler_ = std::move(handler);
    }

private:
    static std::int16_t clampOutstanding(const std::size_t value)
    {
        return static_cast<std::int16_t>(
            std::max<std::size_t>(1, std::min<std::size_t>(value, std::numeric_limits<std::int16_t>::max())));
    }

    void setState(const State state)
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        state_ = state;
    }

    void emit(const sdk::SessionEvent::Var& event) const
    {
        if (event_sink_)
        {
            event_sink_->onEvent(event);
        }
    }

    cetl::optional<PendingTable::Entry> takeEntry(const std::uint32_t invoke_id)
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        return table_.take(invoke_id);
    }

    /// Closes the current link (if any), marks the session disconnected and stops the internal threads.
    ///
    /// Pending requests are failed by the reader, once it sees the link closed.
    ///
    void shutdown()
    {
        std::shared_ptr<iso::IsoLink> link;
        std::uint64_t                 generation{};
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            if (state_ == State::Associated)
            {
                state_ = State::Disconnected;
            }
            stopping_  = true;
            link       = link_;
            generation = generation_;
        }
        timer_condition_.notify_all();
        if (link)
        {
            link->close();
        }
        joinThreads(generation);
    }

    /// Joins the internal threads of the given (or any older) connection.
    ///
    /// Concurrent callers never join the same thread twice.
    ///
    void joinThreads(const std::uint64_t up_to_generation = std::numeric_limits<std::uint64_t>::max())
    {
        std::thread reader;
        std::thread timer;
        {
            const std::lock_guard<std::mutex> lock{threads_mutex_};
            if (threads_generation_ <= up_to_generation)
            {
                reader = std::move(reader_);
                timer  = std::move(timer_);
            }
            ++joining_;
        }
        for (auto* const thread : {&reader, &timer})
        {
            if (!thread->joinable())
            {
                continue;
            }
            if (thread->get_id() == std::this_thread::get_id())
            {
                thread->detach();
            }
            else
            {
                thread->join();
            }
        }
        {
            const std::lock_guard<std::mutex> lock{threads_mutex_};
            --joining_;
        }
        threads_condition_.notify_all();
    }

    /// Joins the internal threads, and waits for those still being joined by another caller.
    ///
    void awaitThreads()
    {
        joinThreads();
        std::unique_lock<std::mutex> lock{threads_mutex_};
        threads_condition_.wait(lock, [this] { return joining_ == 0; });
    }

    void readerLoop(const std::shared_ptr<iso::IsoLink>& link, const std::uint64_t generation)
    {
        std::string reason;
        for (;;)
        {
            auto received = link->receive();
            if (const auto* const err = cetl::get_if<iso::IsoLink::Receive::Failure>(&received))
            {
                reason = (*err == EPROTO) ? "framing error" : "connection closed";
                break;
            }
            const auto& bytes = cetl::get<iso::IsoLink::Receive::Success>(received);

            auto decoded = ber::decode(ber::view(bytes));
            if (const auto* const failure = cetl::get_if<ber::DecodeResult::Failure>(&decoded))
            {
                logger_->warn("Malformed MMS PDU: {}.", failure->detail);
                emit(sdk::SessionEvent::MalformedPdu{failure->detail});
                continue;
            }
            dispatch(cetl::get<ber::DecodeResult::Success>(decoded).value);
        }
        onLinkLost(link, generation, reason);
    }

    void dispatch(const BerValue& pdu)
    {
        const auto type = mms::pduType(pdu);
        if (!type.has_value())
        {
            emit(sdk::SessionEvent::MalformedPdu{"unknown MMS PDU (tag=" + pdu.describeTag() + ")"});
            return;
        }

        switch (*type)
        {
        case mms::PduType::ConfirmedResponse:
        case mms::PduType::ConfirmedError:
        case mms::PduType::Reject: {
            onConfirmed(pdu);
            break;
        }
        case mms::PduType::Unconfirmed: {
            UnconfirmedHandler handler;
            {
                const std::lock_guard<std::mutex> lock{mutex_};
                handler = unconfirmed_handler_;
            }
            if (handler)
            {
                handler(pdu);
            }
            break;
        }
        case mms::PduType::ConcludeResponse:
        case mms::PduType::ConcludeError: {
            Completion completion;
            {
                const std::lock_guard<std::mutex> lock{mutex_};
                std::swap(completion, conclude_completion_);
            }
            if (completion)
            {
                completion(0, pdu);
            }
            break;
        }
        default: {
            logger_->warn("Ignoring unsupported MMS PDU (tag={}).", pdu.describeTag());
            break;
        }
        }
    }

    void onConfirmed(const BerValue& pdu)
    {
        const auto invoke_id = mms::peekInvokeId(pdu);
        if (!invoke_id.has_value())
        {
            logger_->warn("Confirmed PDU without invoke-ID (tag={}).", pdu.describeTag());
            emit(sdk::SessionEvent::MalformedPdu{"confirmed PDU without invoke-ID"});
            return;
        }

        auto entry = takeEntry(*invoke_id);
        if (!entry)
        {
            logger_->debug("Unexpected response (invoke_id={}).", *invoke_id);
            emit(sdk::SessionEvent::UnexpectedResponse{*invoke_id});
            return;
        }

        logger_->trace("Received response (service={}, invoke_id={}).", sdk::toString(entry->service), *invoke_id);
        auto parsed = mms::parseConfirmedResponse(pdu, entry->service, *invoke_id);
        if (auto* const failure = cetl::get_if<sdk::Error>(&parsed))
        {
            entry->completion(*invoke_id, std::move(*failure));
        }
        else
        {
            entry->completion(*invoke_id, cetl::get<BerValue>(std::move(parsed)));
        }
    }

    void onLinkLost(const std::shared_ptr<iso::IsoLink>& link,
                    const std::uint64_t                  generation,
                    const std::string&                   reason)
    {
        std::vector<PendingTable::Entry> entries;
        Completion                       conclude;
        bool                             was_associated = false;
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            if (generation != generation_)
            {
                return;
            }
            entries = table_.takeAll();
            std::swap(conclude, conclude_completion_);
            was_associated = (state_ == State::Associated) && !releasing_;
            state_         = State::Disconnected;
            stopping_      = true;
            link_.reset();
        }
        timer_condition_.notify_all();
        link->close();

        if (was_associated)
        {
            logger_->warn("Association lost: {} (pending={}).", reason, entries.size());
        }
        for (auto& entry : entries)
        {
            entry.completion(entry.invoke_id, sdk::error::ConnectionLost{entry.service, entry.invoke_id});
        }
        if (conclude)
        {
            conclude(0, sdk::error::ConnectionLost{sdk::Service::Conclude, 0});
        }
        if (was_associated)
        {
            emit(sdk::SessionEvent::AssociationLost{reason});
        }
    }

    void timerLoop(const std::uint64_t generation)
    {
        std::unique_lock<std::mutex> lock{mutex_};
        while (!stopping_ && (generation == generation_))
        {
            const auto next = table_.nextDeadline();
            if (next.has_value())
            {
                timer_condition_.wait_until(lock, *next);
            }
            else
            {
                timer_condition_.wait(lock);
            }

            auto expired = table_.takeExpired(Clock::now());
            if (expired.empty())
            {
                continue;
            }

            lock.unlock();
            for (auto& entry : expired)
            {
                logger_->debug("Request timed out (service={}, invoke_id={}).",
                               sdk::toString(entry.service),
                               entry.invoke_id);
                entry.completion(entry.invoke_id, sdk::error::RequestTimeout{entry.service, entry.invoke_id});
                emit(sdk::SessionEvent::RequestTimedOut{entry.service, entry.invoke_id});
            }
            lock.lock();
        }
    }

    const sdk::ClientOptions            options_;
    const LinkFactory                   link_factory_;
    const sdk::EventSink::Ptr           event_sink_;
    LoggerPtr                           logger_;
    mutable std::mutex                  mutex_;
    std::mutex                          write_mutex_;
    std::condition_variable             timer_condition_;
    State                               state_;
    PendingTable                        table_;
    std::shared_ptr<iso::IsoLink>       link_;
    Completion                          conclude_completion_;
    UnconfirmedHandler                  unconfirmed_handler_;
    bool                                stopping_{true};
    bool                                releasing_{false};
    std::uint64_t                       generation_{0};
    std::mutex                          threads_mutex_;
    std::condition_variable             threads_condition_;
    std::size_t                         joining_{0};
    std::uint64_t                       threads_generation_{0};
    std::thread                         reader_;
    std::thread                         timer_;

};  // SessionImpl

}  // namespace

Session::Ptr Session::make(const sdk::ClientOptions& options, LinkFactory link_factory, sdk::EventSink::Ptr event_sink)
{
    return std::make_shared<SessionImpl>(options, std::move(link_factory), std::move(event_sink));
}

}  // namespace session
}  // namespace common
}  // namespace iecmms
