//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_SESSION_PENDING_TABLE_HPP_INCLUDED
#define IECMMS_COMMON_SESSION_PENDING_TABLE_HPP_INCLUDED

#include "ber/ber_value.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <vector>

namespace iecmms
{
namespace common
{
namespace session
{

/// Outcome of a confirmed request: the service response element, or the failure.
///
using Response = cetl::variant<ber::BerValue, sdk::Error>;

/// Called with the invoke-ID of the request (zero for conclude) and its outcome.
using Completion = std::function<void(const std::uint32_t invoke_id, Response&& response)>;

/// Requests awaiting their response, keyed by invoke-ID.
///
/// Not thread-safe - guarded by the owning session.
///
class PendingTable final
{
public:
    using Clock = std::chrono::steady_clock;

    struct Entry final
    {
        std::uint32_t     invoke_id;
        sdk::Service      service;
        Clock::time_point issued;
        Clock::time_point deadline;
        Completion        completion;
    };

    explicit PendingTable(const std::size_t limit, const std::uint32_t first_invoke_id = 0)
        : limit_{limit}
        , next_invoke_id_{first_invoke_id}
    {
    }

    struct Insert
    {
        using Success = std::uint32_t;  // allocated invoke-ID
        using Failure = sdk::error::TooManyPending;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Registers a new request under the next free invoke-ID.
    ///
    /// IDs increase monotonically (wrapping after the whole 32-bit space), and skip the ones still pending.
    ///
    Insert::Var insert(const sdk::Service      service,
                       const Clock::time_point now,
                       const Clock::time_point deadline,
                       Completion              completion);

    cetl::optional<Entry> take(const std::uint32_t invoke_id);

    /// Removes all requests whose deadline is not after `now` (in deadline order).
    ///
    std::vector<Entry> takeExpired(const Clock::time_point now);

    std::vector<Entry> takeAll();

    cetl::optional<Clock::time_point> nextDeadline() const;

    std::size_t size() const noexcept
    {
        return entries_.size();
    }

    std::size_t limit() const noexcept
    {
        return limit_;
    }

    void setLimit(const std::size_t limit) noexcept
    {
        limit_ = limit;
    }

private:
    std::size_t                    limit_;
    std::uint32_t                  next_invoke_id_;
    std::map<std::uint32_t, Entry> entries_;

};  // PendingTable

}  // namespace session
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_SESSION_PENDING_TABLE_HPP_INCLUDED
