//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "pending_table.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

namespace iecmms
{
namespace common
{
namespace session
{

PendingTable::Insert::Var PendingTable::insert(const sdk::Service      service,
                                               const Clock::time_point now,
                                               const Clock::time_point deadline,
                                               Completion              completion)
{
    if (entries_.size() >= limit_)
    {
        return sdk::error::TooManyPending{limit_};
    }

    // The table is bounded far below 2^32 entries, so a free ID is always found.
    while (entries_.find(next_invoke_id_) != entries_.end())
    {
        ++next_invoke_id_;
    }
    const auto invoke_id = next_invoke_id_++;

    entries_.emplace(invoke_id, Entry{invoke_id, service, now, deadline, std::move(completion)});
    return invoke_id;
}

cetl::optional<PendingTable::Entry> PendingTable::take(const std::uint32_t invoke_id)
{
    const auto it = entries_.find(invoke_id);
    if (it == entries_.end())
    {
        return cetl::nullopt;
    }
    auto entry = std::move(it->second);
    entries_.erase(it);
    return entry;
}

std::vector<PendingTable::Entry> PendingTable::takeExpired(const Clock::time_point now)
{
    std::vector<Entry> expired;
    for (auto it = entries_.begin(); it != entries_.end();)
    {
        if (it->second.deadline <= now)
        {
            expired.push_back(std::move(it->second));
            it = entries_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    std::sort(expired.begin(), expired.end(), [](const Entry& lhs, const Entry& rhs) {
        //
        return lhs.deadline < rhs.deadline;
    });
    return expired;
}

std::vector<PendingTable::Entry> PendingTable::takeAll()
{
    std::vector<Entry> all;
    all.reserve(entries_.size());
    for (auto& pair : entries_)
    {
        all.push_back(std::move(pair.second));
    }
    entries_.clear();
    return all;
}

cetl::optional<PendingTable::Clock::time_point> PendingTable::nextDeadline() const
{
    cetl::optional<Clock::time_point> next;
    for (const auto& pair : entries_)
    {
        if (!next.has_value() || (pair.second.deadline < *next))
        {
            next = pair.second.deadline;
        }
    }
    return next;
}

}  // namespace session
}  // namespace common
}  // namespace iecmms
