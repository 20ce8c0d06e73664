//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "session/pending_table.hpp"

#include "cetl_gtest_helpers.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <vector>

namespace
{

using namespace iecmms::common::session;  // NOLINT This our main concern here in the unit tests.

using iecmms::IsNullopt;
using iecmms::sdk::Service;
using iecmms::sdk::error::TooManyPending;
using std::literals::chrono_literals::operator""s;
using testing::ElementsAre;
using testing::Field;
using testing::IsEmpty;
using testing::Optional;
using testing::SizeIs;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestPendingTable : public testing::Test
{
protected:
    using Clock = PendingTable::Clock;

    static std::vector<std::uint32_t> idsOf(const std::vector<PendingTable::Entry>& entries)
    {
        std::vector<std::uint32_t> ids;
        for (const auto& entry : entries)
        {
            ids.push_back(entry.invoke_id);
        }
        return ids;
    }

    static Completion ignore()
    {
        return [](const std::uint32_t, Response&&) {};
    }

    // MARK: Data members:

    // NOLINTBEGIN
    const Clock::time_point now_{Clock::now()};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestPendingTable, insert_allocates_increasing_ids)
{
    PendingTable table{4};
    EXPECT_THAT(table.insert(Service::Read, now_, now_ + 1s, ignore()), VariantWith<std::uint32_t>(0U));
    EXPECT_THAT(table.insert(Service::Write, now_, now_ + 1s, ignore()), VariantWith<std::uint32_t>(1U));
    EXPECT_THAT(table.insert(Service::Identify, now_, now_ + 1s, ignore()), VariantWith<std::uint32_t>(2U));
    EXPECT_EQ(table.size(), 3);

    // released IDs are not reused right away
    EXPECT_TRUE(table.take(1).has_value());
    EXPECT_THAT(table.insert(Service::Read, now_, now_ + 1s, ignore()), VariantWith<std::uint32_t>(3U));
}

TEST_F(TestPendingTable, insert_respects_limit)
{
    PendingTable table{2};
    EXPECT_THAT(table.insert(Service::Read, now_, now_ + 1s, ignore()), VariantWith<std::uint32_t>(0U));
    EXPECT_THAT(table.insert(Service::Read, now_, now_ + 1s, ignore()), VariantWith<std::uint32_t>(1U));
    EXPECT_THAT(table.insert(Service::Read, now_, now_ + 1s, ignore()),
                VariantWith<TooManyPending>(Field(&TooManyPending::limit, 2)));
    EXPECT_EQ(table.size(), 2);

    table.setLimit(3);
    EXPECT_EQ(table.limit(), 3);
    EXPECT_THAT(table.insert(Service::Read, now_, now_ + 1s, ignore()), VariantWith<std::uint32_t>(2U));
}

TEST_F(TestPendingTable, ids_wrap_around_and_skip_pending)
{
    PendingTable table{4, 0xFFFFFFFE};
    EXPECT_THAT(table.insert(Service::Read, now_, now_ + 1s, ignore()), VariantWith<std::uint32_t>(0xFFFFFFFEU));
    EXPECT_THAT(table.insert(Service::Read, now_, now_ + 1s, ignore()), VariantWith<std::uint32_t>(0xFFFFFFFFU));
    EXPECT_THAT(table.insert(Service::Read, now_, now_ + 1s, ignore()), VariantWith<std::uint32_t>(0U));

    PendingTable busy{4, 5};
    EXPECT_THAT(busy.insert(Service::Read, now_, now_ + 1s, ignore()), VariantWith<std::uint32_t>(5U));
    EXPECT_THAT(busy.insert(Service::Read, now_, now_ + 1s, ignore()), VariantWith<std::uint32_t>(6U));
}

TEST_F(TestPendingTable, take)
{
    PendingTable table{4, 10};
    std::uint32_t completed = 0;
    ASSERT_THAT(table.insert(Service::GetNameList,
                             now_,
                             now_ + 2s,
                             [&completed](const std::uint32_t invoke_id, Response&&) { completed = invoke_id; }),
                VariantWith<std::uint32_t>(10U));

    auto entry = table.take(10);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->invoke_id, 10);
    EXPECT_EQ(entry->service, Service::GetNameList);
    EXPECT_EQ(entry->issued, now_);
    EXPECT_EQ(entry->deadline, now_ + 2s);
    entry->completion(entry->invoke_id, iecmms::sdk::Error{iecmms::sdk::error::NotConnected{}});
    EXPECT_EQ(completed, 10);

    EXPECT_THAT(table.take(10), IsNullopt());
    EXPECT_THAT(table.take(11), IsNullopt());
    EXPECT_EQ(table.size(), 0);
}

TEST_F(TestPendingTable, take_expired_in_deadline_order)
{
    PendingTable table{8};
    table.insert(Service::Read, now_, now_ + 3s, ignore());   // 0
    table.insert(Service::Read, now_, now_ + 1s, ignore());   // 1
    table.insert(Service::Read, now_, now_ + 10s, ignore());  // 2
    table.insert(Service::Read, now_, now_ + 2s, ignore());   // 3

    EXPECT_THAT(table.nextDeadline(), Optional(now_ + 1s));

    EXPECT_THAT(idsOf(table.takeExpired(now_)), IsEmpty());
    EXPECT_THAT(idsOf(table.takeExpired(now_ + 3s)), ElementsAre(1, 3, 0));
    EXPECT_EQ(table.size(), 1);
    EXPECT_THAT(table.nextDeadline(), Optional(now_ + 10s));
}

TEST_F(TestPendingTable, take_all)
{
    PendingTable table{8};
    EXPECT_THAT(table.nextDeadline(), IsNullopt());
    EXPECT_THAT(table.takeAll(), IsEmpty());

    table.insert(Service::Read, now_, now_ + 1s, ignore());
    table.insert(Service::Write, now_, now_ + 1s, ignore());
    EXPECT_THAT(table.takeAll(), SizeIs(2));
    EXPECT_EQ(table.size(), 0);
    EXPECT_THAT(table.nextDeadline(), IsNullopt());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
