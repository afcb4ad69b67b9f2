// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <metastake/staking/types.hpp>
#include <metastake/staking/withdrawal_queue.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace metastake;
using namespace metastake::staking;

TEST(WithdrawalQueue, matured_prefix_stops_at_first_immature)
{
    std::vector<UnstakeRequest> const queue{
        {.amount = 10, .maturity_height = 110},
        {.amount = 20, .maturity_height = 120},
        {.amount = 30, .maturity_height = 130}};

    auto prefix = matured_prefix(queue, 109).value();
    EXPECT_EQ(prefix.amount, 0);
    EXPECT_EQ(prefix.count, 0);

    prefix = matured_prefix(queue, 120).value();
    EXPECT_EQ(prefix.amount, 30);
    EXPECT_EQ(prefix.count, 2);

    prefix = matured_prefix(queue, 1000).value();
    EXPECT_EQ(prefix.amount, 60);
    EXPECT_EQ(prefix.count, 3);
}

TEST(WithdrawalQueue, drop_prefix_compacts)
{
    std::vector<UnstakeRequest> queue{
        {.amount = 10, .maturity_height = 110},
        {.amount = 20, .maturity_height = 120},
        {.amount = 30, .maturity_height = 130}};

    drop_prefix(queue, 2);
    ASSERT_EQ(queue.size(), 1);
    EXPECT_EQ(queue[0], (UnstakeRequest{.amount = 30, .maturity_height = 130}));

    drop_prefix(queue, 0);
    EXPECT_EQ(queue.size(), 1);
    drop_prefix(queue, 1);
    EXPECT_TRUE(queue.empty());
}

TEST(WithdrawalQueue, out_of_order_maturity_blocks_later_entries)
{
    // lock duration shortened after the first request
    std::vector<UnstakeRequest> const queue{
        {.amount = 10, .maturity_height = 150},
        {.amount = 20, .maturity_height = 120}};

    auto const prefix = matured_prefix(queue, 130).value();
    EXPECT_EQ(prefix.amount, 0);
    EXPECT_EQ(prefix.count, 0);

    // the summary scans every request
    auto const summary = summarize(queue, 130).value();
    EXPECT_EQ(summary.requested, 30);
    EXPECT_EQ(summary.withdrawable, 20);
}

TEST(WithdrawalQueue, summarize_empty)
{
    auto const summary = summarize({}, 100).value();
    EXPECT_EQ(summary.requested, 0);
    EXPECT_EQ(summary.withdrawable, 0);
}
