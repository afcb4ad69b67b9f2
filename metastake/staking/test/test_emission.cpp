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

#include <metastake/core/int.hpp>
#include <metastake/staking/emission.hpp>
#include <metastake/staking/staking_error.hpp>

#include <gtest/gtest.h>

#include <limits>

using namespace metastake;
using namespace metastake::staking;

namespace
{
    constexpr EmissionSchedule SCHEDULE{
        .start_height = 100, .end_height = 200, .reward_per_block = 5};
}

TEST(EmissionSchedule, inside_window)
{
    EXPECT_EQ(SCHEDULE.multiplier(110, 120).value(), 50);
    EXPECT_EQ(SCHEDULE.multiplier(100, 200).value(), 500);
}

TEST(EmissionSchedule, clipped_to_window)
{
    EXPECT_EQ(SCHEDULE.multiplier(50, 110).value(), 50);
    EXPECT_EQ(SCHEDULE.multiplier(190, 500).value(), 50);
    EXPECT_EQ(SCHEDULE.multiplier(0, 1000).value(), 500);
}

TEST(EmissionSchedule, empty_ranges_mint_nothing)
{
    EXPECT_EQ(SCHEDULE.multiplier(150, 150).value(), 0);
    EXPECT_EQ(SCHEDULE.multiplier(201, 300).value(), 0);
    EXPECT_EQ(SCHEDULE.multiplier(200, 300).value(), 0);
    EXPECT_EQ(SCHEDULE.multiplier(10, 99).value(), 0);
    EXPECT_EQ(SCHEDULE.multiplier(10, 100).value(), 0);
}

TEST(EmissionSchedule, inverted_range)
{
    auto const res = SCHEDULE.multiplier(150, 149);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::InvalidParameter);
}

TEST(EmissionSchedule, overflow)
{
    EmissionSchedule const schedule{
        .start_height = 0,
        .end_height = 10,
        .reward_per_block = std::numeric_limits<uint256_t>::max()};
    EXPECT_EQ(
        schedule.multiplier(0, 1).value(),
        std::numeric_limits<uint256_t>::max());
    auto const res = schedule.multiplier(0, 2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::Overflow);
}

TEST(EmissionSchedule, validation)
{
    EXPECT_FALSE(validate_window(100, 100).has_error());
    EXPECT_EQ(
        validate_window(101, 100).assume_error(),
        StakingError::InvalidParameter);
    EXPECT_EQ(
        validate_reward_per_block(0).assume_error(),
        StakingError::InvalidParameter);
    EXPECT_FALSE(validate_reward_per_block(1).has_error());
}
