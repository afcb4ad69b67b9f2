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
#include <metastake/staking/checked_math.hpp>
#include <metastake/staking/staking_error.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <limits>

using namespace metastake;
using namespace metastake::staking;
using namespace intx::literals;

namespace
{
    constexpr uint256_t MAX = std::numeric_limits<uint256_t>::max();
}

TEST(CheckedMath, add)
{
    EXPECT_EQ(checked_add(2, 3).value(), 5);
    EXPECT_EQ(checked_add(MAX, 0).value(), MAX);
    auto const res = checked_add(MAX, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::Overflow);
}

TEST(CheckedMath, sub)
{
    EXPECT_EQ(checked_sub(5, 5).value(), 0);
    auto const res = checked_sub(4, 5);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::Overflow);
}

TEST(CheckedMath, mul)
{
    EXPECT_EQ(checked_mul(0, MAX).value(), 0);
    EXPECT_EQ(checked_mul(MAX, 1).value(), MAX);
    EXPECT_EQ(
        checked_mul(1'000'000'000'000'000'000_u256, 7).value(),
        7'000'000'000'000'000'000_u256);

    uint256_t const half = (MAX >> 1) + 1;
    auto const res = checked_mul(half, 2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::Overflow);
}

TEST(CheckedMath, div_by_zero)
{
    EXPECT_EQ(checked_div(7, 2).value(), 3);
    auto const res = checked_div(7, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::Overflow);
}

TEST(CheckedMath, mul_div_checks_the_product)
{
    EXPECT_EQ(checked_mul_div(50, 3, 4).value(), 37);
    // the quotient would fit but the product does not
    auto const res = checked_mul_div(MAX, 2, 4);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::Overflow);
}
