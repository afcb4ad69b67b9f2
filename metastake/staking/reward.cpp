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
#include <metastake/core/result.hpp>
#include <metastake/staking/checked_math.hpp>
#include <metastake/staking/constants.hpp>
#include <metastake/staking/reward.hpp>
#include <metastake/staking/types.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

METASTAKE_STAKING_NAMESPACE_BEGIN

Result<uint256_t> accrued_reward(
    uint256_t const &stake, uint256_t const &acc_reward_per_share)
{
    return checked_mul_div(stake, acc_reward_per_share, SCALE);
}

Result<uint256_t>
owed_reward(UserInfo const &user, uint256_t const &acc_reward_per_share)
{
    BOOST_OUTCOME_TRY(
        auto const accrued, accrued_reward(user.stake, acc_reward_per_share));
    BOOST_OUTCOME_TRY(
        auto const unsettled, checked_sub(accrued, user.settled_baseline));
    return checked_add(unsettled, user.pending_reward);
}

Result<void>
fold_accrued(UserInfo &user, uint256_t const &acc_reward_per_share)
{
    BOOST_OUTCOME_TRY(
        auto const pending, owed_reward(user, acc_reward_per_share));
    user.pending_reward = pending;
    return outcome::success();
}

Result<void> rebase(UserInfo &user, uint256_t const &acc_reward_per_share)
{
    BOOST_OUTCOME_TRY(
        auto const baseline,
        accrued_reward(user.stake, acc_reward_per_share));
    user.settled_baseline = baseline;
    return outcome::success();
}

METASTAKE_STAKING_NAMESPACE_END
