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

#pragma once

#include <metastake/core/int.hpp>
#include <metastake/core/result.hpp>
#include <metastake/staking/config.hpp>
#include <metastake/staking/types.hpp>

METASTAKE_STAKING_NAMESPACE_BEGIN

// stake * acc_reward_per_share / SCALE
Result<uint256_t>
accrued_reward(uint256_t const &stake, uint256_t const &acc_reward_per_share);

// accrued - settled_baseline + pending_reward
Result<uint256_t>
owed_reward(UserInfo const &, uint256_t const &acc_reward_per_share);

// moves the reward accrued since the last touch into pending_reward
Result<void>
fold_accrued(UserInfo &, uint256_t const &acc_reward_per_share);

// must follow every change of stake
Result<void> rebase(UserInfo &, uint256_t const &acc_reward_per_share);

METASTAKE_STAKING_NAMESPACE_END
