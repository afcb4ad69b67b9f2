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

#include <metastake/core/address.hpp>
#include <metastake/core/int.hpp>
#include <metastake/staking/config.hpp>
#include <metastake/staking/emission.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

METASTAKE_STAKING_NAMESPACE_BEGIN

struct Pool
{
    Address stake_asset{};
    uint256_t weight{0};
    uint64_t last_settled_height{0};
    uint256_t acc_reward_per_share{0}; // scaled by SCALE
    uint256_t total_staked{0};
    uint256_t min_deposit{0};
    uint64_t unstake_lock_blocks{0};

    bool operator==(Pool const &) const = default;
};

struct UnstakeRequest
{
    uint256_t amount{0};
    uint64_t maturity_height{0};

    bool operator==(UnstakeRequest const &) const = default;
};

struct UserInfo
{
    uint256_t stake{0};
    // stake * acc_reward_per_share / SCALE as of the last touch
    uint256_t settled_baseline{0};
    uint256_t pending_reward{0};
    std::vector<UnstakeRequest> withdrawal_queue{};

    bool operator==(UserInfo const &) const = default;
};

struct UserKey
{
    size_t pool_id{0};
    Address user{};

    bool operator==(UserKey const &) const = default;
};

struct UserKeyHash
{
    using is_avalanching = void;

    uint64_t operator()(UserKey const &key) const noexcept
    {
        uint64_t const h1 = ankerl::unordered_dense::detail::wyhash::hash(
            key.user.bytes, sizeof(key.user.bytes));
        return ankerl::unordered_dense::detail::wyhash::mix(
            h1, static_cast<uint64_t>(key.pool_id));
    }
};

struct GlobalParams
{
    bool initialized{false};
    Address reward_asset{};
    EmissionSchedule schedule{};
    uint256_t total_weight{0}; // sum of every pool weight

    bool operator==(GlobalParams const &) const = default;
};

METASTAKE_STAKING_NAMESPACE_END
