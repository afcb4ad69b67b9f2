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

#include <metastake/core/assert.h>
#include <metastake/core/int.hpp>
#include <metastake/core/result.hpp>
#include <metastake/staking/checked_math.hpp>
#include <metastake/staking/constants.hpp>
#include <metastake/staking/events.hpp>
#include <metastake/staking/settlement.hpp>
#include <metastake/staking/state.hpp>
#include <metastake/staking/types.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>

METASTAKE_STAKING_NAMESPACE_BEGIN

Result<Settlement> settled(
    Pool const &pool, GlobalParams const &globals, uint64_t const height)
{
    if (height <= pool.last_settled_height) {
        return Settlement{.pool = pool, .minted = 0};
    }

    BOOST_OUTCOME_TRY(
        auto const multiplier,
        globals.schedule.multiplier(pool.last_settled_height, height));
    BOOST_OUTCOME_TRY(
        auto const minted,
        checked_mul_div(multiplier, pool.weight, globals.total_weight));

    Settlement result{.pool = pool, .minted = minted};
    if (pool.total_staked > 0) {
        BOOST_OUTCOME_TRY(
            auto const per_share,
            checked_mul_div(minted, SCALE, pool.total_staked));
        BOOST_OUTCOME_TRY(
            auto const acc,
            checked_add(pool.acc_reward_per_share, per_share));
        result.pool.acc_reward_per_share = acc;
    }
    result.pool.last_settled_height = height;
    return result;
}

Result<void>
settle_pool(State &state, size_t const pool_id, uint64_t const height)
{
    METASTAKE_ASSERT(pool_id < state.num_pools());
    Pool const &pool = state.pool(pool_id);
    if (height <= pool.last_settled_height) {
        return outcome::success();
    }

    BOOST_OUTCOME_TRY(
        auto const settlement, settled(pool, state.globals(), height));
    LOG_DEBUG(
        "settled pool {} over [{}, {}) minted={} total_staked={}",
        pool_id,
        pool.last_settled_height,
        height,
        intx::to_string(settlement.minted),
        intx::to_string(pool.total_staked));

    bool const advanced = settlement.pool.acc_reward_per_share !=
                          pool.acc_reward_per_share;
    state.set_pool(pool_id, settlement.pool);
    if (advanced) {
        state.store_log(PoolSettled{
            .pool_id = pool_id,
            .height = height,
            .minted = settlement.minted,
            .acc_reward_per_share = settlement.pool.acc_reward_per_share});
    }
    return outcome::success();
}

Result<void> settle_all_pools(State &state, uint64_t const height)
{
    for (size_t pool_id = 0; pool_id < state.num_pools(); ++pool_id) {
        BOOST_OUTCOME_TRY(settle_pool(state, pool_id, height));
    }
    return outcome::success();
}

METASTAKE_STAKING_NAMESPACE_END
