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

#include <metastake/core/address.hpp>
#include <metastake/core/int.hpp>
#include <metastake/core/likely.h>
#include <metastake/core/result.hpp>
#include <metastake/staking/abi.hpp>
#include <metastake/staking/checked_math.hpp>
#include <metastake/staking/collaborators.hpp>
#include <metastake/staking/constants.hpp>
#include <metastake/staking/emission.hpp>
#include <metastake/staking/events.hpp>
#include <metastake/staking/reward.hpp>
#include <metastake/staking/settlement.hpp>
#include <metastake/staking/staking_contract.hpp>
#include <metastake/staking/staking_error.hpp>
#include <metastake/staking/state.hpp>
#include <metastake/staking/types.hpp>
#include <metastake/staking/withdrawal_queue.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>

METASTAKE_STAKING_NAMESPACE_BEGIN

StakingContract::StakingContract(
    State &state, Collaborators const &collaborators,
    ShortfallPolicy const shortfall_policy)
    : state_{state}
    , collaborators_{collaborators}
    , shortfall_policy_{shortfall_policy}
{
}

// Runs `f` inside a checkpoint. Any error rolls back every ledger change and
// drops the events it stored. Events reach the sink once the outermost
// checkpoint commits.
template <class F>
auto StakingContract::transact(F &&f)
{
    state_.push();
    auto result = std::forward<F>(f)();
    if (result.has_error()) {
        state_.pop_reject();
        return result;
    }
    state_.pop_accept();
    if (state_.depth() == 0) {
        for (auto const &event : state_.take_logs()) {
            collaborators_.event_sink.on_event(event);
        }
    }
    return result;
}

Result<void> StakingContract::authorize(
    Address const &principal, AdminAction const action) const
{
    if (METASTAKE_UNLIKELY(
            !collaborators_.authorizer.is_authorized(principal, action))) {
        LOG_WARNING(
            "StakingContract: {} is not authorized for action {}",
            to_hex(principal),
            static_cast<int>(action));
        return StakingError::Unauthorized;
    }
    return outcome::success();
}

Result<void> StakingContract::require_initialized() const
{
    if (METASTAKE_UNLIKELY(!state_.globals().initialized)) {
        return StakingError::InvalidParameter;
    }
    return outcome::success();
}

Result<void> StakingContract::require_pool(size_t const pool_id) const
{
    if (METASTAKE_UNLIKELY(pool_id >= state_.num_pools())) {
        return StakingError::InvalidPoolId;
    }
    return outcome::success();
}

void StakingContract::emit_log(Event const &event)
{
    state_.store_log(event);
}

/////////////////////////
//  Global Parameters  //
/////////////////////////

Result<void> StakingContract::initialize(
    Address const &reward_asset, uint64_t const start_height,
    uint64_t const end_height, uint256_t const &reward_per_block)
{
    return transact([&] -> Result<void> {
        if (METASTAKE_UNLIKELY(state_.globals().initialized)) {
            return StakingError::InvalidParameter;
        }
        BOOST_OUTCOME_TRY(validate_window(start_height, end_height));
        BOOST_OUTCOME_TRY(validate_reward_per_block(reward_per_block));

        GlobalParams globals = state_.globals();
        globals.initialized = true;
        globals.reward_asset = reward_asset;
        globals.schedule = EmissionSchedule{
            .start_height = start_height,
            .end_height = end_height,
            .reward_per_block = reward_per_block};
        state_.set_globals(globals);

        LOG_INFO(
            "StakingContract: initialized reward_asset={} window=[{}, {}) "
            "reward_per_block={}",
            to_hex(reward_asset),
            start_height,
            end_height,
            intx::to_string(reward_per_block));
        return outcome::success();
    });
}

Result<void> StakingContract::set_reward_asset(
    Address const &principal, Address const &reward_asset)
{
    return transact([&] -> Result<void> {
        BOOST_OUTCOME_TRY(authorize(principal, AdminAction::SetParams));
        BOOST_OUTCOME_TRY(require_initialized());

        GlobalParams globals = state_.globals();
        globals.reward_asset = reward_asset;
        state_.set_globals(globals);
        emit_log(RewardAssetSet{.reward_asset = reward_asset});
        LOG_INFO(
            "StakingContract: reward asset set to {}", to_hex(reward_asset));
        return outcome::success();
    });
}

Result<void> StakingContract::set_start_height(
    Address const &principal, uint64_t const start_height)
{
    return transact([&] -> Result<void> {
        BOOST_OUTCOME_TRY(authorize(principal, AdminAction::SetParams));
        BOOST_OUTCOME_TRY(require_initialized());

        GlobalParams globals = state_.globals();
        BOOST_OUTCOME_TRY(
            validate_window(start_height, globals.schedule.end_height));
        globals.schedule.start_height = start_height;
        state_.set_globals(globals);
        emit_log(StartHeightSet{.start_height = start_height});
        LOG_INFO("StakingContract: start height set to {}", start_height);
        return outcome::success();
    });
}

Result<void> StakingContract::set_end_height(
    Address const &principal, uint64_t const end_height)
{
    return transact([&] -> Result<void> {
        BOOST_OUTCOME_TRY(authorize(principal, AdminAction::SetParams));
        BOOST_OUTCOME_TRY(require_initialized());

        GlobalParams globals = state_.globals();
        BOOST_OUTCOME_TRY(
            validate_window(globals.schedule.start_height, end_height));
        globals.schedule.end_height = end_height;
        state_.set_globals(globals);
        emit_log(EndHeightSet{.end_height = end_height});
        LOG_INFO("StakingContract: end height set to {}", end_height);
        return outcome::success();
    });
}

Result<void> StakingContract::set_reward_per_block(
    Address const &principal, uint256_t const &reward_per_block)
{
    return transact([&] -> Result<void> {
        BOOST_OUTCOME_TRY(authorize(principal, AdminAction::SetParams));
        BOOST_OUTCOME_TRY(require_initialized());
        BOOST_OUTCOME_TRY(validate_reward_per_block(reward_per_block));

        GlobalParams globals = state_.globals();
        globals.schedule.reward_per_block = reward_per_block;
        state_.set_globals(globals);
        emit_log(RewardPerBlockSet{.reward_per_block = reward_per_block});
        LOG_INFO(
            "StakingContract: reward per block set to {}",
            intx::to_string(reward_per_block));
        return outcome::success();
    });
}

///////////////////////////
//  Pool Administration  //
///////////////////////////

Result<size_t> StakingContract::add_pool(
    Address const &principal, uint64_t const height,
    Address const &stake_asset, uint256_t const &weight,
    uint256_t const &min_deposit, uint64_t const unstake_lock_blocks,
    bool const with_update)
{
    return transact([&] -> Result<size_t> {
        BOOST_OUTCOME_TRY(authorize(principal, AdminAction::ManagePools));
        BOOST_OUTCOME_TRY(require_initialized());

        bool const is_native_slot = state_.num_pools() == NATIVE_POOL_ID;
        if (METASTAKE_UNLIKELY(
                is_native_slot != (stake_asset == NATIVE_ASSET))) {
            return StakingError::InvalidParameter;
        }
        if (METASTAKE_UNLIKELY(weight == 0 || unstake_lock_blocks == 0)) {
            return StakingError::InvalidParameter;
        }
        auto const &schedule = state_.globals().schedule;
        if (METASTAKE_UNLIKELY(height >= schedule.end_height)) {
            return StakingError::InvalidParameter;
        }

        if (with_update) {
            BOOST_OUTCOME_TRY(settle_all_pools(state_, height));
        }

        GlobalParams globals = state_.globals();
        BOOST_OUTCOME_TRY(
            auto const total_weight, checked_add(globals.total_weight, weight));
        globals.total_weight = total_weight;
        state_.set_globals(globals);

        Pool const pool{
            .stake_asset = stake_asset,
            .weight = weight,
            .last_settled_height =
                std::max(height, globals.schedule.start_height),
            .acc_reward_per_share = 0,
            .total_staked = 0,
            .min_deposit = min_deposit,
            .unstake_lock_blocks = unstake_lock_blocks};
        size_t const pool_id = state_.append_pool(pool);

        emit_log(PoolAdded{
            .pool_id = pool_id,
            .stake_asset = stake_asset,
            .weight = weight,
            .min_deposit = min_deposit,
            .unstake_lock_blocks = unstake_lock_blocks,
            .last_settled_height = pool.last_settled_height});
        LOG_INFO(
            "StakingContract: added pool {} stake_asset={} weight={} "
            "min_deposit={} unstake_lock_blocks={}",
            pool_id,
            to_hex(stake_asset),
            intx::to_string(weight),
            intx::to_string(min_deposit),
            unstake_lock_blocks);
        return pool_id;
    });
}

Result<void> StakingContract::set_pool_weight(
    Address const &principal, uint64_t const height, size_t const pool_id,
    uint256_t const &weight, bool const with_update)
{
    return transact([&] -> Result<void> {
        BOOST_OUTCOME_TRY(authorize(principal, AdminAction::ManagePools));
        BOOST_OUTCOME_TRY(require_pool(pool_id));
        if (METASTAKE_UNLIKELY(weight == 0)) {
            return StakingError::InvalidParameter;
        }

        if (with_update) {
            BOOST_OUTCOME_TRY(settle_all_pools(state_, height));
        }

        Pool pool = state_.pool(pool_id);
        GlobalParams globals = state_.globals();
        BOOST_OUTCOME_TRY(
            auto const without, checked_sub(globals.total_weight, pool.weight));
        BOOST_OUTCOME_TRY(
            auto const total_weight, checked_add(without, weight));
        globals.total_weight = total_weight;
        pool.weight = weight;
        state_.set_globals(globals);
        state_.set_pool(pool_id, pool);

        emit_log(PoolWeightSet{
            .pool_id = pool_id,
            .weight = weight,
            .total_weight = total_weight});
        LOG_INFO(
            "StakingContract: pool {} weight set to {}, total weight {}",
            pool_id,
            intx::to_string(weight),
            intx::to_string(total_weight));
        return outcome::success();
    });
}

Result<void> StakingContract::update_pool_params(
    Address const &principal, size_t const pool_id,
    uint256_t const &min_deposit, uint64_t const unstake_lock_blocks)
{
    return transact([&] -> Result<void> {
        BOOST_OUTCOME_TRY(authorize(principal, AdminAction::ManagePools));
        BOOST_OUTCOME_TRY(require_pool(pool_id));
        if (METASTAKE_UNLIKELY(unstake_lock_blocks == 0)) {
            return StakingError::InvalidParameter;
        }

        Pool pool = state_.pool(pool_id);
        pool.min_deposit = min_deposit;
        pool.unstake_lock_blocks = unstake_lock_blocks;
        state_.set_pool(pool_id, pool);

        emit_log(PoolParamsUpdated{
            .pool_id = pool_id,
            .min_deposit = min_deposit,
            .unstake_lock_blocks = unstake_lock_blocks});
        LOG_INFO(
            "StakingContract: pool {} min_deposit={} unstake_lock_blocks={}",
            pool_id,
            intx::to_string(min_deposit),
            unstake_lock_blocks);
        return outcome::success();
    });
}

//////////////////
//  Settlement  //
//////////////////

Result<void>
StakingContract::settle_pool(uint64_t const height, size_t const pool_id)
{
    return transact([&] -> Result<void> {
        BOOST_OUTCOME_TRY(require_pool(pool_id));
        return staking::settle_pool(state_, pool_id, height);
    });
}

Result<void> StakingContract::mass_settle_pools(uint64_t const height)
{
    return transact(
        [&] -> Result<void> { return settle_all_pools(state_, height); });
}

//////////////////
//  User Flows  //
//////////////////

Result<void> StakingContract::deposit_into(
    uint64_t const height, Address const &user, size_t const pool_id,
    uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(staking::settle_pool(state_, pool_id, height));

    Pool pool = state_.pool(pool_id);
    UserKey const key{.pool_id = pool_id, .user = user};
    UserInfo info{};
    if (auto const *const existing = state_.find_user(key)) {
        info = *existing;
    }

    if (info.stake > 0) {
        BOOST_OUTCOME_TRY(fold_accrued(info, pool.acc_reward_per_share));
    }
    BOOST_OUTCOME_TRY(auto const stake, checked_add(info.stake, amount));
    BOOST_OUTCOME_TRY(
        auto const total_staked, checked_add(pool.total_staked, amount));
    info.stake = stake;
    pool.total_staked = total_staked;
    BOOST_OUTCOME_TRY(rebase(info, pool.acc_reward_per_share));

    state_.set_user(key, info);
    state_.set_pool(pool_id, pool);
    emit_log(Deposited{.user = user, .pool_id = pool_id, .amount = amount});
    LOG_DEBUG(
        "StakingContract: {} deposited {} into pool {}",
        to_hex(user),
        intx::to_string(amount),
        pool_id);
    return outcome::success();
}

Result<void> StakingContract::deposit_native(
    uint64_t const height, Address const &caller, uint256_t const &value)
{
    return transact([&] -> Result<void> {
        BOOST_OUTCOME_TRY(require_pool(NATIVE_POOL_ID));
        if (METASTAKE_UNLIKELY(
                value < state_.pool(NATIVE_POOL_ID).min_deposit)) {
            return StakingError::InvalidParameter;
        }
        return deposit_into(height, caller, NATIVE_POOL_ID, value);
    });
}

Result<void> StakingContract::deposit(
    uint64_t const height, Address const &caller, size_t const pool_id,
    uint256_t const &amount)
{
    return transact([&] -> Result<void> {
        if (METASTAKE_UNLIKELY(pool_id == NATIVE_POOL_ID)) {
            return StakingError::InvalidPoolId;
        }
        BOOST_OUTCOME_TRY(require_pool(pool_id));
        Pool const pool = state_.pool(pool_id);
        if (METASTAKE_UNLIKELY(amount < pool.min_deposit)) {
            return StakingError::InvalidParameter;
        }
        BOOST_OUTCOME_TRY(deposit_into(height, caller, pool_id, amount));
        // the asset moves last, once no ledger step can fail
        if (amount > 0) {
            BOOST_OUTCOME_TRY(check_transfer_receipt(
                collaborators_.stake_transfer.pull(
                    pool.stake_asset, caller, amount)));
        }
        return outcome::success();
    });
}

Result<void> StakingContract::unstake(
    uint64_t const height, Address const &caller, size_t const pool_id,
    uint256_t const &amount)
{
    return transact([&] -> Result<void> {
        BOOST_OUTCOME_TRY(require_pool(pool_id));
        if (METASTAKE_UNLIKELY(collaborators_.pause_flags.withdraw_paused())) {
            return StakingError::Paused;
        }
        BOOST_OUTCOME_TRY(staking::settle_pool(state_, pool_id, height));

        UserKey const key{.pool_id = pool_id, .user = caller};
        auto const *const existing = state_.find_user(key);
        if (existing == nullptr) {
            if (METASTAKE_UNLIKELY(amount > 0)) {
                return StakingError::InsufficientBalance;
            }
            return outcome::success();
        }
        UserInfo info = *existing;
        if (METASTAKE_UNLIKELY(info.stake < amount)) {
            return StakingError::InsufficientBalance;
        }

        Pool pool = state_.pool(pool_id);
        BOOST_OUTCOME_TRY(fold_accrued(info, pool.acc_reward_per_share));

        if (amount > 0) {
            if (METASTAKE_UNLIKELY(
                    pool.unstake_lock_blocks >
                    std::numeric_limits<uint64_t>::max() - height)) {
                return StakingError::Overflow;
            }
            uint64_t const maturity_height = height + pool.unstake_lock_blocks;
            BOOST_OUTCOME_TRY(
                auto const stake, checked_sub(info.stake, amount));
            BOOST_OUTCOME_TRY(
                auto const total_staked,
                checked_sub(pool.total_staked, amount));
            info.stake = stake;
            pool.total_staked = total_staked;
            info.withdrawal_queue.push_back(UnstakeRequest{
                .amount = amount, .maturity_height = maturity_height});
            emit_log(UnstakeRequested{
                .user = caller,
                .pool_id = pool_id,
                .amount = amount,
                .maturity_height = maturity_height});
        }
        BOOST_OUTCOME_TRY(rebase(info, pool.acc_reward_per_share));

        state_.set_user(key, info);
        state_.set_pool(pool_id, pool);
        LOG_DEBUG(
            "StakingContract: {} unstaked {} from pool {}",
            to_hex(caller),
            intx::to_string(amount),
            pool_id);
        return outcome::success();
    });
}

Result<uint256_t> StakingContract::withdraw(
    uint64_t const height, Address const &caller, size_t const pool_id)
{
    return transact([&] -> Result<uint256_t> {
        BOOST_OUTCOME_TRY(require_pool(pool_id));
        if (METASTAKE_UNLIKELY(collaborators_.pause_flags.withdraw_paused())) {
            return StakingError::Paused;
        }

        UserKey const key{.pool_id = pool_id, .user = caller};
        auto const *const existing = state_.find_user(key);
        if (existing == nullptr) {
            return uint256_t{0};
        }
        UserInfo info = *existing;
        BOOST_OUTCOME_TRY(
            auto const matured, matured_prefix(info.withdrawal_queue, height));
        if (matured.count > 0) {
            drop_prefix(info.withdrawal_queue, matured.count);
            state_.set_user(key, info);
        }

        if (matured.amount > 0) {
            BOOST_OUTCOME_TRY(
                check_transfer_receipt(collaborators_.stake_transfer.push(
                    state_.pool(pool_id).stake_asset,
                    caller,
                    matured.amount)));
        }
        emit_log(Withdrawn{
            .user = caller,
            .pool_id = pool_id,
            .amount = matured.amount,
            .height = height});
        LOG_DEBUG(
            "StakingContract: {} withdrew {} from pool {}",
            to_hex(caller),
            intx::to_string(matured.amount),
            pool_id);
        return matured.amount;
    });
}

Result<uint256_t> StakingContract::claim(
    uint64_t const height, Address const &caller, size_t const pool_id)
{
    return transact([&] -> Result<uint256_t> {
        BOOST_OUTCOME_TRY(require_pool(pool_id));
        if (METASTAKE_UNLIKELY(collaborators_.pause_flags.claim_paused())) {
            return StakingError::Paused;
        }
        BOOST_OUTCOME_TRY(staking::settle_pool(state_, pool_id, height));

        UserKey const key{.pool_id = pool_id, .user = caller};
        auto const *const existing = state_.find_user(key);
        if (existing == nullptr) {
            return uint256_t{0};
        }
        UserInfo info = *existing;

        uint256_t const acc = state_.pool(pool_id).acc_reward_per_share;
        BOOST_OUTCOME_TRY(auto const owed, owed_reward(info, acc));

        uint256_t paid = 0;
        if (owed > 0) {
            Address const reward_asset = state_.globals().reward_asset;
            uint256_t const balance =
                collaborators_.reward_transfer.balance_of(reward_asset);
            paid = std::min(owed, balance);
            if (METASTAKE_UNLIKELY(paid < owed)) {
                LOG_WARNING(
                    "StakingContract: reward shortfall for {} in pool {}, "
                    "owed {} paid {}",
                    to_hex(caller),
                    pool_id,
                    intx::to_string(owed),
                    intx::to_string(paid));
            }
            info.pending_reward = shortfall_policy_ == ShortfallPolicy::Strict
                                      ? owed - paid
                                      : uint256_t{0};
            if (paid > 0) {
                BOOST_OUTCOME_TRY(check_transfer_receipt(
                    collaborators_.reward_transfer.transfer(
                        reward_asset, caller, paid)));
            }
        }
        BOOST_OUTCOME_TRY(rebase(info, acc));
        state_.set_user(key, info);

        emit_log(Claimed{.user = caller, .pool_id = pool_id, .amount = paid});
        LOG_DEBUG(
            "StakingContract: {} claimed {} from pool {}",
            to_hex(caller),
            intx::to_string(paid),
            pool_id);
        return paid;
    });
}

/////////////
//  Views  //
/////////////

size_t StakingContract::pool_length() const
{
    return state_.num_pools();
}

Result<Pool> StakingContract::pool(size_t const pool_id) const
{
    BOOST_OUTCOME_TRY(require_pool(pool_id));
    return state_.pool(pool_id);
}

uint256_t StakingContract::total_weight() const
{
    return state_.globals().total_weight;
}

EmissionSchedule StakingContract::schedule() const
{
    return state_.globals().schedule;
}

Address StakingContract::reward_asset() const
{
    return state_.globals().reward_asset;
}

Result<uint256_t>
StakingContract::get_multiplier(uint64_t const from, uint64_t const to) const
{
    return state_.globals().schedule.multiplier(from, to);
}

Result<uint256_t> StakingContract::pending_reward(
    size_t const pool_id, Address const &user, uint64_t const height) const
{
    BOOST_OUTCOME_TRY(require_pool(pool_id));
    auto const *const info =
        state_.find_user(UserKey{.pool_id = pool_id, .user = user});
    if (info == nullptr) {
        return uint256_t{0};
    }
    BOOST_OUTCOME_TRY(
        auto const projected,
        settled(state_.pool(pool_id), state_.globals(), height));
    return owed_reward(*info, projected.pool.acc_reward_per_share);
}

Result<uint256_t> StakingContract::staking_balance(
    size_t const pool_id, Address const &user) const
{
    BOOST_OUTCOME_TRY(require_pool(pool_id));
    auto const *const info =
        state_.find_user(UserKey{.pool_id = pool_id, .user = user});
    return info == nullptr ? uint256_t{0} : info->stake;
}

Result<WithdrawSummary> StakingContract::withdraw_amount(
    size_t const pool_id, Address const &user, uint64_t const height) const
{
    BOOST_OUTCOME_TRY(require_pool(pool_id));
    auto const *const info =
        state_.find_user(UserKey{.pool_id = pool_id, .user = user});
    if (info == nullptr) {
        return WithdrawSummary{.requested = 0, .withdrawable = 0};
    }
    return summarize(info->withdrawal_queue, height);
}

Result<UserInfo>
StakingContract::user_info(size_t const pool_id, Address const &user) const
{
    BOOST_OUTCOME_TRY(require_pool(pool_id));
    auto const *const info =
        state_.find_user(UserKey{.pool_id = pool_id, .user = user});
    return info == nullptr ? UserInfo{} : *info;
}

METASTAKE_STAKING_NAMESPACE_END
