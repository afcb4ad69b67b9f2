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
#include <metastake/core/result.hpp>
#include <metastake/staking/collaborators.hpp>
#include <metastake/staking/config.hpp>
#include <metastake/staking/emission.hpp>
#include <metastake/staking/events.hpp>
#include <metastake/staking/types.hpp>
#include <metastake/staking/withdrawal_queue.hpp>

#include <cstddef>
#include <cstdint>

METASTAKE_STAKING_NAMESPACE_BEGIN

class State;

// How claim treats a reward balance that cannot cover what is owed.
// Lenient pays what is available and forfeits the rest, Strict keeps the
// unpaid remainder pending.
enum class ShortfallPolicy
{
    Lenient,
    Strict,
};

struct Collaborators
{
    Authorizer const &authorizer;
    PauseFlags const &pause_flags;
    StakeAssetTransfer &stake_transfer;
    RewardAssetTransfer &reward_transfer;
    EventSink &event_sink;
};

class StakingContract
{
    State &state_;
    Collaborators collaborators_;
    ShortfallPolicy shortfall_policy_;

    template <class F>
    auto transact(F &&);

    Result<void> authorize(Address const &principal, AdminAction) const;
    Result<void> require_initialized() const;
    Result<void> require_pool(size_t pool_id) const;

    Result<void> deposit_into(
        uint64_t height, Address const &user, size_t pool_id,
        uint256_t const &amount);

    void emit_log(Event const &);

public:
    StakingContract(
        State &, Collaborators const &,
        ShortfallPolicy = ShortfallPolicy::Lenient);

    //////////////////////////
    //  Global Parameters  //
    //////////////////////////
    Result<void> initialize(
        Address const &reward_asset, uint64_t start_height,
        uint64_t end_height, uint256_t const &reward_per_block);
    Result<void>
    set_reward_asset(Address const &principal, Address const &reward_asset);
    Result<void>
    set_start_height(Address const &principal, uint64_t start_height);
    Result<void> set_end_height(Address const &principal, uint64_t end_height);
    Result<void> set_reward_per_block(
        Address const &principal, uint256_t const &reward_per_block);

    ///////////////////////////
    //  Pool Administration  //
    ///////////////////////////

    // returns the id of the new pool
    Result<size_t> add_pool(
        Address const &principal, uint64_t height, Address const &stake_asset,
        uint256_t const &weight, uint256_t const &min_deposit,
        uint64_t unstake_lock_blocks, bool with_update);
    Result<void> set_pool_weight(
        Address const &principal, uint64_t height, size_t pool_id,
        uint256_t const &weight, bool with_update);
    Result<void> update_pool_params(
        Address const &principal, size_t pool_id,
        uint256_t const &min_deposit, uint64_t unstake_lock_blocks);

    //////////////////
    //  Settlement  //
    //////////////////
    Result<void> settle_pool(uint64_t height, size_t pool_id);
    Result<void> mass_settle_pools(uint64_t height);

    //////////////////
    //  User Flows  //
    //////////////////

    // stake attached to the call, pool 0 only
    Result<void> deposit_native(
        uint64_t height, Address const &caller, uint256_t const &value);
    Result<void> deposit(
        uint64_t height, Address const &caller, size_t pool_id,
        uint256_t const &amount);
    Result<void> unstake(
        uint64_t height, Address const &caller, size_t pool_id,
        uint256_t const &amount);
    // returns the amount released
    Result<uint256_t>
    withdraw(uint64_t height, Address const &caller, size_t pool_id);
    // returns the amount paid
    Result<uint256_t>
    claim(uint64_t height, Address const &caller, size_t pool_id);

    /////////////
    //  Views  //
    /////////////
    size_t pool_length() const;
    Result<Pool> pool(size_t pool_id) const;
    uint256_t total_weight() const;
    EmissionSchedule schedule() const;
    Address reward_asset() const;
    Result<uint256_t> get_multiplier(uint64_t from, uint64_t to) const;
    Result<uint256_t>
    pending_reward(size_t pool_id, Address const &user, uint64_t height) const;
    Result<uint256_t>
    staking_balance(size_t pool_id, Address const &user) const;
    Result<WithdrawSummary> withdraw_amount(
        size_t pool_id, Address const &user, uint64_t height) const;
    Result<UserInfo> user_info(size_t pool_id, Address const &user) const;
};

METASTAKE_STAKING_NAMESPACE_END
