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
#include <metastake/core/assert.h>
#include <metastake/core/int.hpp>
#include <metastake/staking/events.hpp>

#include <fmt/format.h>

#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <string>
#include <type_traits>
#include <variant>

METASTAKE_STAKING_NAMESPACE_BEGIN

std::string to_string(Event const &event)
{
    return std::visit(
        [](auto const &e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, Deposited>) {
                return fmt::format(
                    "Deposited user={} pool={} amount={}",
                    to_hex(e.user),
                    e.pool_id,
                    intx::to_string(e.amount));
            }
            else if constexpr (std::is_same_v<T, UnstakeRequested>) {
                return fmt::format(
                    "UnstakeRequested user={} pool={} amount={} "
                    "maturity_height={}",
                    to_hex(e.user),
                    e.pool_id,
                    intx::to_string(e.amount),
                    e.maturity_height);
            }
            else if constexpr (std::is_same_v<T, Withdrawn>) {
                return fmt::format(
                    "Withdrawn user={} pool={} amount={} height={}",
                    to_hex(e.user),
                    e.pool_id,
                    intx::to_string(e.amount),
                    e.height);
            }
            else if constexpr (std::is_same_v<T, Claimed>) {
                return fmt::format(
                    "Claimed user={} pool={} amount={}",
                    to_hex(e.user),
                    e.pool_id,
                    intx::to_string(e.amount));
            }
            else if constexpr (std::is_same_v<T, PoolAdded>) {
                return fmt::format(
                    "PoolAdded pool={} stake_asset={} weight={} "
                    "min_deposit={} unstake_lock_blocks={} "
                    "last_settled_height={}",
                    e.pool_id,
                    to_hex(e.stake_asset),
                    intx::to_string(e.weight),
                    intx::to_string(e.min_deposit),
                    e.unstake_lock_blocks,
                    e.last_settled_height);
            }
            else if constexpr (std::is_same_v<T, PoolWeightSet>) {
                return fmt::format(
                    "PoolWeightSet pool={} weight={} total_weight={}",
                    e.pool_id,
                    intx::to_string(e.weight),
                    intx::to_string(e.total_weight));
            }
            else if constexpr (std::is_same_v<T, PoolParamsUpdated>) {
                return fmt::format(
                    "PoolParamsUpdated pool={} min_deposit={} "
                    "unstake_lock_blocks={}",
                    e.pool_id,
                    intx::to_string(e.min_deposit),
                    e.unstake_lock_blocks);
            }
            else if constexpr (std::is_same_v<T, PoolSettled>) {
                return fmt::format(
                    "PoolSettled pool={} height={} minted={} "
                    "acc_reward_per_share={}",
                    e.pool_id,
                    e.height,
                    intx::to_string(e.minted),
                    intx::to_string(e.acc_reward_per_share));
            }
            else if constexpr (std::is_same_v<T, RewardAssetSet>) {
                return fmt::format(
                    "RewardAssetSet reward_asset={}", to_hex(e.reward_asset));
            }
            else if constexpr (std::is_same_v<T, StartHeightSet>) {
                return fmt::format(
                    "StartHeightSet start_height={}", e.start_height);
            }
            else if constexpr (std::is_same_v<T, EndHeightSet>) {
                return fmt::format("EndHeightSet end_height={}", e.end_height);
            }
            else {
                static_assert(std::is_same_v<T, RewardPerBlockSet>);
                return fmt::format(
                    "RewardPerBlockSet reward_per_block={}",
                    intx::to_string(e.reward_per_block));
            }
        },
        event);
}

LoggingEventSink::LoggingEventSink(quill::Logger *const logger)
    : logger_{logger}
{
    METASTAKE_ASSERT(logger_ != nullptr);
}

void LoggingEventSink::on_event(Event const &event)
{
    QUILL_LOG_INFO(logger_, "{}", to_string(event));
}

METASTAKE_STAKING_NAMESPACE_END
