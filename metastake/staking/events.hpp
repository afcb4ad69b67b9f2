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

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace quill
{
    class Logger;
}

METASTAKE_STAKING_NAMESPACE_BEGIN

struct Deposited
{
    Address user;
    size_t pool_id;
    uint256_t amount;
};

struct UnstakeRequested
{
    Address user;
    size_t pool_id;
    uint256_t amount;
    uint64_t maturity_height;
};

struct Withdrawn
{
    Address user;
    size_t pool_id;
    uint256_t amount;
    uint64_t height;
};

struct Claimed
{
    Address user;
    size_t pool_id;
    uint256_t amount;
};

struct PoolAdded
{
    size_t pool_id;
    Address stake_asset;
    uint256_t weight;
    uint256_t min_deposit;
    uint64_t unstake_lock_blocks;
    uint64_t last_settled_height;
};

struct PoolWeightSet
{
    size_t pool_id;
    uint256_t weight;
    uint256_t total_weight;
};

struct PoolParamsUpdated
{
    size_t pool_id;
    uint256_t min_deposit;
    uint64_t unstake_lock_blocks;
};

struct PoolSettled
{
    size_t pool_id;
    uint64_t height;
    uint256_t minted;
    uint256_t acc_reward_per_share;
};

struct RewardAssetSet
{
    Address reward_asset;
};

struct StartHeightSet
{
    uint64_t start_height;
};

struct EndHeightSet
{
    uint64_t end_height;
};

struct RewardPerBlockSet
{
    uint256_t reward_per_block;
};

using Event = std::variant<
    Deposited, UnstakeRequested, Withdrawn, Claimed, PoolAdded, PoolWeightSet,
    PoolParamsUpdated, PoolSettled, RewardAssetSet, StartHeightSet,
    EndHeightSet, RewardPerBlockSet>;

std::string to_string(Event const &);

// Receives the events of an operation after it commits
struct EventSink
{
    virtual ~EventSink() = default;
    virtual void on_event(Event const &) = 0;
};

struct NullEventSink final : EventSink
{
    void on_event(Event const &) override {}
};

class LoggingEventSink final : public EventSink
{
    quill::Logger *logger_;

public:
    explicit LoggingEventSink(quill::Logger *);

    void on_event(Event const &) override;
};

METASTAKE_STAKING_NAMESPACE_END
