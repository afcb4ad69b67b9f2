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
#include <metastake/staking/events.hpp>
#include <metastake/staking/state.hpp>
#include <metastake/staking/types.hpp>

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

METASTAKE_STAKING_NAMESPACE_BEGIN

Pool const &State::pool(size_t const pool_id) const
{
    METASTAKE_ASSERT(pool_id < pools_.size());
    return pools_[pool_id];
}

void State::set_pool(size_t const pool_id, Pool const &pool)
{
    METASTAKE_ASSERT(pool_id < pools_.size());
    if (!checkpoints_.empty()) {
        auto &top = checkpoints_.back();
        if (pool_id < top.num_pools) {
            top.pools.try_emplace(pool_id, pools_[pool_id]);
        }
    }
    pools_[pool_id] = pool;
}

size_t State::append_pool(Pool const &pool)
{
    pools_.push_back(pool);
    return pools_.size() - 1;
}

UserInfo const *State::find_user(UserKey const &key) const
{
    auto const it = users_.find(key);
    if (it == users_.end()) {
        return nullptr;
    }
    return &it->second;
}

void State::set_user(UserKey const &key, UserInfo const &info)
{
    auto const it = users_.find(key);
    if (!checkpoints_.empty()) {
        auto &top = checkpoints_.back();
        if (!top.users.contains(key)) {
            top.users.emplace(
                key,
                it == users_.end() ? std::nullopt
                                   : std::make_optional(it->second));
        }
    }
    if (it == users_.end()) {
        users_.emplace(key, info);
    }
    else {
        it->second = info;
    }
}

void State::set_globals(GlobalParams const &globals)
{
    if (!checkpoints_.empty() && !checkpoints_.back().globals.has_value()) {
        checkpoints_.back().globals = globals_;
    }
    globals_ = globals;
}

void State::store_log(Event const &event)
{
    logs_.push_back(event);
}

std::vector<Event> State::take_logs()
{
    METASTAKE_ASSERT(checkpoints_.empty());
    return std::exchange(logs_, {});
}

void State::push()
{
    checkpoints_.push_back(
        Checkpoint{.num_pools = pools_.size(), .num_logs = logs_.size()});
}

void State::pop_accept()
{
    METASTAKE_ASSERT(!checkpoints_.empty());
    Checkpoint child = std::move(checkpoints_.back());
    checkpoints_.pop_back();
    if (checkpoints_.empty()) {
        return;
    }
    auto &parent = checkpoints_.back();
    if (!parent.globals.has_value()) {
        parent.globals = std::move(child.globals);
    }
    for (auto &[pool_id, saved] : child.pools) {
        if (pool_id < parent.num_pools) {
            parent.pools.try_emplace(pool_id, std::move(saved));
        }
    }
    for (auto &[key, saved] : child.users) {
        parent.users.try_emplace(key, std::move(saved));
    }
}

void State::pop_reject()
{
    METASTAKE_ASSERT(!checkpoints_.empty());
    Checkpoint &top = checkpoints_.back();
    METASTAKE_ASSERT(pools_.size() >= top.num_pools);
    METASTAKE_ASSERT(logs_.size() >= top.num_logs);
    pools_.resize(top.num_pools);
    for (auto const &[pool_id, saved] : top.pools) {
        pools_[pool_id] = saved;
    }
    for (auto const &[key, saved] : top.users) {
        if (saved.has_value()) {
            users_[key] = saved.value();
        }
        else {
            users_.erase(key);
        }
    }
    if (top.globals.has_value()) {
        globals_ = top.globals.value();
    }
    logs_.resize(top.num_logs);
    checkpoints_.pop_back();
}

METASTAKE_STAKING_NAMESPACE_END
