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

#include <metastake/staking/config.hpp>
#include <metastake/staking/events.hpp>
#include <metastake/staking/types.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <optional>
#include <vector>

METASTAKE_STAKING_NAMESPACE_BEGIN

// Ledger storage: an append-only pool arena, per (pool, user) records and
// the global parameters, with nested checkpoints. Changes made after push()
// are undone by pop_reject() and folded into the enclosing checkpoint by
// pop_accept(). Logs stored inside a rejected checkpoint are discarded.
class State
{
    using UserMap =
        ankerl::unordered_dense::map<UserKey, UserInfo, UserKeyHash>;

    struct Checkpoint
    {
        size_t num_pools;
        size_t num_logs;
        std::optional<GlobalParams> globals{};
        // values of pools that existed at push()
        ankerl::unordered_dense::map<size_t, Pool> pools{};
        // user records as of push(), nullopt for users created since push()
        ankerl::unordered_dense::
            map<UserKey, std::optional<UserInfo>, UserKeyHash>
                users{};
    };

    std::vector<Pool> pools_{};
    UserMap users_{};
    GlobalParams globals_{};
    std::vector<Event> logs_{};
    std::vector<Checkpoint> checkpoints_{};

public:
    State() = default;
    State(State const &) = delete;
    State &operator=(State const &) = delete;

    size_t num_pools() const
    {
        return pools_.size();
    }

    Pool const &pool(size_t pool_id) const;
    void set_pool(size_t pool_id, Pool const &);
    size_t append_pool(Pool const &);

    UserInfo const *find_user(UserKey const &) const;
    void set_user(UserKey const &, UserInfo const &);

    GlobalParams const &globals() const
    {
        return globals_;
    }

    void set_globals(GlobalParams const &);

    void store_log(Event const &);

    std::vector<Event> const &logs() const
    {
        return logs_;
    }

    // only valid outside of any checkpoint
    std::vector<Event> take_logs();

    void push();
    void pop_accept();
    void pop_reject();

    size_t depth() const
    {
        return checkpoints_.size();
    }
};

METASTAKE_STAKING_NAMESPACE_END
