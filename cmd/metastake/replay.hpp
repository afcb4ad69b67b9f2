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
#include <metastake/core/config.hpp>
#include <metastake/staking/asset_book.hpp>
#include <metastake/staking/collaborators.hpp>
#include <metastake/staking/staking_contract.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <set>
#include <utility>

METASTAKE_NAMESPACE_BEGIN

struct ReplayStats
{
    size_t applied{0};
    size_t rejected{0};
    uint64_t last_height{0};
};

// Feeds a JSON array of operations to the ledger in order. A rejected
// operation is logged and leaves the ledger untouched, a malformed one
// throws MetastakeException.
class Replay
{
    staking::StakingContract &contract_;
    staking::PauseSwitches &pause_;
    staking::AssetBook &book_;
    ReplayStats stats_{};
    std::set<std::pair<size_t, Address>> positions_{};

    void apply(nlohmann::json const &op);

public:
    Replay(
        staking::StakingContract &, staking::PauseSwitches &,
        staking::AssetBook &);

    void run(nlohmann::json const &ops);
    void run(std::filesystem::path const &);

    ReplayStats const &stats() const
    {
        return stats_;
    }

    // every (pool, user) pair an operation touched
    std::set<std::pair<size_t, Address>> const &positions() const
    {
        return positions_;
    }
};

METASTAKE_NAMESPACE_END
