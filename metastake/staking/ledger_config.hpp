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
#include <metastake/staking/config.hpp>
#include <metastake/staking/staking_contract.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

METASTAKE_STAKING_NAMESPACE_BEGIN

struct PoolConfig
{
    Address stake_asset{};
    uint256_t weight{0};
    uint256_t min_deposit{0};
    uint64_t unstake_lock_blocks{0};
};

struct LedgerConfig
{
    Address reward_asset{};
    uint64_t start_height{0};
    uint64_t end_height{0};
    uint256_t reward_per_block{0};
    ShortfallPolicy shortfall_policy{ShortfallPolicy::Lenient};
    std::vector<Address> admins{};
    std::vector<PoolConfig> pools{};
};

// Throws MetastakeException naming the offending field. Only the document
// shape is checked here, ledger rules are enforced by apply_ledger_config.
LedgerConfig parse_ledger_config(nlohmann::json const &);

LedgerConfig read_ledger_config(std::filesystem::path const &);

// Initializes the contract and adds every configured pool at `height`
// through the administrative operations, as `admin`.
Result<void> apply_ledger_config(
    StakingContract &, LedgerConfig const &, Address const &admin,
    uint64_t height);

uint256_t amount_from_json(nlohmann::json const &, char const *field);

uint64_t height_from_json(nlohmann::json const &, char const *field);

Address address_from_json(nlohmann::json const &, char const *field);

METASTAKE_STAKING_NAMESPACE_END
