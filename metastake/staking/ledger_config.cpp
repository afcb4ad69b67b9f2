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
#include <metastake/core/metastake_exception.hpp>
#include <metastake/core/result.hpp>
#include <metastake/staking/ledger_config.hpp>
#include <metastake/staking/staking_contract.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

METASTAKE_STAKING_ANONYMOUS_NAMESPACE_BEGIN

ShortfallPolicy shortfall_policy_from_json(nlohmann::json const &j)
{
    METASTAKE_ASSERT_THROW(
        j.is_string(), "shortfall_policy: expected \"lenient\" or \"strict\"");
    auto const policy = j.get<std::string>();
    if (policy == "lenient") {
        return ShortfallPolicy::Lenient;
    }
    METASTAKE_ASSERT_THROW(
        policy == "strict",
        fmt::format("shortfall_policy: unknown policy '{}'", policy));
    return ShortfallPolicy::Strict;
}

PoolConfig pool_config_from_json(nlohmann::json const &j)
{
    METASTAKE_ASSERT_THROW(j.is_object(), "pools: expected objects");
    PoolConfig pool;
    pool.stake_asset = address_from_json(j.at("stake_asset"), "stake_asset");
    pool.weight = amount_from_json(j.at("weight"), "weight");
    if (auto const it = j.find("min_deposit"); it != j.end()) {
        pool.min_deposit = amount_from_json(*it, "min_deposit");
    }
    pool.unstake_lock_blocks = height_from_json(
        j.at("unstake_lock_blocks"), "unstake_lock_blocks");
    return pool;
}

METASTAKE_STAKING_ANONYMOUS_NAMESPACE_END

METASTAKE_STAKING_NAMESPACE_BEGIN

uint256_t amount_from_json(nlohmann::json const &j, char const *const field)
{
    if (j.is_number_unsigned()) {
        return uint256_t{j.get<uint64_t>()};
    }
    METASTAKE_ASSERT_THROW(
        j.is_string(),
        fmt::format("{}: expected unsigned integer or string", field));
    auto const s = j.get<std::string>();
    try {
        return intx::from_string<uint256_t>(s);
    }
    catch (std::invalid_argument const &) {
        throw MetastakeException(
            fmt::format("{}: invalid amount '{}'", field, s),
            __FILE__,
            __PRETTY_FUNCTION__,
            __LINE__);
    }
    catch (std::out_of_range const &) {
        throw MetastakeException(
            fmt::format("{}: amount '{}' out of range", field, s),
            __FILE__,
            __PRETTY_FUNCTION__,
            __LINE__);
    }
}

uint64_t height_from_json(nlohmann::json const &j, char const *const field)
{
    if (j.is_number_unsigned()) {
        return j.get<uint64_t>();
    }
    METASTAKE_ASSERT_THROW(
        j.is_string(),
        fmt::format("{}: expected unsigned integer or string", field));
    auto const s = j.get<std::string>();
    try {
        size_t pos = 0;
        auto const v = std::stoull(s, &pos, 0);
        METASTAKE_ASSERT_THROW(
            pos == s.size() && s.front() != '-',
            fmt::format("{}: invalid height '{}'", field, s));
        return static_cast<uint64_t>(v);
    }
    catch (std::logic_error const &) {
        throw MetastakeException(
            fmt::format("{}: invalid height '{}'", field, s),
            __FILE__,
            __PRETTY_FUNCTION__,
            __LINE__);
    }
}

Address address_from_json(nlohmann::json const &j, char const *const field)
{
    METASTAKE_ASSERT_THROW(
        j.is_string(), fmt::format("{}: expected hex string", field));
    auto const address = address_from_hex(j.get<std::string>());
    METASTAKE_ASSERT_THROW(
        address.has_value(),
        fmt::format(
            "{}: invalid address '{}'", field, j.get<std::string>()));
    return address.value();
}

LedgerConfig parse_ledger_config(nlohmann::json const &j)
{
    METASTAKE_ASSERT_THROW(j.is_object(), "ledger config: expected object");
    for (char const *const field :
         {"reward_asset", "start_height", "end_height", "reward_per_block"}) {
        METASTAKE_ASSERT_THROW(
            j.contains(field), fmt::format("{}: missing", field));
    }

    LedgerConfig config;
    config.reward_asset = address_from_json(j["reward_asset"], "reward_asset");
    config.start_height = height_from_json(j["start_height"], "start_height");
    config.end_height = height_from_json(j["end_height"], "end_height");
    config.reward_per_block =
        amount_from_json(j["reward_per_block"], "reward_per_block");
    if (auto const it = j.find("shortfall_policy"); it != j.end()) {
        config.shortfall_policy = shortfall_policy_from_json(*it);
    }
    if (auto const it = j.find("admins"); it != j.end()) {
        METASTAKE_ASSERT_THROW(it->is_array(), "admins: expected array");
        for (auto const &admin : *it) {
            config.admins.push_back(address_from_json(admin, "admins"));
        }
    }
    if (auto const it = j.find("pools"); it != j.end()) {
        METASTAKE_ASSERT_THROW(it->is_array(), "pools: expected array");
        for (auto const &pool : *it) {
            config.pools.push_back(pool_config_from_json(pool));
        }
    }
    METASTAKE_ASSERT_THROW(
        config.pools.empty() || !config.admins.empty(),
        "admins: pools require at least one admin");
    return config;
}

LedgerConfig read_ledger_config(std::filesystem::path const &path)
{
    std::ifstream ifile(path);
    METASTAKE_ASSERT_THROW(
        ifile.is_open(),
        fmt::format("could not open ledger config {}", path.string()));
    nlohmann::json j;
    try {
        ifile >> j;
    }
    catch (nlohmann::json::parse_error const &e) {
        throw MetastakeException(
            fmt::format("{}: {}", path.string(), e.what()),
            __FILE__,
            __PRETTY_FUNCTION__,
            __LINE__);
    }
    return parse_ledger_config(j);
}

Result<void> apply_ledger_config(
    StakingContract &contract, LedgerConfig const &config,
    Address const &admin, uint64_t const height)
{
    BOOST_OUTCOME_TRY(contract.initialize(
        config.reward_asset,
        config.start_height,
        config.end_height,
        config.reward_per_block));
    for (auto const &pool : config.pools) {
        BOOST_OUTCOME_TRY(contract.add_pool(
            admin,
            height,
            pool.stake_asset,
            pool.weight,
            pool.min_deposit,
            pool.unstake_lock_blocks,
            false));
    }
    LOG_INFO(
        "applied ledger config with {} pools at height {}",
        config.pools.size(),
        height);
    return outcome::success();
}

METASTAKE_STAKING_NAMESPACE_END
