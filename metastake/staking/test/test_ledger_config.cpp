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
#include <metastake/staking/constants.hpp>
#include <metastake/staking/ledger_config.hpp>
#include <metastake/staking/staking_contract.hpp>
#include <metastake/staking/staking_error.hpp>

#include "fakes.hpp"

#include <gtest/gtest.h>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>

using namespace metastake;
using namespace metastake::staking;
using namespace metastake::staking::test;
using namespace intx::literals;

namespace
{
    nlohmann::json valid_document()
    {
        return nlohmann::json::parse(R"({
            "reward_asset": "0x7e7a4d0000000000000000000000000000000004",
            "start_height": 100,
            "end_height": "0xc8",
            "reward_per_block": "1000000000000000000",
            "shortfall_policy": "strict",
            "admins": ["0xad00000000000000000000000000000000000001"],
            "pools": [
                {
                    "stake_asset": "0x0000000000000000000000000000000000000000",
                    "weight": 1,
                    "unstake_lock_blocks": 10
                },
                {
                    "stake_asset": "0x570ce00000000000000000000000000000000005",
                    "weight": "3",
                    "min_deposit": "0x64",
                    "unstake_lock_blocks": "20"
                }
            ]
        })");
    }
}

TEST(LedgerConfig, parse_valid_document)
{
    auto const config = parse_ledger_config(valid_document());
    EXPECT_EQ(config.reward_asset, REWARD_TOKEN);
    EXPECT_EQ(config.start_height, 100);
    EXPECT_EQ(config.end_height, 200);
    EXPECT_EQ(config.reward_per_block, SCALE);
    EXPECT_EQ(config.shortfall_policy, ShortfallPolicy::Strict);
    ASSERT_EQ(config.admins.size(), 1);
    EXPECT_EQ(config.admins[0], ADMIN);

    ASSERT_EQ(config.pools.size(), 2);
    EXPECT_EQ(config.pools[0].stake_asset, NATIVE_ASSET);
    EXPECT_EQ(config.pools[0].weight, 1);
    EXPECT_EQ(config.pools[0].min_deposit, 0);
    EXPECT_EQ(config.pools[0].unstake_lock_blocks, 10);
    EXPECT_EQ(config.pools[1].stake_asset, STAKE_TOKEN);
    EXPECT_EQ(config.pools[1].weight, 3);
    EXPECT_EQ(config.pools[1].min_deposit, 100);
    EXPECT_EQ(config.pools[1].unstake_lock_blocks, 20);
}

TEST(LedgerConfig, defaults)
{
    auto document = valid_document();
    document.erase("shortfall_policy");
    document.erase("pools");
    document.erase("admins");

    auto const config = parse_ledger_config(document);
    EXPECT_EQ(config.shortfall_policy, ShortfallPolicy::Lenient);
    EXPECT_TRUE(config.admins.empty());
    EXPECT_TRUE(config.pools.empty());
}

TEST(LedgerConfig, amounts)
{
    EXPECT_EQ(amount_from_json(nlohmann::json(42), "x"), 42);
    EXPECT_EQ(amount_from_json(nlohmann::json("0x2a"), "x"), 42);
    EXPECT_EQ(
        amount_from_json(
            nlohmann::json("0x10000000000000000000000000000000000000000"),
            "x"),
        1_u256 << 160);
    EXPECT_THROW(
        amount_from_json(nlohmann::json("12ab"), "x"), MetastakeException);
    EXPECT_THROW(amount_from_json(nlohmann::json(-1), "x"), MetastakeException);
    EXPECT_THROW(
        amount_from_json(nlohmann::json(1.5), "x"), MetastakeException);
}

TEST(LedgerConfig, heights)
{
    EXPECT_EQ(height_from_json(nlohmann::json(7), "h"), 7);
    EXPECT_EQ(height_from_json(nlohmann::json("0x10"), "h"), 16);
    EXPECT_EQ(height_from_json(nlohmann::json("16"), "h"), 16);
    EXPECT_THROW(
        height_from_json(nlohmann::json("16 blocks"), "h"),
        MetastakeException);
    EXPECT_THROW(
        height_from_json(nlohmann::json("-3"), "h"), MetastakeException);
    EXPECT_THROW(height_from_json(nlohmann::json(""), "h"), MetastakeException);
    EXPECT_THROW(
        height_from_json(nlohmann::json("99999999999999999999999"), "h"),
        MetastakeException);
}

TEST(LedgerConfig, invalid_documents)
{
    EXPECT_THROW(
        parse_ledger_config(nlohmann::json::array()), MetastakeException);

    auto missing = valid_document();
    missing.erase("end_height");
    EXPECT_THROW(parse_ledger_config(missing), MetastakeException);

    auto bad_address = valid_document();
    bad_address["reward_asset"] = "0x1234";
    EXPECT_THROW(parse_ledger_config(bad_address), MetastakeException);

    auto bad_policy = valid_document();
    bad_policy["shortfall_policy"] = "generous";
    EXPECT_THROW(parse_ledger_config(bad_policy), MetastakeException);

    auto no_admins = valid_document();
    no_admins.erase("admins");
    EXPECT_THROW(parse_ledger_config(no_admins), MetastakeException);

    auto bad_pool = valid_document();
    bad_pool["pools"][1].erase("weight");
    EXPECT_THROW(parse_ledger_config(bad_pool), MetastakeException);
}

TEST(LedgerConfig, read_from_file)
{
    auto const path = std::filesystem::temp_directory_path() /
                      "metastake_test_ledger_config.json";
    {
        std::ofstream out(path);
        out << valid_document().dump();
    }
    EXPECT_EQ(read_ledger_config(path).pools.size(), 2);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(read_ledger_config(path), MetastakeException);
    std::filesystem::remove(path);

    EXPECT_THROW(
        read_ledger_config(path.parent_path() / "metastake_missing.json"),
        MetastakeException);
}

TEST_F(Ledger, apply_ledger_config)
{
    auto const config = parse_ledger_config(valid_document());
    ASSERT_FALSE(apply_ledger_config(contract, config, ADMIN, 50).has_error());

    EXPECT_EQ(contract.pool_length(), 2);
    EXPECT_EQ(contract.total_weight(), 4);
    EXPECT_EQ(contract.reward_asset(), REWARD_TOKEN);
    EXPECT_EQ(contract.pool(1).value().min_deposit, 100);
    EXPECT_EQ(contract.pool(1).value().last_settled_height, 100);
}

TEST_F(Ledger, apply_ledger_config_enforces_rules)
{
    auto document = valid_document();
    // a token pool cannot take the native slot
    document["pools"].erase(std::size_t{0});
    auto const config = parse_ledger_config(document);
    EXPECT_EQ(
        apply_ledger_config(contract, config, ADMIN, 50).assume_error(),
        StakingError::InvalidParameter);

    auto inverted = parse_ledger_config(valid_document());
    inverted.start_height = 300;
    State fresh;
    StakingContract other{
        fresh,
        Collaborators{
            .authorizer = authorizer,
            .pause_flags = pause,
            .stake_transfer = book,
            .reward_transfer = book,
            .event_sink = sink}};
    EXPECT_EQ(
        apply_ledger_config(other, inverted, ADMIN, 50).assume_error(),
        StakingError::InvalidParameter);
    EXPECT_EQ(other.pool_length(), 0);
}
