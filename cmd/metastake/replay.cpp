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

#include "replay.hpp"

#include <metastake/core/address.hpp>
#include <metastake/core/config.hpp>
#include <metastake/core/int.hpp>
#include <metastake/core/metastake_exception.hpp>
#include <metastake/staking/asset_book.hpp>
#include <metastake/staking/collaborators.hpp>
#include <metastake/staking/constants.hpp>
#include <metastake/staking/ledger_config.hpp>
#include <metastake/staking/staking_contract.hpp>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

METASTAKE_ANONYMOUS_NAMESPACE_BEGIN

nlohmann::json const &field(nlohmann::json const &op, char const *const name)
{
    auto const it = op.find(name);
    METASTAKE_ASSERT_THROW(
        it != op.end(),
        fmt::format("{}: missing field '{}'", op.value("op", "?"), name));
    return *it;
}

bool flag(nlohmann::json const &op, char const *const name)
{
    auto const it = op.find(name);
    if (it == op.end()) {
        return false;
    }
    METASTAKE_ASSERT_THROW(
        it->is_boolean(), fmt::format("{}: expected boolean", name));
    return it->get<bool>();
}

METASTAKE_ANONYMOUS_NAMESPACE_END

METASTAKE_NAMESPACE_BEGIN

using namespace staking;

Replay::Replay(
    StakingContract &contract, PauseSwitches &pause, AssetBook &book)
    : contract_{contract}
    , pause_{pause}
    , book_{book}
{
}

void Replay::apply(nlohmann::json const &op)
{
    METASTAKE_ASSERT_THROW(op.is_object(), "ops: expected objects");
    auto const name = field(op, "op").get<std::string>();

    auto const height = [&] {
        return height_from_json(field(op, "height"), "height");
    };
    auto const caller = [&] {
        return address_from_json(field(op, "caller"), "caller");
    };
    auto const pool_id = [&] {
        return static_cast<size_t>(
            height_from_json(field(op, "pool_id"), "pool_id"));
    };
    auto const amount = [&](char const *const key) {
        return amount_from_json(field(op, key), key);
    };

    std::optional<std::string> rejection;
    auto const check = [&](auto const &res) {
        if (res.has_error()) {
            rejection = res.error().message().c_str();
        }
    };
    auto const track = [&](size_t const id, Address const &user) {
        positions_.emplace(id, user);
    };

    if (op.contains("height")) {
        stats_.last_height = std::max(stats_.last_height, height());
    }

    if (name == "mint") {
        book_.mint(
            address_from_json(field(op, "asset"), "asset"),
            address_from_json(field(op, "holder"), "holder"),
            amount("amount"));
    }
    else if (name == "deposit_native") {
        track(NATIVE_POOL_ID, caller());
        check(
            contract_.deposit_native(height(), caller(), amount("amount")));
    }
    else if (name == "deposit") {
        track(pool_id(), caller());
        check(contract_.deposit(
            height(), caller(), pool_id(), amount("amount")));
    }
    else if (name == "unstake") {
        track(pool_id(), caller());
        check(contract_.unstake(
            height(), caller(), pool_id(), amount("amount")));
    }
    else if (name == "withdraw") {
        auto const withdrawn =
            contract_.withdraw(height(), caller(), pool_id());
        if (withdrawn.has_value()) {
            LOG_INFO(
                "{} withdrew {} from pool {}",
                to_hex(caller()),
                intx::to_string(withdrawn.value()),
                pool_id());
        }
        check(withdrawn);
    }
    else if (name == "claim") {
        auto const paid = contract_.claim(height(), caller(), pool_id());
        if (paid.has_value()) {
            LOG_INFO(
                "{} claimed {} from pool {}",
                to_hex(caller()),
                intx::to_string(paid.value()),
                pool_id());
        }
        check(paid);
    }
    else if (name == "settle") {
        check(contract_.settle_pool(height(), pool_id()));
    }
    else if (name == "mass_settle") {
        check(contract_.mass_settle_pools(height()));
    }
    else if (name == "add_pool") {
        uint256_t min_deposit = 0;
        if (op.contains("min_deposit")) {
            min_deposit = amount("min_deposit");
        }
        check(contract_.add_pool(
            caller(),
            height(),
            address_from_json(field(op, "stake_asset"), "stake_asset"),
            amount("weight"),
            min_deposit,
            height_from_json(
                field(op, "unstake_lock_blocks"), "unstake_lock_blocks"),
            flag(op, "with_update")));
    }
    else if (name == "set_pool_weight") {
        check(contract_.set_pool_weight(
            caller(),
            height(),
            pool_id(),
            amount("weight"),
            flag(op, "with_update")));
    }
    else if (name == "update_pool_params") {
        check(contract_.update_pool_params(
            caller(),
            pool_id(),
            amount("min_deposit"),
            height_from_json(
                field(op, "unstake_lock_blocks"), "unstake_lock_blocks")));
    }
    else if (name == "set_reward_asset") {
        check(contract_.set_reward_asset(
            caller(), address_from_json(field(op, "asset"), "asset")));
    }
    else if (name == "set_start_height") {
        check(contract_.set_start_height(
            caller(), height_from_json(field(op, "value"), "value")));
    }
    else if (name == "set_end_height") {
        check(contract_.set_end_height(
            caller(), height_from_json(field(op, "value"), "value")));
    }
    else if (name == "set_reward_per_block") {
        check(contract_.set_reward_per_block(caller(), amount("value")));
    }
    else if (name == "pause_withdraw") {
        check(pause_.pause_withdraw(caller()));
    }
    else if (name == "unpause_withdraw") {
        check(pause_.unpause_withdraw(caller()));
    }
    else if (name == "pause_claim") {
        check(pause_.pause_claim(caller()));
    }
    else if (name == "unpause_claim") {
        check(pause_.unpause_claim(caller()));
    }
    else {
        throw MetastakeException(
            fmt::format("unknown op '{}'", name),
            __FILE__,
            __PRETTY_FUNCTION__,
            __LINE__);
    }

    if (rejection.has_value()) {
        ++stats_.rejected;
        LOG_WARNING("rejected {}: {}", op.dump(), rejection.value());
        return;
    }
    ++stats_.applied;
}

void Replay::run(nlohmann::json const &ops)
{
    METASTAKE_ASSERT_THROW(ops.is_array(), "ops: expected array");
    for (auto const &op : ops) {
        apply(op);
    }
}

void Replay::run(std::filesystem::path const &path)
{
    std::ifstream ifile(path);
    METASTAKE_ASSERT_THROW(
        ifile.is_open(), fmt::format("could not open ops {}", path.string()));
    nlohmann::json ops;
    try {
        ifile >> ops;
    }
    catch (nlohmann::json::parse_error const &e) {
        throw MetastakeException(
            fmt::format("{}: {}", path.string(), e.what()),
            __FILE__,
            __PRETTY_FUNCTION__,
            __LINE__);
    }
    run(ops);
}

METASTAKE_NAMESPACE_END
