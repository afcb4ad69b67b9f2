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
#include <metastake/core/byte_string.hpp>
#include <metastake/core/int.hpp>
#include <metastake/staking/asset_book.hpp>
#include <metastake/staking/collaborators.hpp>
#include <metastake/staking/constants.hpp>
#include <metastake/staking/events.hpp>
#include <metastake/staking/staking_contract.hpp>
#include <metastake/staking/state.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace metastake::staking::test
{
    using namespace evmc::literals;

    inline constexpr Address ADMIN =
        0xad00000000000000000000000000000000000001_address;
    inline constexpr Address ALICE =
        0xa11ce00000000000000000000000000000000001_address;
    inline constexpr Address BOB =
        0xb0b0000000000000000000000000000000000002_address;
    inline constexpr Address CUSTODY =
        0xc0570d1000000000000000000000000000000003_address;
    inline constexpr Address REWARD_TOKEN =
        0x7e7a4d0000000000000000000000000000000004_address;
    inline constexpr Address STAKE_TOKEN =
        0x570ce00000000000000000000000000000000005_address;
    inline constexpr Address OTHER_TOKEN =
        0x0777e40000000000000000000000000000000006_address;

    // ABI encoding of a bool-like word with the given low byte
    inline byte_string abi_word(uint8_t const low)
    {
        byte_string word(32, 0);
        word.back() = low;
        return word;
    }

    struct RecordingEventSink final : EventSink
    {
        std::vector<Event> events;

        void on_event(Event const &event) override
        {
            events.push_back(event);
        }

        template <class T>
        std::vector<T> of_type() const
        {
            std::vector<T> out;
            for (auto const &event : events) {
                if (auto const *const e = std::get_if<T>(&event)) {
                    out.push_back(*e);
                }
            }
            return out;
        }
    };

    // A ledger wired to in-memory collaborators, ADMIN holding every role
    struct Ledger : public ::testing::Test
    {
        State state;
        RoleAuthorizer authorizer;
        PauseSwitches pause{authorizer};
        AssetBook book{CUSTODY};
        RecordingEventSink sink;
        StakingContract contract{
            state,
            Collaborators{
                .authorizer = authorizer,
                .pause_flags = pause,
                .stake_transfer = book,
                .reward_transfer = book,
                .event_sink = sink}};

        void SetUp() override
        {
            authorizer.grant_all(ADMIN);
        }

        // reward 1 per block over [100, 200), reward balance funded
        void init_window(
            uint64_t const start = 100, uint64_t const end = 200,
            uint256_t const &reward_per_block = 1)
        {
            ASSERT_FALSE(
                contract.initialize(REWARD_TOKEN, start, end, reward_per_block)
                    .has_error());
            book.mint(REWARD_TOKEN, CUSTODY, 1'000'000);
        }

        size_t add_pool(
            uint64_t const height, Address const &asset,
            uint256_t const &weight, uint64_t const lock = 10,
            uint256_t const &min_deposit = 0)
        {
            auto const res = contract.add_pool(
                ADMIN, height, asset, weight, min_deposit, lock, false);
            EXPECT_FALSE(res.has_error());
            return res.value();
        }

        UserInfo user(size_t const pool_id, Address const &who)
        {
            return contract.user_info(pool_id, who).value();
        }
    };
}
