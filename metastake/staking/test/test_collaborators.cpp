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

#include <metastake/core/byte_string.hpp>
#include <metastake/core/int.hpp>
#include <metastake/staking/abi.hpp>
#include <metastake/staking/asset_book.hpp>
#include <metastake/staking/collaborators.hpp>
#include <metastake/staking/staking_error.hpp>

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <optional>

using namespace metastake;
using namespace metastake::staking;
using namespace metastake::staking::test;

TEST(Abi, decode_bool)
{
    EXPECT_TRUE(abi_decode_bool(abi_word(1)).value());
    EXPECT_FALSE(abi_decode_bool(abi_word(0)).value());
    EXPECT_EQ(
        abi_decode_bool(abi_word(2)).assume_error(),
        StakingError::TransferFailed);

    byte_string high = abi_word(1);
    high[0] = 1;
    EXPECT_EQ(
        abi_decode_bool(high).assume_error(), StakingError::TransferFailed);

    byte_string const short_word(31, 0);
    EXPECT_EQ(
        abi_decode_bool(short_word).assume_error(),
        StakingError::TransferFailed);
}

TEST(Abi, check_transfer_receipt)
{
    EXPECT_FALSE(check_transfer_receipt(TransferReceipt{}).has_error());
    EXPECT_FALSE(
        check_transfer_receipt(TransferReceipt{.payload = abi_word(1)})
            .has_error());
    EXPECT_EQ(
        check_transfer_receipt(TransferReceipt{.payload = abi_word(0)})
            .assume_error(),
        StakingError::TransferFailed);
    EXPECT_EQ(
        check_transfer_receipt(TransferReceipt{.success = false})
            .assume_error(),
        StakingError::TransferFailed);
}

TEST(RoleAuthorizer, grant_and_revoke)
{
    RoleAuthorizer authorizer;
    EXPECT_FALSE(authorizer.is_authorized(ALICE, AdminAction::ManagePools));
    authorizer.grant(ALICE, AdminAction::ManagePools);
    EXPECT_TRUE(authorizer.is_authorized(ALICE, AdminAction::ManagePools));
    EXPECT_FALSE(authorizer.is_authorized(ALICE, AdminAction::SetParams));
    authorizer.revoke(ALICE, AdminAction::ManagePools);
    EXPECT_FALSE(authorizer.is_authorized(ALICE, AdminAction::ManagePools));

    authorizer.grant_all(BOB);
    EXPECT_TRUE(authorizer.is_authorized(BOB, AdminAction::PauseClaim));
    EXPECT_TRUE(authorizer.is_authorized(BOB, AdminAction::PauseWithdraw));
}

TEST(PauseSwitches, toggles)
{
    RoleAuthorizer authorizer;
    authorizer.grant(ADMIN, AdminAction::PauseWithdraw);
    PauseSwitches pause{authorizer};

    EXPECT_EQ(
        pause.pause_withdraw(ALICE).assume_error(), StakingError::Unauthorized);
    EXPECT_EQ(
        pause.pause_claim(ADMIN).assume_error(), StakingError::Unauthorized);

    EXPECT_EQ(
        pause.unpause_withdraw(ADMIN).assume_error(),
        StakingError::InvalidParameter);
    ASSERT_FALSE(pause.pause_withdraw(ADMIN).has_error());
    EXPECT_TRUE(pause.withdraw_paused());
    EXPECT_FALSE(pause.claim_paused());
    EXPECT_EQ(
        pause.pause_withdraw(ADMIN).assume_error(),
        StakingError::InvalidParameter);
    ASSERT_FALSE(pause.unpause_withdraw(ADMIN).has_error());
    EXPECT_FALSE(pause.withdraw_paused());
}

TEST(AssetBook, moves_between_holders_and_custody)
{
    AssetBook book{CUSTODY};
    book.mint(STAKE_TOKEN, ALICE, 100);

    EXPECT_TRUE(book.pull(STAKE_TOKEN, ALICE, 60).success);
    EXPECT_EQ(book.balance(STAKE_TOKEN, ALICE), 40);
    EXPECT_EQ(book.balance_of(STAKE_TOKEN), 60);

    EXPECT_FALSE(book.pull(STAKE_TOKEN, ALICE, 41).success);
    EXPECT_EQ(book.balance(STAKE_TOKEN, ALICE), 40);

    EXPECT_TRUE(book.push(STAKE_TOKEN, BOB, 10).success);
    EXPECT_EQ(book.balance(STAKE_TOKEN, BOB), 10);
    EXPECT_EQ(book.balance_of(STAKE_TOKEN), 50);

    book.force_receipt(TransferReceipt{.success = false});
    EXPECT_FALSE(book.transfer(STAKE_TOKEN, BOB, 10).success);
    EXPECT_EQ(book.balance(STAKE_TOKEN, BOB), 10);
    book.force_receipt(std::nullopt);
    EXPECT_TRUE(book.transfer(STAKE_TOKEN, BOB, 10).success);
    EXPECT_EQ(book.balance(STAKE_TOKEN, BOB), 20);

    // a credit that would wrap the recipient is refused
    book.mint(OTHER_TOKEN, ALICE, 1);
    book.mint(OTHER_TOKEN, CUSTODY, std::numeric_limits<uint256_t>::max());
    EXPECT_FALSE(book.pull(OTHER_TOKEN, ALICE, 1).success);
    EXPECT_EQ(book.balance(OTHER_TOKEN, ALICE), 1);
    EXPECT_EQ(
        book.balance_of(OTHER_TOKEN), std::numeric_limits<uint256_t>::max());
    book.mint(OTHER_TOKEN, BOB, std::numeric_limits<uint256_t>::max());
    EXPECT_FALSE(book.push(OTHER_TOKEN, BOB, 1).success);
    EXPECT_EQ(
        book.balance_of(OTHER_TOKEN), std::numeric_limits<uint256_t>::max());
}
