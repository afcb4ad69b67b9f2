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
#include <metastake/core/result.hpp>
#include <metastake/staking/config.hpp>

#include <ankerl/unordered_dense.h>

#include <array>
#include <cstddef>

METASTAKE_STAKING_NAMESPACE_BEGIN

enum class AdminAction
{
    ManagePools = 0,
    SetParams,
    PauseWithdraw,
    PauseClaim,
    Count,
};

struct Authorizer
{
    virtual ~Authorizer() = default;
    virtual bool
    is_authorized(Address const &principal, AdminAction) const = 0;
};

struct PauseFlags
{
    virtual ~PauseFlags() = default;
    virtual bool withdraw_paused() const = 0;
    virtual bool claim_paused() const = 0;
};

// Outcome of an asset movement. A non-empty payload is an ABI encoded bool.
struct TransferReceipt
{
    bool success{true};
    byte_string payload{};
};

// Moves staking assets between users and the ledger's custody
struct StakeAssetTransfer
{
    virtual ~StakeAssetTransfer() = default;
    virtual TransferReceipt
    pull(Address const &asset, Address const &from, uint256_t const &) = 0;
    virtual TransferReceipt
    push(Address const &asset, Address const &to, uint256_t const &) = 0;
};

// Pays out the reward asset from the ledger's custody
struct RewardAssetTransfer
{
    virtual ~RewardAssetTransfer() = default;
    virtual uint256_t balance_of(Address const &asset) const = 0;
    virtual TransferReceipt
    transfer(Address const &asset, Address const &to, uint256_t const &) = 0;
};

class RoleAuthorizer final : public Authorizer
{
    std::array<
        ankerl::unordered_dense::set<Address>,
        static_cast<size_t>(AdminAction::Count)>
        roles_{};

public:
    void grant(Address const &, AdminAction);
    void grant_all(Address const &);
    void revoke(Address const &, AdminAction);

    bool is_authorized(Address const &, AdminAction) const override;
};

// Pause switches toggled by principals holding the matching action.
// Toggling a switch to the state it is already in is rejected.
class PauseSwitches final : public PauseFlags
{
    Authorizer const &authorizer_;
    bool withdraw_paused_{false};
    bool claim_paused_{false};

public:
    explicit PauseSwitches(Authorizer const &);

    Result<void> pause_withdraw(Address const &principal);
    Result<void> unpause_withdraw(Address const &principal);
    Result<void> pause_claim(Address const &principal);
    Result<void> unpause_claim(Address const &principal);

    bool withdraw_paused() const override
    {
        return withdraw_paused_;
    }

    bool claim_paused() const override
    {
        return claim_paused_;
    }
};

METASTAKE_STAKING_NAMESPACE_END
