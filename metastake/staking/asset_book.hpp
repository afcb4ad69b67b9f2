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
#include <metastake/staking/collaborators.hpp>
#include <metastake/staking/config.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <optional>

METASTAKE_STAKING_NAMESPACE_BEGIN

// In-memory balances per (asset, holder). Assets held by the ledger sit
// under the custody address.
class AssetBook final
    : public StakeAssetTransfer
    , public RewardAssetTransfer
{
    struct Key
    {
        Address asset;
        Address holder;

        bool operator==(Key const &) const = default;
    };

    struct KeyHash
    {
        using is_avalanching = void;

        uint64_t operator()(Key const &key) const noexcept
        {
            return ankerl::unordered_dense::detail::wyhash::mix(
                ankerl::unordered_dense::detail::wyhash::hash(
                    key.asset.bytes, sizeof(key.asset.bytes)),
                ankerl::unordered_dense::detail::wyhash::hash(
                    key.holder.bytes, sizeof(key.holder.bytes)));
        }
    };

    Address custody_;
    ankerl::unordered_dense::map<Key, uint256_t, KeyHash> balances_{};
    std::optional<TransferReceipt> forced_receipt_{};

    TransferReceipt move(
        Address const &asset, Address const &from, Address const &to,
        uint256_t const &amount);

public:
    explicit AssetBook(Address const &custody);

    Address const &custody() const
    {
        return custody_;
    }

    void mint(Address const &asset, Address const &holder, uint256_t const &);

    uint256_t balance(Address const &asset, Address const &holder) const;

    // While set, every transfer returns this receipt and moves nothing
    void force_receipt(std::optional<TransferReceipt>);

    TransferReceipt pull(
        Address const &asset, Address const &from,
        uint256_t const &) override;
    TransferReceipt
    push(Address const &asset, Address const &to, uint256_t const &) override;

    uint256_t balance_of(Address const &asset) const override;
    TransferReceipt transfer(
        Address const &asset, Address const &to, uint256_t const &) override;
};

METASTAKE_STAKING_NAMESPACE_END
