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
#include <metastake/core/assert.h>
#include <metastake/core/int.hpp>
#include <metastake/staking/asset_book.hpp>
#include <metastake/staking/collaborators.hpp>

#include <quill/Quill.h>

#include <optional>
#include <utility>

METASTAKE_STAKING_NAMESPACE_BEGIN

AssetBook::AssetBook(Address const &custody)
    : custody_{custody}
{
}

void AssetBook::mint(
    Address const &asset, Address const &holder, uint256_t const &amount)
{
    auto &balance = balances_[Key{.asset = asset, .holder = holder}];
    METASTAKE_ASSERT(balance + amount >= balance);
    balance += amount;
}

uint256_t
AssetBook::balance(Address const &asset, Address const &holder) const
{
    auto const it = balances_.find(Key{.asset = asset, .holder = holder});
    return it == balances_.end() ? uint256_t{0} : it->second;
}

void AssetBook::force_receipt(std::optional<TransferReceipt> receipt)
{
    forced_receipt_ = std::move(receipt);
}

TransferReceipt AssetBook::move(
    Address const &asset, Address const &from, Address const &to,
    uint256_t const &amount)
{
    if (forced_receipt_.has_value()) {
        return forced_receipt_.value();
    }
    auto &from_balance = balances_[Key{.asset = asset, .holder = from}];
    if (from_balance < amount) {
        LOG_DEBUG(
            "asset book: {} holds {} of {}, cannot move {}",
            to_hex(from),
            intx::to_string(from_balance),
            to_hex(asset),
            intx::to_string(amount));
        return TransferReceipt{.success = false};
    }
    uint256_t const to_balance = balance(asset, to);
    if (from != to && to_balance + amount < to_balance) {
        LOG_DEBUG(
            "asset book: crediting {} of {} to {} would overflow",
            intx::to_string(amount),
            to_hex(asset),
            to_hex(to));
        return TransferReceipt{.success = false};
    }
    from_balance -= amount;
    balances_[Key{.asset = asset, .holder = to}] += amount;
    return TransferReceipt{};
}

TransferReceipt AssetBook::pull(
    Address const &asset, Address const &from, uint256_t const &amount)
{
    return move(asset, from, custody_, amount);
}

TransferReceipt AssetBook::push(
    Address const &asset, Address const &to, uint256_t const &amount)
{
    return move(asset, custody_, to, amount);
}

uint256_t AssetBook::balance_of(Address const &asset) const
{
    return balance(asset, custody_);
}

TransferReceipt AssetBook::transfer(
    Address const &asset, Address const &to, uint256_t const &amount)
{
    return move(asset, custody_, to, amount);
}

METASTAKE_STAKING_NAMESPACE_END
