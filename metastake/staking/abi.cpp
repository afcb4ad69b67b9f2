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
#include <metastake/core/likely.h>
#include <metastake/core/result.hpp>
#include <metastake/staking/abi.hpp>
#include <metastake/staking/collaborators.hpp>
#include <metastake/staking/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>

METASTAKE_STAKING_NAMESPACE_BEGIN

Result<bool> abi_decode_bool(byte_string_view const data)
{
    constexpr size_t WORD_SIZE = 32;
    if (METASTAKE_UNLIKELY(data.size() != WORD_SIZE)) {
        return StakingError::TransferFailed;
    }
    bool const high_zero = std::all_of(
        data.begin(), data.end() - 1, [](uint8_t const b) { return b == 0; });
    uint8_t const low = data.back();
    if (METASTAKE_UNLIKELY(!high_zero || low > 1)) {
        return StakingError::TransferFailed;
    }
    return low == 1;
}

Result<void> check_transfer_receipt(TransferReceipt const &receipt)
{
    if (METASTAKE_UNLIKELY(!receipt.success)) {
        return StakingError::TransferFailed;
    }
    if (receipt.payload.empty()) {
        return outcome::success();
    }
    BOOST_OUTCOME_TRY(auto const ok, abi_decode_bool(receipt.payload));
    if (METASTAKE_UNLIKELY(!ok)) {
        return StakingError::TransferFailed;
    }
    return outcome::success();
}

METASTAKE_STAKING_NAMESPACE_END
