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

#include <metastake/core/assert.h>
#include <metastake/core/int.hpp>
#include <metastake/core/result.hpp>
#include <metastake/staking/checked_math.hpp>
#include <metastake/staking/types.hpp>
#include <metastake/staking/withdrawal_queue.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

METASTAKE_STAKING_NAMESPACE_BEGIN

Result<MaturedPrefix> matured_prefix(
    std::vector<UnstakeRequest> const &queue, uint64_t const height)
{
    MaturedPrefix prefix{.amount = 0, .count = 0};
    for (auto const &request : queue) {
        if (request.maturity_height > height) {
            break;
        }
        BOOST_OUTCOME_TRY(
            auto const amount, checked_add(prefix.amount, request.amount));
        prefix.amount = amount;
        ++prefix.count;
    }
    return prefix;
}

void drop_prefix(std::vector<UnstakeRequest> &queue, size_t const count)
{
    METASTAKE_ASSERT(count <= queue.size());
    queue.erase(
        queue.begin(),
        std::next(queue.begin(), static_cast<std::ptrdiff_t>(count)));
}

Result<WithdrawSummary> summarize(
    std::vector<UnstakeRequest> const &queue, uint64_t const height)
{
    WithdrawSummary summary{.requested = 0, .withdrawable = 0};
    for (auto const &request : queue) {
        BOOST_OUTCOME_TRY(
            auto const requested,
            checked_add(summary.requested, request.amount));
        summary.requested = requested;
        if (request.maturity_height <= height) {
            BOOST_OUTCOME_TRY(
                auto const withdrawable,
                checked_add(summary.withdrawable, request.amount));
            summary.withdrawable = withdrawable;
        }
    }
    return summary;
}

METASTAKE_STAKING_NAMESPACE_END
