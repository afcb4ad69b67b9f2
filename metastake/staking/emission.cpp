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
#include <metastake/core/likely.h>
#include <metastake/core/result.hpp>
#include <metastake/staking/checked_math.hpp>
#include <metastake/staking/emission.hpp>
#include <metastake/staking/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>

#include <algorithm>
#include <cstdint>

METASTAKE_STAKING_NAMESPACE_BEGIN

Result<uint256_t>
EmissionSchedule::multiplier(uint64_t from, uint64_t to) const
{
    if (METASTAKE_UNLIKELY(from > to)) {
        return StakingError::InvalidParameter;
    }
    from = std::max(from, start_height);
    to = std::min(to, end_height);
    if (from >= to) {
        return uint256_t{0};
    }
    METASTAKE_ASSERT(from < to);
    return checked_mul(uint256_t{to - from}, reward_per_block);
}

Result<void>
validate_window(uint64_t const start_height, uint64_t const end_height)
{
    if (METASTAKE_UNLIKELY(start_height > end_height)) {
        return StakingError::InvalidParameter;
    }
    return outcome::success();
}

Result<void> validate_reward_per_block(uint256_t const &reward_per_block)
{
    if (METASTAKE_UNLIKELY(reward_per_block == 0)) {
        return StakingError::InvalidParameter;
    }
    return outcome::success();
}

METASTAKE_STAKING_NAMESPACE_END
