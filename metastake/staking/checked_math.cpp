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

#include <metastake/core/int.hpp>
#include <metastake/core/likely.h>
#include <metastake/core/result.hpp>
#include <metastake/staking/checked_math.hpp>
#include <metastake/staking/staking_error.hpp>

#include <boost/outcome/try.hpp>

#include <limits>

METASTAKE_STAKING_NAMESPACE_BEGIN

Result<uint256_t> checked_add(uint256_t const &x, uint256_t const &y)
{
    uint256_t const sum = x + y;
    if (METASTAKE_UNLIKELY(sum < x)) {
        return StakingError::Overflow;
    }
    return sum;
}

Result<uint256_t> checked_sub(uint256_t const &x, uint256_t const &y)
{
    if (METASTAKE_UNLIKELY(y > x)) {
        return StakingError::Overflow;
    }
    return x - y;
}

Result<uint256_t> checked_mul(uint256_t const &x, uint256_t const &y)
{
    if (x == 0 || y == 0) {
        return uint256_t{0};
    }
    if (METASTAKE_UNLIKELY(y > std::numeric_limits<uint256_t>::max() / x)) {
        return StakingError::Overflow;
    }
    return x * y;
}

Result<uint256_t> checked_div(uint256_t const &x, uint256_t const &y)
{
    if (METASTAKE_UNLIKELY(y == 0)) {
        return StakingError::Overflow;
    }
    return x / y;
}

Result<uint256_t>
checked_mul_div(uint256_t const &x, uint256_t const &y, uint256_t const &z)
{
    BOOST_OUTCOME_TRY(auto const p, checked_mul(x, y));
    return checked_div(p, z);
}

METASTAKE_STAKING_NAMESPACE_END
