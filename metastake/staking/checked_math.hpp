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

#include <metastake/core/int.hpp>
#include <metastake/core/result.hpp>
#include <metastake/staking/config.hpp>

METASTAKE_STAKING_NAMESPACE_BEGIN

// Every operation reports StakingError::Overflow instead of wrapping.
// Division by zero is reported the same way.

Result<uint256_t> checked_add(uint256_t const &x, uint256_t const &y);

Result<uint256_t> checked_sub(uint256_t const &x, uint256_t const &y);

Result<uint256_t> checked_mul(uint256_t const &x, uint256_t const &y);

Result<uint256_t> checked_div(uint256_t const &x, uint256_t const &y);

// x * y / z with the product checked before the division
Result<uint256_t>
checked_mul_div(uint256_t const &x, uint256_t const &y, uint256_t const &z);

METASTAKE_STAKING_NAMESPACE_END
