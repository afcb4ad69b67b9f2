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
#include <metastake/staking/types.hpp>

#include <cstddef>
#include <cstdint>

METASTAKE_STAKING_NAMESPACE_BEGIN

class State;

struct Settlement
{
    Pool pool;
    uint256_t minted; // emission attributed to the pool over the range
};

// Pool brought current to `height`. Unchanged when `height` is not past the
// last settlement. Emission over periods with no stake is discarded.
Result<Settlement>
settled(Pool const &, GlobalParams const &, uint64_t height);

Result<void> settle_pool(State &, size_t pool_id, uint64_t height);

// every pool in registry order
Result<void> settle_all_pools(State &, uint64_t height);

METASTAKE_STAKING_NAMESPACE_END
