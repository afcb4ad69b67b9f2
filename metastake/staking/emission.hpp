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

#include <cstdint>

METASTAKE_STAKING_NAMESPACE_BEGIN

// Constant per-block emission over the window [start_height, end_height)
struct EmissionSchedule
{
    uint64_t start_height{0};
    uint64_t end_height{0};
    uint256_t reward_per_block{0};

    bool operator==(EmissionSchedule const &) const = default;

    // Total reward minted over [from, to) after clipping to the window.
    // An inverted input range is InvalidParameter, a range that clips to
    // nothing mints 0.
    Result<uint256_t> multiplier(uint64_t from, uint64_t to) const;
};

Result<void> validate_window(uint64_t start_height, uint64_t end_height);

Result<void> validate_reward_per_block(uint256_t const &);

METASTAKE_STAKING_NAMESPACE_END
