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
#include <metastake/staking/config.hpp>

#include <cstddef>

METASTAKE_STAKING_NAMESPACE_BEGIN

using namespace intx::literals;

// fixed point precision of acc_reward_per_share
inline constexpr uint256_t SCALE = 1'000'000'000'000'000'000_u256;

// stake asset of pool 0
inline constexpr Address NATIVE_ASSET{};

inline constexpr size_t NATIVE_POOL_ID = 0;

METASTAKE_STAKING_NAMESPACE_END
