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
#include <vector>

METASTAKE_STAKING_NAMESPACE_BEGIN

struct MaturedPrefix
{
    uint256_t amount;
    size_t count;
};

// Leading requests with maturity_height <= height. The scan stops at the
// first immature request, so a request queued behind a later maturity
// waits for it.
Result<MaturedPrefix>
matured_prefix(std::vector<UnstakeRequest> const &, uint64_t height);

void drop_prefix(std::vector<UnstakeRequest> &, size_t count);

struct WithdrawSummary
{
    uint256_t requested; // every queued request
    uint256_t withdrawable; // every matured request, wherever it sits
};

Result<WithdrawSummary>
summarize(std::vector<UnstakeRequest> const &, uint64_t height);

METASTAKE_STAKING_NAMESPACE_END
