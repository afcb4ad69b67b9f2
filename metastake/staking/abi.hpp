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

#include <metastake/core/byte_string.hpp>
#include <metastake/core/result.hpp>
#include <metastake/staking/config.hpp>

METASTAKE_STAKING_NAMESPACE_BEGIN

struct TransferReceipt;

// A 32 byte big endian word holding 0 or 1
Result<bool> abi_decode_bool(byte_string_view);

// TransferFailed unless the call succeeded and its payload, if any,
// decodes to true
Result<void> check_transfer_receipt(TransferReceipt const &);

METASTAKE_STAKING_NAMESPACE_END
