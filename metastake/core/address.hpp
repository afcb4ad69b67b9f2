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

#include <metastake/core/config.hpp>

#include <evmc/evmc.hpp>

#include <optional>
#include <string>
#include <string_view>

METASTAKE_NAMESPACE_BEGIN

using Address = ::evmc::address;

static_assert(sizeof(Address) == 20);
static_assert(alignof(Address) == 1);

// 0x-prefixed lowercase hex
std::string to_hex(Address const &);

// exactly 40 hex digits, optionally 0x-prefixed
std::optional<Address> address_from_hex(std::string_view);

METASTAKE_NAMESPACE_END
