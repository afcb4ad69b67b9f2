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

#include <metastake/core/address.hpp>
#include <metastake/core/config.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <optional>
#include <string>
#include <string_view>

METASTAKE_NAMESPACE_BEGIN

std::string to_hex(Address const &address)
{
    return "0x" + evmc::hex({address.bytes, sizeof(address.bytes)});
}

std::optional<Address> address_from_hex(std::string_view s)
{
    if (s.starts_with("0x")) {
        s.remove_prefix(2);
    }
    // evmc left-pads short input, an address must be spelled out in full
    if (s.size() != 2 * sizeof(Address::bytes)) {
        return std::nullopt;
    }
    return evmc::from_hex<Address>(s);
}

METASTAKE_NAMESPACE_END
