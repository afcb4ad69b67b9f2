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
#include <metastake/core/metastake_exception.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace metastake;
using namespace evmc::literals;

TEST(Address, hex)
{
    constexpr Address a = 0x00000000000000000000000000000000000000ff_address;
    EXPECT_EQ(to_hex(a), "0x00000000000000000000000000000000000000ff");
    EXPECT_EQ(to_hex(Address{}), "0x" + std::string(40, '0'));

    EXPECT_EQ(
        address_from_hex("0x00000000000000000000000000000000000000FF"), a);
    EXPECT_EQ(address_from_hex("00000000000000000000000000000000000000ff"), a);
    EXPECT_FALSE(address_from_hex("0xff").has_value());
    EXPECT_FALSE(
        address_from_hex("0x00000000000000000000000000000000000000ff00")
            .has_value());
    EXPECT_FALSE(
        address_from_hex("0x00000000000000000000000000000000000000fg")
            .has_value());
}

TEST(MetastakeException, assert_throw)
{
    try {
        METASTAKE_ASSERT_THROW(1 + 1 == 3, "arithmetic is broken");
        FAIL();
    }
    catch (MetastakeException const &e) {
        EXPECT_STREQ(e.what(), "arithmetic is broken");
        EXPECT_NE(
            std::string{e.file()}.find("test_address.cpp"), std::string::npos);
        EXPECT_GT(e.line(), 0);
    }
    EXPECT_NO_THROW(METASTAKE_ASSERT_THROW(true, "unreachable"));
}
