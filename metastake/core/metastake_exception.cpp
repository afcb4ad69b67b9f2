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

#include <metastake/core/config.hpp>
#include <metastake/core/metastake_exception.hpp>

#include <cstdio>
#include <string>
#include <utility>

METASTAKE_NAMESPACE_BEGIN

MetastakeException::MetastakeException(
    std::string message, char const *const file, char const *const function,
    long const line)
    : message_{std::move(message)}
    , file_{file}
    , function_{function}
    , line_{line}
{
}

char const *MetastakeException::what() const noexcept
{
    return message_.c_str();
}

void MetastakeException::print() const noexcept
{
    std::fprintf(
        stderr,
        "%s:%ld: %s: %s\n",
        file_,
        line_,
        function_,
        message_.c_str());
}

METASTAKE_NAMESPACE_END
