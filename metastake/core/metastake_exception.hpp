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
#include <metastake/core/likely.h>

#include <exception>
#include <string>

METASTAKE_NAMESPACE_BEGIN

class MetastakeException : public std::exception
{
    std::string message_;
    char const *file_;
    char const *function_;
    long line_;

public:
    MetastakeException(
        std::string message, char const *file, char const *function,
        long line);

    char const *what() const noexcept override;

    char const *file() const noexcept
    {
        return file_;
    }

    long line() const noexcept
    {
        return line_;
    }

    void print() const noexcept;
};

METASTAKE_NAMESPACE_END

#define METASTAKE_ASSERT_THROW(expr, msg)                                      \
    do {                                                                       \
        if (METASTAKE_UNLIKELY(!(expr))) {                                     \
            throw ::metastake::MetastakeException(                             \
                (msg), __FILE__, __PRETTY_FUNCTION__, __LINE__);               \
        }                                                                      \
    }                                                                          \
    while (0)
