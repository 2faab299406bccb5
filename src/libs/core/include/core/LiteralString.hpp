/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Clipper.
 *
 * Clipper is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Clipper is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Clipper.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <cstddef>
#include <ostream>
#include <string_view>

namespace clipper::core
{
    // Non owning view on a string literal, safe to copy around and to keep
    class LiteralString
    {
    public:
        constexpr LiteralString() noexcept = default;
        template<std::size_t N>
        constexpr LiteralString(const char (&str)[N]) noexcept
            : _str{ str, N - 1 }
        {
            static_assert(N > 0);
        }

        constexpr bool empty() const noexcept { return _str.empty(); }
        constexpr const char* c_str() const noexcept { return _str.data(); }
        constexpr std::size_t length() const noexcept { return _str.length(); }
        constexpr std::string_view str() const noexcept { return _str; }
        constexpr auto operator<=>(const LiteralString& other) const = default;

    private:
        std::string_view _str;
    };

    inline std::ostream& operator<<(std::ostream& os, const LiteralString& str)
    {
        os << str.str();
        return os;
    }
} // namespace clipper::core
