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

#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Wt
{
    class WDateTime;
} // namespace Wt

namespace clipper::core::stringUtils
{
    [[nodiscard]] std::vector<std::string_view> splitString(std::string_view string, char separator);

    [[nodiscard]] std::string_view stringTrim(std::string_view str, std::string_view whitespaces = " \t\r\n");

    [[nodiscard]] std::string stringToLower(std::string_view str);

    [[nodiscard]] bool stringIsAlnum(std::string_view str);

    // replace every occurrence of "from" by "to"
    [[nodiscard]] std::string replaceInString(std::string_view str, std::string_view from, std::string_view to);

    template<typename T>
    [[nodiscard]] std::optional<T> readAs(std::string_view str)
    {
        T res;
        std::istringstream iss{ std::string{ str } };
        iss >> res;
        if (iss.fail() || !iss.eof())
            return std::nullopt;

        return res;
    }

    template<>
    [[nodiscard]] std::optional<std::string> readAs(std::string_view str);

    [[nodiscard]] std::string toISO8601String(const Wt::WDateTime& dateTime);

    // to "<seconds>.<milliseconds>", as expected by ffmpeg time options
    [[nodiscard]] std::string formatSeconds(double seconds);
} // namespace clipper::core::stringUtils
