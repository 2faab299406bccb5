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

#include "core/String.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>

#include <Wt/WDateTime.h>

namespace clipper::core::stringUtils
{
    std::vector<std::string_view> splitString(std::string_view str, char separator)
    {
        std::vector<std::string_view> res;

        std::size_t currentPos{};
        while (true)
        {
            const std::size_t separatorPos{ str.find(separator, currentPos) };
            if (separatorPos == std::string_view::npos)
            {
                res.push_back(str.substr(currentPos));
                break;
            }

            res.push_back(str.substr(currentPos, separatorPos - currentPos));
            currentPos = separatorPos + 1;
        }

        return res;
    }

    std::string_view stringTrim(std::string_view str, std::string_view whitespaces)
    {
        const auto strBegin{ str.find_first_not_of(whitespaces) };
        if (strBegin == std::string_view::npos)
            return {};

        const auto strEnd{ str.find_last_not_of(whitespaces) };
        const auto strRange{ strEnd - strBegin + 1 };

        return str.substr(strBegin, strRange);
    }

    std::string stringToLower(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        std::transform(std::cbegin(str), std::cend(str), std::back_inserter(res), [](unsigned char c) { return std::tolower(c); });

        return res;
    }

    bool stringIsAlnum(std::string_view str)
    {
        return std::all_of(std::cbegin(str), std::cend(str), [](unsigned char c) { return std::isalnum(c); });
    }

    std::string replaceInString(std::string_view str, std::string_view from, std::string_view to)
    {
        std::string res{ str };
        if (from.empty())
            return res;

        std::size_t pos{};
        while ((pos = res.find(from, pos)) != std::string::npos)
        {
            res.replace(pos, from.length(), to);
            pos += to.length();
        }

        return res;
    }

    template<>
    std::optional<std::string> readAs(std::string_view str)
    {
        return std::string{ str };
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (dateTime.isValid())
        {
            // assume UTC
            return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
        }

        return "";
    }

    std::string formatSeconds(double seconds)
    {
        std::ostringstream oss;
        oss << std::fixed << std::showpoint << std::setprecision(3) << seconds;
        return oss.str();
    }
} // namespace clipper::core::stringUtils
