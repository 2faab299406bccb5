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

#include "IdGenerator.hpp"

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include "core/Random.hpp"
#include "core/String.hpp"

namespace clipper::clipping::ids
{
    namespace
    {
        constexpr std::uint64_t maxRandomValue{ 999'999'999'999 };
        constexpr std::size_t randomDigitCount{ 12 };
        constexpr std::size_t maxExtensionSize{ 10 }; // dot excluded

        std::string generateUniquePart(std::chrono::system_clock::time_point now)
        {
            const auto milliseconds{ std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() };

            std::ostringstream oss;
            oss << milliseconds << '-' << std::setw(randomDigitCount) << std::setfill('0') << core::random::getRandom<std::uint64_t>(0, maxRandomValue);
            return oss.str();
        }
    } // namespace

    std::string generateId(std::string_view prefix)
    {
        return generateId(prefix, std::chrono::system_clock::now());
    }

    std::string generateId(std::string_view prefix, std::chrono::system_clock::time_point now)
    {
        std::string res{ prefix };
        res += '-';
        res += generateUniquePart(now);
        return res;
    }

    std::string generateUploadFilename(std::string_view originalName)
    {
        return generateUniquePart(std::chrono::system_clock::now()) + getSafeExtension(originalName);
    }

    std::string getSafeExtension(std::string_view originalName)
    {
        const std::string extension{ std::filesystem::path{ originalName }.extension().string() };
        if (extension.size() < 2 || extension.size() > maxExtensionSize + 1)
            return {};

        const std::string_view suffix{ std::string_view{ extension }.substr(1) };
        if (!core::stringUtils::stringIsAlnum(suffix))
            return {};

        return "." + core::stringUtils::stringToLower(suffix);
    }
} // namespace clipper::clipping::ids
