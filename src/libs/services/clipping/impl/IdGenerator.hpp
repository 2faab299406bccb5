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

#include <chrono>
#include <string>
#include <string_view>

namespace clipper::clipping::ids
{
    inline constexpr std::string_view sessionPrefix{ "client" };
    inline constexpr std::string_view downloadTokenPrefix{ "dl" };
    inline constexpr std::string_view runPrefix{ "run" };

    // "<prefix>-<milliseconds since epoch>-<12 random digits>"
    std::string generateId(std::string_view prefix);
    std::string generateId(std::string_view prefix, std::chrono::system_clock::time_point now);

    // "<milliseconds since epoch>-<12 random digits><extension>"
    // The extension of the original name is only kept if it looks sane
    std::string generateUploadFilename(std::string_view originalName);

    // Lower case, with the leading dot, or empty if unsuitable
    std::string getSafeExtension(std::string_view originalName);
} // namespace clipper::clipping::ids
