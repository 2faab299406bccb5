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

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>

namespace clipper::clipping
{
    inline constexpr std::size_t transferChunkSize{ 262'144 };

    // Streams the whole file to output, chunk by chunk
    // throw Exception if the file cannot be read or if the output fails
    std::uint64_t copyFileToStream(const std::filesystem::path& path, std::ostream& output);

    // Returns std::nullopt if input holds more than maxSize bytes, the partial file is then removed
    // throw Exception on read/write errors, the partial file is then removed
    std::optional<std::uint64_t> copyStreamToFile(std::istream& input, const std::filesystem::path& path, std::uint64_t maxSize);
} // namespace clipper::clipping
