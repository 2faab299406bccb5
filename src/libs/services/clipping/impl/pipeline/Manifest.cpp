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

#include "Manifest.hpp"

#include "core/String.hpp"

namespace clipper::clipping
{
    std::string buildConcatManifest(std::span<const std::filesystem::path> files)
    {
        std::string res;
        for (const std::filesystem::path& file : files)
        {
            res += "file '";
            res += escapeManifestPath(file);
            res += "'\n";
        }

        return res;
    }

    std::string escapeManifestPath(const std::filesystem::path& path)
    {
        return core::stringUtils::replaceInString(path.string(), "'", "'\\''");
    }
} // namespace clipper::clipping
