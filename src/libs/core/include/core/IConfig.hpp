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

#include <filesystem>
#include <memory>
#include <string_view>

namespace clipper::core
{
    // Used to get config values from configuration files
    class IConfig
    {
    public:
        virtual ~IConfig() = default;

        // Default values are returned in case of setting not found
        virtual std::string_view getString(std::string_view setting, std::string_view def) = 0;
        virtual std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) = 0;
        virtual unsigned long getULong(std::string_view setting, unsigned long def) = 0;
    };

    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p);
} // namespace clipper::core
