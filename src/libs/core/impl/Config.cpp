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

#include "Config.hpp"

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace clipper::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw ClipperException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw ClipperException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
        catch (const libconfig::ConfigException& e)
        {
            throw ClipperException{ "Cannot open config file '" + p.string() + "': " + e.what() };
        }
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        try
        {
            return static_cast<const char*>(_config.lookup(std::string{ setting }));
        }
        catch (const libconfig::SettingTypeException&)
        {
            CLIPPER_LOG(CONFIG, WARNING, "Setting '" << setting << "' is not a string, using default value");
            return def;
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& path)
    {
        try
        {
            const char* res{ _config.lookup(std::string{ setting }) };
            return std::filesystem::path{ std::string(res) };
        }
        catch (const libconfig::ConfigException&)
        {
            return path;
        }
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        try
        {
            return static_cast<unsigned int>(_config.lookup(std::string{ setting }));
        }
        catch (const libconfig::SettingTypeException&)
        {
            CLIPPER_LOG(CONFIG, WARNING, "Setting '" << setting << "' is not an unsigned integer, using default value");
            return def;
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }
} // namespace clipper::core
