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

#include "core/StreamLogger.hpp"

#include <thread>

namespace clipper::core::logging
{
    StreamLogger::StreamLogger(std::ostream& os, Severity minSeverity)
        : _os{ os }
        , _minSeverity{ minSeverity }
    {
    }

    void StreamLogger::processLog(const Log& log)
    {
        const std::scoped_lock lock{ _mutex };
        _os << std::this_thread::get_id() << " [" << getSeverityName(log.getSeverity()) << "] [" << getModuleName(log.getModule()) << "] " << log.getMessage() << std::endl;
    }
} // namespace clipper::core::logging
