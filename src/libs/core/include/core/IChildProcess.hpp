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

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/Exception.hpp"

namespace clipper::core
{
    class ChildProcessException : public ClipperException
    {
    public:
        using ClipperException::ClipperException;
    };

    class IChildProcess
    {
    public:
        using Args = std::vector<std::string>;

        virtual ~IChildProcess() = default;

        struct ExitStatus
        {
            std::optional<int> exitCode; // not set if terminated by a signal
            bool killed{};
            std::string diagnostic; // tail of what the process wrote on stderr

            bool success() const { return !killed && exitCode && *exitCode == 0; }
        };

        // Drains stderr and reaps the process once it closed it
        // Callback is called from the io context threads
        using ExitCallback = std::function<void(const ExitStatus&)>;
        virtual void asyncWaitForExit(ExitCallback callback) = 0;

        virtual void kill() = 0;
        virtual bool finished() const = 0;
    };
} // namespace clipper::core
