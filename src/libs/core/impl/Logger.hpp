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
#include <fstream>
#include <iosfwd>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "core/ILogger.hpp"

namespace clipper::core::logging
{
    class Logger final : public ILogger
    {
    public:
        Logger(Severity minSeverity, const std::filesystem::path& logFilePath);
        ~Logger() override;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

    private:
        bool isSeverityActive(Severity severity) const override;
        void processLog(const Log& log) override;

        void addOutputStream(std::ostream& os, Severity severity);

        struct OutputStream
        {
            OutputStream(std::ostream& os);

            std::mutex mutex;
            std::ostream& stream;
        };

        std::list<OutputStream> _outputStreams;
        std::unordered_map<Severity, OutputStream*> _severityToOutputStreamMap;
        std::unique_ptr<std::ofstream> _logFileStream;
    };
} // namespace clipper::core::logging
