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

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <iostream>
#include <system_error>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace clipper::core::logging
{
    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::CHILDPROCESS:
            return "CHILDPROC";
        case Module::CLIPPING:
            return "CLIPPING";
        case Module::CONFIG:
            return "CONFIG";
        case Module::ENCODER:
            return "ENCODER";
        case Module::GC:
            return "GC";
        case Module::MAIN:
            return "MAIN";
        case Module::PIPELINE:
            return "PIPELINE";
        case Module::TRACKER:
            return "TRACKER";
        case Module::UTILS:
            return "UTILS";
        }
        return "";
    }

    const char* getSeverityName(Severity sev)
    {
        switch (sev)
        {
        case Severity::FATAL:
            return "fatal";
        case Severity::ERROR:
            return "error";
        case Severity::WARNING:
            return "warning";
        case Severity::INFO:
            return "info";
        case Severity::DEBUG:
            return "debug";
        }
        return "";
    }

    Severity parseSeverity(std::string_view name)
    {
        for (const Severity severity : { Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG })
        {
            if (name == getSeverityName(severity))
                return severity;
        }

        throw ClipperException{ "Invalid log severity '" + std::string{ name } + "'" };
    }

    Log::Log(ILogger& logger, Module module, Severity severity)
        : _logger{ logger }
        , _module{ module }
        , _severity{ severity }
    {
    }

    Log::~Log()
    {
        _logger.processLog(*this);
    }

    std::string Log::getMessage() const
    {
        return _oss.str();
    }

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::OutputStream::OutputStream(std::ostream& os)
        : stream{ os }
    {
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        if (!logFilePath.empty())
        {
            _logFileStream = std::make_unique<std::ofstream>(logFilePath, std::ios::out | std::ios::app);
            if (!_logFileStream->is_open())
            {
                const std::error_code ec{ errno, std::generic_category() };
                throw ClipperException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
            }
        }

        // Info and debug go to stdout, the rest to stderr, unless everything goes to the log file
        switch (minSeverity)
        {
        case Severity::DEBUG:
            addOutputStream(_logFileStream ? *_logFileStream : std::cout, Severity::DEBUG);
            [[fallthrough]];
        case Severity::INFO:
            addOutputStream(_logFileStream ? *_logFileStream : std::cout, Severity::INFO);
            [[fallthrough]];
        case Severity::WARNING:
            addOutputStream(_logFileStream ? *_logFileStream : std::cerr, Severity::WARNING);
            [[fallthrough]];
        case Severity::ERROR:
            addOutputStream(_logFileStream ? *_logFileStream : std::cerr, Severity::ERROR);
            [[fallthrough]];
        case Severity::FATAL:
            addOutputStream(_logFileStream ? *_logFileStream : std::cerr, Severity::FATAL);
            break;
        }
    }

    Logger::~Logger() = default;

    void Logger::addOutputStream(std::ostream& os, Severity severity)
    {
        auto it{ std::find_if(_outputStreams.begin(), _outputStreams.end(), [&os](const OutputStream& outputStream) { return &outputStream.stream == &os; }) };
        if (it == _outputStreams.end())
            it = _outputStreams.emplace(_outputStreams.end(), os);

        assert(!_severityToOutputStreamMap.contains(severity));
        _severityToOutputStreamMap.emplace(severity, &(*it));
    }

    bool Logger::isSeverityActive(Severity severity) const
    {
        return _severityToOutputStreamMap.contains(severity);
    }

    void Logger::processLog(const Log& log)
    {
        assert(isSeverityActive(log.getSeverity())); // should have been filtered out by a isSeverityActive call
        OutputStream* outputStream{ _severityToOutputStreamMap.at(log.getSeverity()) };
        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        std::unique_lock lock{ outputStream->mutex };
        outputStream->stream << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " [" << getSeverityName(log.getSeverity()) << "] [" << getModuleName(log.getModule()) << "] " << log.getMessage() << std::endl;
    }
} // namespace clipper::core::logging
