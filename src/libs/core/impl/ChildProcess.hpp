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

#include <sys/types.h>
#include <unistd.h>

#include <array>
#include <filesystem>
#include <mutex>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "core/IChildProcess.hpp"

namespace clipper::core
{
    class ChildProcess : public IChildProcess
    {
    public:
        ChildProcess(boost::asio::io_context& ioContext, const std::filesystem::path& path, const Args& args);
        ~ChildProcess() override;

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

    private:
        void asyncWaitForExit(ExitCallback callback) override;
        void kill() override;
        bool finished() const override;

        void asyncReadStderr();
        void appendDiagnostic(std::size_t byteCount);
        bool wait(bool block); // return true if waited

        static constexpr std::size_t _maxDiagnosticSize{ 4'096 };

        using FileDescriptor = boost::asio::posix::stream_descriptor;

        boost::asio::io_context& _ioContext;
        std::mutex _stateMutex;
        FileDescriptor _childStderr;
        ::pid_t _childPID{};
        bool _waited{};
        bool _finished{};
        bool _killed{};
        std::optional<int> _exitCode;
        std::array<char, 1'024> _readBuffer;
        std::string _diagnostic;
        ExitCallback _exitCallback;
    };
} // namespace clipper::core
