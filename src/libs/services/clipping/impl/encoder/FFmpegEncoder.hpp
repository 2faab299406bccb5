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

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/IChildProcess.hpp"
#include "services/clipping/IEncoder.hpp"

namespace clipper::core
{
    class IChildProcessManager;
}

namespace clipper::clipping
{
    // Video and audio are always re-encoded: stream copy would cut on keyframes only
    core::IChildProcess::Args buildCutArgs(const EncoderSettings& settings, const std::filesystem::path& input, const Segment& segment, const std::filesystem::path& output);
    core::IChildProcess::Args buildConcatArgs(const EncoderSettings& settings, const std::filesystem::path& manifest, const std::filesystem::path& output);

    class FFmpegEncoder : public IEncoder
    {
    public:
        FFmpegEncoder(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, const EncoderSettings& settings);
        ~FFmpegEncoder() override;
        FFmpegEncoder(const FFmpegEncoder&) = delete;
        FFmpegEncoder& operator=(const FFmpegEncoder&) = delete;

    private:
        void cut(const std::filesystem::path& input, const Segment& segment, const std::filesystem::path& output, OnDoneCallback callback) override;
        void concat(const std::filesystem::path& manifest, const std::filesystem::path& output, OnDoneCallback callback) override;

        void run(const core::IChildProcess::Args& args, OnDoneCallback callback);
        void onInvocationDone(std::size_t invocationId, const core::IChildProcess::ExitStatus& status, const OnDoneCallback& callback);

        struct Invocation
        {
            Invocation(boost::asio::io_context& ioContext)
                : timer{ ioContext } {}

            std::unique_ptr<core::IChildProcess> process;
            boost::asio::steady_timer timer;
            bool timedOut{};
        };

        boost::asio::io_context& _ioContext;
        core::IChildProcessManager& _childProcessManager;
        const EncoderSettings _settings;

        std::mutex _mutex;
        std::size_t _nextInvocationId{};
        std::map<std::size_t, std::unique_ptr<Invocation>> _invocations;
    };
} // namespace clipper::clipping
