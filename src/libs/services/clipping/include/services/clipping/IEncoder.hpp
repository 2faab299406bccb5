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

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "services/clipping/Types.hpp"

namespace clipper::core
{
    class IChildProcessManager;
}

namespace boost::asio
{
    class io_context;
}

namespace clipper::clipping
{
    struct EncodeOutcome
    {
        bool success{};
        std::optional<int> exitCode;
        std::string diagnostic;
    };

    // External encoder, driven as a black box
    // Each call spawns one invocation, the callback is called once it is over
    class IEncoder
    {
    public:
        virtual ~IEncoder() = default;

        using OnDoneCallback = std::function<void(const EncodeOutcome& outcome)>;

        // Re-encodes [segment.start, segment.end] of input into a standalone playable output
        virtual void cut(const std::filesystem::path& input, const Segment& segment, const std::filesystem::path& output, OnDoneCallback callback) = 0;

        // Re-encodes the files listed in the manifest into a single output
        virtual void concat(const std::filesystem::path& manifest, const std::filesystem::path& output, OnDoneCallback callback) = 0;
    };

    struct EncoderSettings
    {
        std::filesystem::path ffmpegPath{ "/usr/bin/ffmpeg" };
        std::string videoCodec{ "libx264" };
        std::string audioCodec{ "aac" };
        std::string preset{ "fast" };
        unsigned crf{ 23 };
        std::chrono::seconds timeout{ 600 }; // 0 means no timeout
    };

    std::unique_ptr<IEncoder> createFFmpegEncoder(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, const EncoderSettings& settings);
} // namespace clipper::clipping
