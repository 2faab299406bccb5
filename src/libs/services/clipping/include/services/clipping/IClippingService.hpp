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
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "services/clipping/IEncoder.hpp"
#include "services/clipping/Types.hpp"

namespace clipper::core
{
    class IConfig;
}

namespace clipper::clipping
{
    struct Settings
    {
        std::filesystem::path workingDirectory;
        std::chrono::seconds retention{ std::chrono::minutes{ 30 } };
        std::chrono::seconds heartbeatTimeout{ std::chrono::minutes{ 5 } };
        std::chrono::seconds sweepInterval{ std::chrono::minutes{ 5 } }; // 0 means no periodic collection
        std::uint64_t maxUploadSize{ 500 * 1024 * 1024 };
    };

    Settings readSettings(core::IConfig& config);
    EncoderSettings readEncoderSettings(core::IConfig& config);

    class IClippingService
    {
    public:
        virtual ~IClippingService() = default;

        virtual std::string newSession() = 0;
        virtual bool heartbeat(std::string_view sessionId) = 0;
        virtual void cleanup(std::string_view sessionId) = 0;

        // Stores the uploaded stream as a new source file
        // An empty or unknown session id results in a new session
        // throw ValidationException if the upload is too large
        virtual UploadResult recordUpload(std::istream& input, std::string_view originalName, std::string_view sessionId) = 0;

        // Segment editing, throw NotFoundException on unknown sessions
        virtual MergeOutcome proposeSegment(std::string_view sessionId, double start, double end) = 0;
        virtual bool removeSegment(std::string_view sessionId, std::size_t index) = 0;
        virtual std::vector<Segment> getSegments(std::string_view sessionId) = 0;

        // Runs the encode pipeline on the given source
        // throw ValidationException or NotFoundException before any work
        // The callback is called once, from the io context threads
        using ProcessingCallback = std::function<void(const ProcessingResult& result)>;
        virtual void submitSegments(std::string_view filename, std::span<const Segment> segments, std::string_view sessionId, ProcessingCallback callback) = 0;

        // One shot: a token can only be redeemed once
        // throw NotFoundException on unknown/expired tokens or missing result file
        virtual RedeemResult redeemToken(std::string_view token, std::ostream& output) = 0;

        virtual SweepStats collect() = 0;
    };

    std::unique_ptr<IClippingService> createClippingService(boost::asio::io_context& ioContext, const Settings& settings, IEncoder& encoder);
} // namespace clipper::clipping
