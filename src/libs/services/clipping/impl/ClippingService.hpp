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

#include <condition_variable>
#include <memory>
#include <mutex>

#include "services/clipping/IClippingService.hpp"
#include "services/clipping/IDownloadTokenStore.hpp"
#include "services/clipping/IResourceTracker.hpp"

#include "GarbageCollector.hpp"

namespace clipper::clipping
{
    class ClippingService : public IClippingService
    {
    public:
        ClippingService(boost::asio::io_context& ioContext, const Settings& settings, IEncoder& encoder);
        ~ClippingService() override;
        ClippingService(const ClippingService&) = delete;
        ClippingService& operator=(const ClippingService&) = delete;

    private:
        std::string newSession() override;
        bool heartbeat(std::string_view sessionId) override;
        void cleanup(std::string_view sessionId) override;

        UploadResult recordUpload(std::istream& input, std::string_view originalName, std::string_view sessionId) override;

        MergeOutcome proposeSegment(std::string_view sessionId, double start, double end) override;
        bool removeSegment(std::string_view sessionId, std::size_t index) override;
        std::vector<Segment> getSegments(std::string_view sessionId) override;

        void submitSegments(std::string_view filename, std::span<const Segment> segments, std::string_view sessionId, ProcessingCallback callback) override;
        RedeemResult redeemToken(std::string_view token, std::ostream& output) override;

        SweepStats collect() override;

        std::string resolveOwningSession(std::string_view sessionId, std::string_view filename, Clock::time_point now);
        void onPipelineDone();

        boost::asio::io_context& _ioContext;
        const Settings _settings;
        IEncoder& _encoder;
        std::unique_ptr<IResourceTracker> _tracker;
        std::unique_ptr<IDownloadTokenStore> _tokenStore;
        GarbageCollector _garbageCollector;

        std::mutex _controlMutex;
        std::condition_variable _controlCv;
        std::size_t _runningPipelineCount{};
    };
} // namespace clipper::clipping
