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
#include <condition_variable>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "services/clipping/Types.hpp"

#include "Executor.hpp"

namespace clipper::clipping
{
    class IDownloadTokenStore;
    class IResourceTracker;

    class GarbageCollector
    {
    public:
        struct Settings
        {
            std::chrono::seconds retention;
            std::chrono::seconds heartbeatTimeout;
            std::chrono::seconds sweepInterval; // 0 disables the periodic collection
        };

        GarbageCollector(boost::asio::io_context& ioContext, IResourceTracker& tracker, IDownloadTokenStore& tokenStore, const Settings& settings);
        ~GarbageCollector();
        GarbageCollector(const GarbageCollector&) = delete;
        GarbageCollector& operator=(const GarbageCollector&) = delete;

        // Idempotent, can be called concurrently with the periodic collection
        SweepStats collect(Clock::time_point now);

    private:
        void scheduleCollect();
        void periodicCollect();

        IResourceTracker& _tracker;
        IDownloadTokenStore& _tokenStore;
        const Settings _settings;
        Executor _executor;
        boost::asio::steady_timer _timer;

        std::mutex _controlMutex;
        std::condition_variable _controlCv;
        bool _collectInProgress{};
        bool _abortRequested{};
    };
} // namespace clipper::clipping
