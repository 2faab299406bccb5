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

#include "GarbageCollector.hpp"

#include <exception>

#include "core/ILogger.hpp"
#include "services/clipping/Exception.hpp"
#include "services/clipping/IDownloadTokenStore.hpp"
#include "services/clipping/IResourceTracker.hpp"

namespace clipper::clipping
{
    GarbageCollector::GarbageCollector(boost::asio::io_context& ioContext, IResourceTracker& tracker, IDownloadTokenStore& tokenStore, const Settings& settings)
        : _tracker{ tracker }
        , _tokenStore{ tokenStore }
        , _settings{ settings }
        , _executor{ ioContext }
        , _timer{ ioContext }
    {
        if (_settings.sweepInterval.count() > 0)
        {
            CLIPPER_LOG(GC, INFO, "Collecting every " << _settings.sweepInterval.count() << " seconds, retention = " << _settings.retention.count() << " seconds, heartbeat timeout = " << _settings.heartbeatTimeout.count() << " seconds");

            const std::scoped_lock lock{ _controlMutex };
            scheduleCollect();
        }
        else
            CLIPPER_LOG(GC, INFO, "Periodic collection disabled");
    }

    GarbageCollector::~GarbageCollector()
    {
        std::unique_lock lock{ _controlMutex };

        _abortRequested = true;
        _timer.cancel();

        // the tracker and the token store must outlive a collection that is already running
        _controlCv.wait(lock, [this] { return !_collectInProgress; });
        CLIPPER_LOG(GC, DEBUG, "Periodic collection stopped");
    }

    SweepStats GarbageCollector::collect(Clock::time_point now)
    {
        SweepStats stats;

        _tracker.sweep(now, _settings.retention, _settings.heartbeatTimeout, stats);
        stats.expiredTokenCount = _tokenStore.removeExpiredTokens(now);

        if (stats.evictedSessionCount || stats.removedFileCount || stats.expiredTokenCount)
            CLIPPER_LOG(GC, INFO, "Evicted " << stats.evictedSessionCount << " session(s), removed " << stats.removedFileCount << " file(s), dropped " << stats.expiredTokenCount << " expired token(s)");
        else
            CLIPPER_LOG(GC, DEBUG, "Nothing to collect");

        return stats;
    }

    // _controlMutex must be held
    void GarbageCollector::scheduleCollect()
    {
        _timer.expires_after(_settings.sweepInterval);
        _timer.async_wait([this](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted)
                return;

            if (ec)
                throw Exception{ "Steady timer failure: " + std::string{ ec.message() } };

            const std::scoped_lock lock{ _controlMutex };
            if (_abortRequested)
                return;

            _collectInProgress = true;
            _executor.post([this] { periodicCollect(); });
        });
    }

    void GarbageCollector::periodicCollect()
    {
        try
        {
            collect(Clock::now());
        }
        catch (const std::exception& e)
        {
            CLIPPER_LOG(GC, ERROR, "Periodic collection failed: " << e.what());
        }

        {
            const std::scoped_lock lock{ _controlMutex };

            _collectInProgress = false;
            if (!_abortRequested)
                scheduleCollect();
        }

        _controlCv.notify_all();
    }
} // namespace clipper::clipping
