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
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "services/clipping/IResourceTracker.hpp"

namespace clipper::clipping
{
    class ResourceTracker : public IResourceTracker
    {
    public:
        ResourceTracker(const StorageLayout& storageLayout);
        ~ResourceTracker() override = default;
        ResourceTracker(const ResourceTracker&) = delete;
        ResourceTracker& operator=(const ResourceTracker&) = delete;

    private:
        const StorageLayout& getStorageLayout() const override;
        std::filesystem::path getFilePath(std::string_view filename, FileCategory category) const override;

        std::string createSession(Clock::time_point now) override;
        bool sessionExists(std::string_view sessionId) const override;
        std::size_t getSessionCount() const override;
        bool touchSession(std::string_view sessionId, Clock::time_point now) override;
        std::optional<Clock::time_point> getSessionLastActivity(std::string_view sessionId) const override;

        void setDisplayName(std::string_view sessionId, std::string_view displayName) override;
        std::optional<std::string> getDisplayName(std::string_view sessionId) const override;

        MergeOutcome proposeSegment(std::string_view sessionId, const Segment& segment, Clock::time_point now) override;
        bool removeSegment(std::string_view sessionId, std::size_t index, Clock::time_point now) override;
        std::vector<Segment> getSegments(std::string_view sessionId) const override;

        void track(std::string_view filename, FileCategory category, std::string_view sessionId, Clock::time_point now) override;
        bool remove(std::string_view filename, FileCategory category, Clock::time_point now) override;
        bool touchFile(std::string_view filename, Clock::time_point now) override;
        bool markInUse(std::string_view filename, bool inUse) override;
        std::optional<TrackedFile> getTrackedFile(std::string_view filename) const override;
        std::size_t getTrackedFileCount() const override;

        void cleanupSession(std::string_view sessionId) override;
        void sweep(Clock::time_point now, std::chrono::seconds retention, std::chrono::seconds heartbeatTimeout, SweepStats& stats) override;

        struct SessionRecord
        {
            Clock::time_point lastActivity;
            std::vector<std::string> filenames;
            std::optional<std::string> displayName;
            std::vector<Segment> segments;
        };

        struct FileRecord
        {
            FileCategory category;
            Clock::time_point creationTime;
            std::string sessionId;
            std::size_t inUseCount{};
        };

        using SessionMap = std::map<std::string, SessionRecord, std::less<>>;
        using FileMap = std::map<std::string, FileRecord, std::less<>>;

        SessionRecord& getSessionRecord(std::string_view sessionId);
        const SessionRecord& getSessionRecord(std::string_view sessionId) const;
        bool removeFile(std::string_view filename, FileCategory category, std::optional<Clock::time_point> now);
        std::size_t cleanupSession(SessionMap::iterator itSession);

        const StorageLayout _storageLayout;

        mutable std::mutex _mutex;
        SessionMap _sessions;
        FileMap _files;
    };
} // namespace clipper::clipping
