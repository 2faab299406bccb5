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
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "services/clipping/Types.hpp"

namespace clipper::clipping
{
    struct StorageLayout
    {
        std::filesystem::path uploadDirectory;
        std::filesystem::path intermediateDirectory;
        std::filesystem::path resultDirectory;

        const std::filesystem::path& getDirectory(FileCategory category) const;
    };

    // "uploads", "temp" and "output" sub directories
    StorageLayout createStorageLayout(const std::filesystem::path& workingDirectory);

    // Owns the sessions and the files they produced
    // Only component allowed to delete tracked files
    // All the operations are atomic regarding each other
    class IResourceTracker
    {
    public:
        virtual ~IResourceTracker() = default;

        virtual const StorageLayout& getStorageLayout() const = 0;
        virtual std::filesystem::path getFilePath(std::string_view filename, FileCategory category) const = 0;

        // Sessions
        virtual std::string createSession(Clock::time_point now) = 0;
        virtual bool sessionExists(std::string_view sessionId) const = 0;
        virtual std::size_t getSessionCount() const = 0;
        virtual bool touchSession(std::string_view sessionId, Clock::time_point now) = 0; // return false if session not found
        virtual std::optional<Clock::time_point> getSessionLastActivity(std::string_view sessionId) const = 0;

        virtual void setDisplayName(std::string_view sessionId, std::string_view displayName) = 0;
        virtual std::optional<std::string> getDisplayName(std::string_view sessionId) const = 0;

        // Committed segments, kept disjoint and sorted
        // throw NotFoundException if session not found
        virtual MergeOutcome proposeSegment(std::string_view sessionId, const Segment& segment, Clock::time_point now) = 0;
        virtual bool removeSegment(std::string_view sessionId, std::size_t index, Clock::time_point now) = 0;
        virtual std::vector<Segment> getSegments(std::string_view sessionId) const = 0;

        // Files
        // Creates the session if needed, idempotent per filename
        virtual void track(std::string_view filename, FileCategory category, std::string_view sessionId, Clock::time_point now) = 0;
        // Returns false if the file is in use or if it could not be removed from disk
        virtual bool remove(std::string_view filename, FileCategory category, Clock::time_point now) = 0;
        // Restarts the retention window of the file, returns false if not tracked
        virtual bool touchFile(std::string_view filename, Clock::time_point now) = 0;
        // In use files cannot be removed, calls must be balanced
        virtual bool markInUse(std::string_view filename, bool inUse) = 0;
        virtual std::optional<TrackedFile> getTrackedFile(std::string_view filename) const = 0;
        virtual std::size_t getTrackedFileCount() const = 0;

        // Removes every file owned by the session (except the ones in use) and the session itself
        virtual void cleanupSession(std::string_view sessionId) = 0;

        // Evicts inactive sessions first, then removes the files older than the retention window
        // Token related stats are left untouched
        virtual void sweep(Clock::time_point now, std::chrono::seconds retention, std::chrono::seconds heartbeatTimeout, SweepStats& stats) = 0;
    };

    std::unique_ptr<IResourceTracker> createResourceTracker(const StorageLayout& storageLayout);

    // Protects a file from deletion while in scope
    class InUseGuard
    {
    public:
        InUseGuard(IResourceTracker& tracker, std::string_view filename);
        ~InUseGuard();
        InUseGuard(const InUseGuard&) = delete;
        InUseGuard& operator=(const InUseGuard&) = delete;

        const std::string& getFilename() const { return _filename; }
        bool isAcquired() const { return _acquired; } // false if the file is not tracked

    private:
        IResourceTracker& _tracker;
        const std::string _filename;
        const bool _acquired;
    };
} // namespace clipper::clipping
