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

#include "ResourceTracker.hpp"

#include <algorithm>
#include <system_error>

#include "core/ILogger.hpp"
#include "services/clipping/Exception.hpp"
#include "services/clipping/SegmentMerger.hpp"

#include "IdGenerator.hpp"

namespace clipper::clipping
{
    namespace
    {
        bool isValidFilename(std::string_view filename)
        {
            return !filename.empty()
                && filename != "."
                && filename != ".."
                && filename.find('/') == std::string_view::npos;
        }
    } // namespace

    const std::filesystem::path& StorageLayout::getDirectory(FileCategory category) const
    {
        switch (category)
        {
        case FileCategory::Source:
            return uploadDirectory;
        case FileCategory::Intermediate:
            return intermediateDirectory;
        case FileCategory::Result:
            return resultDirectory;
        }

        throw Exception{ "Unhandled file category" };
    }

    StorageLayout createStorageLayout(const std::filesystem::path& workingDirectory)
    {
        return StorageLayout{
            .uploadDirectory = workingDirectory / "uploads",
            .intermediateDirectory = workingDirectory / "temp",
            .resultDirectory = workingDirectory / "output",
        };
    }

    std::unique_ptr<IResourceTracker> createResourceTracker(const StorageLayout& storageLayout)
    {
        return std::make_unique<ResourceTracker>(storageLayout);
    }

    InUseGuard::InUseGuard(IResourceTracker& tracker, std::string_view filename)
        : _tracker{ tracker }
        , _filename{ filename }
        , _acquired{ _tracker.markInUse(_filename, true) }
    {
        if (!_acquired)
            CLIPPER_LOG(TRACKER, WARNING, "Cannot protect untracked file '" << _filename << "'");
    }

    InUseGuard::~InUseGuard()
    {
        if (_acquired)
            _tracker.markInUse(_filename, false);
    }

    ResourceTracker::ResourceTracker(const StorageLayout& storageLayout)
        : _storageLayout{ storageLayout }
    {
        for (const FileCategory category : { FileCategory::Source, FileCategory::Intermediate, FileCategory::Result })
        {
            const std::filesystem::path& directory{ _storageLayout.getDirectory(category) };
            std::filesystem::create_directories(directory);
            CLIPPER_LOG(TRACKER, DEBUG, "Using " << directory << " for " << toString(category) << " files");
        }
    }

    const StorageLayout& ResourceTracker::getStorageLayout() const
    {
        return _storageLayout;
    }

    std::filesystem::path ResourceTracker::getFilePath(std::string_view filename, FileCategory category) const
    {
        if (!isValidFilename(filename))
            throw ValidationException{ "Invalid filename" };

        return _storageLayout.getDirectory(category) / filename;
    }

    std::string ResourceTracker::createSession(Clock::time_point now)
    {
        std::string sessionId{ ids::generateId(ids::sessionPrefix) };

        const std::scoped_lock lock{ _mutex };
        _sessions.emplace(sessionId, SessionRecord{ .lastActivity = now });

        CLIPPER_LOG(TRACKER, DEBUG, "Created session '" << sessionId << "'");
        return sessionId;
    }

    bool ResourceTracker::sessionExists(std::string_view sessionId) const
    {
        const std::scoped_lock lock{ _mutex };
        return _sessions.find(sessionId) != std::cend(_sessions);
    }

    std::size_t ResourceTracker::getSessionCount() const
    {
        const std::scoped_lock lock{ _mutex };
        return _sessions.size();
    }

    bool ResourceTracker::touchSession(std::string_view sessionId, Clock::time_point now)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _sessions.find(sessionId) };
        if (it == std::end(_sessions))
            return false;

        it->second.lastActivity = now;
        return true;
    }

    std::optional<Clock::time_point> ResourceTracker::getSessionLastActivity(std::string_view sessionId) const
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _sessions.find(sessionId) };
        if (it == std::cend(_sessions))
            return std::nullopt;

        return it->second.lastActivity;
    }

    void ResourceTracker::setDisplayName(std::string_view sessionId, std::string_view displayName)
    {
        const std::scoped_lock lock{ _mutex };
        getSessionRecord(sessionId).displayName = displayName;
    }

    std::optional<std::string> ResourceTracker::getDisplayName(std::string_view sessionId) const
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _sessions.find(sessionId) };
        if (it == std::cend(_sessions))
            return std::nullopt;

        return it->second.displayName;
    }

    MergeOutcome ResourceTracker::proposeSegment(std::string_view sessionId, const Segment& segment, Clock::time_point now)
    {
        const std::scoped_lock lock{ _mutex };

        SessionRecord& session{ getSessionRecord(sessionId) };
        session.lastActivity = now;

        Segment proposed{ segment };
        proposed.color = getSegmentColor(session.segments.size());

        const MergeOutcome outcome{ mergeSegment(session.segments, std::move(proposed)) };
        CLIPPER_LOG(TRACKER, DEBUG, "Session '" << sessionId << "': segment " << segment << " " << toString(outcome) << ", " << session.segments.size() << " committed segment(s)");

        return outcome;
    }

    bool ResourceTracker::removeSegment(std::string_view sessionId, std::size_t index, Clock::time_point now)
    {
        const std::scoped_lock lock{ _mutex };

        SessionRecord& session{ getSessionRecord(sessionId) };
        session.lastActivity = now;

        if (index >= session.segments.size())
            return false;

        session.segments.erase(std::begin(session.segments) + index);
        return true;
    }

    std::vector<Segment> ResourceTracker::getSegments(std::string_view sessionId) const
    {
        const std::scoped_lock lock{ _mutex };
        return getSessionRecord(sessionId).segments;
    }

    void ResourceTracker::track(std::string_view filename, FileCategory category, std::string_view sessionId, Clock::time_point now)
    {
        if (!isValidFilename(filename))
            throw ValidationException{ "Invalid filename" };

        const std::scoped_lock lock{ _mutex };

        auto itSession{ _sessions.find(sessionId) };
        if (itSession == std::end(_sessions))
        {
            CLIPPER_LOG(TRACKER, DEBUG, "Creating record for unknown session '" << sessionId << "'");
            itSession = _sessions.emplace(std::string{ sessionId }, SessionRecord{}).first;
        }
        SessionRecord& session{ itSession->second };
        session.lastActivity = now;

        if (_files.find(filename) != std::cend(_files))
            return;

        _files.emplace(std::string{ filename }, FileRecord{ .category = category, .creationTime = now, .sessionId = std::string{ sessionId } });
        session.filenames.emplace_back(filename);

        CLIPPER_LOG(TRACKER, DEBUG, "Tracking " << toString(category) << " file '" << filename << "' for session '" << sessionId << "'");
    }

    bool ResourceTracker::remove(std::string_view filename, FileCategory category, Clock::time_point now)
    {
        const std::scoped_lock lock{ _mutex };
        return removeFile(filename, category, now);
    }

    bool ResourceTracker::touchFile(std::string_view filename, Clock::time_point now)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _files.find(filename) };
        if (it == std::end(_files))
            return false;

        it->second.creationTime = now;
        return true;
    }

    bool ResourceTracker::markInUse(std::string_view filename, bool inUse)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _files.find(filename) };
        if (it == std::end(_files))
            return false;

        FileRecord& file{ it->second };
        if (inUse)
            file.inUseCount += 1;
        else if (file.inUseCount > 0)
            file.inUseCount -= 1;

        return true;
    }

    std::optional<TrackedFile> ResourceTracker::getTrackedFile(std::string_view filename) const
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _files.find(filename) };
        if (it == std::cend(_files))
            return std::nullopt;

        const FileRecord& file{ it->second };
        return TrackedFile{
            .filename = it->first,
            .category = file.category,
            .creationTime = file.creationTime,
            .sessionId = file.sessionId,
            .inUse = file.inUseCount > 0,
        };
    }

    std::size_t ResourceTracker::getTrackedFileCount() const
    {
        const std::scoped_lock lock{ _mutex };
        return _files.size();
    }

    void ResourceTracker::cleanupSession(std::string_view sessionId)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _sessions.find(sessionId) };
        if (it == std::end(_sessions))
        {
            CLIPPER_LOG(TRACKER, DEBUG, "Nothing to clean up for unknown session '" << sessionId << "'");
            return;
        }

        const std::size_t removedFileCount{ cleanupSession(it) };
        CLIPPER_LOG(TRACKER, DEBUG, "Session '" << sessionId << "' cleaned up, " << removedFileCount << " file(s) removed");
    }

    void ResourceTracker::sweep(Clock::time_point now, std::chrono::seconds retention, std::chrono::seconds heartbeatTimeout, SweepStats& stats)
    {
        const std::scoped_lock lock{ _mutex };

        // sessions first: removing old files must not refresh inactive sessions
        for (auto it{ std::begin(_sessions) }; it != std::end(_sessions);)
        {
            if (now - it->second.lastActivity > heartbeatTimeout)
            {
                CLIPPER_LOG(TRACKER, DEBUG, "Evicting inactive session '" << it->first << "'");

                auto itNext{ std::next(it) };
                stats.removedFileCount += cleanupSession(it);
                stats.evictedSessionCount += 1;
                it = itNext;
            }
            else
                ++it;
        }

        std::vector<std::pair<std::string, FileCategory>> expiredFiles;
        for (const auto& [filename, file] : _files)
        {
            if (file.inUseCount == 0 && now - file.creationTime > retention)
                expiredFiles.emplace_back(filename, file.category);
        }

        for (const auto& [filename, category] : expiredFiles)
        {
            if (removeFile(filename, category, now))
                stats.removedFileCount += 1;
        }
    }

    ResourceTracker::SessionRecord& ResourceTracker::getSessionRecord(std::string_view sessionId)
    {
        auto it{ _sessions.find(sessionId) };
        if (it == std::end(_sessions))
            throw NotFoundException{ "Session not found" };

        return it->second;
    }

    const ResourceTracker::SessionRecord& ResourceTracker::getSessionRecord(std::string_view sessionId) const
    {
        auto it{ _sessions.find(sessionId) };
        if (it == std::cend(_sessions))
            throw NotFoundException{ "Session not found" };

        return it->second;
    }

    bool ResourceTracker::removeFile(std::string_view filename, FileCategory category, std::optional<Clock::time_point> now)
    {
        if (!isValidFilename(filename))
        {
            CLIPPER_LOG(TRACKER, ERROR, "Refusing to remove invalid filename '" << filename << "'");
            return false;
        }

        auto itFile{ _files.find(filename) };
        if (itFile != std::end(_files))
        {
            if (itFile->second.inUseCount > 0)
            {
                CLIPPER_LOG(TRACKER, DEBUG, "Not removing '" << filename << "': in use");
                return false;
            }

            // the tracked category prevails
            category = itFile->second.category;
        }

        const std::filesystem::path filePath{ _storageLayout.getDirectory(category) / filename };

        std::error_code ec;
        const bool removed{ std::filesystem::remove(filePath, ec) };
        if (ec)
        {
            CLIPPER_LOG(TRACKER, ERROR, "Cannot remove " << filePath << ": " << ec.message());
            return false;
        }

        if (!removed)
            CLIPPER_LOG(TRACKER, DEBUG, "File " << filePath << " already gone");
        else
            CLIPPER_LOG(TRACKER, DEBUG, "Removed " << filePath);

        if (itFile != std::end(_files))
        {
            auto itSession{ _sessions.find(itFile->second.sessionId) };
            if (itSession != std::end(_sessions))
            {
                SessionRecord& session{ itSession->second };
                std::erase(session.filenames, filename);
                if (now)
                    session.lastActivity = *now;
            }

            _files.erase(itFile);
        }

        return true;
    }

    std::size_t ResourceTracker::cleanupSession(SessionMap::iterator itSession)
    {
        std::size_t removedFileCount{};

        // copy: removed files are dropped from the session's list
        const std::vector<std::string> filenames{ itSession->second.filenames };
        for (const std::string& filename : filenames)
        {
            auto itFile{ _files.find(filename) };
            if (itFile == std::end(_files))
                continue;

            if (removeFile(filename, itFile->second.category, std::nullopt))
                removedFileCount += 1;
            else
                CLIPPER_LOG(TRACKER, DEBUG, "File '" << filename << "' kept, will be collected later");
        }

        _sessions.erase(itSession);
        return removedFileCount;
    }
} // namespace clipper::clipping
