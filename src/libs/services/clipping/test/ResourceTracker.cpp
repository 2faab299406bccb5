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

#include <gtest/gtest.h>

#include "services/clipping/Exception.hpp"
#include "services/clipping/IResourceTracker.hpp"

#include "Common.hpp"

namespace clipper::clipping::tests
{
    namespace
    {
        class ResourceTrackerTest : public ::testing::Test
        {
        protected:
            std::filesystem::path createFile(std::string_view filename, FileCategory category)
            {
                const std::filesystem::path path{ _tracker->getFilePath(filename, category) };
                writeFile(path, "data");
                return path;
            }

            TmpDirectory _tmpDirectory;
            std::unique_ptr<IResourceTracker> _tracker{ createResourceTracker(createStorageLayout(_tmpDirectory.getPath())) };
            const Clock::time_point _now{ Clock::now() };
        };
    } // namespace

    TEST_F(ResourceTrackerTest, directoriesCreated)
    {
        EXPECT_TRUE(std::filesystem::is_directory(_tmpDirectory.getPath() / "uploads"));
        EXPECT_TRUE(std::filesystem::is_directory(_tmpDirectory.getPath() / "temp"));
        EXPECT_TRUE(std::filesystem::is_directory(_tmpDirectory.getPath() / "output"));
    }

    TEST_F(ResourceTrackerTest, sessions)
    {
        const std::string sessionId{ _tracker->createSession(_now) };
        EXPECT_TRUE(sessionId.starts_with("client-"));
        EXPECT_TRUE(_tracker->sessionExists(sessionId));
        EXPECT_EQ(_tracker->getSessionCount(), 1);

        EXPECT_TRUE(_tracker->touchSession(sessionId, _now + std::chrono::seconds{ 10 }));
        EXPECT_EQ(_tracker->getSessionLastActivity(sessionId), _now + std::chrono::seconds{ 10 });

        EXPECT_FALSE(_tracker->touchSession("client-unknown", _now));
        EXPECT_FALSE(_tracker->sessionExists("client-unknown"));
    }

    TEST_F(ResourceTrackerTest, trackAndRemove)
    {
        const std::string sessionId{ _tracker->createSession(_now) };
        const std::filesystem::path path{ createFile("source.mp4", FileCategory::Source) };

        _tracker->track("source.mp4", FileCategory::Source, sessionId, _now);
        _tracker->track("source.mp4", FileCategory::Source, sessionId, _now); // idempotent
        EXPECT_EQ(_tracker->getTrackedFileCount(), 1);

        const std::optional<TrackedFile> trackedFile{ _tracker->getTrackedFile("source.mp4") };
        ASSERT_TRUE(trackedFile);
        EXPECT_EQ(trackedFile->category, FileCategory::Source);
        EXPECT_EQ(trackedFile->sessionId, sessionId);
        EXPECT_FALSE(trackedFile->inUse);

        const Clock::time_point later{ _now + std::chrono::seconds{ 30 } };
        EXPECT_TRUE(_tracker->remove("source.mp4", FileCategory::Source, later));
        EXPECT_FALSE(std::filesystem::exists(path));
        EXPECT_FALSE(_tracker->getTrackedFile("source.mp4"));
        EXPECT_EQ(_tracker->getSessionLastActivity(sessionId), later);
    }

    TEST_F(ResourceTrackerTest, trackCreatesUnknownSession)
    {
        _tracker->track("source.mp4", FileCategory::Source, "client-42", _now);
        EXPECT_TRUE(_tracker->sessionExists("client-42"));
    }

    TEST_F(ResourceTrackerTest, removeMissingFile)
    {
        _tracker->track("ghost.mp4", FileCategory::Intermediate, "client-42", _now);

        EXPECT_TRUE(_tracker->remove("ghost.mp4", FileCategory::Intermediate, _now));
        EXPECT_EQ(_tracker->getTrackedFileCount(), 0);
    }

    TEST_F(ResourceTrackerTest, invalidFilenames)
    {
        EXPECT_THROW(_tracker->track("", FileCategory::Source, "client-42", _now), ValidationException);
        EXPECT_THROW(_tracker->track("../escape.mp4", FileCategory::Source, "client-42", _now), ValidationException);
        EXPECT_THROW(_tracker->getFilePath("..", FileCategory::Source), ValidationException);
        EXPECT_FALSE(_tracker->remove("../escape.mp4", FileCategory::Source, _now));
    }

    TEST_F(ResourceTrackerTest, inUse)
    {
        const std::string sessionId{ _tracker->createSession(_now) };
        const std::filesystem::path path{ createFile("clip.mp4", FileCategory::Result) };
        _tracker->track("clip.mp4", FileCategory::Result, sessionId, _now);

        {
            const InUseGuard guard{ *_tracker, "clip.mp4" };
            EXPECT_TRUE(guard.isAcquired());
            EXPECT_TRUE(_tracker->getTrackedFile("clip.mp4")->inUse);

            EXPECT_FALSE(_tracker->remove("clip.mp4", FileCategory::Result, _now));
            EXPECT_TRUE(std::filesystem::exists(path));

            _tracker->cleanupSession(sessionId);
            EXPECT_TRUE(std::filesystem::exists(path));
            EXPECT_TRUE(_tracker->getTrackedFile("clip.mp4"));
            EXPECT_FALSE(_tracker->sessionExists(sessionId));
        }

        EXPECT_FALSE(_tracker->getTrackedFile("clip.mp4")->inUse);
        EXPECT_TRUE(_tracker->remove("clip.mp4", FileCategory::Result, _now));
        EXPECT_FALSE(std::filesystem::exists(path));
    }

    TEST_F(ResourceTrackerTest, inUseNested)
    {
        _tracker->track("clip.mp4", FileCategory::Result, "client-42", _now);

        EXPECT_TRUE(_tracker->markInUse("clip.mp4", true));
        EXPECT_TRUE(_tracker->markInUse("clip.mp4", true));
        EXPECT_TRUE(_tracker->markInUse("clip.mp4", false));
        EXPECT_TRUE(_tracker->getTrackedFile("clip.mp4")->inUse);
        EXPECT_TRUE(_tracker->markInUse("clip.mp4", false));
        EXPECT_FALSE(_tracker->getTrackedFile("clip.mp4")->inUse);

        EXPECT_FALSE(_tracker->markInUse("unknown.mp4", true));
        const InUseGuard guard{ *_tracker, "unknown.mp4" };
        EXPECT_FALSE(guard.isAcquired());
    }

    TEST_F(ResourceTrackerTest, cleanupSession)
    {
        const std::string sessionId{ _tracker->createSession(_now) };
        const std::string otherSessionId{ _tracker->createSession(_now) };

        const std::filesystem::path source{ createFile("source.mp4", FileCategory::Source) };
        const std::filesystem::path segment{ createFile("segment.mp4", FileCategory::Intermediate) };
        const std::filesystem::path other{ createFile("other.mp4", FileCategory::Source) };
        _tracker->track("source.mp4", FileCategory::Source, sessionId, _now);
        _tracker->track("segment.mp4", FileCategory::Intermediate, sessionId, _now);
        _tracker->track("other.mp4", FileCategory::Source, otherSessionId, _now);

        _tracker->cleanupSession(sessionId);

        EXPECT_FALSE(std::filesystem::exists(source));
        EXPECT_FALSE(std::filesystem::exists(segment));
        EXPECT_TRUE(std::filesystem::exists(other));
        EXPECT_FALSE(_tracker->sessionExists(sessionId));
        EXPECT_TRUE(_tracker->sessionExists(otherSessionId));
        EXPECT_EQ(_tracker->getTrackedFileCount(), 1);

        // unknown session: no-op
        _tracker->cleanupSession(sessionId);
    }

    TEST_F(ResourceTrackerTest, sweep)
    {
        const std::string activeSessionId{ _tracker->createSession(_now) };
        const std::string staleSessionId{ _tracker->createSession(_now) };

        const std::filesystem::path oldFile{ createFile("old.mp4", FileCategory::Result) };
        const std::filesystem::path recentFile{ createFile("recent.mp4", FileCategory::Result) };
        const std::filesystem::path staleFile{ createFile("stale.mp4", FileCategory::Source) };
        _tracker->track("old.mp4", FileCategory::Result, activeSessionId, _now);
        _tracker->track("stale.mp4", FileCategory::Source, staleSessionId, _now);

        const Clock::time_point later{ _now + std::chrono::minutes{ 31 } };
        _tracker->track("recent.mp4", FileCategory::Result, activeSessionId, later);

        SweepStats stats;
        _tracker->sweep(later, std::chrono::minutes{ 30 }, std::chrono::minutes{ 5 }, stats);

        EXPECT_EQ(stats.evictedSessionCount, 1);
        EXPECT_EQ(stats.removedFileCount, 2);
        EXPECT_FALSE(_tracker->sessionExists(staleSessionId));
        EXPECT_TRUE(_tracker->sessionExists(activeSessionId));
        EXPECT_FALSE(std::filesystem::exists(oldFile));
        EXPECT_FALSE(std::filesystem::exists(staleFile));
        EXPECT_TRUE(std::filesystem::exists(recentFile));
    }

    TEST_F(ResourceTrackerTest, touchFile)
    {
        const std::string sessionId{ _tracker->createSession(_now) };
        const std::filesystem::path path{ createFile("clip.mp4", FileCategory::Result) };
        _tracker->track("clip.mp4", FileCategory::Result, sessionId, _now);

        const Clock::time_point completion{ _now + std::chrono::minutes{ 10 } };
        EXPECT_TRUE(_tracker->touchFile("clip.mp4", completion));
        EXPECT_EQ(_tracker->getTrackedFile("clip.mp4")->creationTime, completion);
        EXPECT_FALSE(_tracker->touchFile("unknown.mp4", completion));

        const Clock::time_point later{ _now + std::chrono::minutes{ 31 } };
        _tracker->touchSession(sessionId, later);

        SweepStats stats;
        _tracker->sweep(later, std::chrono::minutes{ 30 }, std::chrono::minutes{ 5 }, stats);
        EXPECT_EQ(stats.removedFileCount, 0);
        EXPECT_TRUE(std::filesystem::exists(path));
    }

    TEST_F(ResourceTrackerTest, segments)
    {
        const std::string sessionId{ _tracker->createSession(_now) };

        EXPECT_EQ(_tracker->proposeSegment(sessionId, Segment{ .start = 2, .end = 5, .color = {} }, _now), MergeOutcome::Added);
        EXPECT_EQ(_tracker->proposeSegment(sessionId, Segment{ .start = 10, .end = 12, .color = {} }, _now), MergeOutcome::Added);
        EXPECT_EQ(_tracker->proposeSegment(sessionId, Segment{ .start = 7, .end = 3, .color = {} }, _now), MergeOutcome::Rejected);

        std::vector<Segment> segments{ _tracker->getSegments(sessionId) };
        ASSERT_EQ(segments.size(), 2);
        EXPECT_EQ(segments[0].color, "#0077BE");
        EXPECT_EQ(segments[1].color, "#00A8E8");

        EXPECT_TRUE(_tracker->removeSegment(sessionId, 0, _now));
        EXPECT_FALSE(_tracker->removeSegment(sessionId, 5, _now));

        segments = _tracker->getSegments(sessionId);
        ASSERT_EQ(segments.size(), 1);
        EXPECT_EQ(segments[0].start, 10);

        EXPECT_THROW(_tracker->getSegments("client-unknown"), NotFoundException);
        EXPECT_THROW(_tracker->proposeSegment("client-unknown", Segment{ .start = 1, .end = 2, .color = {} }, _now), NotFoundException);
    }
} // namespace clipper::clipping::tests
