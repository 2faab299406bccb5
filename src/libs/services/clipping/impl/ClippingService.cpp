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

#include "ClippingService.hpp"

#include <system_error>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "services/clipping/Exception.hpp"
#include "services/clipping/SegmentMerger.hpp"

#include "FileTransfer.hpp"
#include "IdGenerator.hpp"
#include "pipeline/EncodePipeline.hpp"

namespace clipper::clipping
{
    Settings readSettings(core::IConfig& config)
    {
        return Settings{
            .workingDirectory = config.getPath("working-dir", "/var/clipper"),
            .retention = std::chrono::minutes{ config.getULong("retention-minutes", 30) },
            .heartbeatTimeout = std::chrono::minutes{ config.getULong("heartbeat-timeout-minutes", 5) },
            .sweepInterval = std::chrono::minutes{ config.getULong("sweep-interval-minutes", 5) },
            .maxUploadSize = config.getULong("max-upload-size", 500 * 1024 * 1024),
        };
    }

    EncoderSettings readEncoderSettings(core::IConfig& config)
    {
        return EncoderSettings{
            .ffmpegPath = config.getPath("ffmpeg-file", "/usr/bin/ffmpeg"),
            .videoCodec = std::string{ config.getString("encoder-video-codec", "libx264") },
            .audioCodec = std::string{ config.getString("encoder-audio-codec", "aac") },
            .preset = std::string{ config.getString("encoder-preset", "fast") },
            .crf = static_cast<unsigned>(config.getULong("encoder-crf", 23)),
            .timeout = std::chrono::seconds{ config.getULong("encoder-timeout", 600) },
        };
    }

    std::unique_ptr<IClippingService> createClippingService(boost::asio::io_context& ioContext, const Settings& settings, IEncoder& encoder)
    {
        return std::make_unique<ClippingService>(ioContext, settings, encoder);
    }

    ClippingService::ClippingService(boost::asio::io_context& ioContext, const Settings& settings, IEncoder& encoder)
        : _ioContext{ ioContext }
        , _settings{ settings }
        , _encoder{ encoder }
        , _tracker{ createResourceTracker(createStorageLayout(_settings.workingDirectory)) }
        , _tokenStore{ createDownloadTokenStore(_settings.retention) }
        , _garbageCollector{ _ioContext, *_tracker, *_tokenStore, GarbageCollector::Settings{ .retention = _settings.retention, .heartbeatTimeout = _settings.heartbeatTimeout, .sweepInterval = _settings.sweepInterval } }
    {
        CLIPPER_LOG(CLIPPING, INFO, "Service started, working directory = " << _settings.workingDirectory << ", max upload size = " << _settings.maxUploadSize << " bytes");
    }

    ClippingService::~ClippingService()
    {
        std::unique_lock lock{ _controlMutex };

        if (_runningPipelineCount > 0)
            CLIPPER_LOG(CLIPPING, INFO, "Waiting for " << _runningPipelineCount << " run(s) to complete...");

        _controlCv.wait(lock, [this] { return _runningPipelineCount == 0; });
        CLIPPER_LOG(CLIPPING, INFO, "Service stopped!");
    }

    std::string ClippingService::newSession()
    {
        return _tracker->createSession(Clock::now());
    }

    bool ClippingService::heartbeat(std::string_view sessionId)
    {
        return _tracker->touchSession(sessionId, Clock::now());
    }

    void ClippingService::cleanup(std::string_view sessionId)
    {
        CLIPPER_LOG(CLIPPING, DEBUG, "Cleanup requested for session '" << sessionId << "'");
        _tracker->cleanupSession(sessionId);
    }

    UploadResult ClippingService::recordUpload(std::istream& input, std::string_view originalName, std::string_view sessionId)
    {
        const Clock::time_point now{ Clock::now() };

        UploadResult res;
        if (!sessionId.empty() && _tracker->touchSession(sessionId, now))
            res.sessionId = sessionId;
        else
            res.sessionId = _tracker->createSession(now);

        res.filename = ids::generateUploadFilename(originalName);
        const std::filesystem::path filePath{ _tracker->getFilePath(res.filename, FileCategory::Source) };

        const std::optional<std::uint64_t> size{ copyStreamToFile(input, filePath, _settings.maxUploadSize) };
        if (!size)
            throw ValidationException{ "File too large" };

        _tracker->track(res.filename, FileCategory::Source, res.sessionId, Clock::now());
        if (!originalName.empty())
            _tracker->setDisplayName(res.sessionId, originalName);

        CLIPPER_LOG(CLIPPING, INFO, "Session '" << res.sessionId << "': stored upload '" << originalName << "' as '" << res.filename << "', " << *size << " bytes");
        return res;
    }

    MergeOutcome ClippingService::proposeSegment(std::string_view sessionId, double start, double end)
    {
        return _tracker->proposeSegment(sessionId, Segment{ .start = start, .end = end, .color = {} }, Clock::now());
    }

    bool ClippingService::removeSegment(std::string_view sessionId, std::size_t index)
    {
        return _tracker->removeSegment(sessionId, index, Clock::now());
    }

    std::vector<Segment> ClippingService::getSegments(std::string_view sessionId)
    {
        return _tracker->getSegments(sessionId);
    }

    void ClippingService::submitSegments(std::string_view filename, std::span<const Segment> segments, std::string_view sessionId, ProcessingCallback callback)
    {
        if (filename.empty())
            throw ValidationException{ "Missing filename" };
        if (segments.empty())
            throw ValidationException{ "No segments provided" };
        for (const Segment& segment : segments)
        {
            if (!isValidSegment(segment))
                throw ValidationException{ "Invalid segment" };
        }

        // throws on malformed filenames
        const std::filesystem::path sourcePath{ _tracker->getFilePath(filename, FileCategory::Source) };

        std::error_code ec;
        if (!std::filesystem::is_regular_file(sourcePath, ec))
            throw NotFoundException{ "Source file not found" };

        const Clock::time_point now{ Clock::now() };

        EncodePipeline::Parameters parameters{
            .sessionId = resolveOwningSession(sessionId, filename, now),
            .sourceFilename = std::string{ filename },
            .segments = std::vector<Segment>(std::cbegin(segments), std::cend(segments)),
        };

        // sources left by a previous instance are adopted
        _tracker->track(filename, FileCategory::Source, parameters.sessionId, now);

        {
            const std::scoped_lock lock{ _controlMutex };
            _runningPipelineCount += 1;
        }

        auto pipeline{ std::make_shared<EncodePipeline>(_ioContext, *_tracker, *_tokenStore, _encoder, std::move(parameters), [this, callback = std::move(callback)](const ProcessingResult& result) {
            callback(result);
            onPipelineDone();
        }) };

        pipeline->start();
    }

    RedeemResult ClippingService::redeemToken(std::string_view token, std::ostream& output)
    {
        const std::optional<DownloadToken> downloadToken{ _tokenStore->take(token, Clock::now()) };
        if (!downloadToken)
        {
            CLIPPER_LOG(CLIPPING, DEBUG, "Unknown or expired download token '" << token << "'");
            throw NotFoundException{ "Download link has expired or is invalid" };
        }

        // protect the result while streaming it
        const InUseGuard guard{ *_tracker, downloadToken->resultFilename };

        const std::filesystem::path resultPath{ _tracker->getFilePath(downloadToken->resultFilename, FileCategory::Result) };
        std::error_code ec;
        if (!guard.isAcquired() || !std::filesystem::is_regular_file(resultPath, ec))
        {
            CLIPPER_LOG(CLIPPING, ERROR, "Result file " << resultPath << " not found");
            throw NotFoundException{ "File not found on server" };
        }

        RedeemResult res{ .displayName = downloadToken->displayName, .byteCount = copyFileToStream(resultPath, output) };
        CLIPPER_LOG(CLIPPING, INFO, "Redeemed download token '" << token << "': sent " << res.byteCount << " bytes as '" << res.displayName << "'");

        return res;
    }

    SweepStats ClippingService::collect()
    {
        return _garbageCollector.collect(Clock::now());
    }

    std::string ClippingService::resolveOwningSession(std::string_view sessionId, std::string_view filename, Clock::time_point now)
    {
        if (!sessionId.empty())
        {
            if (!_tracker->touchSession(sessionId, now))
                CLIPPER_LOG(CLIPPING, DEBUG, "Unknown session '" << sessionId << "', will be recreated");

            return std::string{ sessionId };
        }

        if (const std::optional<TrackedFile> trackedFile{ _tracker->getTrackedFile(filename) })
        {
            _tracker->touchSession(trackedFile->sessionId, now);
            return trackedFile->sessionId;
        }

        return _tracker->createSession(now);
    }

    void ClippingService::onPipelineDone()
    {
        {
            const std::scoped_lock lock{ _controlMutex };
            _runningPipelineCount -= 1;
        }

        _controlCv.notify_all();
    }
} // namespace clipper::clipping
