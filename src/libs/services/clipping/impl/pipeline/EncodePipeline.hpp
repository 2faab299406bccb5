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
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "services/clipping/IResourceTracker.hpp"
#include "services/clipping/Types.hpp"

#include "Executor.hpp"
#include "PipelineContext.hpp"

namespace clipper::clipping
{
    class PipelineStep;

    // Cut, manifest, concat, cleanup and token steps, strictly sequential
    // Keeps itself alive until the completion callback has been called
    class EncodePipeline : public std::enable_shared_from_this<EncodePipeline>
    {
    public:
        using OnDoneCallback = std::function<void(const ProcessingResult& result)>;

        struct Parameters
        {
            std::string sessionId;
            std::string sourceFilename;
            std::vector<Segment> segments;
        };

        EncodePipeline(boost::asio::io_context& ioContext, IResourceTracker& tracker, IDownloadTokenStore& tokenStore, IEncoder& encoder, Parameters parameters, OnDoneCallback callback);
        ~EncodePipeline();
        EncodePipeline(const EncodePipeline&) = delete;
        EncodePipeline& operator=(const EncodePipeline&) = delete;

        const std::string& getRunId() const { return _context.runId; }

        void start();

    private:
        void setupSteps();
        void onCurrentStepDone(bool success);
        void runNextStep();
        void runStep(std::size_t stepIndex);
        void onPipelineDone();

        Executor _executor;
        PipelineContext _context;
        OnDoneCallback _callback;
        std::optional<InUseGuard> _sourceGuard;

        std::vector<std::unique_ptr<PipelineStep>> _steps;
        std::size_t _stepIndex{};
        std::shared_ptr<EncodePipeline> _self;
    };
} // namespace clipper::clipping
