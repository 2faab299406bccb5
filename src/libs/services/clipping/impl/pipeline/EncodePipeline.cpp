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

#include "EncodePipeline.hpp"

#include <exception>

#include "core/ILogger.hpp"
#include "services/clipping/Exception.hpp"

#include "IdGenerator.hpp"
#include "steps/ConcatStep.hpp"
#include "steps/CutSegmentsStep.hpp"
#include "steps/IssueTokenStep.hpp"
#include "steps/RemoveIntermediatesStep.hpp"
#include "steps/WriteManifestStep.hpp"

namespace clipper::clipping
{
    EncodePipeline::EncodePipeline(boost::asio::io_context& ioContext, IResourceTracker& tracker, IDownloadTokenStore& tokenStore, IEncoder& encoder, Parameters parameters, OnDoneCallback callback)
        : _executor{ ioContext }
        , _context{
            .executor = _executor,
            .tracker = tracker,
            .tokenStore = tokenStore,
            .encoder = encoder,
            .runId = ids::generateId(ids::runPrefix),
            .sessionId = std::move(parameters.sessionId),
            .sourceFilename = std::move(parameters.sourceFilename),
            .segments = std::move(parameters.segments),
        }
        , _callback{ std::move(callback) }
    {
        setupSteps();
    }

    EncodePipeline::~EncodePipeline()
    {
        CLIPPER_LOG(PIPELINE, DEBUG, "Run '" << _context.runId << "' destroyed");
    }

    void EncodePipeline::start()
    {
        if (_self)
            throw Exception{ "Pipeline already started" };

        _self = shared_from_this();

        CLIPPER_LOG(PIPELINE, INFO, "Run '" << _context.runId << "': processing " << _context.segments.size() << " segment(s) of '" << _context.sourceFilename << "' for session '" << _context.sessionId << "'");

        // the source must outlive the whole run
        _sourceGuard.emplace(_context.tracker, _context.sourceFilename);
        _context.displayName = _context.tracker.getDisplayName(_context.sessionId);

        _stepIndex = 0;
        runStep(_stepIndex);
    }

    void EncodePipeline::setupSteps()
    {
        auto onDoneCallback{ [this](bool success) {
            onCurrentStepDone(success);
        } };

        // order is important, each step is done only when the previous one is done
        _steps.emplace_back(std::make_unique<CutSegmentsStep>(_context, onDoneCallback));
        _steps.emplace_back(std::make_unique<WriteManifestStep>(_context, onDoneCallback));
        _steps.emplace_back(std::make_unique<ConcatStep>(_context, onDoneCallback));
        _steps.emplace_back(std::make_unique<RemoveIntermediatesStep>(_context, onDoneCallback));
        _steps.emplace_back(std::make_unique<IssueTokenStep>(_context, onDoneCallback));
    }

    void EncodePipeline::onCurrentStepDone(bool success)
    {
        CLIPPER_LOG(PIPELINE, DEBUG, "Run '" << _context.runId << "': step '" << _steps[_stepIndex]->getName() << "' done: " << (success ? "success" : "failure"));

        if (success)
        {
            runNextStep();
            return;
        }

        if (!_context.failure)
            _context.failure = EncodeFailure{ .stepIndex = _stepIndex, .stepName = _steps[_stepIndex]->getName(), .segmentIndex = std::nullopt, .diagnostic = {} };
        _context.failure->stepIndex = _stepIndex;

        onPipelineDone();
    }

    void EncodePipeline::runNextStep()
    {
        if (++_stepIndex < _steps.size())
            runStep(_stepIndex);
        else
            onPipelineDone();
    }

    void EncodePipeline::runStep(std::size_t stepIndex)
    {
        _executor.post([stepIndex, this] {
            PipelineStep& step{ *_steps[stepIndex] };

            CLIPPER_LOG(PIPELINE, DEBUG, "Run '" << _context.runId << "': running step '" << step.getName() << "'");
            try
            {
                step.run();
            }
            catch (const std::exception& e)
            {
                CLIPPER_LOG(PIPELINE, ERROR, "Run '" << _context.runId << "': step '" << step.getName() << "' failed: " << e.what());

                _context.failure = EncodeFailure{ .stepIndex = stepIndex, .stepName = step.getName(), .segmentIndex = std::nullopt, .diagnostic = e.what() };
                onPipelineDone();
            }
        });
    }

    void EncodePipeline::onPipelineDone()
    {
        // what has been produced so far stays tracked, just no longer protected
        _context.intermediateGuards.clear();
        _context.manifestGuard.reset();
        _sourceGuard.reset();

        ProcessingResult result;
        if (_context.failure)
        {
            CLIPPER_LOG(PIPELINE, ERROR, "Run '" << _context.runId << "' failed: " << *_context.failure);
            result.failure = _context.failure;
        }
        else
        {
            CLIPPER_LOG(PIPELINE, INFO, "Run '" << _context.runId << "' done, result = '" << _context.resultFilename << "'");
            result.downloadToken = _context.downloadToken;
        }

        // released last, this may be the last reference
        std::shared_ptr<EncodePipeline> self{ std::move(_self) };
        OnDoneCallback callback{ std::move(_callback) };
        callback(result);
    }
} // namespace clipper::clipping
