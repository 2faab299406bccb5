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

#include "ConcatStep.hpp"

#include "core/ILogger.hpp"
#include "services/clipping/IEncoder.hpp"

namespace clipper::clipping
{
    core::LiteralString ConcatStep::getName() const
    {
        return "Concat segments";
    }

    void ConcatStep::run()
    {
        PipelineContext& context{ getContext() };

        context.resultFilename = "clip-" + context.runId + ".mp4";
        getTracker().track(context.resultFilename, FileCategory::Result, context.sessionId, Clock::now());
        _resultGuard = std::make_unique<InUseGuard>(getTracker(), context.resultFilename);

        CLIPPER_LOG(PIPELINE, DEBUG, "Run '" << context.runId << "': concatenating " << context.intermediateFilenames.size() << " segment(s) into '" << context.resultFilename << "'");

        context.encoder.concat(getFilePath(context.manifestFilename, FileCategory::Intermediate), getFilePath(context.resultFilename, FileCategory::Result), [this](const EncodeOutcome& outcome) {
            getExecutor().post([this, outcome] { onConcatDone(outcome); });
        });
    }

    void ConcatStep::onConcatDone(const EncodeOutcome& outcome)
    {
        PipelineContext& context{ getContext() };

        if (!outcome.success)
        {
            CLIPPER_LOG(PIPELINE, ERROR, "Run '" << context.runId << "': cannot concatenate segments: " << outcome.diagnostic);

            _resultGuard.reset();
            if (!getTracker().remove(context.resultFilename, FileCategory::Result, Clock::now()))
                CLIPPER_LOG(PIPELINE, WARNING, "Cannot remove partial output '" << context.resultFilename << "'");

            onFailure(std::nullopt, outcome.diagnostic);
            return;
        }

        // the retention window starts once the result is complete, as for its download token
        if (!getTracker().touchFile(context.resultFilename, Clock::now()))
            CLIPPER_LOG(PIPELINE, WARNING, "Result '" << context.resultFilename << "' is no longer tracked");
        _resultGuard.reset();

        onDone();
    }
} // namespace clipper::clipping
