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

#include "CutSegmentsStep.hpp"

#include "core/ILogger.hpp"
#include "services/clipping/IEncoder.hpp"

namespace clipper::clipping
{
    core::LiteralString CutSegmentsStep::getName() const
    {
        return "Cut segments";
    }

    void CutSegmentsStep::run()
    {
        _segmentIndex = 0;
        cutNextSegment();
    }

    void CutSegmentsStep::cutNextSegment()
    {
        PipelineContext& context{ getContext() };
        if (_segmentIndex >= context.segments.size())
        {
            onDone();
            return;
        }

        const Segment& segment{ context.segments[_segmentIndex] };
        _currentFilename = "segment-" + context.runId + "-" + std::to_string(_segmentIndex) + ".mp4";

        // registered before the encoder writes anything, so that a crash leaves nothing untracked
        getTracker().track(_currentFilename, FileCategory::Intermediate, context.sessionId, Clock::now());
        _currentGuard = std::make_unique<InUseGuard>(getTracker(), _currentFilename);

        CLIPPER_LOG(PIPELINE, DEBUG, "Run '" << context.runId << "': cutting segment " << _segmentIndex << " " << segment << " into '" << _currentFilename << "'");

        context.encoder.cut(getFilePath(context.sourceFilename, FileCategory::Source), segment, getFilePath(_currentFilename, FileCategory::Intermediate), [this](const EncodeOutcome& outcome) {
            getExecutor().post([this, outcome] { onSegmentCut(outcome); });
        });
    }

    void CutSegmentsStep::onSegmentCut(const EncodeOutcome& outcome)
    {
        PipelineContext& context{ getContext() };

        if (!outcome.success)
        {
            CLIPPER_LOG(PIPELINE, ERROR, "Run '" << context.runId << "': cannot cut segment " << _segmentIndex << ": " << outcome.diagnostic);

            _currentGuard.reset();
            if (!getTracker().remove(_currentFilename, FileCategory::Intermediate, Clock::now()))
                CLIPPER_LOG(PIPELINE, WARNING, "Cannot remove partial output '" << _currentFilename << "'");

            onFailure(_segmentIndex, outcome.diagnostic);
            return;
        }

        context.intermediateFilenames.push_back(std::move(_currentFilename));
        context.intermediateGuards.push_back(std::move(_currentGuard));

        _segmentIndex += 1;
        cutNextSegment();
    }
} // namespace clipper::clipping
