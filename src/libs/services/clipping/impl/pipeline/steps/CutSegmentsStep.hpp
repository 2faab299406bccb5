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

#include <memory>
#include <string>

#include "PipelineStep.hpp"

namespace clipper::clipping
{
    struct EncodeOutcome;

    // One encoder invocation per segment, in order
    class CutSegmentsStep : public PipelineStep
    {
    public:
        using PipelineStep::PipelineStep;

    private:
        core::LiteralString getName() const override;
        void run() override;

        void cutNextSegment();
        void onSegmentCut(const EncodeOutcome& outcome);

        std::size_t _segmentIndex{};
        std::string _currentFilename;
        std::unique_ptr<InUseGuard> _currentGuard;
    };
} // namespace clipper::clipping
