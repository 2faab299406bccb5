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

#include "RemoveIntermediatesStep.hpp"

#include "core/ILogger.hpp"

namespace clipper::clipping
{
    core::LiteralString RemoveIntermediatesStep::getName() const
    {
        return "Remove intermediates";
    }

    void RemoveIntermediatesStep::run()
    {
        PipelineContext& context{ getContext() };
        context.intermediateGuards.clear();
        context.manifestGuard.reset();

        std::vector<std::string> filenames{ context.intermediateFilenames };
        filenames.push_back(context.manifestFilename);

        for (const std::string& filename : filenames)
        {
            if (!getTracker().remove(filename, FileCategory::Intermediate, Clock::now()))
                CLIPPER_LOG(PIPELINE, WARNING, "Run '" << context.runId << "': cannot remove '" << filename << "', left to the garbage collector");
        }

        onDone();
    }
} // namespace clipper::clipping
