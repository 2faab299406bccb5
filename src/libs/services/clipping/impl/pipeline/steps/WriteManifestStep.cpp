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

#include "WriteManifestStep.hpp"

#include <fstream>
#include <vector>

#include "core/ILogger.hpp"

#include "Manifest.hpp"

namespace clipper::clipping
{
    core::LiteralString WriteManifestStep::getName() const
    {
        return "Write manifest";
    }

    void WriteManifestStep::run()
    {
        PipelineContext& context{ getContext() };

        std::vector<std::filesystem::path> intermediatePaths;
        intermediatePaths.reserve(context.intermediateFilenames.size());
        for (const std::string& filename : context.intermediateFilenames)
            intermediatePaths.push_back(std::filesystem::absolute(getFilePath(filename, FileCategory::Intermediate)));

        context.manifestFilename = "manifest-" + context.runId + ".txt";
        getTracker().track(context.manifestFilename, FileCategory::Intermediate, context.sessionId, Clock::now());
        context.manifestGuard = std::make_unique<InUseGuard>(getTracker(), context.manifestFilename);

        const std::filesystem::path manifestPath{ getFilePath(context.manifestFilename, FileCategory::Intermediate) };
        {
            std::ofstream ofs{ manifestPath, std::ios::out | std::ios::trunc };
            ofs << buildConcatManifest(intermediatePaths);
            ofs.close();

            if (!ofs)
            {
                CLIPPER_LOG(PIPELINE, ERROR, "Run '" << context.runId << "': cannot write manifest " << manifestPath);

                context.manifestGuard.reset();
                if (!getTracker().remove(context.manifestFilename, FileCategory::Intermediate, Clock::now()))
                    CLIPPER_LOG(PIPELINE, WARNING, "Cannot remove partial output '" << context.manifestFilename << "'");

                onFailure(std::nullopt, "Cannot write concat manifest");
                return;
            }
        }

        CLIPPER_LOG(PIPELINE, DEBUG, "Run '" << context.runId << "': manifest " << manifestPath << " lists " << intermediatePaths.size() << " file(s)");
        onDone();
    }
} // namespace clipper::clipping
