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
#include <optional>
#include <string>
#include <vector>

#include "services/clipping/IResourceTracker.hpp"
#include "services/clipping/Types.hpp"

namespace clipper::clipping
{
    class Executor;
    class IDownloadTokenStore;
    class IEncoder;

    // State shared by the steps of a single encode run
    struct PipelineContext
    {
        Executor& executor;
        IResourceTracker& tracker;
        IDownloadTokenStore& tokenStore;
        IEncoder& encoder;

        const std::string runId;
        const std::string sessionId;
        const std::string sourceFilename;
        const std::vector<Segment> segments;

        // captured at start: the session may be evicted while the run is in progress
        std::optional<std::string> displayName;

        // filled in by the steps, in order
        std::vector<std::string> intermediateFilenames; // one per segment, same order
        std::vector<std::unique_ptr<InUseGuard>> intermediateGuards;
        std::string manifestFilename;
        std::unique_ptr<InUseGuard> manifestGuard;
        std::string resultFilename;
        std::optional<std::string> downloadToken;
        std::optional<EncodeFailure> failure;
    };
} // namespace clipper::clipping
