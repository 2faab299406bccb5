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

#include "IssueTokenStep.hpp"

#include <filesystem>

#include "core/ILogger.hpp"
#include "services/clipping/IDownloadTokenStore.hpp"

namespace clipper::clipping
{
    std::string getResultDisplayName(std::optional<std::string_view> originalName)
    {
        std::string stem;
        if (originalName)
            stem = std::filesystem::path{ *originalName }.filename().stem().string();

        if (stem.empty())
            stem = "video";

        return stem + "-edited.mp4";
    }

    core::LiteralString IssueTokenStep::getName() const
    {
        return "Issue download token";
    }

    void IssueTokenStep::run()
    {
        PipelineContext& context{ getContext() };

        context.downloadToken = context.tokenStore.issue(context.resultFilename, getResultDisplayName(context.displayName), Clock::now());

        onDone();
    }
} // namespace clipper::clipping
