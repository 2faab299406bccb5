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

#include "services/clipping/Types.hpp"

#include "core/String.hpp"

namespace clipper::clipping
{
    core::LiteralString toString(FileCategory category)
    {
        switch (category)
        {
        case FileCategory::Source:
            return "source";
        case FileCategory::Intermediate:
            return "intermediate";
        case FileCategory::Result:
            return "result";
        }

        return "unknown";
    }

    core::LiteralString toString(MergeOutcome outcome)
    {
        switch (outcome)
        {
        case MergeOutcome::Added:
            return "added";
        case MergeOutcome::Merged:
            return "merged";
        case MergeOutcome::Rejected:
            return "rejected";
        }

        return "unknown";
    }

    std::ostream& operator<<(std::ostream& os, const Segment& segment)
    {
        os << "[" << core::stringUtils::formatSeconds(segment.start) << ", " << core::stringUtils::formatSeconds(segment.end) << "]";
        return os;
    }

    std::ostream& operator<<(std::ostream& os, const EncodeFailure& failure)
    {
        os << "step " << failure.stepIndex << " ('" << failure.stepName << "')";
        if (failure.segmentIndex)
            os << ", segment " << *failure.segmentIndex;
        if (!failure.diagnostic.empty())
            os << ": " << failure.diagnostic;

        return os;
    }
} // namespace clipper::clipping
