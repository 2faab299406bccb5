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

#include "services/clipping/SegmentMerger.hpp"

#include <algorithm>
#include <array>
#include <cmath>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace clipper::clipping
{
    namespace
    {
        constexpr std::array<std::string_view, 10> segmentColors{
            "#0077BE",
            "#00A8E8",
            "#00C9FF",
            "#00E5FF",
            "#1DE9B6",
            "#00E676",
            "#69F0AE",
            "#B2FF59",
            "#76FF03",
            "#64DD17",
        };

        bool compareByStart(const Segment& a, const Segment& b)
        {
            return a.start < b.start;
        }
    } // namespace

    std::span<const std::string_view> getSegmentColors()
    {
        return segmentColors;
    }

    std::string_view getSegmentColor(std::size_t committedSegmentCount)
    {
        return segmentColors[committedSegmentCount % segmentColors.size()];
    }

    bool segmentsOverlap(const Segment& a, const Segment& b)
    {
        return a.start <= b.end && b.start <= a.end;
    }

    bool isValidSegment(const Segment& segment)
    {
        return std::isfinite(segment.start)
            && std::isfinite(segment.end)
            && segment.start >= 0
            && segment.end > segment.start;
    }

    bool isDisjointSet(std::span<const Segment> segments)
    {
        for (std::size_t i{ 1 }; i < segments.size(); ++i)
        {
            if (segments[i - 1].start > segments[i].start)
                return false;
            if (segmentsOverlap(segments[i - 1], segments[i]))
                return false;
        }

        return true;
    }

    MergeOutcome mergeSegment(std::vector<Segment>& segments, Segment proposed)
    {
        if (!isValidSegment(proposed))
        {
            CLIPPER_LOG(CLIPPING, DEBUG, "Rejected degenerate segment " << proposed);
            return MergeOutcome::Rejected;
        }

        bool merged{};

        // folding may grow the proposal over segments it did not overlap at first
        bool overlapFound{ true };
        while (overlapFound)
        {
            overlapFound = false;

            auto it{ std::find_if(std::begin(segments), std::end(segments), [&](const Segment& segment) { return segmentsOverlap(segment, proposed); }) };
            if (it != std::end(segments))
            {
                proposed.start = std::min(proposed.start, it->start);
                proposed.end = std::max(proposed.end, it->end);
                segments.erase(it);

                merged = true;
                overlapFound = true;
            }
        }

        segments.insert(std::upper_bound(std::begin(segments), std::end(segments), proposed, compareByStart), std::move(proposed));

        if (!isDisjointSet(segments))
            throw core::ClipperException{ "Segment set is not disjoint after merge" };

        return merged ? MergeOutcome::Merged : MergeOutcome::Added;
    }
} // namespace clipper::clipping
