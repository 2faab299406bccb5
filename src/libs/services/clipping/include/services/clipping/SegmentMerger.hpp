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

#include <span>
#include <string_view>
#include <vector>

#include "services/clipping/Types.hpp"

namespace clipper::clipping
{
    // Colors given to committed segments, in rotation
    std::span<const std::string_view> getSegmentColors();
    std::string_view getSegmentColor(std::size_t committedSegmentCount);

    // Intervals are closed: touching segments do overlap
    bool segmentsOverlap(const Segment& a, const Segment& b);

    // Degenerate segments (end <= start, negative start, not finite) are invalid
    bool isValidSegment(const Segment& segment);

    // Sorted by start and pairwise disjoint
    bool isDisjointSet(std::span<const Segment> segments);

    // Folds the proposed segment into a disjoint sorted set
    // Every segment overlapping the proposal, even transitively, is merged into it
    // The merged segment keeps the proposal's color
    MergeOutcome mergeSegment(std::vector<Segment>& segments, Segment proposed);
} // namespace clipper::clipping
