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

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "core/LiteralString.hpp"

namespace clipper::clipping
{
    using Clock = std::chrono::steady_clock;

    enum class FileCategory
    {
        Source,       // uploaded by the client
        Intermediate, // cut segments and concat manifests
        Result,       // final output, redeemable through a download token
    };

    core::LiteralString toString(FileCategory category);

    // Time interval of the source video, in seconds
    struct Segment
    {
        double start{};
        double end{};
        std::string color; // display only

        bool operator==(const Segment& other) const = default;
    };

    std::ostream& operator<<(std::ostream& os, const Segment& segment);

    enum class MergeOutcome
    {
        Added,    // inserted as is
        Merged,   // folded with at least one existing segment
        Rejected, // degenerate proposal, set left unchanged
    };

    core::LiteralString toString(MergeOutcome outcome);

    struct TrackedFile
    {
        std::string filename;
        FileCategory category{ FileCategory::Source };
        Clock::time_point creationTime;
        std::string sessionId;
        bool inUse{};
    };

    struct EncodeFailure
    {
        std::size_t stepIndex{};
        core::LiteralString stepName;
        std::optional<std::size_t> segmentIndex; // set if the failure is bound to a given segment
        std::string diagnostic;                  // for operators only
    };

    std::ostream& operator<<(std::ostream& os, const EncodeFailure& failure);

    // Message to be reported to clients whatever the actual failure is
    inline constexpr core::LiteralString processingFailedMessage{ "Video processing failed" };

    struct ProcessingResult
    {
        std::optional<std::string> downloadToken; // set on success
        std::optional<EncodeFailure> failure;     // set on failure

        bool success() const { return downloadToken.has_value(); }
    };

    struct UploadResult
    {
        std::string filename;
        std::string sessionId;
    };

    struct RedeemResult
    {
        std::string displayName;
        std::uint64_t byteCount{};
    };

    struct SweepStats
    {
        std::size_t evictedSessionCount{};
        std::size_t removedFileCount{};
        std::size_t expiredTokenCount{};
    };
} // namespace clipper::clipping
