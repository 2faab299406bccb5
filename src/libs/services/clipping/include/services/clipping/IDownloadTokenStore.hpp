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
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "services/clipping/Types.hpp"

namespace clipper::clipping
{
    struct DownloadToken
    {
        std::string id;
        std::string resultFilename;
        std::string displayName;
        Clock::time_point creationTime;
    };

    class IDownloadTokenStore
    {
    public:
        virtual ~IDownloadTokenStore() = default;

        virtual std::string issue(std::string_view resultFilename, std::string_view displayName, Clock::time_point now) = 0;

        // Consumes the token: a given token can only be taken once
        // Expired tokens are handled as unknown ones
        virtual std::optional<DownloadToken> take(std::string_view tokenId, Clock::time_point now) = 0;

        // Drops expired tokens, the files they refer to are left untouched
        virtual std::size_t removeExpiredTokens(Clock::time_point now) = 0;

        virtual std::size_t getTokenCount() const = 0;
    };

    std::unique_ptr<IDownloadTokenStore> createDownloadTokenStore(std::chrono::seconds retention);
} // namespace clipper::clipping
