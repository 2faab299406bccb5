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

#include <functional>
#include <map>
#include <mutex>

#include "services/clipping/IDownloadTokenStore.hpp"

namespace clipper::clipping
{
    class DownloadTokenStore : public IDownloadTokenStore
    {
    public:
        DownloadTokenStore(std::chrono::seconds retention);
        ~DownloadTokenStore() override = default;
        DownloadTokenStore(const DownloadTokenStore&) = delete;
        DownloadTokenStore& operator=(const DownloadTokenStore&) = delete;

    private:
        std::string issue(std::string_view resultFilename, std::string_view displayName, Clock::time_point now) override;
        std::optional<DownloadToken> take(std::string_view tokenId, Clock::time_point now) override;
        std::size_t removeExpiredTokens(Clock::time_point now) override;
        std::size_t getTokenCount() const override;

        bool isExpired(const DownloadToken& token, Clock::time_point now) const;

        const std::chrono::seconds _retention;

        mutable std::mutex _mutex;
        std::map<std::string, DownloadToken, std::less<>> _tokens;
    };
} // namespace clipper::clipping
