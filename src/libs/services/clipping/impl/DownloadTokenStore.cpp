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

#include "DownloadTokenStore.hpp"

#include "core/ILogger.hpp"

#include "IdGenerator.hpp"

namespace clipper::clipping
{
    std::unique_ptr<IDownloadTokenStore> createDownloadTokenStore(std::chrono::seconds retention)
    {
        return std::make_unique<DownloadTokenStore>(retention);
    }

    DownloadTokenStore::DownloadTokenStore(std::chrono::seconds retention)
        : _retention{ retention }
    {
    }

    std::string DownloadTokenStore::issue(std::string_view resultFilename, std::string_view displayName, Clock::time_point now)
    {
        DownloadToken token{
            .id = ids::generateId(ids::downloadTokenPrefix),
            .resultFilename = std::string{ resultFilename },
            .displayName = std::string{ displayName },
            .creationTime = now,
        };
        std::string tokenId{ token.id };

        {
            const std::scoped_lock lock{ _mutex };
            _tokens.emplace(tokenId, std::move(token));
        }

        CLIPPER_LOG(CLIPPING, DEBUG, "Issued download token '" << tokenId << "' for '" << resultFilename << "'");
        return tokenId;
    }

    std::optional<DownloadToken> DownloadTokenStore::take(std::string_view tokenId, Clock::time_point now)
    {
        const std::scoped_lock lock{ _mutex };

        auto it{ _tokens.find(tokenId) };
        if (it == std::end(_tokens))
            return std::nullopt;

        DownloadToken token{ std::move(it->second) };
        _tokens.erase(it);

        if (isExpired(token, now))
        {
            CLIPPER_LOG(CLIPPING, DEBUG, "Download token '" << tokenId << "' expired");
            return std::nullopt;
        }

        return token;
    }

    std::size_t DownloadTokenStore::removeExpiredTokens(Clock::time_point now)
    {
        const std::scoped_lock lock{ _mutex };

        return std::erase_if(_tokens, [&](const auto& entry) { return isExpired(entry.second, now); });
    }

    std::size_t DownloadTokenStore::getTokenCount() const
    {
        const std::scoped_lock lock{ _mutex };
        return _tokens.size();
    }

    bool DownloadTokenStore::isExpired(const DownloadToken& token, Clock::time_point now) const
    {
        return now - token.creationTime > _retention;
    }
} // namespace clipper::clipping
