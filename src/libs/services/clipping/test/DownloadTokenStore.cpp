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

#include <gtest/gtest.h>

#include "services/clipping/IDownloadTokenStore.hpp"

namespace clipper::clipping::tests
{
    TEST(DownloadTokenStore, takeOnce)
    {
        auto store{ createDownloadTokenStore(std::chrono::minutes{ 30 }) };
        const Clock::time_point now{ Clock::now() };

        const std::string tokenId{ store->issue("clip.mp4", "holidays-edited.mp4", now) };
        EXPECT_TRUE(tokenId.starts_with("dl-"));
        EXPECT_EQ(store->getTokenCount(), 1);

        const std::optional<DownloadToken> token{ store->take(tokenId, now) };
        ASSERT_TRUE(token);
        EXPECT_EQ(token->id, tokenId);
        EXPECT_EQ(token->resultFilename, "clip.mp4");
        EXPECT_EQ(token->displayName, "holidays-edited.mp4");

        EXPECT_FALSE(store->take(tokenId, now));
        EXPECT_EQ(store->getTokenCount(), 0);
    }

    TEST(DownloadTokenStore, unknown)
    {
        auto store{ createDownloadTokenStore(std::chrono::minutes{ 30 }) };
        EXPECT_FALSE(store->take("dl-unknown", Clock::now()));
    }

    TEST(DownloadTokenStore, expired)
    {
        auto store{ createDownloadTokenStore(std::chrono::minutes{ 30 }) };
        const Clock::time_point now{ Clock::now() };

        const std::string tokenId{ store->issue("clip.mp4", "video-edited.mp4", now) };
        EXPECT_FALSE(store->take(tokenId, now + std::chrono::minutes{ 31 }));
        // consumed anyway
        EXPECT_FALSE(store->take(tokenId, now));
    }

    TEST(DownloadTokenStore, removeExpiredTokens)
    {
        auto store{ createDownloadTokenStore(std::chrono::minutes{ 30 }) };
        const Clock::time_point now{ Clock::now() };

        store->issue("old.mp4", "video-edited.mp4", now);
        const std::string recentTokenId{ store->issue("recent.mp4", "video-edited.mp4", now + std::chrono::minutes{ 20 }) };

        EXPECT_EQ(store->removeExpiredTokens(now + std::chrono::minutes{ 31 }), 1);
        EXPECT_EQ(store->getTokenCount(), 1);
        EXPECT_EQ(store->removeExpiredTokens(now + std::chrono::minutes{ 31 }), 0);
        EXPECT_TRUE(store->take(recentTokenId, now + std::chrono::minutes{ 31 }));
    }
} // namespace clipper::clipping::tests
