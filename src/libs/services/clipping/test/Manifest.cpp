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

#include "pipeline/Manifest.hpp"

namespace clipper::clipping::tests
{
    TEST(Manifest, build)
    {
        const std::vector<std::filesystem::path> files{ "/var/clipper/temp/segment-0.mp4", "/var/clipper/temp/segment-1.mp4" };

        EXPECT_EQ(buildConcatManifest(files), "file '/var/clipper/temp/segment-0.mp4'\n"
                                              "file '/var/clipper/temp/segment-1.mp4'\n");
    }

    TEST(Manifest, escape)
    {
        EXPECT_EQ(escapeManifestPath("/tmp/it's here.mp4"), "/tmp/it'\\''s here.mp4");
        EXPECT_EQ(buildConcatManifest(std::vector<std::filesystem::path>{ "/tmp/a'b.mp4" }), "file '/tmp/a'\\''b.mp4'\n");
    }

    TEST(Manifest, empty)
    {
        EXPECT_EQ(buildConcatManifest({}), "");
    }
} // namespace clipper::clipping::tests
