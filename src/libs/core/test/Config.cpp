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

#include <unistd.h>

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

namespace clipper::core::tests
{
    namespace
    {
        class TmpConfigFile
        {
        public:
            TmpConfigFile(std::string_view content)
                : _path{ std::filesystem::temp_directory_path() / ("clipper-test-" + std::to_string(::getpid()) + ".conf") }
            {
                std::ofstream ofs{ _path, std::ios::out | std::ios::trunc };
                ofs << content;
            }

            ~TmpConfigFile()
            {
                std::error_code ec;
                std::filesystem::remove(_path, ec);
            }

            const std::filesystem::path& getPath() const { return _path; }

        private:
            const std::filesystem::path _path;
        };
    } // namespace

    TEST(Config, values)
    {
        const TmpConfigFile file{ R"(
working-dir = "/var/clipper";
ffmpeg-file = "/usr/local/bin/ffmpeg";
retention-minutes = 45;
encoder-crf = 18;
)" };

        const auto config{ createConfig(file.getPath()) };
        EXPECT_EQ(config->getPath("working-dir", "/tmp"), "/var/clipper");
        EXPECT_EQ(config->getString("ffmpeg-file", "/usr/bin/ffmpeg"), "/usr/local/bin/ffmpeg");
        EXPECT_EQ(config->getULong("retention-minutes", 30), 45);
        EXPECT_EQ(config->getULong("encoder-crf", 23), 18);
        EXPECT_EQ(config->getULong("sweep-interval-minutes", 5), 5);
    }

    TEST(Config, defaults)
    {
        const TmpConfigFile file{ R"(retention-minutes = "not a number";)" };

        const auto config{ createConfig(file.getPath()) };
        EXPECT_EQ(config->getPath("working-dir", "/tmp"), "/tmp");
        EXPECT_EQ(config->getString("ffmpeg-file", "/usr/bin/ffmpeg"), "/usr/bin/ffmpeg");
        EXPECT_EQ(config->getULong("retention-minutes", 30), 30);
    }

    TEST(Config, parseError)
    {
        const TmpConfigFile file{ "retention-minutes = ;" };

        EXPECT_THROW(createConfig(file.getPath()), ClipperException);
        EXPECT_THROW(createConfig("/nonexistent/clipper.conf"), ClipperException);
    }
} // namespace clipper::core::tests
