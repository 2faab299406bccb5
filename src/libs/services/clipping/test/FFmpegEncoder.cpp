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

#include <algorithm>
#include <optional>

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include "core/IChildProcessManager.hpp"

#include "Common.hpp"
#include "encoder/FFmpegEncoder.hpp"

namespace clipper::clipping::tests
{
    namespace
    {
        bool contains(const core::IChildProcess::Args& args, std::string_view arg)
        {
            return std::find(std::cbegin(args), std::cend(args), arg) != std::cend(args);
        }

        std::string getArgAfter(const core::IChildProcess::Args& args, std::string_view option)
        {
            auto it{ std::find(std::cbegin(args), std::cend(args), option) };
            if (it == std::cend(args) || std::next(it) == std::cend(args))
                return {};

            return *std::next(it);
        }

        std::filesystem::path createScript(const std::filesystem::path& directory, std::string_view content)
        {
            const std::filesystem::path path{ directory / "fake-ffmpeg.sh" };
            writeFile(path, "#!/bin/sh\n" + std::string{ content } + "\n");
            std::filesystem::permissions(path, std::filesystem::perms::owner_all);
            return path;
        }

        EncodeOutcome runCut(const EncoderSettings& settings)
        {
            boost::asio::io_context ioContext;
            auto childProcessManager{ core::createChildProcessManager(ioContext) };
            auto encoder{ createFFmpegEncoder(ioContext, *childProcessManager, settings) };

            std::optional<EncodeOutcome> res;
            encoder->cut("/tmp/in.mp4", Segment{ .start = 1, .end = 2, .color = {} }, "/tmp/out.mp4", [&](const EncodeOutcome& outcome) { res = outcome; });

            ioContext.run();

            EXPECT_TRUE(res);
            return res.value_or(EncodeOutcome{});
        }
    } // namespace

    TEST(FFmpegEncoder, cutArgs)
    {
        const EncoderSettings settings;
        const core::IChildProcess::Args args{ buildCutArgs(settings, "/work/uploads/in.mkv", Segment{ .start = 1.5, .end = 12.25, .color = {} }, "/work/temp/segment-0.mp4") };

        ASSERT_FALSE(args.empty());
        EXPECT_EQ(args.front(), "/usr/bin/ffmpeg");
        EXPECT_EQ(args.back(), "/work/temp/segment-0.mp4");
        EXPECT_TRUE(contains(args, "-nostdin"));
        EXPECT_TRUE(contains(args, "-y"));
        EXPECT_EQ(getArgAfter(args, "-loglevel"), "error");
        EXPECT_EQ(getArgAfter(args, "-i"), "/work/uploads/in.mkv");
        EXPECT_EQ(getArgAfter(args, "-ss"), "1.500");
        EXPECT_EQ(getArgAfter(args, "-to"), "12.250");
        EXPECT_EQ(getArgAfter(args, "-c:v"), "libx264");
        EXPECT_EQ(getArgAfter(args, "-c:a"), "aac");
        EXPECT_EQ(getArgAfter(args, "-preset"), "fast");
        EXPECT_EQ(getArgAfter(args, "-crf"), "23");
        EXPECT_EQ(getArgAfter(args, "-avoid_negative_ts"), "make_zero");

        // never stream copy
        EXPECT_FALSE(contains(args, "copy"));
    }

    TEST(FFmpegEncoder, concatArgs)
    {
        EncoderSettings settings;
        settings.ffmpegPath = "/opt/ffmpeg/bin/ffmpeg";
        settings.preset = "veryfast";
        settings.crf = 28;

        const core::IChildProcess::Args args{ buildConcatArgs(settings, "/work/temp/manifest.txt", "/work/output/clip.mp4") };

        EXPECT_EQ(args.front(), "/opt/ffmpeg/bin/ffmpeg");
        EXPECT_EQ(args.back(), "/work/output/clip.mp4");
        EXPECT_EQ(getArgAfter(args, "-f"), "concat");
        EXPECT_EQ(getArgAfter(args, "-safe"), "0");
        EXPECT_EQ(getArgAfter(args, "-i"), "/work/temp/manifest.txt");
        EXPECT_EQ(getArgAfter(args, "-preset"), "veryfast");
        EXPECT_EQ(getArgAfter(args, "-crf"), "28");
        EXPECT_FALSE(contains(args, "copy"));
    }

    TEST(FFmpegEncoder, success)
    {
        TmpDirectory tmpDirectory;
        EncoderSettings settings;
        settings.ffmpegPath = createScript(tmpDirectory.getPath(), "exit 0");

        const EncodeOutcome outcome{ runCut(settings) };
        EXPECT_TRUE(outcome.success);
        EXPECT_EQ(outcome.exitCode, 0);
    }

    TEST(FFmpegEncoder, failure)
    {
        TmpDirectory tmpDirectory;
        EncoderSettings settings;
        settings.ffmpegPath = createScript(tmpDirectory.getPath(), "echo 'moov atom not found' >&2; exit 1");

        const EncodeOutcome outcome{ runCut(settings) };
        EXPECT_FALSE(outcome.success);
        EXPECT_EQ(outcome.exitCode, 1);
        EXPECT_EQ(outcome.diagnostic, "moov atom not found\n");
    }

    TEST(FFmpegEncoder, missingBinary)
    {
        EncoderSettings settings;
        settings.ffmpegPath = "/nonexistent/ffmpeg";

        const EncodeOutcome outcome{ runCut(settings) };
        EXPECT_FALSE(outcome.success);
    }

    TEST(FFmpegEncoder, timeout)
    {
        TmpDirectory tmpDirectory;
        EncoderSettings settings;
        settings.ffmpegPath = createScript(tmpDirectory.getPath(), "exec sleep 30");
        settings.timeout = std::chrono::seconds{ 1 };

        const EncodeOutcome outcome{ runCut(settings) };
        EXPECT_FALSE(outcome.success);
        EXPECT_FALSE(outcome.exitCode);
        EXPECT_TRUE(outcome.diagnostic.starts_with("Timeout"));
    }
} // namespace clipper::clipping::tests
