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
#include <sstream>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/StreamLogger.hpp"

namespace clipper::core::logging::tests
{
    namespace
    {
        std::string readLogFile(const std::filesystem::path& path)
        {
            std::ifstream ifs{ path };
            std::ostringstream oss;
            oss << ifs.rdbuf();
            return oss.str();
        }
    } // namespace

    TEST(Logger, parseSeverity)
    {
        EXPECT_EQ(parseSeverity("debug"), Severity::DEBUG);
        EXPECT_EQ(parseSeverity("info"), Severity::INFO);
        EXPECT_EQ(parseSeverity("warning"), Severity::WARNING);
        EXPECT_EQ(parseSeverity("error"), Severity::ERROR);
        EXPECT_EQ(parseSeverity("fatal"), Severity::FATAL);
        EXPECT_THROW(parseSeverity("verbose"), ClipperException);
    }

    TEST(Logger, logFile)
    {
        const std::filesystem::path logFilePath{ std::filesystem::temp_directory_path() / ("clipper-test-" + std::to_string(::getpid()) + ".log") };
        {
            Service<ILogger> logger{ createLogger(Severity::INFO, logFilePath) };

            EXPECT_TRUE(logger->isSeverityActive(Severity::ERROR));
            EXPECT_TRUE(logger->isSeverityActive(Severity::INFO));
            EXPECT_FALSE(logger->isSeverityActive(Severity::DEBUG));

            CLIPPER_LOG(GC, INFO, "Removed " << 3 << " file(s)");
            CLIPPER_LOG(GC, DEBUG, "Not logged");
        }

        const std::string content{ readLogFile(logFilePath) };
        std::filesystem::remove(logFilePath);

        EXPECT_NE(content.find("[info] [GC] Removed 3 file(s)\n"), std::string::npos);
        EXPECT_EQ(content.find("Not logged"), std::string::npos);
    }

    TEST(Logger, streamLogger)
    {
        std::ostringstream oss;
        {
            Service<ILogger> logger{ std::make_unique<StreamLogger>(oss, Severity::WARNING) };

            CLIPPER_LOG(ENCODER, ERROR, "Exit code 1");
            CLIPPER_LOG(ENCODER, INFO, "Not logged");
        }

        EXPECT_NE(oss.str().find("[error] [ENCODER] Exit code 1"), std::string::npos);
        EXPECT_EQ(oss.str().find("Not logged"), std::string::npos);
    }
} // namespace clipper::core::logging::tests
