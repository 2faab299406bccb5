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

#include "core/String.hpp"

namespace clipper::core::stringUtils::tests
{
    TEST(StringUtils, splitString)
    {
        struct TestCase
        {
            std::string_view input;
            char delimiter;
            std::vector<std::string_view> expectedOutput;
        };

        TestCase tests[]{
            { "abc", '-', { "abc" } },
            { "", '-', { "" } },
            { "a-b-c", '-', { "a", "b", "c" } },
            { "2.5-7", '-', { "2.5", "7" } },
            { "-7", '-', { "", "7" } },
            { "a-", '-', { "a", "" } },
            { ";;", ';', { "", "", "" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string_view> res{ splitString(test.input, test.delimiter) };
            EXPECT_EQ(res, test.expectedOutput) << "Input = '" << test.input << "', delim = '" << test.delimiter << "'";
        }
    }

    TEST(StringUtils, stringTrim)
    {
        EXPECT_EQ(stringTrim("  abc "), "abc");
        EXPECT_EQ(stringTrim("abc"), "abc");
        EXPECT_EQ(stringTrim("   "), "");
        EXPECT_EQ(stringTrim("\ta b\r\n"), "a b");
    }

    TEST(StringUtils, stringToLower)
    {
        EXPECT_EQ(stringToLower("MoV"), "mov");
        EXPECT_EQ(stringToLower(""), "");
    }

    TEST(StringUtils, replaceInString)
    {
        EXPECT_EQ(replaceInString("it's", "'", "'\\''"), "it'\\''s");
        EXPECT_EQ(replaceInString("aaa", "a", "aa"), "aaaaaa");
        EXPECT_EQ(replaceInString("abc", "", "x"), "abc");
    }

    TEST(StringUtils, readAs)
    {
        EXPECT_EQ(readAs<double>("2.5"), 2.5);
        EXPECT_EQ(readAs<long>("42"), 42);
        EXPECT_EQ(readAs<double>("abc"), std::nullopt);
        EXPECT_EQ(readAs<double>("2.5abc"), std::nullopt);
        EXPECT_EQ(readAs<double>(""), std::nullopt);
        EXPECT_EQ(readAs<std::string>("foo bar"), "foo bar");
    }

    TEST(StringUtils, formatSeconds)
    {
        EXPECT_EQ(formatSeconds(0), "0.000");
        EXPECT_EQ(formatSeconds(2.5), "2.500");
        EXPECT_EQ(formatSeconds(61.25), "61.250");
    }
} // namespace clipper::core::stringUtils::tests
