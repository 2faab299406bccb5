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

#include "Common.hpp"

#include <unistd.h>

#include <atomic>
#include <sstream>
#include <system_error>

namespace clipper::clipping::tests
{
    TmpDirectory::TmpDirectory()
    {
        static std::atomic<unsigned> counter{};

        _path = std::filesystem::temp_directory_path() / ("clipper-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(_path);
    }

    TmpDirectory::~TmpDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    void writeFile(const std::filesystem::path& path, std::string_view content)
    {
        std::ofstream ofs{ path, std::ios::out | std::ios::binary | std::ios::trunc };
        ofs << content;
        ASSERT_TRUE(ofs.good());
    }

    std::string readFile(const std::filesystem::path& path)
    {
        std::ifstream ifs{ path, std::ios::in | std::ios::binary };
        std::ostringstream oss;
        oss << ifs.rdbuf();
        return oss.str();
    }

    void FakeEncoder::cut(const std::filesystem::path& input, const Segment& segment, const std::filesystem::path& output, OnDoneCallback callback)
    {
        Invocation invocation{ .type = Invocation::Type::Cut, .input = input, .segment = segment, .output = output };
        if (_invocationHook)
            _invocationHook(invocation);

        std::ostringstream oss;
        oss << "cut " << segment;
        complete(std::move(invocation), oss.str(), callback);
    }

    void FakeEncoder::concat(const std::filesystem::path& manifest, const std::filesystem::path& output, OnDoneCallback callback)
    {
        Invocation invocation{ .type = Invocation::Type::Concat, .input = manifest, .segment = std::nullopt, .output = output };
        if (_invocationHook)
            _invocationHook(invocation);

        complete(std::move(invocation), "concat of:\n" + readFile(manifest), callback);
    }

    void FakeEncoder::complete(Invocation invocation, std::string_view content, const OnDoneCallback& callback)
    {
        const bool fail{ _failingInvocation && *_failingInvocation == _invocations.size() };

        // a failing encoder may leave a partial output behind
        writeFile(invocation.output, fail ? "partial" : content);
        _invocations.push_back(std::move(invocation));

        if (fail)
            callback(EncodeOutcome{ .success = false, .exitCode = 1, .diagnostic = "Invalid data found when processing input\n" });
        else
            callback(EncodeOutcome{ .success = true, .exitCode = 0, .diagnostic = {} });
    }
} // namespace clipper::clipping::tests
