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

#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "services/clipping/IEncoder.hpp"

namespace clipper::clipping::tests
{
    class TmpDirectory
    {
    public:
        TmpDirectory();
        ~TmpDirectory();
        TmpDirectory(const TmpDirectory&) = delete;
        TmpDirectory& operator=(const TmpDirectory&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

    private:
        std::filesystem::path _path;
    };

    void writeFile(const std::filesystem::path& path, std::string_view content);
    std::string readFile(const std::filesystem::path& path);

    // Records invocations and writes dummy outputs, synchronously
    class FakeEncoder : public IEncoder
    {
    public:
        struct Invocation
        {
            enum class Type
            {
                Cut,
                Concat,
            };

            Type type;
            std::filesystem::path input; // source or manifest
            std::optional<Segment> segment;
            std::filesystem::path output;
        };

        const std::vector<Invocation>& getInvocations() const { return _invocations; }

        // invocation index (whatever its type) that must fail
        void setFailingInvocation(std::size_t index) { _failingInvocation = index; }

        // called while the invocation is running, before its input is read
        using InvocationHook = std::function<void(const Invocation& invocation)>;
        void setInvocationHook(InvocationHook hook) { _invocationHook = std::move(hook); }

    private:
        void cut(const std::filesystem::path& input, const Segment& segment, const std::filesystem::path& output, OnDoneCallback callback) override;
        void concat(const std::filesystem::path& manifest, const std::filesystem::path& output, OnDoneCallback callback) override;

        void complete(Invocation invocation, std::string_view content, const OnDoneCallback& callback);

        std::vector<Invocation> _invocations;
        std::optional<std::size_t> _failingInvocation;
        InvocationHook _invocationHook;
    };
} // namespace clipper::clipping::tests
