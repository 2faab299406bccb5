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
#include <functional>
#include <optional>
#include <string>

#include "core/LiteralString.hpp"

#include "Executor.hpp"
#include "PipelineContext.hpp"

namespace clipper::clipping
{
    class PipelineStep
    {
    public:
        using OnDoneCallback = std::function<void(bool success)>;

        PipelineStep(PipelineContext& context, OnDoneCallback callback)
            : _context{ context }
            , _onDoneCallback{ std::move(callback) } {}
        virtual ~PipelineStep() = default;
        PipelineStep(const PipelineStep&) = delete;
        PipelineStep& operator=(const PipelineStep&) = delete;

        virtual core::LiteralString getName() const = 0;
        virtual void run() = 0;

    protected:
        // Called by the step implementation when done
        void onDone()
        {
            _onDoneCallback(true);
        }

        // Called by the step implementation when it wants to abort the whole pipeline
        // The step must have removed its own partial output
        void onFailure(std::optional<std::size_t> segmentIndex, std::string diagnostic)
        {
            _context.failure = EncodeFailure{ .stepIndex = 0, .stepName = getName(), .segmentIndex = segmentIndex, .diagnostic = std::move(diagnostic) };
            _onDoneCallback(false);
        }

        PipelineContext& getContext()
        {
            return _context;
        }

        Executor& getExecutor()
        {
            return _context.executor;
        }

        IResourceTracker& getTracker()
        {
            return _context.tracker;
        }

        std::filesystem::path getFilePath(std::string_view filename, FileCategory category) const
        {
            return _context.tracker.getFilePath(filename, category);
        }

    private:
        PipelineContext& _context;
        OnDoneCallback _onDoneCallback;
    };
} // namespace clipper::clipping
