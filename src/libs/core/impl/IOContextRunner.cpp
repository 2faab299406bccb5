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

#include "core/IOContextRunner.hpp"

#include <cstdlib>
#include <string>

#include "core/ILogger.hpp"

namespace clipper::core
{
    IOContextRunner::IOContextRunner(boost::asio::io_context& ioContext, std::size_t threadCount, std::string_view name)
        : _ioContext{ ioContext }
        , _work{ boost::asio::make_work_guard(ioContext) }
    {
        CLIPPER_LOG(UTILS, INFO, "Starting IO context '" << name << "' with " << threadCount << " threads...");

        for (std::size_t i{}; i < threadCount; ++i)
        {
            _threads.emplace_back([this] {
                try
                {
                    _ioContext.run();
                }
                catch (const std::exception& e)
                {
                    CLIPPER_LOG(UTILS, FATAL, "Exception caught in IO context: " << e.what());
                    std::abort();
                }
            });
        }
    }

    void IOContextRunner::stop()
    {
        CLIPPER_LOG(UTILS, DEBUG, "Stopping IO context...");
        _work.reset();
        _ioContext.stop();
        CLIPPER_LOG(UTILS, DEBUG, "IO context stopped!");
    }

    IOContextRunner::~IOContextRunner()
    {
        stop();

        for (std::thread& t : _threads)
            t.join();
    }
} // namespace clipper::core
