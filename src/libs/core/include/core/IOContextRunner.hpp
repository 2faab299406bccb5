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

#include <string_view>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace clipper::core
{
    class IOContextRunner
    {
    public:
        IOContextRunner(boost::asio::io_context& ioContext, std::size_t threadCount, std::string_view name);
        ~IOContextRunner();
        IOContextRunner(const IOContextRunner&) = delete;
        IOContextRunner& operator=(const IOContextRunner&) = delete;

        void stop();

    private:
        boost::asio::io_context& _ioContext;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> _work;
        std::vector<std::thread> _threads;
    };
} // namespace clipper::core
