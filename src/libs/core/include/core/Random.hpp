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

#include <cstdint>
#include <random>

namespace clipper::core::random
{
    using RandGenerator = std::mt19937_64;

    // thread local, seeded from std::random_device
    RandGenerator& getRandGenerator();

    template<typename T>
    T getRandom(T min, T max)
    {
        std::uniform_int_distribution<T> dist{ min, max };
        return dist(getRandGenerator());
    }
} // namespace clipper::core::random
