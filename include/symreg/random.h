#pragma once
/*
 *  Copyright (C) 2024  Brett Terpstra
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef SYMREG_RANDOM_H
#define SYMREG_RANDOM_H

#include <blt/std/types.h>
#include <blt/std/random.h>
#include <symreg/fwdecl.h>

namespace symreg
{
#define SYMREG_RANDOM_FUNCTION blt::random::murmur_random64
#define SYMREG_RANDOM_DOUBLE blt::random::murmur_double64

    /**
     * Seeded generator shared by every stochastic part of a run. A run seeded with the same value is fully reproducible,
     * which is what lets the tests drive whole runs deterministically.
     */
    class random_t
    {
    public:
        explicit random_t(const u64 seed): seed(seed)
        {
        }

        void set_seed(const u64 s)
        {
            seed = s;
        }

        // [min, max)
        i64 get_i64(const i64 min, const i64 max)
        {
            return SYMREG_RANDOM_FUNCTION(seed, min, max);
        }

        // [min, max)
        u64 get_u64(const u64 min, const u64 max)
        {
            return SYMREG_RANDOM_FUNCTION(seed, min, max);
        }

        // [min, max]
        i64 get_i64_inclusive(const i64 min, const i64 max)
        {
            return get_i64(min, max + 1);
        }

        // [0, size)
        size_t get_index(const size_t size)
        {
            return static_cast<size_t>(get_u64(0, size));
        }

        /**
         * @return true with probability cutoff. choice(0) is never true and choice(1) is always true.
         */
        bool choice(const double cutoff)
        {
            return SYMREG_RANDOM_DOUBLE(seed) < cutoff;
        }

        template <typename Container>
        const auto& select(const Container& container)
        {
            return container[get_index(container.size())];
        }

    private:
        u64 seed;
    };
}

#endif //SYMREG_RANDOM_H
