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

#ifndef SYMREG_FWDECL_H
#define SYMREG_FWDECL_H

#include <blt/std/types.h>
#include <cstddef>

namespace symreg
{
    using std::size_t;
    using std::ptrdiff_t;
    using blt::u8;
    using blt::u32;
    using blt::u64;
    using blt::i32;
    using blt::i64;

    class gp_program;

    class random_t;

    struct node_t;

    class tree_t;

    struct fitness_t;

    struct individual_t;

    class population_t;

    class fitness_function_t;

    class tree_generator_t;

    class grow_generator_t;

    class population_initializer_t;

    class selection_t;

    class crossover_t;

    class mutation_t;

    struct prog_config_t;

    struct generation_stats_t;

    class driver_t;
}

#endif //SYMREG_FWDECL_H
