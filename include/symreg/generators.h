#pragma once
/*
 *  Copyright (C) 2025  Brett Terpstra
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

#ifndef SYMREG_GENERATORS_H
#define SYMREG_GENERATORS_H

#include <symreg/fwdecl.h>
#include <symreg/tree.h>

namespace symreg
{
    struct generator_config_t
    {
        // chance that a node above the depth limit becomes a terminal
        double terminal_chance = 0.3;
        // chance that a terminal is the variable rather than a constant
        double variable_chance = 0.5;
        // constants are integers drawn from [constant_min, constant_max]
        i64 constant_min = -5;
        i64 constant_max = 5;
        // whether the root is always a function when the depth limit allows one
        bool function_root = true;

        generator_config_t& set_terminal_chance(const double chance)
        {
            terminal_chance = chance;
            return *this;
        }

        generator_config_t& set_variable_chance(const double chance)
        {
            variable_chance = chance;
            return *this;
        }

        generator_config_t& set_constant_range(const i64 min, const i64 max)
        {
            constant_min = min;
            constant_max = max;
            return *this;
        }

        generator_config_t& set_function_root(const bool value)
        {
            function_root = value;
            return *this;
        }
    };

    struct generator_arguments
    {
        random_t& random;
        size_t max_depth;
    };

    struct initializer_arguments
    {
        random_t& random;
        size_t size;
        size_t max_depth;

        [[nodiscard]] generator_arguments to_gen_args() const
        {
            return {random, max_depth};
        }
    };

    operator_t random_operator(random_t& random);

    node_t random_constant(random_t& random, const generator_config_t& config);

    node_t random_terminal(random_t& random, const generator_config_t& config);

    // base class for any kind of tree generator
    class tree_generator_t
    {
    public:
        virtual tree_t generate(const generator_arguments& args) = 0;

        virtual ~tree_generator_t() = default;
    };

    class grow_generator_t : public tree_generator_t
    {
    public:
        grow_generator_t() = default;

        explicit grow_generator_t(const generator_config_t& config): config(config)
        {
        }

        tree_t generate(const generator_arguments& args) final;

    private:
        generator_config_t config;
    };

    class population_initializer_t
    {
    public:
        virtual population_t generate(const initializer_arguments& args) = 0;

        virtual ~population_initializer_t() = default;
    };

    /**
     * Every tree is grown independently with the full depth limit.
     */
    class grow_initializer_t : public population_initializer_t
    {
    public:
        grow_initializer_t() = default;

        explicit grow_initializer_t(const generator_config_t& config): grow(config)
        {
        }

        population_t generate(const initializer_arguments& args) final;

    private:
        grow_generator_t grow;
    };

    /**
     * Every tree is grown with its own depth limit, drawn uniformly from [2, max_depth].
     */
    class ramped_initializer_t : public population_initializer_t
    {
    public:
        static constexpr size_t min_depth = 2;

        ramped_initializer_t() = default;

        explicit ramped_initializer_t(const generator_config_t& config): grow(config)
        {
        }

        population_t generate(const initializer_arguments& args) final;

    private:
        grow_generator_t grow;
    };

    /**
     * @return size independently grown trees, none deeper than max_depth
     */
    population_t generate_population(random_t& random, size_t size, size_t max_depth);
}

#endif //SYMREG_GENERATORS_H
