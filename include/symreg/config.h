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

#ifndef SYMREG_CONFIG_H
#define SYMREG_CONFIG_H

#include <algorithm>
#include <functional>
#include <optional>
#include <thread>
#include <tuple>
#include <symreg/fwdecl.h>
#include <symreg/errors.h>
#include <symreg/generators.h>
#include <symreg/transformers.h>

namespace symreg
{
    struct prog_config_t
    {
        // inclusive limits accepted by validate()
        struct bounds
        {
            static constexpr size_t min_population_size = 20;
            static constexpr size_t max_population_size = 200;
            static constexpr size_t min_max_depth = 3;
            static constexpr size_t max_max_depth = 10;
            static constexpr size_t min_tournament_size = 2;
            static constexpr size_t max_tournament_size = 10;
            static constexpr double min_crossover_rate = 0;
            static constexpr double max_crossover_rate = 1;
            static constexpr double min_mutation_rate = 0;
            static constexpr double max_mutation_rate = 0.5;
            static constexpr size_t min_generations = 10;
            static constexpr size_t max_generations = 200;
        };

        size_t population_size = 100;
        size_t max_depth = 6;
        size_t tournament_size = 3;
        // chance that a selected pair of parents is recombined
        double crossover_rate = 0.8;
        // chance that each child is mutated
        double mutation_rate = 0.2;
        size_t generations = 50;
        // the run completes early once the best fitness drops below this
        double fitness_tolerance = 0.001;

        std::reference_wrapper<mutation_t> mutator;
        std::reference_wrapper<crossover_t> crossover;
        std::reference_wrapper<population_initializer_t> pop_initializer;

        // 0 runs one thread per hardware thread
        size_t threads = 1;
        // number of elements each thread should pull per execution. this is for granularity performance and can be optimized for better results!
        size_t evaluation_size = 4;

        // default config (grow init, subtree crossover and subtree mutation) or for buildering
        prog_config_t();

        // default config with a user specified initializer
        prog_config_t(const std::reference_wrapper<population_initializer_t>& popInitializer); // NOLINT

        /**
         * Checks every parameter against its accepted range.
         * @return the first parameter found to be invalid, or nothing if the config can be used for a run
         */
        [[nodiscard]] std::optional<config_error_t> validate() const;

        prog_config_t& set_pop_size(const size_t pop)
        {
            population_size = pop;
            return *this;
        }

        prog_config_t& set_max_depth(const size_t depth)
        {
            max_depth = depth;
            return *this;
        }

        prog_config_t& set_tournament_size(const size_t size)
        {
            tournament_size = size;
            return *this;
        }

        prog_config_t& set_crossover_rate(const double rate)
        {
            crossover_rate = rate;
            return *this;
        }

        prog_config_t& set_mutation_rate(const double rate)
        {
            mutation_rate = rate;
            return *this;
        }

        prog_config_t& set_generations(const size_t new_generations)
        {
            generations = new_generations;
            return *this;
        }

        prog_config_t& set_fitness_tolerance(const double tolerance)
        {
            fitness_tolerance = tolerance;
            return *this;
        }

        prog_config_t& set_crossover(crossover_t& ref)
        {
            crossover = {ref};
            return *this;
        }

        prog_config_t& set_mutation(mutation_t& ref)
        {
            mutator = {ref};
            return *this;
        }

        prog_config_t& set_initializer(population_initializer_t& ref)
        {
            pop_initializer = ref;
            return *this;
        }

        prog_config_t& set_thread_count(size_t t)
        {
            if (t == 0)
                t = std::max(1u, std::thread::hardware_concurrency());
            threads = t;
            return *this;
        }

        prog_config_t& set_evaluation_size(const size_t s)
        {
            evaluation_size = s;
            return *this;
        }
    };

    /**
     * Reads the run parameters from command line flags. Use --help to list them. Flags which are not given keep their defaults.
     * The result is not validated, pass it to gp_program::configure() or prog_config_t::validate().
     * @return the config and the seed to run it with
     */
    std::tuple<prog_config_t, u64> create_config_from_args(int argc, const char** argv);
}

#endif //SYMREG_CONFIG_H
