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

#ifndef SYMREG_PROGRAM_H
#define SYMREG_PROGRAM_H

#include <cstddef>
#include <functional>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <blt/std/types.h>
#include <blt/std/expected.h>
#include <symreg/fwdecl.h>
#include <symreg/errors.h>
#include <symreg/tree.h>
#include <symreg/random.h>
#include <symreg/config.h>
#include <symreg/fitness.h>
#include <symreg/selection.h>
#include <symreg/stats.h>

namespace symreg
{
    /**
     * A single symbolic regression run. The run moves through IDLE -> RUNNING -> {PAUSED, STOPPED, COMPLETED}; PAUSED resumes to
     * RUNNING and both STOPPED and COMPLETED need a reset() to get back to IDLE. Operations not allowed in the current state are
     * rejected with an error and change nothing.
     *
     * The program is advanced one generation at a time with step(). It never schedules itself, see driver_t for paced runs.
     */
    class gp_program
    {
    public:
        /**
         * @param seed seed for the program's random engine. programs seeded the same way make the same decisions
         */
        explicit gp_program(u64 seed);

        gp_program(u64 seed, const prog_config_t& config);

        /**
         * @param seed_func function which provides the seed. it is called again on every reset, so returning a new value
         * each time gives every run after a reset its own random stream
         */
        explicit gp_program(std::function<u64()> seed_func);

        gp_program(std::function<u64()> seed_func, const prog_config_t& config);

        gp_program(const gp_program&) = delete;

        gp_program& operator=(const gp_program&) = delete;

        /**
         * Validates and stores the config. It is used by the next run started from IDLE.
         * Rejected while a run is in progress (RUNNING or PAUSED).
         */
        std::optional<program_error_t> configure(const prog_config_t& new_config);

        /**
         * Replaces the fitness function. Rejected while a run is in progress (RUNNING or PAUSED).
         */
        std::optional<state_error_t> set_fitness_function(const fitness_function_t& function);

        /**
         * IDLE: creates generation 0 and starts running. PAUSED: resumes with the current population.
         */
        std::optional<state_error_t> start();

        std::optional<state_error_t> pause();

        /**
         * Ends a run in progress and discards its population. The statistics stay available until reset().
         */
        std::optional<state_error_t> stop();

        /**
         * Discards the population and statistics and returns to IDLE. Always succeeds.
         */
        void reset();

        /**
         * Evaluates the current generation, records its statistics and either completes the run or breeds the next generation.
         * Only valid while RUNNING.
         */
        blt::expected<generation_stats_t, state_error_t> step();

        /**
         * Starts the run if needed and steps until it is no longer RUNNING.
         * @return statistics for every generation of the run
         */
        blt::expected<std::vector<generation_stats_t>, state_error_t> run();

        [[nodiscard]] run_state_t get_state() const
        {
            return state;
        }

        [[nodiscard]] size_t get_current_generation() const
        {
            return current_generation;
        }

        [[nodiscard]] const std::vector<generation_stats_t>& get_history() const
        {
            return history;
        }

        // best individual of the most recently evaluated generation
        [[nodiscard]] const std::optional<individual_t>& get_best_individual() const
        {
            return best_individual;
        }

        [[nodiscard]] std::optional<std::string> get_best_expression() const;

        [[nodiscard]] std::optional<exported_node_t> export_best_tree() const;

        [[nodiscard]] const population_t& get_current_pop() const
        {
            return current_pop;
        }

        [[nodiscard]] const prog_config_t& get_config() const
        {
            return config;
        }

        [[nodiscard]] const fitness_function_t& get_fitness_function() const
        {
            return fitness_function;
        }

        [[nodiscard]] size_t get_thread_count() const;

    private:
        [[nodiscard]] bool run_in_progress() const
        {
            return state == run_state_t::RUNNING || state == run_state_t::PAUSED;
        }

        state_error_t reject(std::string_view operation) const;

        void create_initial_population();

        void evaluate_fitness();

        void evaluate_fitness_internal(std::atomic_size_t& evaluation_left);

        generation_stats_t compute_stats();

        void create_next_generation();

        std::function<u64()> seed_func;
        prog_config_t config;
        fitness_function_t fitness_function;
        random_t random;

        run_state_t state = run_state_t::IDLE;
        size_t current_generation = 0;
        population_t current_pop;
        std::unique_ptr<selection_t> selection;
        std::vector<generation_stats_t> history;
        std::optional<individual_t> best_individual;
    };
}

#endif //SYMREG_PROGRAM_H
