/*
 *  <Short Description>
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
#include <symreg/program.h>
#include <blt/logging/logging.h>
#include <blt/std/assert.h>
#include <algorithm>
#include <limits>
#include <thread>

namespace symreg
{
    gp_program::gp_program(const u64 seed): gp_program([seed] { return seed; })
    {
    }

    gp_program::gp_program(const u64 seed, const prog_config_t& config): gp_program([seed] { return seed; }, config)
    {
    }

    gp_program::gp_program(std::function<u64()> seed_func): gp_program(std::move(seed_func), prog_config_t{})
    {
    }

    gp_program::gp_program(std::function<u64()> seed_func, const prog_config_t& config): seed_func(std::move(seed_func)), config(config),
                                                                                          random(this->seed_func())
    {
    }

    state_error_t gp_program::reject(const std::string_view operation) const
    {
        const state_error_t error{operation, state};
        BLT_WARN("Rejected: {}", errors::to_string(error));
        return error;
    }

    std::optional<program_error_t> gp_program::configure(const prog_config_t& new_config)
    {
        if (run_in_progress())
            return program_error_t{reject("configure")};
        if (auto error = new_config.validate())
        {
            BLT_WARN("Rejected configuration: {}", errors::to_string(*error));
            return program_error_t{*error};
        }
        config = new_config;
        BLT_DEBUG("Configured population {} depth {} tournament {} crossover {:0.6f} mutation {:0.6f} generations {}",
                  config.population_size, config.max_depth, config.tournament_size, config.crossover_rate, config.mutation_rate,
                  config.generations);
        return {};
    }

    std::optional<state_error_t> gp_program::set_fitness_function(const fitness_function_t& function)
    {
        if (run_in_progress())
            return reject("set the fitness function");
        fitness_function = function;
        return {};
    }

    std::optional<state_error_t> gp_program::start()
    {
        switch (state)
        {
        case run_state_t::IDLE:
            if (auto error = config.validate())
            {
                // only reachable when a config was given directly to the constructor
                BLT_WARN("Cannot start with an invalid configuration: {}", errors::to_string(*error));
                return reject("start");
            }
            create_initial_population();
            state = run_state_t::RUNNING;
            BLT_INFO("Starting run with {} individuals for {} generations", config.population_size, config.generations);
            return {};
        case run_state_t::PAUSED:
            state = run_state_t::RUNNING;
            BLT_DEBUG("Resuming at generation {}", current_generation);
            return {};
        default:
            return reject("start");
        }
    }

    std::optional<state_error_t> gp_program::pause()
    {
        if (state != run_state_t::RUNNING)
            return reject("pause");
        state = run_state_t::PAUSED;
        BLT_DEBUG("Paused at generation {}", current_generation);
        return {};
    }

    std::optional<state_error_t> gp_program::stop()
    {
        if (!run_in_progress())
            return reject("stop");
        state = run_state_t::STOPPED;
        current_pop.clear();
        selection.reset();
        BLT_INFO("Stopped at generation {}", current_generation);
        return {};
    }

    void gp_program::reset()
    {
        state = run_state_t::IDLE;
        current_generation = 0;
        current_pop.clear();
        selection.reset();
        history.clear();
        best_individual.reset();
        random.set_seed(seed_func());
        BLT_DEBUG("Reset");
    }

    size_t gp_program::get_thread_count() const
    {
        if (config.threads == 0)
            return std::max(1u, std::thread::hardware_concurrency());
        return config.threads;
    }

    void gp_program::create_initial_population()
    {
        current_generation = 0;
        history.clear();
        best_individual.reset();
        selection = std::make_unique<select_tournament_t>(config.tournament_size);
        current_pop = config.pop_initializer.get().generate({random, config.population_size, config.max_depth});
        BLT_ASSERT_MSG(current_pop.size() == config.population_size, "Initializer created the wrong number of individuals!");
    }

    void gp_program::evaluate_fitness_internal(std::atomic_size_t& evaluation_left)
    {
        while (evaluation_left > 0)
        {
            size_t size = 0;
            size_t begin = 0;
            size_t end = evaluation_left.load(std::memory_order_relaxed);
            do
            {
                size = std::min(end, config.evaluation_size);
                begin = end - size;
            }
            while (!evaluation_left.compare_exchange_weak(end, end - size, std::memory_order_relaxed, std::memory_order_relaxed));
            for (size_t i = begin; i < end; i++)
            {
                auto& ind = current_pop[i];
                if (!ind.fitness.evaluated)
                    fitness_function.evaluate(ind);
            }
        }
    }

    void gp_program::evaluate_fitness()
    {
        std::atomic_size_t evaluation_left{current_pop.size()};
        const auto thread_count = std::min(get_thread_count(), std::max<size_t>(1, current_pop.size() / config.evaluation_size));

        std::vector<std::thread> threads;
        threads.reserve(thread_count - 1);
        for (size_t i = 1; i < thread_count; i++)
            threads.emplace_back([this, &evaluation_left]() { evaluate_fitness_internal(evaluation_left); });

        evaluate_fitness_internal(evaluation_left);

        for (auto& thread : threads)
            thread.join();
    }

    generation_stats_t gp_program::compute_stats()
    {
        generation_stats_t stats;
        stats.generation = current_generation;
        stats.population_size = current_pop.size();

        double overall = 0;
        double worst = -std::numeric_limits<double>::infinity();
        for (const auto& ind : current_pop)
        {
            overall += ind.fitness.standardized_fitness;
            worst = std::max(worst, ind.fitness.standardized_fitness);
            if (ind.fitness.is_finite())
                stats.valid_individuals++;
        }

        const auto& best = current_pop[current_pop.best_index()];
        stats.best_fitness = best.fitness.standardized_fitness;
        stats.best_hits = best.fitness.hits;
        stats.mean_fitness = overall / static_cast<double>(current_pop.size());
        stats.worst_fitness = worst;
        stats.best_expression = best.tree.to_string();

        best_individual.emplace(best);
        return stats;
    }

    void gp_program::create_next_generation()
    {
        auto& crossover = config.crossover.get();
        auto& mutator = config.mutator.get();

        population_t next_pop;
        auto& next = next_pop.get_individuals();
        next.reserve(config.population_size);

        // the best individual is carried over untouched, keeping its fitness
        next.emplace_back(current_pop[current_pop.best_index()]);

        while (next.size() < config.population_size)
        {
            const auto& p1 = selection->select(random, current_pop);
            const auto& p2 = selection->select(random, current_pop);

            auto [c1, c2] = crossover.crossover(random, p1, p2, config.crossover_rate, config.max_depth);

            next.push_back(mutator.mutate(random, c1, config.mutation_rate, config.max_depth));
            if (next.size() < config.population_size)
                next.push_back(mutator.mutate(random, c2, config.mutation_rate, config.max_depth));
        }

        current_pop = std::move(next_pop);
    }

    blt::expected<generation_stats_t, state_error_t> gp_program::step()
    {
        if (state != run_state_t::RUNNING)
            return blt::unexpected<state_error_t>(reject("step"));

        evaluate_fitness();
        auto stats = compute_stats();
        history.push_back(stats);
        BLT_TRACE("Generation {}: best {:0.6f} mean {:0.6f} worst {:0.6f} valid {}/{} '{}'", stats.generation, stats.best_fitness,
                  stats.mean_fitness, stats.worst_fitness, stats.valid_individuals, stats.population_size, stats.best_expression);

        if (current_generation + 1 >= config.generations || stats.best_fitness < config.fitness_tolerance)
        {
            state = run_state_t::COMPLETED;
            BLT_INFO("Run completed after {} generations with fitness {:0.6f}: {}", current_generation + 1, stats.best_fitness,
                     stats.best_expression);
            return stats;
        }

        create_next_generation();
        current_generation++;
        return stats;
    }

    blt::expected<std::vector<generation_stats_t>, state_error_t> gp_program::run()
    {
        if (state != run_state_t::RUNNING)
        {
            if (auto error = start())
                return blt::unexpected<state_error_t>(*error);
        }

        while (state == run_state_t::RUNNING)
        {
            auto result = step();
            if (!result.has_value())
                return blt::unexpected<state_error_t>(result.error());
        }
        return history;
    }

    std::optional<std::string> gp_program::get_best_expression() const
    {
        if (!best_individual)
            return {};
        return best_individual->tree.to_string();
    }

    std::optional<exported_node_t> gp_program::export_best_tree() const
    {
        if (!best_individual)
            return {};
        return best_individual->tree.export_tree();
    }
}
