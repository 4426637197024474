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
#include <symreg/config.h>
#include <blt/parse/argparse_v2.h>
#include <cmath>
#include <string>

namespace symreg
{
    // default static references for mutation, crossover, and initializer
    // it's also to allow for quick setup of a gp program if you don't care how crossover or mutation is handled
    static mutation_t s_mutator;
    static subtree_crossover_t s_crossover;
    static grow_initializer_t s_init;

    prog_config_t::prog_config_t(): mutator(s_mutator), crossover(s_crossover), pop_initializer(s_init)
    {
    }

    prog_config_t::prog_config_t(const std::reference_wrapper<population_initializer_t>& popInitializer):
        mutator(s_mutator), crossover(s_crossover), pop_initializer(popInitializer)
    {
    }

    namespace
    {
        template <typename T>
        std::optional<config_error_t> check_range(const std::string_view parameter, const T value, const T min, const T max)
        {
            // written so that NaN fails the check
            if (!(value >= min && value <= max))
                return config_error_t{
                    errors::config::parameter_out_of_range_t{parameter, static_cast<double>(value), static_cast<double>(min), static_cast<double>(max)}
                };
            return {};
        }
    }

    std::optional<config_error_t> prog_config_t::validate() const
    {
        if (auto err = check_range("population_size", population_size, bounds::min_population_size, bounds::max_population_size))
            return err;
        if (auto err = check_range("max_depth", max_depth, bounds::min_max_depth, bounds::max_max_depth))
            return err;
        if (auto err = check_range("tournament_size", tournament_size, bounds::min_tournament_size, bounds::max_tournament_size))
            return err;
        if (auto err = check_range("crossover_rate", crossover_rate, bounds::min_crossover_rate, bounds::max_crossover_rate))
            return err;
        if (auto err = check_range("mutation_rate", mutation_rate, bounds::min_mutation_rate, bounds::max_mutation_rate))
            return err;
        if (auto err = check_range("generations", generations, bounds::min_generations, bounds::max_generations))
            return err;
        if (!std::isfinite(fitness_tolerance) || fitness_tolerance < 0)
            return config_error_t{errors::config::invalid_parameter_t{"fitness_tolerance", "must be finite and not negative"}};
        if (evaluation_size == 0)
            return config_error_t{errors::config::invalid_parameter_t{"evaluation_size", "threads must claim at least one individual at a time"}};
        return {};
    }

    std::tuple<prog_config_t, u64> create_config_from_args(const int argc, const char** argv)
    {
        blt::argparse::argument_parser_t parser;
        parser.with_help();
        parser.add_flag("--seed", "-s").set_dest("seed").set_default(static_cast<u64>(691)).as_type<u64>().set_help(
            "Seed for the random number generator. Runs with the same seed and parameters are identical.");
        parser.add_flag("--population_size", "-p").set_dest("population_size").set_default(100u).as_type<u32>().set_help("The size of the population");
        parser.add_flag("--max_depth", "-d").set_dest("max_depth").set_default(6u).as_type<u32>().set_help(
            "The maximum depth of any tree, counted in edges from the root");
        parser.add_flag("--tournament_size", "-k").set_dest("tournament_size").set_default(3u).as_type<u32>().set_help(
            "How many individuals compete in each tournament");
        parser.add_flag("--crossover_rate", "-c").set_dest("crossover_rate").set_default(0.8).as_type<double>().set_help("The rate of crossover");
        parser.add_flag("--mutation_rate", "-m").set_dest("mutation_rate").set_default(0.2).as_type<double>().set_help("The rate of mutation");
        parser.add_flag("--max_generations", "-g").set_dest("max_generations").set_default(50u).as_type<u32>().set_help(
            "The maximum number of generations to run");
        parser.add_flag("--fitness_tolerance").set_dest("fitness_tolerance").set_default(0.001).as_type<double>().set_help(
            "The run stops early once the best fitness drops below this");
        parser.add_flag("--threads", "-t").set_dest("threads").set_default(0u).as_type<u32>().set_help(
            "The number of threads to use, 0 uses every hardware thread");

        const auto args = parser.parse(argc, argv);

        auto config = prog_config_t().set_pop_size(args.get<u32>("population_size"))
                                     .set_max_depth(args.get<u32>("max_depth"))
                                     .set_tournament_size(args.get<u32>("tournament_size"))
                                     .set_crossover_rate(args.get<double>("crossover_rate"))
                                     .set_mutation_rate(args.get<double>("mutation_rate"))
                                     .set_generations(args.get<u32>("max_generations"))
                                     .set_fitness_tolerance(args.get<double>("fitness_tolerance"))
                                     .set_thread_count(args.get<u32>("threads"));

        return {config, args.get<u64>("seed")};
    }
}
