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
#include <symreg/evaluator.h>
#include <blt/logging/logging.h>
#include <array>

int main(const int argc, const char** argv)
{
    const auto [config, seed] = symreg::create_config_from_args(argc, argv);

    BLT_INFO("Evolving an approximation of x*x + 3x + 2 (seed {})", seed);

    symreg::gp_program program{seed};
    if (const auto error = program.configure(config))
    {
        BLT_ERROR("Invalid parameters: {}", symreg::errors::to_string(*error));
        return 1;
    }
    const auto result = program.run();
    if (!result.has_value())
    {
        BLT_ERROR("Run failed: {}", symreg::errors::to_string(result.error()));
        return 1;
    }

    for (const auto& stats : result.value())
    {
        if (stats.generation % 10 == 0 || stats.generation + 1 == result.value().size())
            BLT_INFO("Generation {}: best {:0.6f}, mean {:0.6f}", stats.generation, stats.best_fitness, stats.mean_fitness);
        else
            BLT_DEBUG("{}", stats.to_string());
    }

    const auto& best = program.get_best_individual();
    BLT_INFO("Best expression: {}", best->tree.to_string());
    BLT_INFO("Fitness: {:0.6f} ({} of {} points hit)", best->fitness.standardized_fitness, best->fitness.hits,
             program.get_fitness_function().get_test_points().size());

    constexpr std::array<double, 5> samples = {-5, -2, 0, 2, 5};
    for (const auto x : samples)
    {
        const auto value = symreg::evaluate(best->tree, x);
        const auto target = program.get_fitness_function().target(x);
        if (value.has_value())
            BLT_INFO("x = {:0.1f}\ttarget {:0.4f}\tevolved {:0.4f}", x, target, value.value());
        else
            BLT_INFO("x = {:0.1f}\ttarget {:0.4f}\tevolved expression does not evaluate", x, target);
    }

    return 0;
}
