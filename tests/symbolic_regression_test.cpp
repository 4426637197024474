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

using namespace symreg;

constexpr size_t TRIALS = 40;

const prog_config_t config = prog_config_t()
                             .set_pop_size(50)
                             .set_max_depth(5)
                             .set_tournament_size(3)
                             .set_crossover_rate(0.8)
                             .set_mutation_rate(0.2)
                             .set_generations(50);

int main()
{
    BLT_INFO("Evolving x*x + 3x + 2 over {} seeded trials", TRIALS);

    size_t improved_or_equal = 0;
    size_t strictly_improved = 0;
    size_t solved = 0;
    for (size_t trial = 0; trial < TRIALS; trial++)
    {
        gp_program program{691 + trial * 7919, config};
        const auto history = program.run();
        BLT_ASSERT(history.has_value());
        BLT_ASSERT(program.get_state() == run_state_t::COMPLETED);

        const auto& stats = history.value();
        const auto first = stats.front().best_fitness;
        const auto last = stats.back().best_fitness;
        if (last <= first)
            improved_or_equal++;
        if (last < first)
            strictly_improved++;
        if (last < config.fitness_tolerance)
            solved++;

        BLT_DEBUG("Trial {}: {:0.6f} -> {:0.6f} after {} generations, best {}", trial, first, last, stats.size(), stats.back().best_expression);
    }

    BLT_INFO("{} of {} trials did not get worse, {} improved and {} found the target exactly", improved_or_equal, TRIALS, strictly_improved,
             solved);
    BLT_ASSERT(improved_or_equal * 100 >= TRIALS * 95);
    // evolution has to do something on most runs
    BLT_ASSERT(strictly_improved * 2 >= TRIALS);
}
