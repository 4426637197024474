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

#ifndef SYMREG_STATS_H
#define SYMREG_STATS_H

#include <symreg/fwdecl.h>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>

namespace symreg
{
    /**
     * Summary of one evaluated generation. Fitness values may be infinite when individuals failed to evaluate, in which case
     * the mean is infinite too.
     */
    struct generation_stats_t
    {
        size_t generation = 0;
        double best_fitness = std::numeric_limits<double>::infinity();
        double mean_fitness = std::numeric_limits<double>::infinity();
        double worst_fitness = std::numeric_limits<double>::infinity();
        // hits of the best individual
        i64 best_hits = 0;
        // rendered form of the best individual
        std::string best_expression;
        size_t population_size = 0;
        // individuals whose fitness is finite
        size_t valid_individuals = 0;

        [[nodiscard]] std::string to_string() const
        {
            std::stringstream ss;
            ss << *this;
            return ss.str();
        }

        friend std::ostream& operator<<(std::ostream& out, const generation_stats_t& stats)
        {
            return out << "generation " << stats.generation << ": best " << stats.best_fitness << " mean " << stats.mean_fitness << " worst "
                << stats.worst_fitness << " (" << stats.valid_individuals << "/" << stats.population_size << " valid) " << stats.best_expression;
        }
    };
}

#endif //SYMREG_STATS_H
