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
#include <symreg/fitness.h>
#include <symreg/evaluator.h>
#include <limits>
#include <cmath>

namespace symreg
{
    fitness_function_t::fitness_function_t(): fitness_function_t(default_target, default_test_points())
    {
    }

    fitness_function_t::fitness_function_t(target_t target, std::vector<double> test_points): m_target(std::move(target)),
                                                                                              m_test_points(std::move(test_points))
    {
        m_expected.reserve(m_test_points.size());
        for (const auto x : m_test_points)
            m_expected.push_back(m_target(x));
    }

    double fitness_function_t::default_target(const double x)
    {
        return x * x + 3 * x + 2;
    }

    std::vector<double> fitness_function_t::default_test_points()
    {
        std::vector<double> points;
        for (i32 x = -10; x <= 10; x++)
            points.push_back(static_cast<double>(x));
        return points;
    }

    fitness_t fitness_function_t::compute(const tree_t& tree) const
    {
        fitness_t fitness;
        double error = 0;
        i64 hits = 0;
        for (size_t i = 0; i < m_test_points.size(); i++)
        {
            auto result = symreg::evaluate(tree, m_test_points[i]);
            if (!result.has_value())
            {
                fitness.set(std::numeric_limits<double>::infinity(), 0);
                return fitness;
            }
            const auto diff = std::abs(result.value() - m_expected[i]);
            if (diff <= hit_threshold)
                hits++;
            error += diff;
        }
        // a sum of finite errors can still overflow
        if (!std::isfinite(error))
            error = std::numeric_limits<double>::infinity();
        fitness.set(error, hits);
        return fitness;
    }

    double fitness_function_t::evaluate(const tree_t& tree) const
    {
        return compute(tree).standardized_fitness;
    }

    void fitness_function_t::evaluate(individual_t& individual) const
    {
        individual.fitness = compute(individual.tree);
    }
}
