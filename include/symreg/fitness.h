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

#ifndef SYMREG_FITNESS_H
#define SYMREG_FITNESS_H

#include <symreg/fwdecl.h>
#include <symreg/tree.h>
#include <functional>
#include <vector>

namespace symreg
{
    /**
     * Scores a tree by the sum of absolute errors against a target function over a fixed set of test points.
     * Lower is better and 0 is a perfect fit. A tree which fails to evaluate at any test point scores +infinity.
     */
    class fitness_function_t
    {
    public:
        using target_t = std::function<double(double)>;

        // a test point counts as a hit when its absolute error is at most this
        static constexpr double hit_threshold = 0.01;

        /**
         * x*x + 3x + 2 over the integers -10..10
         */
        fitness_function_t();

        fitness_function_t(target_t target, std::vector<double> test_points);

        [[nodiscard]] double evaluate(const tree_t& tree) const;

        /**
         * Evaluates the tree and stores the error and hit count into the individual's cached fitness.
         */
        void evaluate(individual_t& individual) const;

        double operator()(const tree_t& tree) const
        {
            return evaluate(tree);
        }

        [[nodiscard]] double target(const double x) const
        {
            return m_target(x);
        }

        [[nodiscard]] const std::vector<double>& get_test_points() const
        {
            return m_test_points;
        }

        static double default_target(double x);

        static std::vector<double> default_test_points();

    private:
        [[nodiscard]] fitness_t compute(const tree_t& tree) const;

        target_t m_target;
        std::vector<double> m_test_points;
        // target values at each test point, computed once
        std::vector<double> m_expected;
    };
}

#endif //SYMREG_FITNESS_H
