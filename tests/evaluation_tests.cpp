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
#include <symreg/evaluator.h>
#include <symreg/fitness.h>
#include <symreg/generators.h>
#include <symreg/random.h>
#include <symreg/tree.h>
#include <blt/logging/logging.h>
#include <blt/std/assert.h>
#include <cmath>

using namespace symreg;

const fitness_function_t fitness_function;

tree_t must_parse(const std::string_view str)
{
    auto tree = tree_t::parse(str);
    BLT_ASSERT_MSG(tree.has_value(), "Failed to parse test expression!");
    return *tree;
}

void basic_evaluation()
{
    BLT_INFO("Testing basic evaluation");
    BLT_ASSERT(evaluate(tree_t::make_variable(), 4).value() == 4);
    BLT_ASSERT(evaluate(tree_t::make_constant(-3), 4).value() == -3);
    BLT_ASSERT(evaluate(must_parse("(x - 10)"), 4).value() == -6);
    // operand order matters for subtraction
    BLT_ASSERT(evaluate(must_parse("(10 - x)"), 4).value() == 6);
    BLT_ASSERT(evaluate(must_parse("((x * x) - (2 * x))"), 3).value() == 3);

    const auto target = must_parse("((x * x) + ((3 * x) + 2))");
    for (i32 x = -10; x <= 10; x++)
    {
        const auto value = evaluate(target, x);
        BLT_ASSERT(value.has_value());
        BLT_ASSERT(value.value() == fitness_function_t::default_target(x));
    }
}

void deterministic_evaluation()
{
    BLT_INFO("Testing evaluation is deterministic");
    random_t random{5};
    const auto pop = generate_population(random, 50, 6);
    for (const auto& ind : pop)
    {
        for (const double x : {-2.5, 0.0, 7.0})
        {
            const auto a = evaluate(ind.tree, x);
            const auto b = evaluate(ind.tree, x);
            BLT_ASSERT(a.has_value() == b.has_value());
            if (a.has_value())
                BLT_ASSERT(a.value() == b.value());
        }
    }
}

void non_finite_evaluation()
{
    BLT_INFO("Testing non-finite results are reported");
    const auto huge = tree_t::make_constant(1e200);
    const auto overflow = tree_t::make_function(operator_t::MULTIPLY, huge, huge);
    const auto result = evaluate(overflow, 0);
    BLT_ASSERT(!result.has_value());
    BLT_ASSERT(result.error() == eval_error_t::NON_FINITE);

    // the overflow happens deep inside the tree and is still caught
    const auto nested = tree_t::make_function(operator_t::SUBTRACT, tree_t::make_function(operator_t::ADD, overflow, huge),
                                              tree_t::make_variable());
    BLT_ASSERT(!evaluate(nested, 1).has_value());

    // x * x already overflows at 1e200
    const auto x_squared = must_parse("(x * x)");
    BLT_ASSERT(!evaluate(tree_t::make_function(operator_t::MULTIPLY, x_squared, x_squared), 1e200).has_value());
}

void fitness_values()
{
    BLT_INFO("Testing fitness values");
    const auto perfect = must_parse("((x * x) + ((3 * x) + 2))");
    BLT_ASSERT(fitness_function.evaluate(perfect) == 0);

    // sum of (x + 1)^2 + 1 over -10..10
    BLT_ASSERT(fitness_function.evaluate(tree_t::make_variable()) == 812);
    // sum of |x * (x + 3)| over -10..10
    BLT_ASSERT(fitness_function.evaluate(tree_t::make_constant(2)) == 778);
    BLT_ASSERT(fitness_function(tree_t::make_constant(2)) == 778);

    individual_t ind{perfect};
    BLT_ASSERT(!ind.fitness.evaluated);
    fitness_function.evaluate(ind);
    BLT_ASSERT(ind.fitness.evaluated);
    BLT_ASSERT(ind.fitness.standardized_fitness == 0);
    BLT_ASSERT(ind.fitness.hits == 21);

    // the constant 2 is only right where x * (x + 3) is 0
    individual_t constant{tree_t::make_constant(2)};
    fitness_function.evaluate(constant);
    BLT_ASSERT(constant.fitness.hits == 2);
}

void infinite_fitness()
{
    BLT_INFO("Testing failing trees get infinite fitness");
    const auto huge = tree_t::make_constant(1e200);
    individual_t ind{tree_t::make_function(operator_t::MULTIPLY, huge, huge)};
    fitness_function.evaluate(ind);
    BLT_ASSERT(ind.fitness.evaluated);
    BLT_ASSERT(!ind.fitness.is_finite());
    BLT_ASSERT(std::isinf(ind.fitness.standardized_fitness) && ind.fitness.standardized_fitness > 0);
    BLT_ASSERT(ind.fitness.hits == 0);

    // only fails for large x, which is enough to fail the whole tree
    const auto x_squared = must_parse("(x * x)");
    const fitness_function_t wide{[](const double x) { return x; }, {1, 2, 1e200}};
    BLT_ASSERT(std::isinf(wide.evaluate(tree_t::make_function(operator_t::MULTIPLY, x_squared, x_squared))));
}

void custom_fitness()
{
    BLT_INFO("Testing custom targets");
    const fitness_function_t identity{[](const double x) { return x; }, {0, 1, 2}};
    BLT_ASSERT(identity.get_test_points().size() == 3);
    BLT_ASSERT(identity.evaluate(tree_t::make_variable()) == 0);
    BLT_ASSERT(identity.evaluate(tree_t::make_constant(1)) == 2);
    BLT_ASSERT(identity.target(5) == 5);
}

void random_fitness_not_negative()
{
    BLT_INFO("Testing fitness of random trees is never negative");
    random_t random{691};
    const auto pop = generate_population(random, 200, 8);
    for (const auto& ind : pop)
    {
        const auto fitness = fitness_function.evaluate(ind.tree);
        BLT_ASSERT(fitness >= 0);
        BLT_ASSERT(!std::isnan(fitness));
    }
}

int main()
{
    BLT_ASSERT(fitness_function.get_test_points().size() == 21);
    basic_evaluation();
    deterministic_evaluation();
    non_finite_evaluation();
    fitness_values();
    infinite_fitness();
    custom_fitness();
    random_fitness_not_negative();
    BLT_INFO("All evaluation tests passed");
}
