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
#include <symreg/generators.h>
#include <symreg/random.h>
#include <blt/logging/logging.h>
#include <algorithm>
#include <stack>

namespace symreg
{
    struct stack
    {
        node_type_t kind;
        size_t depth;
    };

    operator_t random_operator(random_t& random)
    {
        return random.select(all_operators);
    }

    node_t random_constant(random_t& random, const generator_config_t& config)
    {
        return node_t::constant(static_cast<double>(random.get_i64_inclusive(config.constant_min, config.constant_max)));
    }

    node_t random_terminal(random_t& random, const generator_config_t& config)
    {
        if (random.choice(config.variable_chance))
            return node_t::variable();
        return random_constant(random, config);
    }

    tree_t grow_generator_t::generate(const generator_arguments& args)
    {
        std::stack<stack> tree_generator;
        tree_t tree;

        const auto pick = [this, &args](const size_t depth)
        {
            if (depth >= args.max_depth)
                return node_type_t::CONSTANT;
            if (depth == 0 && config.function_root)
                return node_type_t::FUNCTION;
            return args.random.choice(config.terminal_chance) ? node_type_t::CONSTANT : node_type_t::FUNCTION;
        };

        tree_generator.push({pick(0), 0});

        while (!tree_generator.empty())
        {
            auto top = tree_generator.top();
            tree_generator.pop();

            // the children are identically distributed, so the order they come off the stack does not matter
            if (top.kind == node_type_t::FUNCTION)
            {
                tree.get_nodes().push_back(node_t::function(random_operator(args.random)));
                tree_generator.push({pick(top.depth + 1), top.depth + 1});
                tree_generator.push({pick(top.depth + 1), top.depth + 1});
            }
            else
                tree.get_nodes().push_back(random_terminal(args.random, config));
        }

        return tree;
    }

    population_t grow_initializer_t::generate(const initializer_arguments& args)
    {
        population_t pop;

        for (size_t i = 0; i < args.size; i++)
            pop.get_individuals().emplace_back(grow.generate(args.to_gen_args()));

        return pop;
    }

    population_t ramped_initializer_t::generate(const initializer_arguments& args)
    {
        population_t pop;

        const auto lower = std::min(min_depth, args.max_depth);
        for (size_t i = 0; i < args.size; i++)
        {
            const auto depth = static_cast<size_t>(args.random.get_u64(lower, args.max_depth + 1));
            pop.get_individuals().emplace_back(grow.generate({args.random, depth}));
        }

        return pop;
    }

    population_t generate_population(random_t& random, const size_t size, const size_t max_depth)
    {
        grow_initializer_t initializer;
        return initializer.generate({random, size, max_depth});
    }
}
