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
#include <symreg/tree.h>
#include <blt/logging/logging.h>
#include <blt/std/assert.h>
#include <blt/std/ranges.h>
#include <algorithm>
#include <cmath>

using namespace symreg;

void check_terminals(const tree_t& tree, const generator_config_t& config)
{
    for (const auto& node : tree.get_nodes())
    {
        if (node.type != node_type_t::CONSTANT)
            continue;
        BLT_ASSERT(node.value == std::trunc(node.value));
        BLT_ASSERT(node.value >= static_cast<double>(config.constant_min) && node.value <= static_cast<double>(config.constant_max));
    }
}

void population_shape()
{
    BLT_INFO("Testing generated populations have the requested size and depth");
    random_t random{691};
    for (size_t max_depth = 1; max_depth <= 10; max_depth++)
    {
        const auto pop = generate_population(random, 100, max_depth);
        BLT_ASSERT(pop.size() == 100);
        for (const auto& ind : pop)
        {
            BLT_ASSERT(ind.tree.check());
            BLT_ASSERT(ind.tree.depth() <= max_depth);
            BLT_ASSERT(ind.tree.get_node(0).is_function());
            BLT_ASSERT(!ind.fitness.evaluated);
            check_terminals(ind.tree, generator_config_t{});
        }
    }
}

void depth_zero()
{
    BLT_INFO("Testing a depth limit of zero gives lone terminals");
    random_t random{12};
    const auto pop = generate_population(random, 50, 0);
    for (const auto& ind : pop)
    {
        BLT_ASSERT(ind.tree.size() == 1);
        BLT_ASSERT(ind.tree.get_node(0).is_terminal());
    }
}

void generator_config()
{
    BLT_INFO("Testing generator configuration");
    random_t random{41};

    // only terminals, but the root is still forced to be a function
    grow_generator_t shallow{generator_config_t{}.set_terminal_chance(1)};
    for (size_t i = 0; i < 50; i++)
    {
        const auto tree = shallow.generate({random, 6});
        BLT_ASSERT(tree.size() == 3);
        BLT_ASSERT(tree.depth() == 1);
    }

    grow_generator_t lone{generator_config_t{}.set_terminal_chance(1).set_function_root(false)};
    for (size_t i = 0; i < 50; i++)
        BLT_ASSERT(lone.generate({random, 6}).size() == 1);

    // never a terminal above the limit, every tree is full
    grow_generator_t full{generator_config_t{}.set_terminal_chance(0)};
    for (size_t depth = 0; depth < 6; depth++)
    {
        const auto tree = full.generate({random, depth});
        BLT_ASSERT(tree.depth() == depth);
        BLT_ASSERT(tree.size() == (1ul << (depth + 1)) - 1);
    }

    const auto constants = generator_config_t{}.set_variable_chance(0).set_constant_range(-1, 1);
    grow_generator_t constant_only{constants};
    for (size_t i = 0; i < 50; i++)
    {
        const auto tree = constant_only.generate({random, 4});
        for (const auto& node : tree.get_nodes())
            BLT_ASSERT(node.type != node_type_t::VARIABLE);
        check_terminals(tree, constants);
    }
}

void ramped_population()
{
    BLT_INFO("Testing ramped initialisation");
    random_t random{1024};
    ramped_initializer_t initializer;
    const auto pop = initializer.generate({random, 200, 6});
    BLT_ASSERT(pop.size() == 200);

    size_t max_seen = 0;
    for (const auto& ind : pop)
    {
        BLT_ASSERT(ind.tree.check());
        BLT_ASSERT(ind.tree.depth() <= 6);
        max_seen = std::max(max_seen, ind.tree.depth());
    }
    BLT_ASSERT(max_seen > 2);
}

void reproducible()
{
    BLT_INFO("Testing generation is reproducible for a seed");
    random_t first{99};
    random_t second{99};
    const auto a = generate_population(first, 50, 6);
    const auto b = generate_population(second, 50, 6);
    for (const auto& [index, ind] : blt::enumerate(a))
        BLT_ASSERT(ind.tree == b[index].tree);
}

void operators_used()
{
    BLT_INFO("Testing every operator and terminal kind shows up");
    random_t random{7};
    bool seen[3] = {false, false, false};
    bool seen_variable = false;
    bool seen_constant = false;
    const auto pop = generate_population(random, 100, 5);
    for (const auto& ind : pop)
    {
        for (const auto& node : ind.tree.get_nodes())
        {
            if (node.is_function())
                seen[static_cast<size_t>(node.op)] = true;
            else if (node.type == node_type_t::VARIABLE)
                seen_variable = true;
            else
                seen_constant = true;
        }
    }
    BLT_ASSERT(seen[0] && seen[1] && seen[2]);
    BLT_ASSERT(seen_variable && seen_constant);
}

int main()
{
    population_shape();
    depth_zero();
    generator_config();
    ramped_population();
    reproducible();
    operators_used();
    BLT_INFO("All generator tests passed");
}
