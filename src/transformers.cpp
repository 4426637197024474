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
#include <symreg/transformers.h>
#include <symreg/random.h>
#include <blt/std/assert.h>
#include <blt/logging/logging.h>
#include <algorithm>

namespace symreg
{
    grow_generator_t grow_generator;

    mutation_t::config_t::config_t(): generator(grow_generator)
    {
    }

    std::pair<individual_t, individual_t> crossover_t::crossover(random_t& random, const individual_t& p1, const individual_t& p2,
                                                                 const double rate, const size_t max_depth)
    {
        std::pair<individual_t, individual_t> children{p1, p2};
        if (!random.choice(rate))
            return children;

        tree_t c1 = p1.tree;
        tree_t c2 = p2.tree;
        if (!apply(random, p1.tree, p2.tree, c1, c2, max_depth))
            return children;

        children.first.set_tree(std::move(c1));
        children.second.set_tree(std::move(c2));
        return children;
    }

    subtree_crossover_t::crossover_point_t subtree_crossover_t::get_crossover_point(random_t& random, const tree_t& c1, const tree_t& c2)
    {
        return {c1.select_subtree(random), c2.select_subtree(random)};
    }

    bool subtree_crossover_t::apply(random_t& random, const tree_t& p1, const tree_t& p2, tree_t& c1, tree_t& c2, const size_t max_depth)
    {
        for (u32 i = 0; i < config.max_crossover_tries; i++)
        {
            const auto [p1_point, p2_point] = get_crossover_point(random, c1, c2);

            // depth of the subtree arriving at a point plus the depth of that point bounds the new tree's depth
            const auto c1_depth = c1.depth_at(p1_point.pos) + c2.subtree_depth(p2_point);
            const auto c2_depth = c2.depth_at(p2_point.pos) + c1.subtree_depth(p1_point);
            if (c1_depth > max_depth || c2_depth > max_depth)
                continue;

            c1.swap_subtrees(p1_point, c2, p2_point);

#if BLT_DEBUG_LEVEL >= 2
            if (!c1.check() || !c2.check())
            {
                BLT_ERROR("Crossover produced an invalid tree! Parents were {} and {}", p1.to_string(), p2.to_string());
                BLT_ABORT("Tree Check Failed.");
            }
#else
            (void) p1;
            (void) p2;
#endif
            return true;
        }
        return false;
    }

    void mutation_t::mutate_point(random_t& random, tree_t& c, const tree_t::subtree_point_t node, const size_t max_depth) const
    {
        const auto depth = c.depth_at(node.pos);
        const auto limit = std::min(config.replacement_max_depth, max_depth > depth ? max_depth - depth : size_t{0});
        const auto replacement_depth = limit == 0 ? size_t{0} : static_cast<size_t>(random.get_u64(1, limit + 1));

        const auto replacement = config.generator.get().generate({random, replacement_depth});
        c.replace_subtree(node, replacement);
    }

    bool mutation_t::apply(random_t& random, const tree_t& p, tree_t& c, const size_t max_depth)
    {
        for (u32 i = 0; i < config.max_mutation_tries; i++)
        {
            const auto point = c.select_subtree(random);
            mutate_point(random, c, point, max_depth);
            if (c != p)
                return true;
        }
        return false;
    }

    individual_t mutation_t::mutate(random_t& random, const individual_t& individual, const double rate, const size_t max_depth)
    {
        individual_t child{individual};
        if (!random.choice(rate))
            return child;

        tree_t c = individual.tree;
        if (apply(random, individual.tree, c, max_depth))
            child.set_tree(std::move(c));
        return child;
    }

    bool point_mutation_t::apply(random_t& random, const tree_t&, tree_t& c, size_t)
    {
        const auto point = c.select_subtree(random);
        auto& node = c.get_nodes()[point.pos];

        switch (node.type)
        {
        case node_type_t::FUNCTION:
        {
            // one of the two other operators
            const auto offset = 1 + random.get_index(all_operators.size() - 1);
            const auto current = static_cast<size_t>(node.op);
            node.op = all_operators[(current + offset) % all_operators.size()];
            return true;
        }
        case node_type_t::CONSTANT:
            if (terminals.constant_max > terminals.constant_min)
            {
                node_t replacement = node;
                while (replacement == node)
                    replacement = random_constant(random, terminals);
                node = replacement;
            }
            else
                node = node_t::variable();
            return true;
        case node_type_t::VARIABLE:
            node = random_constant(random, terminals);
            return true;
        }
        return false;
    }
}
