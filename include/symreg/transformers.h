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

#ifndef SYMREG_TRANSFORMERS_H
#define SYMREG_TRANSFORMERS_H

#include <symreg/fwdecl.h>
#include <symreg/tree.h>
#include <symreg/generators.h>
#include <functional>
#include <optional>
#include <utility>

namespace symreg
{
    class crossover_t
    {
    public:
        struct config_t
        {
            // number of times crossover will try to find a pair of points which keeps both children within the depth limit
            u32 max_crossover_tries = 10;

            config_t& set_max_crossover_tries(const u32 tries)
            {
                max_crossover_tries = tries;
                return *this;
            }
        };

        explicit crossover_t(const config_t& config): config(config)
        {
        }

        /**
         * Apply crossover to a set of parents. Note: c1 and c2 are already filled with their respective parent's nodes.
         * @return true if the crossover succeeded. on false the children are discarded
         */
        virtual bool apply(random_t& random, const tree_t& p1, const tree_t& p2, tree_t& c1, tree_t& c2, size_t max_depth) = 0;

        /**
         * With probability rate recombines the parents, otherwise returns copies of them with their fitness intact.
         * Children which were changed have no cached fitness. A failed recombination also returns the copies.
         */
        std::pair<individual_t, individual_t> crossover(random_t& random, const individual_t& p1, const individual_t& p2, double rate,
                                                        size_t max_depth);

        virtual ~crossover_t() = default;

    protected:
        config_t config;
    };

    /**
     * Swaps the subtrees rooted at two uniformly chosen nodes, one in each parent.
     */
    class subtree_crossover_t : public crossover_t
    {
    public:
        struct crossover_point_t
        {
            tree_t::subtree_point_t p1_crossover_point;
            tree_t::subtree_point_t p2_crossover_point;
        };

        subtree_crossover_t(): crossover_t(config_t{})
        {
        }

        explicit subtree_crossover_t(const config_t& config): crossover_t(config)
        {
        }

        [[nodiscard]] static crossover_point_t get_crossover_point(random_t& random, const tree_t& c1, const tree_t& c2);

        bool apply(random_t& random, const tree_t& p1, const tree_t& p2, tree_t& c1, tree_t& c2, size_t max_depth) override;

        ~subtree_crossover_t() override = default;
    };

    class mutation_t
    {
    public:
        struct config_t
        {
            // replacement subtrees are never deeper than this, nor deep enough to push the tree over its limit
            size_t replacement_max_depth = 3;
            // how many times we redraw a replacement which is identical to the subtree it replaces
            u32 max_mutation_tries = 10;

            std::reference_wrapper<tree_generator_t> generator;

            config_t(tree_generator_t& generator): generator(generator) // NOLINT
            {
            }

            config_t();

            config_t& set_replacement_max_depth(const size_t depth)
            {
                replacement_max_depth = depth;
                return *this;
            }

            config_t& set_max_mutation_tries(const u32 tries)
            {
                max_mutation_tries = tries;
                return *this;
            }
        };

        mutation_t() = default;

        explicit mutation_t(const config_t& config): config(config)
        {
        }

        /**
         * Note: c is already a copy of p.
         * @return true if c was changed
         */
        virtual bool apply(random_t& random, const tree_t& p, tree_t& c, size_t max_depth);

        /**
         * With probability rate returns a changed copy of the individual (with no cached fitness), otherwise an unchanged copy.
         */
        individual_t mutate(random_t& random, const individual_t& individual, double rate, size_t max_depth);

        // replaces the subtree at node with a fresh one which keeps the tree within max_depth
        void mutate_point(random_t& random, tree_t& c, tree_t::subtree_point_t node, size_t max_depth) const;

        virtual ~mutation_t() = default;

    protected:
        config_t config;
    };

    /**
     * Changes a single node in place. Functions get a different operator, constants a different value and the variable becomes
     * a constant. The shape and depth of the tree never change.
     */
    class point_mutation_t : public mutation_t
    {
    public:
        point_mutation_t() = default;

        explicit point_mutation_t(const generator_config_t& terminals): terminals(terminals)
        {
        }

        bool apply(random_t& random, const tree_t& p, tree_t& c, size_t max_depth) final;

    private:
        generator_config_t terminals;
    };
}

#endif //SYMREG_TRANSFORMERS_H
