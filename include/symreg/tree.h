#pragma once
/*
 *  Copyright (C) 2024  Brett Terpstra
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

#ifndef SYMREG_TREE_H
#define SYMREG_TREE_H

#include <symreg/fwdecl.h>
#include <array>
#include <cmath>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace symreg
{
    enum class operator_t : u8
    {
        ADD,
        SUBTRACT,
        MULTIPLY
    };

    inline constexpr std::array<operator_t, 3> all_operators = {operator_t::ADD, operator_t::SUBTRACT, operator_t::MULTIPLY};

    std::string_view to_string(operator_t op);

    char to_symbol(operator_t op);

    inline double apply_operator(const operator_t op, const double a, const double b)
    {
        switch (op)
        {
        case operator_t::ADD:
            return a + b;
        case operator_t::SUBTRACT:
            return a - b;
        case operator_t::MULTIPLY:
            return a * b;
        }
        return std::numeric_limits<double>::quiet_NaN();
    }

    enum class node_type_t : u8
    {
        FUNCTION,
        VARIABLE,
        CONSTANT
    };

    /**
     * A single node of an expression tree. Functions always take exactly two children, which directly follow the node in
     * prefix order. Terminals (the variable and constants) take none.
     */
    struct node_t
    {
        node_type_t type = node_type_t::VARIABLE;
        operator_t op = operator_t::ADD;
        // only meaningful for constants
        double value = 0;

        static node_t function(const operator_t op)
        {
            return {node_type_t::FUNCTION, op, 0};
        }

        static node_t variable()
        {
            return {node_type_t::VARIABLE, operator_t::ADD, 0};
        }

        static node_t constant(const double value)
        {
            return {node_type_t::CONSTANT, operator_t::ADD, value};
        }

        [[nodiscard]] bool is_function() const
        {
            return type == node_type_t::FUNCTION;
        }

        [[nodiscard]] bool is_terminal() const
        {
            return type != node_type_t::FUNCTION;
        }

        [[nodiscard]] u32 argc() const
        {
            return is_function() ? 2 : 0;
        }

        friend bool operator==(const node_t& a, const node_t& b)
        {
            if (a.type != b.type)
                return false;
            if (a.type == node_type_t::FUNCTION)
                return a.op == b.op;
            if (a.type == node_type_t::CONSTANT)
                return a.value == b.value;
            return true;
        }

        friend bool operator!=(const node_t& a, const node_t& b)
        {
            return !(a == b);
        }
    };

    /**
     * Nested form of a tree, for consumers (like a renderer) which want to walk the structure instead of the prefix array.
     */
    struct exported_node_t
    {
        node_type_t type;
        // operator symbol, "x" or the printed constant
        std::string label;
        std::unique_ptr<exported_node_t> left;
        std::unique_ptr<exported_node_t> right;
    };

    /**
     * Expression tree stored in prefix order. The subtree rooted at any position is the contiguous range
     * [pos, find_endpoint(pos)), so copying, replacing and swapping subtrees are all range operations on a single vector.
     * A tree exclusively owns its nodes; copies are always deep.
     */
    class tree_t
    {
    public:
        struct child_t
        {
            ptrdiff_t start;
            // one past the end
            ptrdiff_t end;
        };

        struct subtree_point_t
        {
            ptrdiff_t pos;

            explicit subtree_point_t(const ptrdiff_t pos): pos(pos)
            {
            }
        };

        tree_t() = default;

        tree_t(const tree_t& copy) = default;

        tree_t(tree_t&& move) = default;

        tree_t& operator=(const tree_t& copy) = default;

        tree_t& operator=(tree_t&& move) = default;

        static tree_t make_variable();

        static tree_t make_constant(double value);

        static tree_t make_function(operator_t op, const tree_t& left, const tree_t& right);

        /**
         * Reads the fully parenthesised infix form produced by print(), for example "((x * x) + -3)".
         * @return the tree, or nothing if the string is not a complete expression
         */
        static std::optional<tree_t> parse(std::string_view expression);

        [[nodiscard]] size_t size() const
        {
            return nodes.size();
        }

        [[nodiscard]] bool empty() const
        {
            return nodes.empty();
        }

        [[nodiscard]] const node_t& get_node(const size_t pos) const
        {
            return nodes[pos];
        }

        [[nodiscard]] const std::vector<node_t>& get_nodes() const
        {
            return nodes;
        }

        // used by generators to emit nodes in prefix order
        std::vector<node_t>& get_nodes()
        {
            return nodes;
        }

        void clear()
        {
            nodes.clear();
        }

        /**
         * @return one past the last node of the subtree starting at start
         */
        [[nodiscard]] ptrdiff_t find_endpoint(ptrdiff_t start) const;

        [[nodiscard]] child_t get_subtree(const subtree_point_t point) const
        {
            return {point.pos, find_endpoint(point.pos)};
        }

        [[nodiscard]] size_t get_subtree_size(const subtree_point_t point) const
        {
            return static_cast<size_t>(find_endpoint(point.pos) - point.pos);
        }

        // number of edges on the longest root to leaf path. a single terminal has depth 0
        [[nodiscard]] size_t depth() const;

        // number of edges between the root and the node at pos
        [[nodiscard]] size_t depth_at(ptrdiff_t pos) const;

        [[nodiscard]] size_t subtree_depth(subtree_point_t point) const;

        /**
         * Selects a node uniformly among all nodes of the tree.
         */
        [[nodiscard]] subtree_point_t select_subtree(random_t& random) const;

        [[nodiscard]] tree_t copy_subtree(subtree_point_t point) const;

        /**
         * Replaces the subtree at point with a copy of other.
         */
        void replace_subtree(subtree_point_t point, const tree_t& other);

        /**
         * Exchanges the subtree at our_point with the subtree at other_point of other_tree.
         * Swapping a tree with itself is not supported.
         */
        void swap_subtrees(subtree_point_t our_point, tree_t& other_tree, subtree_point_t other_point);

        /**
         * @return true if every function node has exactly two children and nothing trails the root's subtree
         */
        [[nodiscard]] bool check() const;

        void print(std::ostream& out) const;

        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] exported_node_t export_tree() const;

        friend bool operator==(const tree_t& a, const tree_t& b)
        {
            return a.nodes == b.nodes;
        }

        friend bool operator!=(const tree_t& a, const tree_t& b)
        {
            return !(a == b);
        }

        friend std::ostream& operator<<(std::ostream& out, const tree_t& tree)
        {
            tree.print(out);
            return out;
        }

    private:
        std::vector<node_t> nodes;
    };

    struct fitness_t
    {
        // sum of absolute errors, lower is better. infinite if the tree failed to evaluate on any test point
        double standardized_fitness = std::numeric_limits<double>::infinity();
        // test points predicted within the hit threshold
        i64 hits = 0;
        bool evaluated = false;

        void set(const double error, const i64 hit_count)
        {
            standardized_fitness = error;
            hits = hit_count;
            evaluated = true;
        }

        [[nodiscard]] bool is_finite() const
        {
            return std::isfinite(standardized_fitness);
        }
    };

    struct individual_t
    {
        tree_t tree;
        fitness_t fitness;

        /**
         * Replaces the tree and drops the cached fitness.
         */
        void set_tree(tree_t&& new_tree)
        {
            tree = std::move(new_tree);
            fitness = {};
        }

        individual_t() = delete;

        explicit individual_t(tree_t&& tree): tree(std::move(tree))
        {
        }

        explicit individual_t(const tree_t& tree): tree(tree)
        {
        }

        individual_t(const individual_t&) = default;

        individual_t(individual_t&&) = default;

        individual_t& operator=(const individual_t&) = delete;

        individual_t& operator=(individual_t&&) = default;
    };

    class population_t
    {
    public:
        std::vector<individual_t>& get_individuals()
        {
            return individuals;
        }

        [[nodiscard]] const std::vector<individual_t>& get_individuals() const
        {
            return individuals;
        }

        [[nodiscard]] size_t size() const
        {
            return individuals.size();
        }

        [[nodiscard]] bool empty() const
        {
            return individuals.empty();
        }

        individual_t& operator[](const size_t index)
        {
            return individuals[index];
        }

        const individual_t& operator[](const size_t index) const
        {
            return individuals[index];
        }

        auto begin()
        {
            return individuals.begin();
        }

        auto end()
        {
            return individuals.end();
        }

        [[nodiscard]] auto begin() const
        {
            return individuals.begin();
        }

        [[nodiscard]] auto end() const
        {
            return individuals.end();
        }

        void clear()
        {
            individuals.clear();
        }

        /**
         * @return index of the individual with the lowest fitness, the first one on ties
         */
        [[nodiscard]] size_t best_index() const;

        population_t() = default;

        population_t(const population_t&) = default;

        population_t(population_t&&) = default;

        population_t& operator=(const population_t&) = delete;

        population_t& operator=(population_t&&) = default;

    private:
        std::vector<individual_t> individuals;
    };
}

#endif //SYMREG_TREE_H
