/*
 *  <Short Description>
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
#include <symreg/tree.h>
#include <symreg/random.h>
#include <blt/std/assert.h>
#include <blt/logging/logging.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stack>

namespace symreg
{
    std::string_view to_string(const operator_t op)
    {
        switch (op)
        {
        case operator_t::ADD:
            return "add";
        case operator_t::SUBTRACT:
            return "subtract";
        case operator_t::MULTIPLY:
            return "multiply";
        }
        return "unknown";
    }

    char to_symbol(const operator_t op)
    {
        switch (op)
        {
        case operator_t::ADD:
            return '+';
        case operator_t::SUBTRACT:
            return '-';
        case operator_t::MULTIPLY:
            return '*';
        }
        return '?';
    }

    namespace
    {
        void print_constant(std::ostream& out, const double value)
        {
            // integers print without a fractional part, matching the constant range they are drawn from
            if (std::isfinite(value) && value == std::trunc(value) && std::abs(value) < 1e15)
            {
                out << static_cast<i64>(value);
                return;
            }
            // enough digits for parse() to read back the exact same double
            const auto precision = out.precision(std::numeric_limits<double>::max_digits10);
            out << value;
            out.precision(precision);
        }

        std::string label_of(const node_t& node)
        {
            switch (node.type)
            {
            case node_type_t::FUNCTION:
                return std::string(1, to_symbol(node.op));
            case node_type_t::VARIABLE:
                return "x";
            case node_type_t::CONSTANT:
            {
                std::stringstream ss;
                print_constant(ss, node.value);
                return ss.str();
            }
            }
            return "";
        }

        std::unique_ptr<exported_node_t> export_node(const std::vector<node_t>& nodes, size_t& pos)
        {
            const auto& node = nodes[pos++];
            auto out = std::make_unique<exported_node_t>();
            out->type = node.type;
            out->label = label_of(node);
            if (node.is_function())
            {
                out->left = export_node(nodes, pos);
                out->right = export_node(nodes, pos);
            }
            return out;
        }

        class expression_parser_t
        {
        public:
            explicit expression_parser_t(const std::string_view str): str(str)
            {
            }

            bool parse(std::vector<node_t>& out)
            {
                if (!parse_expression(out))
                    return false;
                skip_whitespace();
                return index == str.size();
            }

        private:
            void skip_whitespace()
            {
                while (index < str.size() && std::isspace(static_cast<unsigned char>(str[index])))
                    ++index;
            }

            bool parse_expression(std::vector<node_t>& out)
            {
                skip_whitespace();
                if (index >= str.size())
                    return false;
                const char c = str[index];
                if (c == '(')
                {
                    ++index;
                    // reserve the slot for the operator, which we only learn after the left operand
                    const auto op_pos = out.size();
                    out.push_back(node_t::function(operator_t::ADD));
                    if (!parse_expression(out))
                        return false;
                    skip_whitespace();
                    if (index >= str.size())
                        return false;
                    switch (str[index])
                    {
                    case '+':
                        out[op_pos].op = operator_t::ADD;
                        break;
                    case '-':
                        out[op_pos].op = operator_t::SUBTRACT;
                        break;
                    case '*':
                        out[op_pos].op = operator_t::MULTIPLY;
                        break;
                    default:
                        return false;
                    }
                    ++index;
                    if (!parse_expression(out))
                        return false;
                    skip_whitespace();
                    if (index >= str.size() || str[index] != ')')
                        return false;
                    ++index;
                    return true;
                }
                if (c == 'x')
                {
                    ++index;
                    out.push_back(node_t::variable());
                    return true;
                }
                return parse_number(out);
            }

            bool parse_number(std::vector<node_t>& out)
            {
                const auto begin = index;
                if (index < str.size() && (str[index] == '-' || str[index] == '+'))
                    ++index;
                bool digits = false;
                while (index < str.size() && (std::isdigit(static_cast<unsigned char>(str[index])) || str[index] == '.'))
                {
                    digits |= str[index] != '.';
                    ++index;
                }
                if (!digits)
                    return false;
                if (index < str.size() && (str[index] == 'e' || str[index] == 'E'))
                {
                    ++index;
                    if (index < str.size() && (str[index] == '-' || str[index] == '+'))
                        ++index;
                    bool exponent_digits = false;
                    while (index < str.size() && std::isdigit(static_cast<unsigned char>(str[index])))
                    {
                        exponent_digits = true;
                        ++index;
                    }
                    if (!exponent_digits)
                        return false;
                }
                const std::string number{str.substr(begin, index - begin)};
                char* end = nullptr;
                const double value = std::strtod(number.c_str(), &end);
                if (end != number.c_str() + number.size())
                    return false;
                out.push_back(node_t::constant(value));
                return true;
            }

            std::string_view str;
            size_t index = 0;
        };
    }

    tree_t tree_t::make_variable()
    {
        tree_t tree;
        tree.nodes.push_back(node_t::variable());
        return tree;
    }

    tree_t tree_t::make_constant(const double value)
    {
        tree_t tree;
        tree.nodes.push_back(node_t::constant(value));
        return tree;
    }

    tree_t tree_t::make_function(const operator_t op, const tree_t& left, const tree_t& right)
    {
        tree_t tree;
        tree.nodes.reserve(1 + left.size() + right.size());
        tree.nodes.push_back(node_t::function(op));
        tree.nodes.insert(tree.nodes.end(), left.nodes.begin(), left.nodes.end());
        tree.nodes.insert(tree.nodes.end(), right.nodes.begin(), right.nodes.end());
        return tree;
    }

    std::optional<tree_t> tree_t::parse(const std::string_view expression)
    {
        tree_t tree;
        expression_parser_t parser{expression};
        if (!parser.parse(tree.nodes))
            return {};
        return tree;
    }

    ptrdiff_t tree_t::find_endpoint(ptrdiff_t start) const
    {
        i64 children_left = 0;

        do
        {
            const auto& node = nodes[start];
            // this is a child to someone
            if (children_left != 0)
                children_left--;
            children_left += node.argc();
            start++;
        }
        while (children_left > 0 && start < static_cast<ptrdiff_t>(nodes.size()));

        return start;
    }

    size_t tree_t::depth() const
    {
        if (nodes.empty())
            return 0;
        return subtree_depth(subtree_point_t{0});
    }

    size_t tree_t::depth_at(const ptrdiff_t pos) const
    {
        // depth of each pending child slot, in the order the slots will be filled
        thread_local std::vector<size_t> pending;
        pending.clear();
        pending.push_back(0);

        for (ptrdiff_t i = 0; i < static_cast<ptrdiff_t>(nodes.size()) && !pending.empty(); i++)
        {
            const auto depth = pending.back();
            pending.pop_back();
            if (i == pos)
                return depth;
            if (nodes[i].is_function())
            {
                pending.push_back(depth + 1);
                pending.push_back(depth + 1);
            }
        }
        BLT_ABORT("Position is outside of the tree!");
    }

    size_t tree_t::subtree_depth(const subtree_point_t point) const
    {
        thread_local std::vector<size_t> pending;
        pending.clear();
        pending.push_back(0);

        size_t max_depth = 0;
        const auto end = find_endpoint(point.pos);
        for (auto i = point.pos; i < end; i++)
        {
            const auto depth = pending.back();
            pending.pop_back();
            max_depth = std::max(max_depth, depth);
            if (nodes[i].is_function())
            {
                pending.push_back(depth + 1);
                pending.push_back(depth + 1);
            }
        }
        return max_depth;
    }

    tree_t::subtree_point_t tree_t::select_subtree(random_t& random) const
    {
        BLT_ASSERT_MSG(!nodes.empty(), "Cannot select a subtree from an empty tree!");
        return subtree_point_t{static_cast<ptrdiff_t>(random.get_index(nodes.size()))};
    }

    tree_t tree_t::copy_subtree(const subtree_point_t point) const
    {
        const auto [start, end] = get_subtree(point);
        tree_t out;
        out.nodes.insert(out.nodes.end(), nodes.begin() + start, nodes.begin() + end);
        return out;
    }

    void tree_t::replace_subtree(const subtree_point_t point, const tree_t& other)
    {
        const auto [start, end] = get_subtree(point);
        const auto our_begin = nodes.begin() + start;
        const auto our_end = nodes.begin() + end;

        nodes.insert(nodes.erase(our_begin, our_end), other.nodes.begin(), other.nodes.end());
    }

    void tree_t::swap_subtrees(const subtree_point_t our_point, tree_t& other_tree, const subtree_point_t other_point)
    {
        BLT_ASSERT_MSG(&other_tree != this, "Swapping subtrees within the same tree is not supported!");

        const auto our_subtree = copy_subtree(our_point);
        const auto other_subtree = other_tree.copy_subtree(other_point);

        replace_subtree(our_point, other_subtree);
        other_tree.replace_subtree(other_point, our_subtree);
    }

    bool tree_t::check() const
    {
        if (nodes.empty())
            return false;
        i64 slots = 1;
        for (const auto& node : nodes)
        {
            // a node with no slot left to fill trails the root's subtree
            if (slots == 0)
                return false;
            slots += static_cast<i64>(node.argc()) - 1;
        }
        return slots == 0;
    }

    void tree_t::print(std::ostream& out) const
    {
        struct pending_function_t
        {
            operator_t op;
            u32 children_done;
        };
        std::stack<pending_function_t> functions;

        for (const auto& node : nodes)
        {
            if (node.is_function())
            {
                out << '(';
                functions.push({node.op, 0});
                continue;
            }
            if (node.type == node_type_t::VARIABLE)
                out << 'x';
            else
                print_constant(out, node.value);

            // a subtree just finished, walk up through every function it completes
            while (!functions.empty())
            {
                auto& top = functions.top();
                if (++top.children_done == 1)
                {
                    out << ' ' << to_symbol(top.op) << ' ';
                    break;
                }
                out << ')';
                functions.pop();
            }
        }
        if (!functions.empty())
            BLT_ERROR("Failed to print tree correctly! {} functions are missing arguments", functions.size());
    }

    std::string tree_t::to_string() const
    {
        std::stringstream ss;
        print(ss);
        return ss.str();
    }

    exported_node_t tree_t::export_tree() const
    {
        BLT_ASSERT_MSG(check(), "Only complete trees can be exported!");
        size_t pos = 0;
        auto root = export_node(nodes, pos);
        return std::move(*root);
    }

    size_t population_t::best_index() const
    {
        size_t best = 0;
        for (size_t i = 1; i < individuals.size(); i++)
        {
            if (individuals[i].fitness.standardized_fitness < individuals[best].fitness.standardized_fitness)
                best = i;
        }
        return best;
    }
}
