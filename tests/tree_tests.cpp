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
#include <symreg/tree.h>
#include <symreg/random.h>
#include <blt/logging/logging.h>
#include <blt/std/assert.h>
#include <vector>

using namespace symreg;

tree_t must_parse(const std::string_view str)
{
    auto tree = tree_t::parse(str);
    BLT_ASSERT_MSG(tree.has_value(), "Failed to parse test expression!");
    return *tree;
}

void test_construction()
{
    BLT_INFO("Testing tree construction and printing");
    const auto x = tree_t::make_variable();
    const auto three = tree_t::make_constant(3);
    const auto tree = tree_t::make_function(operator_t::ADD, tree_t::make_function(operator_t::MULTIPLY, x, x), three);

    BLT_ASSERT(tree.size() == 5);
    BLT_ASSERT(tree.check());
    BLT_ASSERT(tree.to_string() == "((x * x) + 3)");
    BLT_ASSERT(tree == must_parse("((x * x) + 3)"));

    BLT_ASSERT(tree_t::make_function(operator_t::SUBTRACT, x, tree_t::make_constant(-5)).to_string() == "(x - -5)");
    BLT_ASSERT(tree_t::make_constant(2.5).to_string() == "2.5");
    BLT_ASSERT(x.to_string() == "x");
}

void test_depth()
{
    BLT_INFO("Testing depth");
    BLT_ASSERT(tree_t::make_variable().depth() == 0);
    BLT_ASSERT(must_parse("(x + 1)").depth() == 1);

    const auto tree = must_parse("((x * x) + 3)");
    BLT_ASSERT(tree.depth() == 2);
    BLT_ASSERT(tree.depth_at(0) == 0);
    BLT_ASSERT(tree.depth_at(1) == 1);
    BLT_ASSERT(tree.depth_at(2) == 2);
    BLT_ASSERT(tree.depth_at(3) == 2);
    BLT_ASSERT(tree.depth_at(4) == 1);
    BLT_ASSERT(tree.subtree_depth(tree_t::subtree_point_t{1}) == 1);
    BLT_ASSERT(tree.subtree_depth(tree_t::subtree_point_t{4}) == 0);

    // lopsided, the deep side is on the right
    const auto right_heavy = must_parse("(1 - (x * (x + (2 * x))))");
    BLT_ASSERT(right_heavy.depth() == 4);
    BLT_ASSERT(right_heavy.depth_at(1) == 1);
}

void test_endpoints()
{
    BLT_INFO("Testing subtree boundaries");
    const auto tree = must_parse("((x * x) + 3)");
    BLT_ASSERT(tree.find_endpoint(0) == 5);
    BLT_ASSERT(tree.find_endpoint(1) == 4);
    BLT_ASSERT(tree.find_endpoint(2) == 3);
    BLT_ASSERT(tree.find_endpoint(3) == 4);
    BLT_ASSERT(tree.find_endpoint(4) == 5);
    BLT_ASSERT(tree.get_subtree_size(tree_t::subtree_point_t{1}) == 3);
    BLT_ASSERT(tree.copy_subtree(tree_t::subtree_point_t{1}) == must_parse("(x * x)"));
}

void test_replace_and_swap()
{
    BLT_INFO("Testing subtree replacement and swapping");
    auto tree = must_parse("((x * x) + 3)");
    tree.replace_subtree(tree_t::subtree_point_t{1}, tree_t::make_constant(7));
    BLT_ASSERT(tree.to_string() == "(7 + 3)");
    BLT_ASSERT(tree.check());

    tree.replace_subtree(tree_t::subtree_point_t{2}, must_parse("(x - (x * 2))"));
    BLT_ASSERT(tree.to_string() == "(7 + (x - (x * 2)))");
    BLT_ASSERT(tree.check());

    auto first = must_parse("((x * x) + 3)");
    auto second = must_parse("(x - 2)");
    first.swap_subtrees(tree_t::subtree_point_t{4}, second, tree_t::subtree_point_t{0});
    BLT_ASSERT(first.to_string() == "((x * x) + (x - 2))");
    BLT_ASSERT(second.to_string() == "3");
    BLT_ASSERT(first.check() && second.check());
}

void test_deep_copy()
{
    BLT_INFO("Testing copies do not share nodes");
    const auto original = must_parse("((x * x) + 3)");
    auto copy = original;
    copy.replace_subtree(tree_t::subtree_point_t{4}, tree_t::make_variable());
    BLT_ASSERT(original.to_string() == "((x * x) + 3)");
    BLT_ASSERT(copy.to_string() == "((x * x) + x)");
    BLT_ASSERT(copy != original);
}

void test_check()
{
    BLT_INFO("Testing structural checks");
    tree_t empty;
    BLT_ASSERT(!empty.check());

    tree_t missing_children;
    missing_children.get_nodes().push_back(node_t::function(operator_t::ADD));
    missing_children.get_nodes().push_back(node_t::variable());
    BLT_ASSERT(!missing_children.check());

    auto trailing = must_parse("(x + 1)");
    trailing.get_nodes().push_back(node_t::variable());
    BLT_ASSERT(!trailing.check());
}

void test_parse()
{
    BLT_INFO("Testing parsing");
    const std::vector<std::string_view> valid = {"x", "-3", "(x + -5)", "((x * x) + ((3 * x) + 2))", "  ( x -  1.5 )  ", "1e20",
                                                 "(x * 2.5e-3)", "-1E+3"};
    for (const auto& str : valid)
    {
        const auto tree = tree_t::parse(str);
        BLT_ASSERT(tree.has_value());
        BLT_ASSERT(tree->check());
        // printing and parsing again gives back the same tree
        BLT_ASSERT(tree_t::parse(tree->to_string()).value() == *tree);
    }

    const std::vector<std::string_view> invalid = {"", "(", "(x + )", "((x * x) + 3", "x x", "(x / 2)", "(x + 2))", "y", "(x - -x)", "1e", "(x + 2e+)"};
    for (const auto& str : invalid)
        BLT_ASSERT(!tree_t::parse(str).has_value());

    BLT_ASSERT(tree_t::parse("(x * 2.5e-3)").value() == tree_t::make_function(operator_t::MULTIPLY, tree_t::make_variable(),
                                                                                   tree_t::make_constant(0.0025)));

    // constants survive printing exactly, whatever their magnitude
    const std::vector<double> constants = {0.1, 1.0 / 3.0, -2.0 / 7.0, 1e15, 1e20, -6.02214076e23, 123456789.123456789, 4.9e-300};
    for (const auto value : constants)
    {
        const auto tree = tree_t::make_function(operator_t::ADD, tree_t::make_variable(), tree_t::make_constant(value));
        const auto parsed = tree_t::parse(tree.to_string());
        BLT_ASSERT_MSG(parsed.has_value(), "Failed to parse a printed constant!");
        BLT_ASSERT(parsed->get_node(2).value == value);
        BLT_ASSERT(*parsed == tree);
    }
}

void test_export()
{
    BLT_INFO("Testing tree export");
    const auto exported = must_parse("((x * x) + 3)").export_tree();
    BLT_ASSERT(exported.type == node_type_t::FUNCTION);
    BLT_ASSERT(exported.label == "+");
    BLT_ASSERT(exported.left && exported.right);
    BLT_ASSERT(exported.left->label == "*");
    BLT_ASSERT(exported.left->left->type == node_type_t::VARIABLE);
    BLT_ASSERT(exported.left->left->label == "x");
    BLT_ASSERT(exported.right->type == node_type_t::CONSTANT);
    BLT_ASSERT(exported.right->label == "3");
    BLT_ASSERT(!exported.right->left && !exported.right->right);
}

void test_select_subtree()
{
    BLT_INFO("Testing subtree selection covers every node");
    random_t random{691};
    const auto tree = must_parse("((x * x) + 3)");
    std::vector<size_t> counts(tree.size(), 0);
    for (size_t i = 0; i < 1000; i++)
    {
        const auto point = tree.select_subtree(random);
        BLT_ASSERT(point.pos >= 0 && static_cast<size_t>(point.pos) < tree.size());
        counts[point.pos]++;
    }
    for (const auto count : counts)
        BLT_ASSERT(count > 100);
}

int main()
{
    test_construction();
    test_depth();
    test_endpoints();
    test_replace_and_swap();
    test_deep_copy();
    test_check();
    test_parse();
    test_export();
    test_select_subtree();
    BLT_INFO("All tree tests passed");
}
