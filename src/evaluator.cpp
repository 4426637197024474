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
#include <symreg/tree.h>
#include <blt/std/assert.h>
#include <cmath>
#include <vector>

namespace symreg
{
    blt::expected<double, eval_error_t> evaluate(const tree_t& tree, const double x)
    {
        BLT_ASSERT_MSG(!tree.empty(), "Cannot evaluate an empty tree!");

        thread_local std::vector<double> values;
        values.clear();

        // walking the prefix order backwards means both children of a function are on the stack when we reach it
        const auto& nodes = tree.get_nodes();
        for (auto it = nodes.rbegin(); it != nodes.rend(); ++it)
        {
            const auto& node = *it;
            switch (node.type)
            {
            case node_type_t::VARIABLE:
                values.push_back(x);
                break;
            case node_type_t::CONSTANT:
                values.push_back(node.value);
                break;
            case node_type_t::FUNCTION:
            {
                BLT_ASSERT_MSG(values.size() >= 2, "Function node is missing arguments!");
                const auto left = values.back();
                values.pop_back();
                const auto right = values.back();
                values.pop_back();
                const auto result = apply_operator(node.op, left, right);
                if (!std::isfinite(result))
                    return blt::unexpected<eval_error_t>(eval_error_t::NON_FINITE);
                values.push_back(result);
                break;
            }
            }
        }

        BLT_ASSERT_MSG(values.size() == 1, "Tree did not reduce to a single value!");
        if (!std::isfinite(values.back()))
            return blt::unexpected<eval_error_t>(eval_error_t::NON_FINITE);
        return values.back();
    }
}
