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

#ifndef SYMREG_EVALUATOR_H
#define SYMREG_EVALUATOR_H

#include <symreg/fwdecl.h>
#include <symreg/errors.h>
#include <blt/std/expected.h>

namespace symreg
{
    /**
     * Computes the value of the expression at x. Fails if any intermediate or final result is infinite or NaN.
     * Evaluation is pure, the same tree and input always produce the same result.
     */
    blt::expected<double, eval_error_t> evaluate(const tree_t& tree, double x);
}

#endif //SYMREG_EVALUATOR_H
