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

#ifndef SYMREG_SELECTION_H
#define SYMREG_SELECTION_H

#include <symreg/fwdecl.h>
#include <symreg/tree.h>
#include <blt/std/assert.h>

namespace symreg
{
    class selection_t
    {
    public:
        /**
         * @param random source of randomness for the selection
         * @param pop population to select from. it is never modified
         * @return a member of pop
         */
        virtual const individual_t& select(random_t& random, const population_t& pop) = 0;

        virtual ~selection_t() = default;
    };

    /**
     * Samples selection_size distinct individuals (or the whole population if it is smaller) and returns the one with the
     * lowest fitness. Ties go to whichever was sampled first.
     */
    class select_tournament_t final : public selection_t
    {
    public:
        explicit select_tournament_t(const size_t selection_size = 3): selection_size(selection_size)
        {
            if (selection_size == 0)
                BLT_ABORT("Unable to select with this size. Must select at least 1 individual_t!");
        }

        const individual_t& select(random_t& random, const population_t& pop) override;

    private:
        const size_t selection_size;
    };
}

#endif //SYMREG_SELECTION_H
