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
#include <symreg/selection.h>
#include <symreg/random.h>
#include <blt/std/hashmap.h>
#include <algorithm>

namespace symreg
{
    const individual_t& select_tournament_t::select(random_t& random, const population_t& pop)
    {
        BLT_ASSERT_MSG(!pop.empty(), "Cannot select from an empty population!");

        thread_local blt::hashset_t<u64> already_selected;
        already_selected.clear();
        auto& i_ref = pop.get_individuals();

        std::optional<u64> best;
        for (size_t i = 0; i < std::min(selection_size, pop.size()); i++)
        {
            u64 sel_point;
            do
            {
                sel_point = random.get_u64(0ul, pop.size());
            }
            while (!already_selected.insert(sel_point).second);
            if (!best || i_ref[sel_point].fitness.standardized_fitness < i_ref[*best].fitness.standardized_fitness)
                best = sel_point;
        }
        return i_ref[*best];
    }
}
