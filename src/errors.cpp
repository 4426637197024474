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
#include <symreg/errors.h>

namespace symreg
{
    std::string_view to_string(const run_state_t state)
    {
        switch (state)
        {
        case run_state_t::IDLE:
            return "IDLE";
        case run_state_t::RUNNING:
            return "RUNNING";
        case run_state_t::PAUSED:
            return "PAUSED";
        case run_state_t::STOPPED:
            return "STOPPED";
        case run_state_t::COMPLETED:
            return "COMPLETED";
        }
        return "UNKNOWN";
    }

    std::ostream& operator<<(std::ostream& out, const run_state_t state)
    {
        return out << to_string(state);
    }

    namespace errors
    {
        namespace eval
        {
            std::ostream& operator<<(std::ostream& out, const eval_error_t error)
            {
                switch (error)
                {
                case eval_error_t::NON_FINITE:
                    return out << "expression produced a non-finite value";
                }
                return out << "unknown evaluation error";
            }
        }

        namespace config
        {
            std::ostream& operator<<(std::ostream& out, const parameter_out_of_range_t& error)
            {
                return out << "parameter '" << error.parameter << "' is " << error.value << " but must be within [" << error.min << ", "
                    << error.max << "]";
            }

            std::ostream& operator<<(std::ostream& out, const invalid_parameter_t& error)
            {
                return out << "parameter '" << error.parameter << "' is invalid: " << error.reason;
            }

            std::ostream& operator<<(std::ostream& out, const config_error_t& error)
            {
                std::visit([&out](const auto& err) { out << err; }, error);
                return out;
            }
        }

        namespace state
        {
            std::ostream& operator<<(std::ostream& out, const state_error_t& error)
            {
                return out << "cannot " << error.operation << " while the run is " << error.state;
            }
        }

        std::ostream& operator<<(std::ostream& out, const program_error_t& error)
        {
            std::visit([&out](const auto& err)
            {
                using config::operator<<;
                using state::operator<<;
                out << err;
            }, error);
            return out;
        }
    }
}
