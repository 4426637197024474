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

#ifndef SYMREG_ERRORS_H
#define SYMREG_ERRORS_H

#include <symreg/fwdecl.h>
#include <string_view>
#include <string>
#include <variant>
#include <ostream>
#include <sstream>

namespace symreg
{
    enum class run_state_t : u8
    {
        IDLE,
        RUNNING,
        PAUSED,
        STOPPED,
        COMPLETED
    };

    std::string_view to_string(run_state_t state);

    std::ostream& operator<<(std::ostream& out, run_state_t state);

    namespace errors
    {
        namespace eval
        {
            enum class eval_error_t : u8
            {
                // result of an operator was infinite or NaN
                NON_FINITE
            };

            std::ostream& operator<<(std::ostream& out, eval_error_t error);
        }

        namespace config
        {
            struct parameter_out_of_range_t
            {
                std::string_view parameter;
                double value;
                double min;
                double max;
            };

            struct invalid_parameter_t
            {
                std::string_view parameter;
                std::string reason;
            };

            using config_error_t = std::variant<parameter_out_of_range_t, invalid_parameter_t>;

            std::ostream& operator<<(std::ostream& out, const parameter_out_of_range_t& error);

            std::ostream& operator<<(std::ostream& out, const invalid_parameter_t& error);

            std::ostream& operator<<(std::ostream& out, const config_error_t& error);
        }

        namespace state
        {
            /**
             * An operation was requested which the run's current state does not allow. The state is left as it was.
             */
            struct invalid_transition_t
            {
                std::string_view operation;
                run_state_t state;
            };

            using state_error_t = invalid_transition_t;

            std::ostream& operator<<(std::ostream& out, const state_error_t& error);
        }

        using program_error_t = std::variant<config::config_error_t, state::state_error_t>;

        std::ostream& operator<<(std::ostream& out, const program_error_t& error);

        template <typename T>
        std::string to_string(const T& error)
        {
            std::stringstream ss;
            ss << error;
            return ss.str();
        }
    }

    using errors::eval::eval_error_t;
    using errors::config::config_error_t;
    using errors::state::state_error_t;
    using errors::program_error_t;
}

#endif //SYMREG_ERRORS_H
