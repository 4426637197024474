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

#ifndef SYMREG_DRIVER_H
#define SYMREG_DRIVER_H

#include <symreg/fwdecl.h>
#include <symreg/errors.h>
#include <symreg/program.h>
#include <symreg/stats.h>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace symreg
{
    /**
     * Steps a program on a background thread, waiting a fixed delay between generations so that a viewer can follow the run.
     * Every generation's statistics are handed to the observer, which is called without the driver's lock held and may call
     * back into the driver.
     *
     * While a driver exists it is the only thing which may touch the program; use with_program() for queries.
     */
    class driver_t
    {
    public:
        using observer_t = std::function<void(const generation_stats_t&)>;

        explicit driver_t(gp_program& program);

        driver_t(const driver_t&) = delete;

        driver_t& operator=(const driver_t&) = delete;

        driver_t& with_delay(const std::chrono::milliseconds delay)
        {
            std::scoped_lock lock(mutex);
            m_delay = delay;
            return *this;
        }

        driver_t& with_observer(observer_t observer)
        {
            std::scoped_lock lock(mutex);
            m_observer = std::move(observer);
            return *this;
        }

        std::optional<state_error_t> start();

        /**
         * No further generations are scheduled once the one in progress finishes.
         */
        std::optional<state_error_t> pause();

        std::optional<state_error_t> stop();

        void reset();

        /**
         * Blocks until the program is no longer RUNNING and the observer has seen the last generation.
         */
        void wait();

        /**
         * Like wait() but gives up after timeout.
         * @return true if the program stopped running in time
         */
        bool wait_for(std::chrono::milliseconds timeout);

        [[nodiscard]] run_state_t get_state();

        [[nodiscard]] std::vector<generation_stats_t> get_history();

        /**
         * Calls func with the program while the driver is locked. The result is returned by value so nothing which refers to
         * the program outlives the lock.
         */
        template <typename Func>
        std::decay_t<std::invoke_result_t<Func, const gp_program&>> with_program(Func&& func)
        {
            std::scoped_lock lock(mutex);
            return std::forward<Func>(func)(static_cast<const gp_program&>(*m_program));
        }

        ~driver_t();

    private:
        void run_loop();

        gp_program* m_program;
        std::chrono::milliseconds m_delay{100};
        observer_t m_observer;

        std::mutex mutex;
        std::condition_variable condition_variable;
        bool should_run = true;
        // true from the start of a step until its observer has returned
        bool stepping = false;
        std::thread thread;
    };
}

#endif //SYMREG_DRIVER_H
