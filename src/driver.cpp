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
#include <symreg/driver.h>
#include <blt/logging/logging.h>
#include <exception>

namespace symreg
{
    driver_t::driver_t(gp_program& program): m_program(&program)
    {
        thread = std::thread([this]() { run_loop(); });
    }

    void driver_t::run_loop()
    {
        std::unique_lock lock(mutex);
        while (true)
        {
            condition_variable.wait(lock, [this]() { return !should_run || m_program->get_state() == run_state_t::RUNNING; });
            if (!should_run)
                break;

            stepping = true;
            auto result = m_program->step();
            const auto observer = m_observer;
            const auto delay = m_delay;

            lock.unlock();
            if (result.has_value() && observer)
            {
                try
                {
                    observer(result.value());
                }
                catch (const std::exception& e)
                {
                    BLT_ERROR("Observer failed on generation {}: {}", result.value().generation, e.what());
                }
            }
            lock.lock();
            stepping = false;
            condition_variable.notify_all();

            // wake early if the run was paused, stopped or reset while we slept
            condition_variable.wait_for(lock, delay, [this]()
            {
                return !should_run || m_program->get_state() != run_state_t::RUNNING;
            });
        }
    }

    std::optional<state_error_t> driver_t::start()
    {
        std::optional<state_error_t> error;
        {
            std::scoped_lock lock(mutex);
            error = m_program->start();
        }
        condition_variable.notify_all();
        return error;
    }

    std::optional<state_error_t> driver_t::pause()
    {
        std::optional<state_error_t> error;
        {
            std::scoped_lock lock(mutex);
            error = m_program->pause();
        }
        condition_variable.notify_all();
        return error;
    }

    std::optional<state_error_t> driver_t::stop()
    {
        std::optional<state_error_t> error;
        {
            std::scoped_lock lock(mutex);
            error = m_program->stop();
        }
        condition_variable.notify_all();
        return error;
    }

    void driver_t::reset()
    {
        {
            std::scoped_lock lock(mutex);
            m_program->reset();
        }
        condition_variable.notify_all();
    }

    void driver_t::wait()
    {
        std::unique_lock lock(mutex);
        condition_variable.wait(lock, [this]() { return !stepping && m_program->get_state() != run_state_t::RUNNING; });
    }

    bool driver_t::wait_for(const std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(mutex);
        return condition_variable.wait_for(lock, timeout, [this]() { return !stepping && m_program->get_state() != run_state_t::RUNNING; });
    }

    run_state_t driver_t::get_state()
    {
        std::scoped_lock lock(mutex);
        return m_program->get_state();
    }

    std::vector<generation_stats_t> driver_t::get_history()
    {
        std::scoped_lock lock(mutex);
        return m_program->get_history();
    }

    driver_t::~driver_t()
    {
        {
            std::scoped_lock lock(mutex);
            should_run = false;
        }
        condition_variable.notify_all();
        if (thread.joinable())
            thread.join();
        BLT_DEBUG("Driver finished at generation {}", m_program->get_current_generation());
    }
}
