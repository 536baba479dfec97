/*
 * This file is part of PowerGuard Actuator (PGuard).
 *
 * Copyright (c) 2025 Ian Anthony R. Tancinco
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "worker_thread.h"
#include "logger.h"

void WorkerQueue::Start()
{
    m_state = std::make_shared<State>();
    m_state->running.store(true, std::memory_order_release);
    m_thread = std::thread(&WorkerQueue::WorkerLoop, m_state);
}

void WorkerQueue::Stop()
{
    if (!m_state) return;
    m_state->running.store(false, std::memory_order_release);
    m_state->cv.notify_all();
    if (m_thread.joinable())
        m_thread.join();
}

void WorkerQueue::Abandon()
{
    if (!m_state) return;
    {
        std::lock_guard<std::mutex> lk(m_state->mtx);
        m_state->tasks.clear();
    }
    m_state->running.store(false, std::memory_order_release);
    m_state->cv.notify_all();
    if (m_thread.joinable())
        m_thread.detach();
    m_state.reset();
}

void WorkerQueue::Push(std::function<void()> task)
{
    if (!m_state) return;
    {
        std::lock_guard<std::mutex> lk(m_state->mtx);
        m_state->tasks.push_back(std::move(task));
    }
    m_state->cv.notify_one();
}

void WorkerQueue::WorkerLoop(std::shared_ptr<State> state)
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(state->mtx);
            state->cv.wait(lk, [&state]
            {
                return !state->tasks.empty() || !state->running.load(std::memory_order_acquire);
            });

            if (!state->running.load(std::memory_order_acquire) && state->tasks.empty())
                return;

            if (!state->tasks.empty())
            {
                task = std::move(state->tasks.front());
                state->tasks.pop_front();
            }
        }
        if (task) task();
    }
}

DeadlineLane::DeadlineLane()
    : m_queue(std::make_unique<WorkerQueue>())
{
    m_queue->Start();
}

DeadlineLane::~DeadlineLane()
{
    m_queue->Stop();
}

void DeadlineLane::ReplaceWorker()
{
    m_queue->Abandon();
    m_queue->Start();
    size_t n = ++m_abandoned;
    Log("[LANE] Worker abandoned after deadline (total " + std::to_string(n) + ")");
}
