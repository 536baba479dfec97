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

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

// Single background thread executing posted tasks in order.
// Queue state is shared with the thread so a stuck worker can be abandoned safely.
class WorkerQueue
{
public:
    WorkerQueue()  = default;
    ~WorkerQueue() { if (m_state && m_state->running.load(std::memory_order_acquire)) Stop(); }

    WorkerQueue(const WorkerQueue&)            = delete;
    WorkerQueue& operator=(const WorkerQueue&) = delete;
    WorkerQueue(WorkerQueue&&)                 = delete;
    WorkerQueue& operator=(WorkerQueue&&)      = delete;

    // Starts the dedicated background worker thread. Call before Push().
    void Start();

    // Drains remaining tasks then joins. Blocks until thread exits.
    void Stop();

    // Leaves the current thread to finish on its own (detached); pending tasks are dropped.
    // Start() may be called again afterwards.
    void Abandon();

    // Thread-safe. Posts a task.
    void Push(std::function<void()> task);

    bool IsRunning() const { return m_state && m_state->running.load(std::memory_order_acquire); }

private:
    struct State {
        std::mutex                         mtx;
        std::deque<std::function<void()>>  tasks;
        std::condition_variable            cv;
        std::atomic<bool>                  running{false};
    };

    static void WorkerLoop(std::shared_ptr<State> state);

    std::shared_ptr<State> m_state;
    std::thread            m_thread;
};

// Runs calls one at a time on a WorkerQueue with a per-call deadline.
// A call that misses its deadline keeps its thread; the lane moves on with a fresh one.
class DeadlineLane
{
public:
    DeadlineLane();
    ~DeadlineLane();

    template <typename R>
    std::optional<R> Run(std::function<R()> call, std::chrono::milliseconds deadline)
    {
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(call));
        std::future<R> result = task->get_future();

        m_queue->Push([task]() { (*task)(); });

        if (result.wait_for(deadline) != std::future_status::ready) {
            ReplaceWorker();
            return std::nullopt;
        }
        return result.get();
    }

    // Number of workers abandoned so far
    size_t AbandonedCount() const { return m_abandoned.load(); }

private:
    void ReplaceWorker();

    std::unique_ptr<WorkerQueue> m_queue;
    std::atomic<size_t> m_abandoned{0};
};
