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
#include "types.h"
#include "worker_thread.h"
#include <vector>
#include <mutex>
#include <atomic>
#include <chrono>

class ActionableRegistry;
class CapabilityProber;
class OutcomeLedger;

// Guards the per-record state machine:
// Received -> Validated -> Probed -> Executed, or Received -> Rejected.
class RecordLifecycle {
public:
    explicit RecordLifecycle(std::string id) : m_id(std::move(id)) {}

    // Refuses (and logs) illegal transitions
    bool Advance(RecordState next);

    RecordState State() const { return m_state; }
    bool IsTerminal() const { return m_state == RecordState::Executed || m_state == RecordState::Rejected; }

    static bool IsLegal(RecordState from, RecordState to);

private:
    std::string m_id;
    RecordState m_state = RecordState::Received;
};

// Central subsystem: validates and sequentially executes instruction batches
class Executor {
public:
    Executor(ActionableRegistry& registry, CapabilityProber& prober,
             OutcomeLedger* ledger, std::chrono::milliseconds handlerTimeout);
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // One result per record, in input order. Batches are serialized.
    std::vector<ExecutionResult> ExecuteBatch(const std::vector<ActionableRecord>& records);

    uint64_t BatchesExecuted() const { return m_batchCount.load(); }
    size_t TimedOutCalls() const { return m_lane.AbandonedCount(); }

private:
    ExecutionResult ExecuteOne(const ActionableRecord& record);
    ExecutionResult Rejected(const ActionableRecord& record, ExecutionStatus status, std::string detail);

    ActionableRegistry& m_registry;
    CapabilityProber& m_prober;
    OutcomeLedger* m_ledger; // Optional, not owned
    const std::chrono::milliseconds m_handlerTimeout;

    std::mutex m_batchMtx;
    DeadlineLane m_lane;
    std::atomic<uint64_t> m_batchCount{0};
};
