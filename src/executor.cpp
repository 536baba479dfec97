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

#include "executor.h"
#include "actionable_registry.h"
#include "capability_prober.h"
#include "outcome_ledger.h"
#include "logger.h"
#include "utils.h"
#include <memory>

bool RecordLifecycle::IsLegal(RecordState from, RecordState to)
{
    switch (from) {
        case RecordState::Received:  return to == RecordState::Validated || to == RecordState::Rejected;
        case RecordState::Validated: return to == RecordState::Probed;
        case RecordState::Probed:    return to == RecordState::Executed;
        default:                     return false; // Executed, Rejected are terminal
    }
}

bool RecordLifecycle::Advance(RecordState next)
{
    if (!IsLegal(m_state, next)) {
        Log("[EXECUTOR] Illegal transition for " + m_id + ": " + StateName(m_state) + " -> " + StateName(next));
        return false;
    }
    m_state = next;
    return true;
}

Executor::Executor(ActionableRegistry& registry, CapabilityProber& prober,
                   OutcomeLedger* ledger, std::chrono::milliseconds handlerTimeout)
    : m_registry(registry), m_prober(prober), m_ledger(ledger), m_handlerTimeout(handlerTimeout)
{
}

Executor::~Executor() = default;

std::vector<ExecutionResult> Executor::ExecuteBatch(const std::vector<ActionableRecord>& records)
{
    std::lock_guard lg(m_batchMtx);
    const uint64_t batchNo = ++m_batchCount;

    Log("[EXECUTOR] Batch #" + std::to_string(batchNo) + " received: " + std::to_string(records.size()) + " records");

    std::vector<ExecutionResult> results;
    results.reserve(records.size());

    size_t ok = 0, failed = 0, unsupported = 0;
    for (const auto& record : records) {
        ExecutionResult result = ExecuteOne(record);

        switch (result.status) {
            case ExecutionStatus::Success:     ++ok; break;
            case ExecutionStatus::Unsupported: ++unsupported; break;
            default:                           ++failed; break;
        }

        if (m_ledger) m_ledger->Record(result);
        results.push_back(std::move(result));
    }

    Log("[EXECUTOR] Batch #" + std::to_string(batchNo) + " done: " + std::to_string(ok) + " success, " +
        std::to_string(failed) + " failed, " + std::to_string(unsupported) + " unsupported");
    return results;
}

ExecutionResult Executor::Rejected(const ActionableRecord& record, ExecutionStatus status, std::string detail)
{
    ExecutionResult r;
    r.actionableId = record.id;
    r.status = status;
    r.detail = std::move(detail);
    r.completedAt = NowEpochMs();
    r.type = record.type;
    r.target = record.target.value_or("");
    r.tier = CapabilityTier::Unavailable;
    Log("[EXECUTOR] " + record.id + " rejected: " + r.detail);
    return r;
}

ExecutionResult Executor::ExecuteOne(const ActionableRecord& record)
{
    RecordLifecycle life(record.id);

    // 1. Closed-world validation, no OS interaction on failure
    ValidationResult v = m_registry.Validate(record);
    if (!v.Ok()) {
        life.Advance(RecordState::Rejected);
        if (v.error == ValidationErrorKind::UnknownType) {
            return Rejected(record, ExecutionStatus::Unsupported, "unsupported type: " + record.type);
        }
        return Rejected(record, ExecutionStatus::Failed, "contract violation: missing field " + v.field);
    }

    auto handler = m_registry.Resolve(record.type);
    if (!handler) {
        life.Advance(RecordState::Rejected);
        return Rejected(record, ExecutionStatus::Unsupported, "unsupported type: " + record.type);
    }
    life.Advance(RecordState::Validated);

    // 2. Tier for the handler's domain (cached after the first probe)
    const auto type = ParseActionableType(record.type);
    const CapabilityTier tier = m_prober.Probe(DomainOf(*type));
    life.Advance(RecordState::Probed);

    // 3. Bounded handler call
    auto expired = std::make_shared<std::atomic<bool>>(false);
    std::function<ExecutionResult()> call = [handler, record, tier, expired]() {
        ExecutionResult r = handler->Handle(record, tier);
        if (expired->load()) {
            Log("[EXECUTOR] Late completion of " + record.id + " discarded (" + StatusName(r.status) + ")");
        }
        return r;
    };

    std::optional<ExecutionResult> result = m_lane.Run(std::move(call), m_handlerTimeout);
    life.Advance(RecordState::Executed);

    if (!result) {
        expired->store(true);
        ExecutionResult r;
        r.actionableId = record.id;
        r.status = ExecutionStatus::Failed;
        r.detail = "timeout";
        r.completedAt = NowEpochMs();
        r.type = record.type;
        r.target = record.target.value_or("");
        r.tier = tier;
        Log("[EXECUTOR] " + record.id + " timed out after " + std::to_string(m_handlerTimeout.count()) + "ms");
        return r;
    }

    return std::move(*result);
}
