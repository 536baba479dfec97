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

#include "actionable_handler.h"
#include "system_bridge.h"
#include "logger.h"
#include "utils.h"

ExecutionResult ActionableHandler::Handle(const ActionableRecord& record, CapabilityTier tier) noexcept
{
    ExecutionResult result;
    result.actionableId = record.id;
    result.type = record.type;
    result.target = record.target.value_or("");
    result.tier = tier;

    HandlerOutcome outcome;
    try {
        if (auto violation = CheckPayload(record)) {
            outcome = HandlerOutcome::Fail(*violation);
        }
        else if (tier == CapabilityTier::Unavailable) {
            outcome = HandlerOutcome::Fail("capability unavailable");
        }
        else {
            outcome = Apply(record, tier);
        }
    }
    catch (const std::exception& e) {
        outcome = HandlerOutcome::Fail(std::string("Error: ") + e.what());
    }
    catch (...) {
        outcome = HandlerOutcome::Fail("Error: unknown exception");
    }

    result.status = outcome.status;
    result.detail = SanitizeText(outcome.detail);
    result.completedAt = NowEpochMs();

    Log(std::string("[HANDLER] ") + Name() + " " + record.id + " @" + TierName(tier) + " -> " +
        StatusName(result.status) + ": " + result.detail);
    return result;
}

std::optional<std::string> ActionableHandler::CheckPayload(const ActionableRecord&) const
{
    return std::nullopt;
}

AppScopedHandler::AppScopedHandler(std::shared_ptr<SystemBridge> bridge)
    : m_bridge(std::move(bridge))
{
}

std::optional<std::string> AppScopedHandler::CheckPayload(const ActionableRecord& record) const
{
    if (IsBlank(record.target)) return std::string("blank target");

    std::string target = Trim(*record.target);
    if (!IsValidPackageName(target)) return "invalid target: " + target;
    return std::nullopt;
}

std::string AppScopedHandler::TargetOf(const ActionableRecord& record)
{
    return Trim(record.target.value_or(""));
}

std::string AppScopedHandler::Param(const ActionableRecord& record, const std::string& key, const std::string& def)
{
    auto it = record.parameters.find(key);
    return it != record.parameters.end() ? it->second : def;
}
