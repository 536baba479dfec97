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

#ifndef PGUARD_ACTIONABLE_HANDLER_H
#define PGUARD_ACTIONABLE_HANDLER_H

#include "types.h"
#include <memory>
#include <optional>
#include <string>

class SystemBridge;

struct HandlerOutcome {
    ExecutionStatus status = ExecutionStatus::Failed;
    std::string detail;

    static HandlerOutcome Ok(std::string detail) { return { ExecutionStatus::Success, std::move(detail) }; }
    static HandlerOutcome Fail(std::string detail) { return { ExecutionStatus::Failed, std::move(detail) }; }
};

// Translates one instruction into OS effects at a given tier.
class ActionableHandler {
public:
    virtual ~ActionableHandler() = default;

    virtual CapabilityDomain Domain() const = 0;
    virtual const char* Name() const = 0;

    // Never throws. Payload checks run before any OS call;
    // Unavailable short-circuits to Failed("capability unavailable").
    ExecutionResult Handle(const ActionableRecord& record, CapabilityTier tier) noexcept;

protected:
    // Failure detail for a malformed payload, nullopt when acceptable
    virtual std::optional<std::string> CheckPayload(const ActionableRecord& record) const;

    // Only called with Primary or Fallback. May throw; Handle() converts.
    virtual HandlerOutcome Apply(const ActionableRecord& record, CapabilityTier tier) = 0;
};

// Handlers acting on one application package through the bridge
class AppScopedHandler : public ActionableHandler {
public:
    explicit AppScopedHandler(std::shared_ptr<SystemBridge> bridge);

protected:
    std::optional<std::string> CheckPayload(const ActionableRecord& record) const override;

    // Trimmed target; only valid after CheckPayload passed
    static std::string TargetOf(const ActionableRecord& record);

    // Parameter lookup with a fallback
    static std::string Param(const ActionableRecord& record, const std::string& key, const std::string& def = "");

    std::shared_ptr<SystemBridge> m_bridge;
};

#endif // PGUARD_ACTIONABLE_HANDLER_H
