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

#ifndef PGUARD_WAKE_LOCK_HANDLER_H
#define PGUARD_WAKE_LOCK_HANDLER_H

#include "actionable_handler.h"

enum class WakeLockPolicy : uint8_t {
    Ignore,   // Acquire calls succeed but have no effect
    Deny,
    Allow,
    Inspect   // Read-only report of kernel wake sources
};

// Wake-source management through the WAKE_LOCK app-op
class WakeLockHandler : public AppScopedHandler {
public:
    using AppScopedHandler::AppScopedHandler;

    CapabilityDomain Domain() const override { return CapabilityDomain::WakeSource; }
    const char* Name() const override { return "WakeLock"; }

    // "enabled=false" forces Allow; unrecognized modes map to Ignore
    static WakeLockPolicy ParsePolicy(const std::string& mode, const std::string& enabledParam);
    static const char* AppOpMode(WakeLockPolicy policy);

protected:
    HandlerOutcome Apply(const ActionableRecord& record, CapabilityTier tier) override;

private:
    HandlerOutcome Inspect(const ActionableRecord& record);
};

#endif // PGUARD_WAKE_LOCK_HANDLER_H
