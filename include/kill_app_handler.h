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

#ifndef PGUARD_KILL_APP_HANDLER_H
#define PGUARD_KILL_APP_HANDLER_H

#include "actionable_handler.h"
#include "config.h"

enum class TerminationMode : uint8_t {
    Background,  // Only cached/background processes (am kill, SIGTERM)
    ForceStop    // Whole package (am force-stop, SIGKILL)
};

// Process termination. The host application and protected packages are refused.
class KillAppHandler : public AppScopedHandler {
public:
    KillAppHandler(std::shared_ptr<SystemBridge> bridge, EngineConfig config);

    CapabilityDomain Domain() const override { return CapabilityDomain::ProcessTermination; }
    const char* Name() const override { return "KillApp"; }

    // Unrecognized modes map to Background
    static TerminationMode ParseMode(const std::string& mode);

protected:
    std::optional<std::string> CheckPayload(const ActionableRecord& record) const override;
    HandlerOutcome Apply(const ActionableRecord& record, CapabilityTier tier) override;

private:
    HandlerOutcome SignalProcesses(const std::string& pkg, TerminationMode mode);

    EngineConfig m_config;
};

#endif // PGUARD_KILL_APP_HANDLER_H
