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

#ifndef PGUARD_CPU_THROTTLE_HANDLER_H
#define PGUARD_CPU_THROTTLE_HANDLER_H

#include "actionable_handler.h"
#include "config.h"

// CPU/priority throttling of every process belonging to a package
class CpuThrottleHandler : public AppScopedHandler {
public:
    // Granular Throttle Levels
    enum class ThrottleLevel {
        None,       // nice 0
        Mild,       // nice 10 (background)
        Moderate,   // nice 15
        Aggressive  // nice 19
    };

    CpuThrottleHandler(std::shared_ptr<SystemBridge> bridge, EngineConfig config);

    CapabilityDomain Domain() const override { return CapabilityDomain::CpuThrottle; }
    const char* Name() const override { return "CpuThrottle"; }

    // Unrecognized modes map to Mild
    static ThrottleLevel ParseLevel(const std::string& mode);
    static int NiceFor(ThrottleLevel level);

    // throttle_level 1..10 (clamped) to a nice value
    static int NiceForNumericLevel(long long level);

    // Resolves mode + "throttle_level" parameter into the target nice value
    static int ResolveNice(const ActionableRecord& record);

protected:
    std::optional<std::string> CheckPayload(const ActionableRecord& record) const override;
    HandlerOutcome Apply(const ActionableRecord& record, CapabilityTier tier) override;

private:
    EngineConfig m_config;
};

#endif // PGUARD_CPU_THROTTLE_HANDLER_H
