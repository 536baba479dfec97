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

#include "access_plan.h"
#include "system_bridge.h"
#include "constants.h"

namespace {

    // Mechanism gated on a minimum platform revision. API level 0 (plain Linux) never qualifies.
    ProbeVerdict ProbeVersioned(SystemBridge& bridge, int minApi, const std::vector<std::string>& query)
    {
        int api = bridge.PlatformApiLevel();
        if (api < minApi) return ProbeVerdict::NotPresent;
        return ClassifyCommand(bridge.RunCommand(query));
    }

    ProbeVerdict ProbeCommand(SystemBridge& bridge, const std::vector<std::string>& query)
    {
        return ClassifyCommand(bridge.RunCommand(query));
    }

    ProbeVerdict ProbeCapability(SystemBridge& bridge, int capBit)
    {
        return bridge.HasCapability(capBit) ? ProbeVerdict::Granted : ProbeVerdict::PermissionDenied;
    }
}

AccessPlanTable BuildDefaultAccessPlans(std::shared_ptr<SystemBridge> bridge)
{
    AccessPlanTable plans;

    plans[CapabilityDomain::IdleState].mechanisms = {
        { CapabilityTier::Primary, "am set-standby-bucket", [bridge]() {
            return ProbeVersioned(*bridge, API_LEVEL_STANDBY_BUCKETS,
                                  { "am", "get-standby-bucket", "android" });
        } },
        { CapabilityTier::Fallback, "appops RUN_ANY_IN_BACKGROUND", [bridge]() {
            return ProbeCommand(*bridge, { "cmd", "appops", "get", "android", "RUN_ANY_IN_BACKGROUND" });
        } },
    };

    plans[CapabilityDomain::BackgroundTransfer].mechanisms = {
        { CapabilityTier::Primary, "netpolicy restrict-background-denylist", [bridge]() {
            return ProbeVersioned(*bridge, API_LEVEL_NETPOLICY_DENYLIST,
                                  { "cmd", "netpolicy", "list", "restrict-background-denylist" });
        } },
        { CapabilityTier::Fallback, "netpolicy restrict-background-blacklist", [bridge]() {
            return ProbeCommand(*bridge, { "cmd", "netpolicy", "list", "restrict-background-blacklist" });
        } },
    };

    plans[CapabilityDomain::ProcessTermination].mechanisms = {
        { CapabilityTier::Primary, "am force-stop", [bridge]() {
            return ProbeCommand(*bridge, { "am", "force-stop", PROBE_SENTINEL_PACKAGE });
        } },
        { CapabilityTier::Fallback, "signal", [bridge]() {
            return ProbeCapability(*bridge, CAP_BIT_KILL);
        } },
    };

    plans[CapabilityDomain::WakeSource].mechanisms = {
        { CapabilityTier::Primary, "cmd appops WAKE_LOCK", [bridge]() {
            return ProbeCommand(*bridge, { "cmd", "appops", "get", "android", "WAKE_LOCK" });
        } },
        { CapabilityTier::Fallback, "appops WAKE_LOCK", [bridge]() {
            return ProbeCommand(*bridge, { "appops", "get", "android", "WAKE_LOCK" });
        } },
    };

    plans[CapabilityDomain::CpuThrottle].mechanisms = {
        { CapabilityTier::Primary, "setpriority", [bridge]() {
            return ProbeCapability(*bridge, CAP_BIT_SYS_NICE);
        } },
        { CapabilityTier::Fallback, "su renice", [bridge]() {
            return ProbeCommand(*bridge, { "su", "-c", "true" });
        } },
    };

    // Notification-only: nothing to probe
    plans[CapabilityDomain::UsageAlert].mechanisms = {
        { CapabilityTier::Primary, "notification sink", []() { return ProbeVerdict::Granted; } },
    };

    return plans;
}
