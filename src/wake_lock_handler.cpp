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

#include "wake_lock_handler.h"
#include "system_bridge.h"
#include "utils.h"
#include <algorithm>

WakeLockPolicy WakeLockHandler::ParsePolicy(const std::string& mode, const std::string& enabledParam)
{
    if (auto enabled = ParseBool(enabledParam)) {
        if (!*enabled) return WakeLockPolicy::Allow;
    }

    std::string m = ToLower(Trim(mode));
    if (m == "inspect" || m == "report" || m == "list") return WakeLockPolicy::Inspect;
    if (m == "deny") return WakeLockPolicy::Deny;
    if (m == "allow" || m == "enable" || m == "default") return WakeLockPolicy::Allow;
    return WakeLockPolicy::Ignore;
}

const char* WakeLockHandler::AppOpMode(WakeLockPolicy policy)
{
    switch (policy) {
        case WakeLockPolicy::Deny:  return "deny";
        case WakeLockPolicy::Allow: return "allow";
        default:                    return "ignore";
    }
}

HandlerOutcome WakeLockHandler::Apply(const ActionableRecord& record, CapabilityTier tier)
{
    const WakeLockPolicy policy = ParsePolicy(record.requestedMode, Param(record, "enabled"));
    if (policy == WakeLockPolicy::Inspect) return Inspect(record);

    const std::string pkg = TargetOf(record);
    const char* mode = AppOpMode(policy);

    std::vector<std::string> argv;
    if (tier == CapabilityTier::Primary) argv = { "cmd", "appops", "set", pkg, "WAKE_LOCK", mode };
    else                                 argv = { "appops", "set", pkg, "WAKE_LOCK", mode };

    CommandResult r = m_bridge->RunCommand(argv);
    if (ClassifyCommand(r) != ProbeVerdict::Granted) {
        return HandlerOutcome::Fail("WAKE_LOCK app-op failed: " + DescribeCommandFailure(r));
    }
    return HandlerOutcome::Ok("wake locks of " + pkg + " set to " + mode);
}

HandlerOutcome WakeLockHandler::Inspect(const ActionableRecord& record)
{
    std::vector<WakeSourceStat> sources = m_bridge->ReadWakeSources();
    if (sources.empty()) return HandlerOutcome::Ok("no kernel wake sources readable");

    std::sort(sources.begin(), sources.end(), [](const WakeSourceStat& a, const WakeSourceStat& b) {
        if (a.totalTimeMs != b.totalTimeMs) return a.totalTimeMs > b.totalTimeMs;
        return a.name < b.name;
    });

    size_t limit = 5;
    if (auto v = ParseInteger(Param(record, "limit"))) {
        if (*v > 0) limit = static_cast<size_t>(*v);
    }
    limit = std::min(limit, sources.size());

    std::string detail = std::to_string(sources.size()) + " wake sources; top:";
    for (size_t i = 0; i < limit; ++i) {
        detail += " " + sources[i].name + "(" + std::to_string(sources[i].totalTimeMs) + "ms)";
    }
    return HandlerOutcome::Ok(detail);
}
