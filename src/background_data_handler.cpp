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

#include "background_data_handler.h"
#include "system_bridge.h"
#include "utils.h"

BackgroundDataPolicy BackgroundDataHandler::ParsePolicy(const std::string& mode, const std::string& enabledParam)
{
    if (auto enabled = ParseBool(enabledParam)) {
        if (!*enabled) return BackgroundDataPolicy::Allow;
    }

    std::string m = ToLower(Trim(mode));
    if (m == "allow" || m == "unrestricted" || m == "disable" || m == "off" || m == "none") {
        return BackgroundDataPolicy::Allow;
    }
    // restrict / restricted / enable / on / deny, and anything unrecognized
    return BackgroundDataPolicy::Restrict;
}

HandlerOutcome BackgroundDataHandler::Apply(const ActionableRecord& record, CapabilityTier tier)
{
    const std::string pkg = TargetOf(record);
    const BackgroundDataPolicy policy = ParsePolicy(record.requestedMode, Param(record, "enabled"));

    auto uid = m_bridge->ResolvePackageUid(pkg);
    if (!uid) {
        return HandlerOutcome::Fail("unknown package: " + pkg);
    }

    const char* list = tier == CapabilityTier::Primary ? "restrict-background-denylist"
                                                       : "restrict-background-blacklist";
    const char* verb = policy == BackgroundDataPolicy::Restrict ? "add" : "remove";

    CommandResult r = m_bridge->RunCommand({ "cmd", "netpolicy", verb, list, std::to_string(*uid) });
    if (ClassifyCommand(r) != ProbeVerdict::Granted) {
        return HandlerOutcome::Fail(std::string("netpolicy ") + verb + " failed: " + DescribeCommandFailure(r));
    }

    return HandlerOutcome::Ok("background data of " + pkg + " (uid " + std::to_string(*uid) + ") " +
                              (policy == BackgroundDataPolicy::Restrict ? "restricted" : "allowed"));
}
