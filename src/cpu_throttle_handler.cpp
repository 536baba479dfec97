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

#include "cpu_throttle_handler.h"
#include "system_bridge.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cstring>

CpuThrottleHandler::CpuThrottleHandler(std::shared_ptr<SystemBridge> bridge, EngineConfig config)
    : AppScopedHandler(std::move(bridge)), m_config(std::move(config))
{
}

CpuThrottleHandler::ThrottleLevel CpuThrottleHandler::ParseLevel(const std::string& mode)
{
    std::string m = ToLower(Trim(mode));
    if (m == "none" || m == "restore" || m == "normal") return ThrottleLevel::None;
    if (m == "moderate" || m == "medium") return ThrottleLevel::Moderate;
    if (m == "aggressive" || m == "high" || m == "max") return ThrottleLevel::Aggressive;
    return ThrottleLevel::Mild;
}

int CpuThrottleHandler::NiceFor(ThrottleLevel level)
{
    switch (level) {
        case ThrottleLevel::None:       return 0;
        case ThrottleLevel::Moderate:   return 15;
        case ThrottleLevel::Aggressive: return 19;
        case ThrottleLevel::Mild:
        default:                        return 10;
    }
}

int CpuThrottleHandler::NiceForNumericLevel(long long level)
{
    static constexpr int kNiceByLevel[10] = { -2, 0, 2, 4, 6, 8, 10, 13, 16, 19 };
    long long clamped = std::clamp<long long>(level, 1, 10);
    return kNiceByLevel[clamped - 1];
}

int CpuThrottleHandler::ResolveNice(const ActionableRecord& record)
{
    if (auto level = ParseInteger(Param(record, "throttle_level"))) {
        return NiceForNumericLevel(*level);
    }
    return NiceFor(ParseLevel(record.requestedMode));
}

std::optional<std::string> CpuThrottleHandler::CheckPayload(const ActionableRecord& record) const
{
    if (auto violation = AppScopedHandler::CheckPayload(record)) return violation;

    const std::string pkg = TargetOf(record);
    if (m_config.IsProtected(pkg)) return "refusing to throttle protected package: " + pkg;
    return std::nullopt;
}

HandlerOutcome CpuThrottleHandler::Apply(const ActionableRecord& record, CapabilityTier tier)
{
    const std::string pkg = TargetOf(record);
    const int nice = ResolveNice(record);

    std::vector<int> pids = m_bridge->FindProcesses(pkg);
    if (pids.empty()) {
        return HandlerOutcome::Fail("no running processes for " + pkg);
    }

    if (tier == CapabilityTier::Fallback)
    {
        std::string cmd = "renice -n " + std::to_string(nice) + " -p";
        for (int pid : pids) cmd += " " + std::to_string(pid);

        CommandResult r = m_bridge->RunCommand({ "su", "-c", cmd });
        if (ClassifyCommand(r) != ProbeVerdict::Granted) {
            return HandlerOutcome::Fail("renice failed: " + DescribeCommandFailure(r));
        }
        return HandlerOutcome::Ok("reniced " + std::to_string(pids.size()) + " processes of " + pkg +
                                  " to " + std::to_string(nice));
    }

    size_t applied = 0;
    int lastError = 0;
    for (int pid : pids) {
        int err = m_bridge->SetProcessNice(pid, nice);
        if (err == 0) {
            ++applied;
        } else {
            lastError = err;
            Log("[THROTTLE] setpriority(" + std::to_string(pid) + ", " + std::to_string(nice) +
                ") failed: " + std::strerror(err));
        }
    }

    if (applied == 0) {
        return HandlerOutcome::Fail(std::string("setpriority failed: ") + std::strerror(lastError));
    }
    return HandlerOutcome::Ok("throttled " + std::to_string(applied) + "/" + std::to_string(pids.size()) +
                              " processes of " + pkg + " to nice " + std::to_string(nice));
}
