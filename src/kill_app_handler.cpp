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

#include "kill_app_handler.h"
#include "system_bridge.h"
#include "logger.h"
#include "utils.h"
#include <csignal>
#include <cerrno>
#include <cstring>

KillAppHandler::KillAppHandler(std::shared_ptr<SystemBridge> bridge, EngineConfig config)
    : AppScopedHandler(std::move(bridge)), m_config(std::move(config))
{
}

TerminationMode KillAppHandler::ParseMode(const std::string& mode)
{
    std::string m = ToLower(Trim(mode));
    if (m == "force_stop" || m == "force" || m == "kill" || m == "stop") return TerminationMode::ForceStop;
    return TerminationMode::Background;
}

std::optional<std::string> KillAppHandler::CheckPayload(const ActionableRecord& record) const
{
    if (auto violation = AppScopedHandler::CheckPayload(record)) return violation;

    const std::string pkg = TargetOf(record);
    if (m_config.IsProtected(pkg)) return "refusing to stop protected package: " + pkg;
    return std::nullopt;
}

HandlerOutcome KillAppHandler::Apply(const ActionableRecord& record, CapabilityTier tier)
{
    const std::string pkg = TargetOf(record);
    const TerminationMode mode = ParseMode(record.requestedMode);

    if (tier == CapabilityTier::Fallback) return SignalProcesses(pkg, mode);

    const char* verb = mode == TerminationMode::ForceStop ? "force-stop" : "kill";
    CommandResult r = m_bridge->RunCommand({ "am", verb, pkg });
    if (ClassifyCommand(r) != ProbeVerdict::Granted) {
        return HandlerOutcome::Fail(std::string("am ") + verb + " failed: " + DescribeCommandFailure(r));
    }
    return HandlerOutcome::Ok(mode == TerminationMode::ForceStop
                                  ? "force-stopped " + pkg
                                  : "killed background processes of " + pkg);
}

HandlerOutcome KillAppHandler::SignalProcesses(const std::string& pkg, TerminationMode mode)
{
    std::vector<int> pids = m_bridge->FindProcesses(pkg);
    if (pids.empty()) return HandlerOutcome::Ok(pkg + " not running");

    const int sig = mode == TerminationMode::ForceStop ? SIGKILL : SIGTERM;
    size_t signalled = 0;
    int lastError = 0;

    for (int pid : pids) {
        int err = m_bridge->SendSignal(pid, sig);
        // ESRCH: exited between lookup and signal
        if (err == 0 || err == ESRCH) {
            ++signalled;
        } else {
            lastError = err;
            Log("[HANDLER] KillApp: signal " + std::to_string(sig) + " to " + std::to_string(pid) +
                " failed: " + std::strerror(err));
        }
    }

    if (signalled == 0) {
        return HandlerOutcome::Fail(std::string("signal failed: ") + std::strerror(lastError));
    }
    return HandlerOutcome::Ok(std::string("sent ") + (sig == SIGKILL ? "SIGKILL" : "SIGTERM") + " to " +
                              std::to_string(signalled) + "/" + std::to_string(pids.size()) +
                              " processes of " + pkg);
}
