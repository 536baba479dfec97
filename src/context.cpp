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

#include "context.h"
#include "system_bridge.h"
#include "access_plan.h"
#include "capability_prober.h"
#include "actionable_registry.h"
#include "usage_alert_handler.h"
#include "outcome_ledger.h"
#include "executor.h"
#include "ipc_server.h"
#include "logger.h"

PGuardContext::PGuardContext() = default;

PGuardContext::~PGuardContext()
{
    Shutdown();
}

bool PGuardContext::Initialize(const std::filesystem::path& configPath)
{
    std::lock_guard lg(m_initMtx);
    if (m_initialized) return true;

    conf.path = configPath;
    if (!ConfigManager::Load(configPath, conf.engine)) {
        Log("[INIT] Config unavailable, running with defaults");
    }
    if (!conf.engine.logDir.empty()) SetLogDirectory(conf.engine.logDir);

    auto& cfg = conf.engine;
    subs.bridge = std::make_shared<LinuxSystemBridge>(std::chrono::milliseconds(cfg.commandTimeoutMs));
    subs.alerts = std::make_shared<AlertBook>();
    subs.notifications = std::make_shared<LogNotificationSink>();
    subs.prober = std::make_unique<CapabilityProber>(BuildDefaultAccessPlans(subs.bridge));
    subs.registry = BuildDefaultRegistry(subs.bridge, cfg, subs.alerts, subs.notifications);

    subs.ledger = std::make_unique<OutcomeLedger>(cfg.ResolvedJournalPath());
    if (!subs.ledger->Open()) {
        Log("[INIT] Outcome journal unavailable; outcomes kept in memory only");
    }

    subs.executor = std::make_unique<Executor>(*subs.registry, *subs.prober, subs.ledger.get(),
                                               std::chrono::milliseconds(cfg.handlerTimeoutMs));

    m_initialized = true;
    Log("[INIT] PowerGuard Actuator initialized");
    return true;
}

void PGuardContext::Shutdown()
{
    std::lock_guard lg(m_initMtx);
    if (!m_initialized) return;

    isRunning.store(false);
    if (subs.ipc) subs.ipc->Shutdown();

    // Reverse construction order
    subs.ipc.reset();
    subs.executor.reset();
    subs.ledger.reset();
    subs.registry.reset();
    subs.prober.reset();
    subs.notifications.reset();
    subs.alerts.reset();
    subs.bridge.reset();

    m_initialized = false;
    Log("[INIT] Shutdown complete");
}
