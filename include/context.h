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

#ifndef PGUARD_CONTEXT_H
#define PGUARD_CONTEXT_H

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include "types.h"
#include "config.h"

// Forward declarations to avoid circular dependencies
class SystemBridge;
class CapabilityProber;
class ActionableRegistry;
class OutcomeLedger;
class Executor;
class AlertBook;
class NotificationSink;
class IpcServer;

class PGuardContext {
public:
    static PGuardContext& Get() {
        static PGuardContext instance;
        return instance;
    }

    // Delete copy/move to enforce singleton
    PGuardContext(const PGuardContext&) = delete;
    PGuardContext& operator=(const PGuardContext&) = delete;

    // Loads config and builds every subsystem. Safe to call once.
    bool Initialize(const std::filesystem::path& configPath);
    void Shutdown();

    // -- App State --
    std::atomic<bool> isRunning{true};

    // -- Configuration (immutable after Initialize) --
    struct ConfigState {
        std::filesystem::path path;
        EngineConfig engine;
    } conf;

    // -- Subsystems --
    struct Subsystems {
        std::shared_ptr<SystemBridge> bridge;
        std::shared_ptr<AlertBook> alerts;
        std::shared_ptr<NotificationSink> notifications;
        std::unique_ptr<CapabilityProber> prober;
        std::unique_ptr<ActionableRegistry> registry;
        std::unique_ptr<OutcomeLedger> ledger;
        std::unique_ptr<Executor> executor;
        std::unique_ptr<IpcServer> ipc;
    } subs;

private:
    PGuardContext();
    ~PGuardContext();

    std::mutex m_initMtx;
    bool m_initialized = false;
};

#endif // PGUARD_CONTEXT_H
