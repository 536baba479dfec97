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

#ifndef PGUARD_TEST_SUPPORT_H
#define PGUARD_TEST_SUPPORT_H

#include "system_bridge.h"
#include "access_plan.h"
#include "types.h"
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <unistd.h>
#include <string>
#include <vector>

// Scriptable bridge that records every OS-facing call
class FakeSystemBridge : public SystemBridge {
public:
    // Scripted behaviour
    std::function<CommandResult(const std::vector<std::string>&)> onCommand;
    std::map<std::string, std::vector<int>> processes;
    std::map<std::string, int> uids;
    std::map<int, int> niceErrors;    // pid -> errno
    std::map<int, int> signalErrors;  // pid -> errno
    std::vector<WakeSourceStat> wakeSources;
    std::set<int> capabilities;
    int apiLevel = 33;

    CommandResult RunCommand(const std::vector<std::string>& argv) override {
        std::lock_guard lk(m_mtx);
        commands.push_back(argv);
        if (onCommand) return onCommand(argv);
        CommandResult ok;
        ok.launched = true;
        ok.exitCode = 0;
        return ok;
    }

    std::vector<int> FindProcesses(const std::string& packageName) override {
        std::lock_guard lk(m_mtx);
        ++findCalls;
        auto it = processes.find(packageName);
        return it != processes.end() ? it->second : std::vector<int>{};
    }

    std::optional<int> ResolvePackageUid(const std::string& packageName) override {
        std::lock_guard lk(m_mtx);
        ++uidCalls;
        auto it = uids.find(packageName);
        if (it == uids.end()) return std::nullopt;
        return it->second;
    }

    int SetProcessNice(int pid, int nice) override {
        std::lock_guard lk(m_mtx);
        niceCalls.emplace_back(pid, nice);
        auto it = niceErrors.find(pid);
        return it != niceErrors.end() ? it->second : 0;
    }

    int SendSignal(int pid, int sig) override {
        std::lock_guard lk(m_mtx);
        signalCalls.emplace_back(pid, sig);
        auto it = signalErrors.find(pid);
        return it != signalErrors.end() ? it->second : 0;
    }

    std::vector<WakeSourceStat> ReadWakeSources() override {
        std::lock_guard lk(m_mtx);
        ++wakeReads;
        return wakeSources;
    }

    bool HasCapability(int capBit) override {
        std::lock_guard lk(m_mtx);
        ++capabilityChecks;
        return capabilities.count(capBit) > 0;
    }

    int PlatformApiLevel() override {
        std::lock_guard lk(m_mtx);
        ++apiQueries;
        return apiLevel;
    }

    size_t TotalCalls() const {
        std::lock_guard lk(m_mtx);
        return commands.size() + niceCalls.size() + signalCalls.size() +
               findCalls + uidCalls + wakeReads + capabilityChecks + apiQueries;
    }

    std::vector<std::vector<std::string>> Commands() const {
        std::lock_guard lk(m_mtx);
        return commands;
    }

    // Recorded calls
    std::vector<std::vector<std::string>> commands;
    std::vector<std::pair<int, int>> niceCalls;
    std::vector<std::pair<int, int>> signalCalls;
    size_t findCalls = 0;
    size_t uidCalls = 0;
    size_t wakeReads = 0;
    size_t capabilityChecks = 0;
    size_t apiQueries = 0;

private:
    mutable std::mutex m_mtx;
};

inline CommandResult CommandOutput(int exitCode, const std::string& output) {
    CommandResult r;
    r.launched = true;
    r.exitCode = exitCode;
    r.output = output;
    return r;
}

// Probe plan with fixed verdicts and per-mechanism call counters
struct ScriptedPlan {
    ProbeVerdict primary = ProbeVerdict::Granted;
    ProbeVerdict fallback = ProbeVerdict::Granted;
    std::shared_ptr<std::atomic<int>> primaryCalls = std::make_shared<std::atomic<int>>(0);
    std::shared_ptr<std::atomic<int>> fallbackCalls = std::make_shared<std::atomic<int>>(0);
};

// Every domain not listed in 'overrides' gets a plan whose primary is granted
inline AccessPlanTable ScriptedPlans(std::map<CapabilityDomain, ScriptedPlan>& overrides) {
    AccessPlanTable table;
    for (size_t i = 0; i < CAPABILITY_DOMAIN_COUNT; ++i) {
        auto domain = static_cast<CapabilityDomain>(i);
        ScriptedPlan& plan = overrides[domain];
        auto primaryVerdict = plan.primary;
        auto fallbackVerdict = plan.fallback;
        auto primaryCalls = plan.primaryCalls;
        auto fallbackCalls = plan.fallbackCalls;
        table[domain].mechanisms = {
            { CapabilityTier::Primary, "scripted-primary", [primaryVerdict, primaryCalls]() {
                ++*primaryCalls;
                return primaryVerdict;
            } },
            { CapabilityTier::Fallback, "scripted-fallback", [fallbackVerdict, fallbackCalls]() {
                ++*fallbackCalls;
                return fallbackVerdict;
            } },
        };
    }
    return table;
}

inline ActionableRecord MakeRecord(const std::string& id, const std::string& type,
                                   std::optional<std::string> target, const std::string& mode = "",
                                   std::map<std::string, std::string> params = {}) {
    ActionableRecord r;
    r.id = id;
    r.type = type;
    r.target = std::move(target);
    r.requestedMode = mode;
    r.reason = "test";
    r.parameters = std::move(params);
    return r;
}

// Fresh directory under the system temp dir, removed on destruction
class ScopedTempDir {
public:
    ScopedTempDir() {
        static std::atomic<int> counter{0};
        m_path = std::filesystem::temp_directory_path() /
                 ("pguard_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(m_path);
    }
    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

#endif // PGUARD_TEST_SUPPORT_H
