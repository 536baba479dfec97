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

#ifndef PGUARD_SYSTEM_BRIDGE_H
#define PGUARD_SYSTEM_BRIDGE_H

#include "types.h"
#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <chrono>

struct CommandResult {
    bool launched = false;   // false: exec failed / binary missing
    bool timedOut = false;
    int exitCode = -1;
    std::string output;      // stdout + stderr
};

// Maps one command outcome to a verdict. Shared by probes and handlers.
ProbeVerdict ClassifyCommand(const CommandResult& r);

// Short human-readable reason for a failed command (first output line or exit code)
std::string DescribeCommandFailure(const CommandResult& r);

// The only path from the engine to the OS.
class SystemBridge {
public:
    virtual ~SystemBridge() = default;

    // Runs argv[0] with arguments; never via a shell.
    virtual CommandResult RunCommand(const std::vector<std::string>& argv) = 0;

    // Pids whose process name is the package or "package:<suffix>"
    virtual std::vector<int> FindProcesses(const std::string& packageName) = 0;

    virtual std::optional<int> ResolvePackageUid(const std::string& packageName) = 0;

    // Return 0 on success, errno otherwise
    virtual int SetProcessNice(int pid, int nice) = 0;
    virtual int SendSignal(int pid, int sig) = 0;

    virtual std::vector<WakeSourceStat> ReadWakeSources() = 0;

    // Effective capability bit, or root
    virtual bool HasCapability(int capBit) = 0;

    // ro.build.version.sdk; 0 when unknown (non-Android Linux)
    virtual int PlatformApiLevel() = 0;
};

class LinuxSystemBridge : public SystemBridge {
public:
    explicit LinuxSystemBridge(std::chrono::milliseconds commandTimeout);

    CommandResult RunCommand(const std::vector<std::string>& argv) override;
    std::vector<int> FindProcesses(const std::string& packageName) override;
    std::optional<int> ResolvePackageUid(const std::string& packageName) override;
    int SetProcessNice(int pid, int nice) override;
    int SendSignal(int pid, int sig) override;
    std::vector<WakeSourceStat> ReadWakeSources() override;
    bool HasCapability(int capBit) override;
    int PlatformApiLevel() override;

    // Parses the kernel wakeup_sources table (exposed for tests)
    static std::vector<WakeSourceStat> ParseWakeSources(const std::string& table);

    // Parses "package:<name> uid:<n>" lines from `cmd package list packages -U`
    static std::optional<int> ParsePackageUid(const std::string& listing, const std::string& packageName);

private:
    std::chrono::milliseconds m_commandTimeout;

    std::once_flag m_apiOnce;
    int m_apiLevel = 0;
};

#endif // PGUARD_SYSTEM_BRIDGE_H
