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

#include "system_bridge.h"
#include "logger.h"
#include "utils.h"
#include <sstream>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <sys/resource.h>

static constexpr size_t MAX_COMMAND_OUTPUT = 64 * 1024;

ProbeVerdict ClassifyCommand(const CommandResult& r)
{
    if (!r.launched || r.exitCode == 127) return ProbeVerdict::NotPresent;
    if (ContainsIgnoreCase(r.output, "SecurityException") ||
        ContainsIgnoreCase(r.output, "Permission Denial") ||
        ContainsIgnoreCase(r.output, "not allowed") ||
        ContainsIgnoreCase(r.output, "Operation not permitted")) {
        return ProbeVerdict::PermissionDenied;
    }
    if (r.timedOut) return ProbeVerdict::Error;
    if (r.exitCode == 0) return ProbeVerdict::Granted;
    // "Unknown command" from cmd/am on older platform revisions
    if (ContainsIgnoreCase(r.output, "Unknown command") || ContainsIgnoreCase(r.output, "Can't find service")) {
        return ProbeVerdict::NotPresent;
    }
    return ProbeVerdict::Error;
}

std::string DescribeCommandFailure(const CommandResult& r)
{
    if (!r.launched) return "command not found";
    if (r.timedOut) return "command timed out";
    std::string first = SanitizeText(Trim(r.output.substr(0, r.output.find('\n'))));
    if (!first.empty()) return first;
    return "exit code " + std::to_string(r.exitCode);
}

LinuxSystemBridge::LinuxSystemBridge(std::chrono::milliseconds commandTimeout)
    : m_commandTimeout(commandTimeout)
{
}

CommandResult LinuxSystemBridge::RunCommand(const std::vector<std::string>& argv)
{
    CommandResult result;
    if (argv.empty()) return result;

    // Prepare argv before fork: the child may only call async-signal-safe functions
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        Log("[BRIDGE] pipe2 failed: " + std::string(std::strerror(errno)));
        return result;
    }
    UniqueFd readEnd(fds[0]);
    UniqueFd writeEnd(fds[1]);

    pid_t pid = ::fork();
    if (pid < 0) {
        Log("[BRIDGE] fork failed: " + std::string(std::strerror(errno)));
        return result;
    }

    if (pid == 0) {
        ::dup2(writeEnd.get(), STDOUT_FILENO);
        ::dup2(writeEnd.get(), STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::execvp(cargv[0], cargv.data());
        ::_exit(127);
    }

    writeEnd.reset();

    auto deadline = std::chrono::steady_clock::now() + m_commandTimeout;
    char buf[4096];
    bool eof = false;

    while (!eof) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timedOut = true;
            break;
        }

        struct pollfd pfd = { readEnd.get(), POLLIN, 0 };
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue; // deadline re-checked at loop top

        ssize_t n = ::read(readEnd.get(), buf, sizeof(buf));
        if (n > 0) {
            if (result.output.size() < MAX_COMMAND_OUTPUT)
                result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR) {
            break;
        }
    }

    if (result.timedOut) {
        ::kill(pid, SIGKILL);
        Log("[BRIDGE] Command timed out after " + std::to_string(m_commandTimeout.count()) +
            "ms: " + JoinArgs(argv));
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    result.launched = true;
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        if (result.exitCode == 127 && result.output.empty()) result.launched = false;
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    return result;
}

std::vector<int> LinuxSystemBridge::FindProcesses(const std::string& packageName)
{
    std::vector<int> pids;
    if (packageName.empty()) return pids;

    const int self = static_cast<int>(::getpid());
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        auto pid = ParseInteger(name);
        if (!pid || *pid <= 0 || *pid == self) continue;

        auto cmdline = ReadSmallFile(entry.path() / "cmdline", 4096);
        if (!cmdline || cmdline->empty()) continue;

        std::string proc = cmdline->substr(0, cmdline->find('\0'));
        if (proc == packageName ||
            (proc.size() > packageName.size() &&
             proc.compare(0, packageName.size(), packageName) == 0 &&
             proc[packageName.size()] == ':')) {
            pids.push_back(static_cast<int>(*pid));
        }
    }
    return pids;
}

std::optional<int> LinuxSystemBridge::ParsePackageUid(const std::string& listing, const std::string& packageName)
{
    std::istringstream in(listing);
    std::string line;
    const std::string want = "package:" + packageName;
    while (std::getline(in, line)) {
        std::istringstream tokens(line);
        std::string pkgTok, uidTok;
        tokens >> pkgTok >> uidTok;
        if (pkgTok != want) continue;
        if (uidTok.rfind("uid:", 0) != 0) continue;
        auto uid = ParseInteger(uidTok.substr(4));
        if (uid && *uid >= 0) return static_cast<int>(*uid);
    }
    return std::nullopt;
}

std::optional<int> LinuxSystemBridge::ResolvePackageUid(const std::string& packageName)
{
    if (!IsValidPackageName(packageName)) return std::nullopt;

    struct stat st {};
    const std::string dataDir = "/data/data/" + packageName;
    if (::stat(dataDir.c_str(), &st) == 0) {
        return static_cast<int>(st.st_uid);
    }

    CommandResult r = RunCommand({ "cmd", "package", "list", "packages", "-U", packageName });
    if (r.exitCode != 0) return std::nullopt;
    return ParsePackageUid(r.output, packageName);
}

int LinuxSystemBridge::SetProcessNice(int pid, int nice)
{
    if (::setpriority(PRIO_PROCESS, static_cast<id_t>(pid), nice) != 0) return errno;
    return 0;
}

int LinuxSystemBridge::SendSignal(int pid, int sig)
{
    if (pid <= 0) return EINVAL;
    if (::kill(pid, sig) != 0) return errno;
    return 0;
}

std::vector<WakeSourceStat> LinuxSystemBridge::ParseWakeSources(const std::string& table)
{
    // name active_count event_count wakeup_count expire_count active_since total_time
    // max_time last_change prevent_suspend_time
    std::vector<WakeSourceStat> out;
    std::istringstream in(table);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) { header = false; continue; }

        std::istringstream row(line);
        std::vector<std::string> cols;
        std::string tok;
        while (row >> tok) cols.push_back(tok);
        if (cols.size() < 10) continue;

        WakeSourceStat s;
        s.name = cols[0];
        auto active = ParseInteger(cols[1]);
        auto total = ParseInteger(cols[6]);
        auto prevent = ParseInteger(cols[9]);
        if (!active || !total) continue;
        s.activeCount = static_cast<uint64_t>(*active);
        s.totalTimeMs = static_cast<uint64_t>(*total);
        s.preventSuspendTimeMs = prevent ? static_cast<uint64_t>(*prevent) : 0;
        out.push_back(std::move(s));
    }
    return out;
}

std::vector<WakeSourceStat> LinuxSystemBridge::ReadWakeSources()
{
    for (const char* path : { "/sys/kernel/debug/wakeup_sources", "/d/wakeup_sources" }) {
        auto table = ReadSmallFile(path);
        if (table && !table->empty()) return ParseWakeSources(*table);
    }
    return {};
}

bool LinuxSystemBridge::HasCapability(int capBit)
{
    if (::geteuid() == 0) return true;
    if (capBit < 0 || capBit > 63) return false;

    auto status = ReadSmallFile("/proc/self/status", 16384);
    if (!status) return false;

    std::istringstream in(*status);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("CapEff:", 0) != 0) continue;
        std::string hex = Trim(line.substr(7));
        try {
            unsigned long long mask = std::stoull(hex, nullptr, 16);
            return (mask >> capBit) & 1ULL;
        } catch (const std::exception&) {
            return false;
        }
    }
    return false;
}

int LinuxSystemBridge::PlatformApiLevel()
{
    std::call_once(m_apiOnce, [this]() {
        CommandResult r = RunCommand({ "getprop", "ro.build.version.sdk" });
        if (r.exitCode == 0) {
            auto v = ParseInteger(r.output);
            if (v && *v > 0) m_apiLevel = static_cast<int>(*v);
        }
        Log("[BRIDGE] Platform API level: " + std::to_string(m_apiLevel));
    });
    return m_apiLevel;
}
