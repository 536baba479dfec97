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

#include "ipc_server.h"
#include "executor.h"
#include "capability_prober.h"
#include "outcome_ledger.h"
#include "batch_codec.h"
#include "constants.h"
#include "logger.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>

using json = nlohmann::json;

IpcServer::IpcServer(std::filesystem::path socketPath, std::vector<uint32_t> allowedUids,
                     Executor& executor, CapabilityProber& prober, OutcomeLedger& ledger)
    : m_socketPath(std::move(socketPath)), m_allowedUids(std::move(allowedUids)),
      m_executor(executor), m_prober(prober), m_ledger(ledger)
{
}

IpcServer::~IpcServer() {
    Shutdown();
}

bool IpcServer::Initialize() {
    if (m_running.load()) return true;

    const std::string path = m_socketPath.string();
    sockaddr_un addr {};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        Log("[IPC] Socket path invalid or too long: " + path);
        return false;
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd) {
        Log("[IPC] socket() failed: " + std::string(std::strerror(errno)));
        return false;
    }

    std::error_code ec;
    if (m_socketPath.has_parent_path()) std::filesystem::create_directories(m_socketPath.parent_path(), ec);
    ::unlink(path.c_str()); // Stale socket from a previous run

    if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        Log("[IPC] bind(" + path + ") failed: " + std::string(std::strerror(errno)));
        return false;
    }
    // Access control happens per request via SO_PEERCRED
    ::chmod(path.c_str(), 0666);

    if (::listen(fd.get(), 8) != 0) {
        Log("[IPC] listen() failed: " + std::string(std::strerror(errno)));
        return false;
    }

    int pipeFds[2];
    if (::pipe2(pipeFds, O_CLOEXEC | O_NONBLOCK) != 0) {
        Log("[IPC] pipe2() failed: " + std::string(std::strerror(errno)));
        return false;
    }
    m_wakeRead.reset(pipeFds[0]);
    m_wakeWrite.reset(pipeFds[1]);
    m_listenFd = std::move(fd);

    m_running.store(true);
    m_worker = std::thread(&IpcServer::WorkerThread, this);
    Log("[IPC] Listening on " + path);
    return true;
}

void IpcServer::Shutdown() {
    if (!m_running.exchange(false)) return;

    if (m_wakeWrite) {
        char b = 1;
        ssize_t n = ::write(m_wakeWrite.get(), &b, 1);
        (void)n; // Pipe full still wakes the poll
    }
    if (m_worker.joinable()) m_worker.join();

    m_listenFd.reset();
    m_wakeRead.reset();
    m_wakeWrite.reset();
    ::unlink(m_socketPath.c_str());
    Log("[IPC] Stopped");
}

void IpcServer::WorkerThread() {
    while (m_running.load()) {
        struct pollfd fds[2] = {
            { m_listenFd.get(), POLLIN, 0 },
            { m_wakeRead.get(), POLLIN, 0 },
        };

        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            Log("[IPC] poll() failed: " + std::string(std::strerror(errno)));
            break;
        }
        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & POLLIN)) continue;

        int client = ::accept4(m_listenFd.get(), nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno != EINTR && errno != EAGAIN) {
                Log("[IPC] accept() failed: " + std::string(std::strerror(errno)));
            }
            continue;
        }
        try {
            ServeConnection(client);
        }
        catch (const std::exception& e) {
            Log(std::string("[IPC] Connection dropped: ") + e.what());
        }
    }
}

void IpcServer::ServeConnection(int clientFd) {
    UniqueFd client(clientFd);

    // 1. Identify the caller
    ucred cred {};
    socklen_t len = sizeof(cred);
    PeerIdentity peer;
    bool identified = ::getsockopt(client.get(), SOL_SOCKET, SO_PEERCRED, &cred, &len) == 0;
    if (identified) {
        peer.pid = cred.pid;
        peer.uid = cred.uid;
    }

    timeval tv { 2, 0 };
    ::setsockopt(client.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(client.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    std::string response;
    if (!identified) {
        json resp;
        resp["status"] = "error";
        resp["message"] = "Authentication Failed";
        response = DumpJson(resp);
        Log("[IPC] Auth Failed: SO_PEERCRED unavailable");
    } else {
        // 2. Read one request (newline or EOF terminated)
        std::string request;
        char buf[4096];
        while (request.size() < IPC_MAX_REQUEST_BYTES) {
            ssize_t n = ::read(client.get(), buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            request.append(buf, static_cast<size_t>(n));
            if (request.find('\n') != std::string::npos) break;
        }
        response = ProcessRequest(request, peer);
    }

    response += '\n';
    size_t off = 0;
    while (off < response.size()) {
        ssize_t n = ::write(client.get(), response.data() + off, response.size() - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        off += static_cast<size_t>(n);
    }
}

bool IpcServer::IsTrusted(const PeerIdentity& peer) const {
    if (peer.uid == 0 || peer.uid == ::geteuid()) return true;
    return std::find(m_allowedUids.begin(), m_allowedUids.end(), static_cast<uint32_t>(peer.uid)) != m_allowedUids.end();
}

bool IpcServer::CheckRateLimit(pid_t pid) {
    std::lock_guard lk(m_rateMtx);
    auto now = std::chrono::steady_clock::now();

    // Policy: 10 Requests / Second (Burst Size)
    const auto REFILL_INTERVAL = std::chrono::seconds(1);

    // Buckets idle past a full refill are indistinguishable from new ones
    for (auto stale = m_clientBuckets.begin(); stale != m_clientBuckets.end();) {
        if (now - stale->second.lastRefill >= REFILL_INTERVAL) stale = m_clientBuckets.erase(stale);
        else ++stale;
    }

    auto it = m_clientBuckets.find(pid);
    if (it == m_clientBuckets.end()) {
        it = m_clientBuckets.emplace(pid, RateBucket{ now, IPC_MAX_TOKENS }).first;
    }
    auto& bucket = it->second;

    // Lazy Refill
    if (now - bucket.lastRefill >= REFILL_INTERVAL) {
        bucket.tokens = IPC_MAX_TOKENS;
        bucket.lastRefill = now;
    }

    if (bucket.tokens > 0) {
        bucket.tokens--;
        return true;
    }
    return false;
}

size_t IpcServer::TrackedClients() const {
    std::lock_guard lk(m_rateMtx);
    return m_clientBuckets.size();
}

std::string IpcServer::ProcessRequest(const std::string& request, const PeerIdentity& peer) {
    json resp;

    if (!CheckRateLimit(peer.pid)) {
        resp["status"] = "error";
        resp["message"] = "Rate limit exceeded";
        Log("[IPC] Rate limited pid " + std::to_string(peer.pid));
        return DumpJson(resp);
    }

    json req = json::parse(request, nullptr, /*allow_exceptions=*/false);
    if (req.is_discarded() || !req.is_object() || !req.contains("cmd") || !req["cmd"].is_string()) {
        resp["status"] = "error";
        resp["message"] = "Invalid JSON";
        return DumpJson(resp);
    }

    const std::string cmd = req["cmd"].get<std::string>();
    const bool trusted = IsTrusted(peer);

    try {
        // Read-only commands are open to every local caller
        if (cmd == "PROBE_STATUS") {
            resp = HandleProbeStatus();
        }
        else if (cmd == "GET_HISTORY") {
            resp = HandleHistory(req);
        }
        else if (cmd == "EXECUTE_BATCH" || cmd == "INVALIDATE") {
            if (!trusted) {
                resp["status"] = "denied";
                resp["message"] = "Caller uid " + std::to_string(peer.uid) + " is not trusted";
                Log("[IPC] Denied " + cmd + " from uid " + std::to_string(peer.uid));
            } else if (cmd == "EXECUTE_BATCH") {
                resp = HandleExecute(req);
            } else {
                resp = HandleInvalidate(req);
            }
        }
        else {
            resp["status"] = "error";
            resp["message"] = "Unknown Command";
        }
    }
    catch (const std::exception& e) {
        resp = json::object();
        resp["status"] = "error";
        resp["message"] = std::string("Internal error: ") + e.what();
        Log("[IPC] " + cmd + " failed: " + e.what());
    }

    return DumpJson(resp);
}

json IpcServer::HandleExecute(const json& req) {
    json resp;
    if (!req.contains("data")) {
        resp["status"] = "error";
        resp["message"] = "Protocol Error: Missing data field";
        return resp;
    }

    std::vector<ActionableRecord> records;
    std::string error;
    if (!ParseBatch(req["data"], records, error)) {
        resp["status"] = "error";
        resp["message"] = "Protocol Error: " + error;
        return resp;
    }

    auto results = m_executor.ExecuteBatch(records);
    resp["status"] = "ok";
    resp["results"] = ResultsToJson(results);
    return resp;
}

json IpcServer::HandleInvalidate(const json& req) {
    json resp;
    const std::string name = req.value("domain", "");

    if (name == "all") {
        m_prober.InvalidateAll();
        resp["status"] = "ok";
        Log("[IPC] Permission change: all domains invalidated");
        return resp;
    }

    auto domain = ParseDomain(name);
    if (!domain) {
        resp["status"] = "error";
        resp["message"] = "Unknown domain: " + name;
        return resp;
    }

    m_prober.Invalidate(*domain);
    resp["status"] = "ok";
    Log("[IPC] Permission change: " + name + " invalidated");
    return resp;
}

json IpcServer::HandleProbeStatus() {
    json resp;
    json domains = json::array();
    for (size_t i = 0; i < CAPABILITY_DOMAIN_COUNT; ++i) {
        auto domain = static_cast<CapabilityDomain>(i);
        json d;
        d["domain"] = DomainName(domain);
        if (auto report = m_prober.Cached(domain)) {
            d["tier"] = TierName(report->tier);
            d["mechanism"] = report->mechanism;
            d["probed_at"] = report->probedAt;
            json attempts = json::array();
            for (const auto& [mech, verdict] : report->attempts) {
                attempts.push_back({ { "mechanism", mech }, { "verdict", VerdictName(verdict) } });
            }
            d["attempts"] = attempts;
        } else {
            d["tier"] = "unprobed";
        }
        domains.push_back(d);
    }
    resp["status"] = "ok";
    resp["domains"] = domains;
    return resp;
}

json IpcServer::HandleHistory(const json& req) {
    json resp;
    const std::string group = req.value("group", "none");
    const int offset = req.value("utc_offset_minutes", 0);

    auto entryJson = [](const LedgerEntry& e) {
        json j = ResultToJson(e.result);
        j["sequence"] = e.sequence;
        return j;
    };

    if (group == "day" || group == "hour") {
        auto groups = group == "day" ? m_ledger.GroupByDay(offset) : m_ledger.GroupByHour(offset);
        json arr = json::array();
        for (const auto& g : groups) {
            json entries = json::array();
            for (const auto& e : g.entries) entries.push_back(entryJson(e));
            arr.push_back({ { "label", g.label }, { "entries", entries } });
        }
        resp["groups"] = arr;
    } else {
        json arr = json::array();
        for (const auto& e : m_ledger.Entries()) arr.push_back(entryJson(e));
        resp["entries"] = arr;
    }
    resp["status"] = "ok";
    return resp;
}
