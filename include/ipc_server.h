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

#ifndef PGUARD_IPC_SERVER_H
#define PGUARD_IPC_SERVER_H

#include "types.h"
#include "utils.h"
#include <string>
#include <thread>
#include <atomic>
#include <mutex>
#include <unordered_map>
#include <chrono>
#include <filesystem>
#include <vector>
#include <sys/types.h>

#include <nlohmann/json.hpp>

class Executor;
class CapabilityProber;
class OutcomeLedger;

struct PeerIdentity {
    pid_t pid = 0;
    uid_t uid = 0;
};

// Unix-domain socket front end: one JSON request per connection
class IpcServer {
public:
    IpcServer(std::filesystem::path socketPath, std::vector<uint32_t> allowedUids,
              Executor& executor, CapabilityProber& prober, OutcomeLedger& ledger);
    ~IpcServer();

    // Binds the socket and starts the listener thread
    bool Initialize();

    // Stops the listener and removes the socket file
    void Shutdown();

    // Handles one decoded request on behalf of 'peer'
    std::string ProcessRequest(const std::string& request, const PeerIdentity& peer);

    // Callers with a live rate-limit bucket
    size_t TrackedClients() const;

private:
    void WorkerThread();
    void ServeConnection(int clientFd);

    // Root, our own uid, or a configured uid may change state; anyone else may read
    bool IsTrusted(const PeerIdentity& peer) const;

    // Rate Limiting (Token Bucket)
    struct RateBucket {
        std::chrono::steady_clock::time_point lastRefill;
        int tokens;
    };
    std::unordered_map<pid_t, RateBucket> m_clientBuckets;
    bool CheckRateLimit(pid_t pid);

    nlohmann::json HandleExecute(const nlohmann::json& req);
    nlohmann::json HandleInvalidate(const nlohmann::json& req);
    nlohmann::json HandleProbeStatus();
    nlohmann::json HandleHistory(const nlohmann::json& req);

    std::filesystem::path m_socketPath;
    std::vector<uint32_t> m_allowedUids;
    Executor& m_executor;
    CapabilityProber& m_prober;
    OutcomeLedger& m_ledger;

    std::atomic<bool> m_running{false};
    std::thread m_worker;
    UniqueFd m_listenFd;
    UniqueFd m_wakeRead;   // Self-pipe for clean shutdown
    UniqueFd m_wakeWrite;
    mutable std::mutex m_rateMtx;
};

#endif // PGUARD_IPC_SERVER_H
