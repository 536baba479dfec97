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

#include "ipc_client.h"
#include "utils.h"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/un.h>

using json = nlohmann::json;

IpcClient::Response IpcClient::Send(const std::filesystem::path& socketPath, const json& envelope) {
    // 1. The Connection Layer
    const std::string path = socketPath.string();
    sockaddr_un addr {};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        return { false, "Connection Failed: invalid socket path.", false, nullptr };
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd) {
        return { false, std::string("Connection Failed: ") + std::strerror(errno), false, nullptr };
    }

    timeval tv { 2, 0 };
    ::setsockopt(fd.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        return { false, "Connection Failed: PowerGuard daemon is not running.", false, nullptr };
    }

    // 2. Transmission
    std::string payload = envelope.dump() + "\n";
    size_t off = 0;
    while (off < payload.size()) {
        ssize_t n = ::write(fd.get(), payload.data() + off, payload.size() - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return { false, "Transmission Error: Send timeout or failure.", false, nullptr };
        off += static_cast<size_t>(n);
    }
    ::shutdown(fd.get(), SHUT_WR);

    // 3. Read Verdict
    std::string reply;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) return { false, "Protocol Error: Receive timeout.", false, nullptr };
        if (n == 0) break;
        reply.append(buf, static_cast<size_t>(n));
    }

    json response = json::parse(reply, nullptr, /*allow_exceptions=*/false);
    if (response.is_discarded() || !response.is_object()) {
        return { false, "Protocol Error: Invalid JSON response from daemon.", false, nullptr };
    }

    std::string status = response.value("status", "error");
    if (status == "ok") {
        return { true, "ok", false, response };
    } else if (status == "denied") {
        return { false, "Access Denied: " + response.value("message", "caller not trusted"), true, response };
    }
    return { false, "Daemon Error: " + response.value("message", "Unknown error"), false, response };
}

IpcClient::Response IpcClient::SendInvalidate(const std::filesystem::path& socketPath, const std::string& domain) {
    json envelope;
    envelope["cmd"] = "INVALIDATE";
    envelope["domain"] = domain;
    return Send(socketPath, envelope);
}
