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

#ifndef PGUARD_IPC_CLIENT_H
#define PGUARD_IPC_CLIENT_H

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

class IpcClient {
public:
    struct Response {
        bool success;
        std::string message;
        bool denied; // True if the daemon refused the caller
        nlohmann::json body;
    };

    /**
     * Sends one request envelope ({"cmd": ...}) to a running daemon and waits
     * up to two seconds for its reply.
     */
    static Response Send(const std::filesystem::path& socketPath, const nlohmann::json& envelope);

    // Permission-flow signal: drop cached tiers for a domain name or "all"
    static Response SendInvalidate(const std::filesystem::path& socketPath, const std::string& domain);
};

#endif // PGUARD_IPC_CLIENT_H
