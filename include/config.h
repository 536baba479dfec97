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

#ifndef PGUARD_CONFIG_H
#define PGUARD_CONFIG_H
#include <filesystem>
#include <vector>
#include <string>
#include <cstdint>
#include "constants.h"
#include "nlohmann/json.hpp" // Required for serialization

struct EngineConfig {
    int version = CONFIG_VERSION;
    std::string selfPackage = DEFAULT_SELF_PACKAGE;
    std::vector<std::string> protectedPackages{
        "android", "com.android.systemui", "com.android.phone", "com.android.settings"
    };
    uint32_t handlerTimeoutMs = DEFAULT_HANDLER_TIMEOUT_MS;
    uint32_t commandTimeoutMs = DEFAULT_COMMAND_TIMEOUT_MS;
    std::string journalPath;  // Empty: GetLogPath()/outcomes.jsonl
    std::string logDir;       // Empty: GetLogPath()/logs
    std::string socketPath;   // Empty: GetLogPath()/pguard.sock
    int batteryAlertDefault = DEFAULT_BATTERY_ALERT_PERCENT;
    int dataAlertDefaultMb = DEFAULT_DATA_ALERT_MB;
    std::vector<uint32_t> ipcAllowedUids;

    std::filesystem::path ResolvedJournalPath() const;
    std::filesystem::path ResolvedSocketPath() const;
    bool IsProtected(const std::string& pkg) const;
};

class ConfigValidator {
public:
    // Rejects wrong types and out-of-range values. 'why' receives the first offending key.
    static bool Validate(const nlohmann::json& j, std::string* why = nullptr);
};

class ConfigManager {
public:
    // --config, else $PGUARD_HOME/pguard.json, else the data directory default
    static std::filesystem::path GetConfigPath();

    // Creates a default file when missing. On any failure 'out' keeps its defaults.
    static bool Load(const std::filesystem::path& path, EngineConfig& out);

    // Validates then merges present keys into 'out'
    static bool Apply(const nlohmann::json& j, EngineConfig& out);

    static bool Save(const std::filesystem::path& path, const EngineConfig& cfg);
};

nlohmann::json ConfigToJson(const EngineConfig& cfg);
bool CreateDefaultConfig(const std::filesystem::path& configPath);

#endif // PGUARD_CONFIG_H
