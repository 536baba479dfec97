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

#include "config.h"
#include "logger.h"
#include <fstream>
#include <algorithm>
#include <cstdlib>

using json = nlohmann::json;

std::filesystem::path EngineConfig::ResolvedJournalPath() const
{
    if (!journalPath.empty()) return journalPath;
    return GetLogPath() / JOURNAL_FILENAME;
}

std::filesystem::path EngineConfig::ResolvedSocketPath() const
{
    if (!socketPath.empty()) return socketPath;
    return GetLogPath() / SOCKET_FILENAME;
}

bool EngineConfig::IsProtected(const std::string& pkg) const
{
    if (pkg == selfPackage) return true;
    return std::find(protectedPackages.begin(), protectedPackages.end(), pkg) != protectedPackages.end();
}

static bool Reject(std::string* why, const std::string& key)
{
    if (why) *why = key;
    return false;
}

bool ConfigValidator::Validate(const json& j, std::string* why)
{
    if (!j.is_object()) return Reject(why, "<root>");

    auto checkTimeout = [&](const char* key) {
        if (!j.contains(key)) return true;
        const auto& v = j[key];
        if (!v.is_number_integer()) return false;
        auto n = v.get<long long>();
        return n >= MIN_TIMEOUT_MS && n <= MAX_TIMEOUT_MS;
    };
    auto checkString = [&](const char* key) {
        return !j.contains(key) || j[key].is_string();
    };

    if (j.contains("version") && !j["version"].is_number_integer()) return Reject(why, "version");
    if (!checkString("self_package")) return Reject(why, "self_package");
    if (!checkString("journal_path")) return Reject(why, "journal_path");
    if (!checkString("log_dir")) return Reject(why, "log_dir");
    if (!checkString("socket_path")) return Reject(why, "socket_path");
    if (!checkTimeout("handler_timeout_ms")) return Reject(why, "handler_timeout_ms");
    if (!checkTimeout("command_timeout_ms")) return Reject(why, "command_timeout_ms");

    if (j.contains("protected_packages")) {
        const auto& arr = j["protected_packages"];
        if (!arr.is_array()) return Reject(why, "protected_packages");
        for (const auto& p : arr) {
            if (!p.is_string()) return Reject(why, "protected_packages");
        }
    }

    if (j.contains("battery_alert_default")) {
        const auto& v = j["battery_alert_default"];
        if (!v.is_number_integer()) return Reject(why, "battery_alert_default");
        auto n = v.get<long long>();
        if (n < 1 || n > 100) return Reject(why, "battery_alert_default");
    }

    if (j.contains("data_alert_default_mb")) {
        const auto& v = j["data_alert_default_mb"];
        if (!v.is_number_integer() || v.get<long long>() <= 0) return Reject(why, "data_alert_default_mb");
    }

    if (j.contains("ipc_allowed_uids")) {
        const auto& arr = j["ipc_allowed_uids"];
        if (!arr.is_array()) return Reject(why, "ipc_allowed_uids");
        for (const auto& u : arr) {
            if (!u.is_number_unsigned() && !(u.is_number_integer() && u.get<long long>() >= 0))
                return Reject(why, "ipc_allowed_uids");
        }
    }

    return true;
}

std::filesystem::path ConfigManager::GetConfigPath()
{
    return GetLogPath() / CONFIG_FILENAME;
}

bool ConfigManager::Apply(const json& j, EngineConfig& out)
{
    std::string why;
    if (!ConfigValidator::Validate(j, &why)) {
        Log("[CONFIG] Validation failed at key '" + why + "'. Keeping previous values.");
        return false;
    }

    EngineConfig next = out;
    next.version = j.value("version", next.version);
    next.selfPackage = j.value("self_package", next.selfPackage);
    next.handlerTimeoutMs = j.value("handler_timeout_ms", next.handlerTimeoutMs);
    next.commandTimeoutMs = j.value("command_timeout_ms", next.commandTimeoutMs);
    next.journalPath = j.value("journal_path", next.journalPath);
    next.logDir = j.value("log_dir", next.logDir);
    next.socketPath = j.value("socket_path", next.socketPath);
    next.batteryAlertDefault = j.value("battery_alert_default", next.batteryAlertDefault);
    next.dataAlertDefaultMb = j.value("data_alert_default_mb", next.dataAlertDefaultMb);

    if (j.contains("protected_packages")) {
        next.protectedPackages = j["protected_packages"].get<std::vector<std::string>>();
    }
    if (j.contains("ipc_allowed_uids")) {
        next.ipcAllowedUids = j["ipc_allowed_uids"].get<std::vector<uint32_t>>();
    }

    out = std::move(next);
    return true;
}

json ConfigToJson(const EngineConfig& cfg)
{
    json j;
    j["version"] = cfg.version;
    j["self_package"] = cfg.selfPackage;
    j["protected_packages"] = cfg.protectedPackages;
    j["handler_timeout_ms"] = cfg.handlerTimeoutMs;
    j["command_timeout_ms"] = cfg.commandTimeoutMs;
    j["journal_path"] = cfg.journalPath;
    j["log_dir"] = cfg.logDir;
    j["socket_path"] = cfg.socketPath;
    j["battery_alert_default"] = cfg.batteryAlertDefault;
    j["data_alert_default_mb"] = cfg.dataAlertDefaultMb;
    j["ipc_allowed_uids"] = cfg.ipcAllowedUids;
    return j;
}

bool ConfigManager::Save(const std::filesystem::path& path, const EngineConfig& cfg)
{
    try {
        if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
        std::ofstream f(path, std::ios::trunc);
        if (!f) {
            Log("[CONFIG] Cannot write " + path.string());
            return false;
        }
        f << ConfigToJson(cfg).dump(4) << "\n";
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        Log(std::string("[CONFIG] Save exception: ") + e.what());
        return false;
    }
}

bool CreateDefaultConfig(const std::filesystem::path& configPath)
{
    try {
        if (configPath.has_parent_path()) std::filesystem::create_directories(configPath.parent_path());
        std::ofstream f(configPath);
        if (!f) return false;
        f << DEFAULT_CONFIG;
        Log("[CONFIG] Created default config: " + configPath.string());
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        Log(std::string("[CONFIG] CreateDefaultConfig exception: ") + e.what());
        return false;
    }
}

bool ConfigManager::Load(const std::filesystem::path& configPath, EngineConfig& out)
{
    try
    {
        if (!std::filesystem::exists(configPath))
        {
            if (!CreateDefaultConfig(configPath)) return false;
        }

        std::ifstream f(configPath);
        if (!f) {
            Log("[CONFIG] Cannot open " + configPath.string());
            return false;
        }

        json j = json::parse(f, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
        f.close();
        if (j.is_discarded()) {
            Log("[CONFIG] Parse error in " + configPath.string() + ". Using defaults.");
            return false;
        }

        int fileVersion = j.contains("version") && j["version"].is_number_integer()
                              ? j["version"].get<int>() : 0;

        // Migration: back up the old file and write a fresh one, keeping compatible values
        if (fileVersion < CONFIG_VERSION)
        {
            Log("[CONFIG] Version mismatch (File: " + std::to_string(fileVersion) +
                ", App: " + std::to_string(CONFIG_VERSION) + "). backing up and resetting...");

            std::filesystem::path backupPath = configPath;
            backupPath += ".old";
            std::filesystem::copy_file(configPath, backupPath, std::filesystem::copy_options::overwrite_existing);

            j.erase("version");
            EngineConfig migrated;
            if (!Apply(j, migrated)) migrated = EngineConfig{};
            migrated.version = CONFIG_VERSION;
            Save(configPath, migrated);
            out = migrated;
            return true;
        }

        if (!Apply(j, out)) return false;

        Log("[CONFIG] Config loaded: self=" + out.selfPackage +
            " | protected=" + std::to_string(out.protectedPackages.size()) +
            " | handler_timeout=" + std::to_string(out.handlerTimeoutMs) + "ms" +
            " | command_timeout=" + std::to_string(out.commandTimeoutMs) + "ms");
        return true;
    }
    catch (const std::exception& e)
    {
        Log(std::string("[CONFIG] Load exception: ") + e.what());
        return false;
    }
}
