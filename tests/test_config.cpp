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

#include <gtest/gtest.h>
#include "config.h"
#include "test_support.h"
#include <fstream>

namespace {

using json = nlohmann::json;

TEST(ConfigValidatorTest, AcceptsDefaults) {
    std::string why;
    EXPECT_TRUE(ConfigValidator::Validate(json::parse(DEFAULT_CONFIG), &why)) << why;
    EXPECT_TRUE(ConfigValidator::Validate(json::object()));
}

TEST(ConfigValidatorTest, RejectsOutOfRangeValues) {
    struct Case { const char* doc; const char* key; };
    const Case cases[] = {
        { R"({"handler_timeout_ms": 50})", "handler_timeout_ms" },
        { R"({"command_timeout_ms": 120000})", "command_timeout_ms" },
        { R"({"handler_timeout_ms": "5s"})", "handler_timeout_ms" },
        { R"({"battery_alert_default": 0})", "battery_alert_default" },
        { R"({"data_alert_default_mb": -1})", "data_alert_default_mb" },
        { R"({"protected_packages": ["ok", 3]})", "protected_packages" },
        { R"({"ipc_allowed_uids": [-2]})", "ipc_allowed_uids" },
        { R"({"self_package": 12})", "self_package" },
        { R"([1, 2])", "<root>" },
    };

    for (const auto& c : cases) {
        std::string why;
        EXPECT_FALSE(ConfigValidator::Validate(json::parse(c.doc), &why)) << c.doc;
        EXPECT_EQ(why, c.key) << c.doc;
    }
}

TEST(ConfigManagerTest, ApplyMergesOnlyPresentKeys) {
    EngineConfig cfg;
    ASSERT_TRUE(ConfigManager::Apply(json::parse(R"({
        "handler_timeout_ms": 800,
        "protected_packages": ["com.bank.app"],
        "ipc_allowed_uids": [2000]
    })"), cfg));

    EXPECT_EQ(cfg.handlerTimeoutMs, 800u);
    EXPECT_EQ(cfg.commandTimeoutMs, static_cast<uint32_t>(DEFAULT_COMMAND_TIMEOUT_MS));
    ASSERT_EQ(cfg.protectedPackages.size(), 1u);
    EXPECT_TRUE(cfg.IsProtected("com.bank.app"));
    EXPECT_FALSE(cfg.IsProtected("android"));
    EXPECT_TRUE(cfg.IsProtected(DEFAULT_SELF_PACKAGE));
    EXPECT_EQ(cfg.ipcAllowedUids, (std::vector<uint32_t>{ 2000 }));
}

TEST(ConfigManagerTest, InvalidDocumentLeavesConfigUntouched) {
    EngineConfig cfg;
    cfg.handlerTimeoutMs = 1234;
    EXPECT_FALSE(ConfigManager::Apply(json::parse(R"({"handler_timeout_ms": 700, "battery_alert_default": 500})"), cfg));
    EXPECT_EQ(cfg.handlerTimeoutMs, 1234u);
}

TEST(ConfigManagerTest, LoadCreatesDefaultFile) {
    ScopedTempDir dir;
    const auto path = dir.path() / "nested" / "pguard.json";

    EngineConfig cfg;
    ASSERT_TRUE(ConfigManager::Load(path, cfg));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(cfg.version, CONFIG_VERSION);
    EXPECT_EQ(cfg.handlerTimeoutMs, static_cast<uint32_t>(DEFAULT_HANDLER_TIMEOUT_MS));
    EXPECT_EQ(cfg.protectedPackages.size(), 4u);
}

TEST(ConfigManagerTest, OldVersionIsBackedUpAndMigrated) {
    ScopedTempDir dir;
    const auto path = dir.path() / "pguard.json";
    {
        std::ofstream out(path);
        out << R"({"version": 1, "handler_timeout_ms": 900, "obsolete_key": true})";
    }

    EngineConfig cfg;
    ASSERT_TRUE(ConfigManager::Load(path, cfg));
    EXPECT_EQ(cfg.version, CONFIG_VERSION);
    EXPECT_EQ(cfg.handlerTimeoutMs, 900u);

    auto backup = path;
    backup += ".old";
    EXPECT_TRUE(std::filesystem::exists(backup));

    std::ifstream in(path);
    json rewritten = json::parse(in);
    EXPECT_EQ(rewritten["version"].get<int>(), CONFIG_VERSION);
    EXPECT_FALSE(rewritten.contains("obsolete_key"));
}

TEST(ConfigManagerTest, ParseErrorKeepsDefaults) {
    ScopedTempDir dir;
    const auto path = dir.path() / "pguard.json";
    {
        std::ofstream out(path);
        out << "{ broken";
    }

    EngineConfig cfg;
    EXPECT_FALSE(ConfigManager::Load(path, cfg));
    EXPECT_EQ(cfg.handlerTimeoutMs, static_cast<uint32_t>(DEFAULT_HANDLER_TIMEOUT_MS));
}

TEST(ConfigManagerTest, SaveRoundTripsThroughLoad) {
    ScopedTempDir dir;
    const auto path = dir.path() / "pguard.json";

    EngineConfig cfg;
    cfg.selfPackage = "org.example.guard";
    cfg.dataAlertDefaultMb = 250;
    ASSERT_TRUE(ConfigManager::Save(path, cfg));

    EngineConfig loaded;
    ASSERT_TRUE(ConfigManager::Load(path, loaded));
    EXPECT_EQ(loaded.selfPackage, "org.example.guard");
    EXPECT_EQ(loaded.dataAlertDefaultMb, 250);
}

TEST(EngineConfigTest, ResolvedPathsFollowOverrides) {
    EngineConfig cfg;
    EXPECT_EQ(cfg.ResolvedJournalPath().filename().string(), JOURNAL_FILENAME);
    cfg.journalPath = "/tmp/custom.jsonl";
    EXPECT_EQ(cfg.ResolvedJournalPath().string(), "/tmp/custom.jsonl");
    cfg.socketPath = "/tmp/x.sock";
    EXPECT_EQ(cfg.ResolvedSocketPath().string(), "/tmp/x.sock");
}

} // namespace
