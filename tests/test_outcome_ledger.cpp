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
#include "outcome_ledger.h"
#include "test_support.h"
#include <nlohmann/json.hpp>
#include <fstream>

namespace {

using json = nlohmann::json;

constexpr uint64_t MAR10_2330 = 1741649400000ULL; // 2025-03-10 23:30:00 UTC
constexpr uint64_t MAR11_0015 = 1741652100000ULL; // 2025-03-11 00:15:00 UTC
constexpr uint64_t MAR11_0045 = 1741653900000ULL; // 2025-03-11 00:45:00 UTC

ExecutionResult Outcome(const std::string& id, uint64_t at, ExecutionStatus status = ExecutionStatus::Success)
{
    ExecutionResult r;
    r.actionableId = id;
    r.status = status;
    r.detail = "detail of " + id;
    r.completedAt = at;
    r.type = "kill_app";
    r.target = "com.example.app";
    r.tier = CapabilityTier::Primary;
    return r;
}

TEST(OutcomeLedgerTest, EntriesAreNewestFirst) {
    OutcomeLedger ledger;
    ASSERT_TRUE(ledger.Open());
    ledger.Record(Outcome("b", MAR11_0015));
    ledger.Record(Outcome("a", MAR10_2330));
    ledger.Record(Outcome("c", MAR11_0045));
    ledger.Record(Outcome("c2", MAR11_0045));

    auto entries = ledger.Entries();
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].result.actionableId, "c2"); // Same instant: later append first
    EXPECT_EQ(entries[1].result.actionableId, "c");
    EXPECT_EQ(entries[2].result.actionableId, "b");
    EXPECT_EQ(entries[3].result.actionableId, "a");
    EXPECT_EQ(entries[3].sequence, 2u);
}

TEST(OutcomeLedgerTest, GroupsByUtcDay) {
    OutcomeLedger ledger;
    ledger.Record(Outcome("a", MAR10_2330));
    ledger.Record(Outcome("b", MAR11_0015));
    ledger.Record(Outcome("c", MAR11_0045));

    auto groups = ledger.GroupByDay();
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].label, "2025-03-11");
    ASSERT_EQ(groups[0].entries.size(), 2u);
    EXPECT_EQ(groups[0].entries[0].result.actionableId, "c");
    EXPECT_EQ(groups[1].label, "2025-03-10");
    EXPECT_EQ(groups[1].entries.size(), 1u);
}

TEST(OutcomeLedgerTest, GroupingHonoursUtcOffset) {
    OutcomeLedger ledger;
    ledger.Record(Outcome("a", MAR10_2330));
    ledger.Record(Outcome("b", MAR11_0015));
    ledger.Record(Outcome("c", MAR11_0045));

    // One hour behind UTC: everything falls on the 10th
    auto groups = ledger.GroupByDay(-60);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].label, "2025-03-10");
    EXPECT_EQ(groups[0].entries.size(), 3u);
}

TEST(OutcomeLedgerTest, GroupsByHour) {
    OutcomeLedger ledger;
    ledger.Record(Outcome("a", MAR10_2330));
    ledger.Record(Outcome("b", MAR11_0015));
    ledger.Record(Outcome("c", MAR11_0045));

    auto groups = ledger.GroupByHour();
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].label, "2025-03-11 00:00");
    EXPECT_EQ(groups[0].entries.size(), 2u);
    EXPECT_EQ(groups[1].label, "2025-03-10 23:00");
}

TEST(OutcomeLedgerTest, UndecodableDetailKeepsJournalHealthy) {
    ScopedTempDir dir;
    const auto path = dir.path() / "outcomes.jsonl";

    {
        OutcomeLedger ledger(path);
        ASSERT_TRUE(ledger.Open());
        auto bad = Outcome("a", MAR10_2330, ExecutionStatus::Failed);
        bad.detail = "Fehler \xe4nderung";
        ledger.Record(bad);
        ledger.Record(Outcome("b", MAR11_0015));
        EXPECT_TRUE(ledger.IsHealthy());
    }

    OutcomeLedger reopened(path);
    ASSERT_TRUE(reopened.Open());
    ASSERT_EQ(reopened.Size(), 2u);
    EXPECT_EQ(reopened.Entries()[1].result.detail, "Fehler \xef\xbf\xbdnderung");
}

TEST(OutcomeLedgerTest, JournalSurvivesRestart) {
    ScopedTempDir dir;
    const auto path = dir.path() / "outcomes.jsonl";

    {
        OutcomeLedger ledger(path);
        ASSERT_TRUE(ledger.Open());
        ledger.Record(Outcome("a", MAR10_2330));
        ledger.Record(Outcome("b", MAR11_0015, ExecutionStatus::Unsupported));
        EXPECT_TRUE(ledger.IsHealthy());
    }

    OutcomeLedger reopened(path);
    ASSERT_TRUE(reopened.Open());
    ASSERT_EQ(reopened.Size(), 2u);

    auto entries = reopened.Entries();
    EXPECT_EQ(entries[0].result.actionableId, "b");
    EXPECT_EQ(entries[0].result.status, ExecutionStatus::Unsupported);
    EXPECT_EQ(entries[0].result.detail, "detail of b");
    EXPECT_EQ(entries[1].result.tier, CapabilityTier::Primary);

    // New appends continue the sequence
    reopened.Record(Outcome("c", MAR11_0045));
    EXPECT_EQ(reopened.Entries()[0].sequence, 3u);
}

TEST(OutcomeLedgerTest, MalformedJournalLinesAreSkipped) {
    ScopedTempDir dir;
    const auto path = dir.path() / "outcomes.jsonl";
    {
        std::ofstream out(path);
        out << R"({"id":"a","status":"success","completed_at":1741649400000,"detail":"ok"})" << "\n";
        out << "{not json\n";
        out << "\n";
        out << R"({"id":"b","status":"exploded","completed_at":1})" << "\n";
        out << R"({"id":"c","status":"failed","completed_at":1741652100000})" << "\n";
    }

    OutcomeLedger ledger(path);
    ASSERT_TRUE(ledger.Open());
    EXPECT_EQ(ledger.Size(), 2u);
    EXPECT_EQ(ledger.SkippedOnReplay(), 2u);
}

TEST(OutcomeLedgerTest, UnwritableJournalKeepsEntriesInMemory) {
    ScopedTempDir dir;
    const auto blocker = dir.path() / "not_a_dir";
    {
        std::ofstream f(blocker);
        f << "x";
    }

    OutcomeLedger ledger(blocker / "outcomes.jsonl");
    EXPECT_FALSE(ledger.Open());
    EXPECT_FALSE(ledger.IsHealthy());

    ledger.Record(Outcome("a", MAR10_2330));
    EXPECT_EQ(ledger.Size(), 1u);
}

TEST(OutcomeLedgerTest, ExportWritesAppendOrder) {
    ScopedTempDir dir;
    OutcomeLedger ledger;
    ledger.Record(Outcome("late", MAR11_0045));
    ledger.Record(Outcome("early", MAR10_2330));

    const auto out = dir.path() / "export.json";
    ASSERT_TRUE(ledger.ExportLog(out));

    std::ifstream in(out);
    json arr = json::parse(in);
    ASSERT_TRUE(arr.is_array());
    ASSERT_EQ(arr.size(), 2u);
    EXPECT_EQ(arr[0]["id"].get<std::string>(), "late");
    EXPECT_EQ(arr[0]["sequence"].get<uint64_t>(), 1u);
    EXPECT_EQ(arr[1]["status"].get<std::string>(), "success");
}

} // namespace
