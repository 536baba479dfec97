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

#include "outcome_ledger.h"
#include "batch_codec.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>

using json = nlohmann::json;

OutcomeLedger::OutcomeLedger(std::filesystem::path journalPath)
    : m_journalPath(std::move(journalPath))
{
    m_ledger.reserve(1024);
}

OutcomeLedger::~OutcomeLedger()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_journal.is_open()) m_journal.flush();
}

bool OutcomeLedger::Open()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_journalPath.empty()) return true;

    try {
        if (std::filesystem::exists(m_journalPath)) {
            std::ifstream in(m_journalPath);
            std::string line;
            while (std::getline(in, line)) {
                if (Trim(line).empty()) continue;

                json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
                auto result = j.is_discarded() ? std::nullopt : ResultFromJson(j);
                if (!result) {
                    ++m_skipped;
                    continue;
                }
                m_ledger.push_back({ m_nextSequence++, std::move(*result) });
            }
        }
        else if (m_journalPath.has_parent_path()) {
            std::filesystem::create_directories(m_journalPath.parent_path());
        }

        m_journal.open(m_journalPath, std::ios::app);
        if (!m_journal.is_open()) {
            m_healthy = false;
            Log("[LEDGER] Cannot open journal for append: " + m_journalPath.string());
            return false;
        }

        Log("[LEDGER] Opened " + m_journalPath.string() + ": " + std::to_string(m_ledger.size()) +
            " entries replayed, " + std::to_string(m_skipped) + " skipped");
        return true;
    }
    catch (const std::exception& e) {
        m_healthy = false;
        Log(std::string("[LEDGER] Open failed: ") + e.what());
        return false;
    }
}

void OutcomeLedger::Record(const ExecutionResult& result)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    // 1. Immutable Append (always, even when the journal is unhealthy)
    m_ledger.push_back({ m_nextSequence++, result });

    // 2. Durable journal line
    if (m_journalPath.empty() || !m_healthy) return;

    try {
        m_journal << DumpJson(ResultToJson(result)) << '\n';
        m_journal.flush();
        if (!m_journal) {
            m_healthy = false;
            Log("[CRITICAL] Outcome journal write failed. Continuing in memory only.");
        }
    }
    catch (const std::exception& e) {
        m_healthy = false;
        Log(std::string("[CRITICAL] Outcome journal write failed: ") + e.what());
    }
}

std::vector<LedgerEntry> OutcomeLedger::SortedNewestFirst() const
{
    std::vector<LedgerEntry> out = m_ledger;
    std::stable_sort(out.begin(), out.end(), [](const LedgerEntry& a, const LedgerEntry& b) {
        if (a.result.completedAt != b.result.completedAt) return a.result.completedAt > b.result.completedAt;
        return a.sequence > b.sequence;
    });
    return out;
}

std::vector<LedgerEntry> OutcomeLedger::Entries() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return SortedNewestFirst();
}

std::vector<OutcomeGroup> OutcomeLedger::Group(int utcOffsetMinutes, uint64_t bucketMs, const char* fmt) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<OutcomeGroup> groups;
    const long long offsetMs = static_cast<long long>(utcOffsetMinutes) * 60 * 1000;

    for (auto& entry : SortedNewestFirst()) {
        long long local = static_cast<long long>(entry.result.completedAt) + offsetMs;
        if (local < 0) local = 0;
        uint64_t bucket = static_cast<uint64_t>(local) / bucketMs * bucketMs;

        // Sorted newest first, so a new bucket always starts a new group
        if (groups.empty() || groups.back().bucketStart != bucket) {
            OutcomeGroup g;
            g.bucketStart = bucket;
            g.label = FormatEpochMs(bucket, 0, fmt);
            groups.push_back(std::move(g));
        }
        groups.back().entries.push_back(std::move(entry));
    }
    return groups;
}

std::vector<OutcomeGroup> OutcomeLedger::GroupByDay(int utcOffsetMinutes) const
{
    return Group(utcOffsetMinutes, 24ULL * 60 * 60 * 1000, "%Y-%m-%d");
}

std::vector<OutcomeGroup> OutcomeLedger::GroupByHour(int utcOffsetMinutes) const
{
    return Group(utcOffsetMinutes, 60ULL * 60 * 1000, "%Y-%m-%d %H:00");
}

size_t OutcomeLedger::Size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ledger.size();
}

bool OutcomeLedger::IsHealthy() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_healthy;
}

size_t OutcomeLedger::SkippedOnReplay() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_skipped;
}

bool OutcomeLedger::ExportLog(const std::filesystem::path& filePath) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        std::ofstream file(filePath, std::ios::trunc);
        if (!file.is_open()) {
            Log("[AUDIT] Failed to open file for export: " + filePath.string());
            return false;
        }

        json arr = json::array();
        for (const auto& entry : m_ledger) {
            json j = ResultToJson(entry.result);
            j["sequence"] = entry.sequence;
            arr.push_back(std::move(j));
        }
        file << DumpJson(arr, 2) << "\n";

        Log("[AUDIT] Outcome log exported to: " + filePath.string());
        return static_cast<bool>(file);
    } catch (const std::exception& e) {
        Log(std::string("[AUDIT] Exception during audit export: ") + e.what());
        return false;
    }
}
