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

#ifndef PGUARD_OUTCOME_LEDGER_H
#define PGUARD_OUTCOME_LEDGER_H

#include "types.h"
#include <filesystem>
#include <fstream>
#include <vector>
#include <mutex>
#include <string>

struct LedgerEntry {
    uint64_t sequence;       // Append order, starts at 1
    ExecutionResult result;
};

struct OutcomeGroup {
    std::string label;       // "YYYY-MM-DD" or "YYYY-MM-DD HH:00"
    uint64_t bucketStart;    // Epoch ms of the bucket start (local to the offset)
    std::vector<LedgerEntry> entries; // Newest first
};

// Append-only record of execution outcomes.
// Entries are never modified or removed; reads return copies.
class OutcomeLedger {
public:
    // Empty path: memory only
    explicit OutcomeLedger(std::filesystem::path journalPath = {});
    ~OutcomeLedger();

    OutcomeLedger(const OutcomeLedger&) = delete;
    OutcomeLedger& operator=(const OutcomeLedger&) = delete;

    // Replays an existing journal. Malformed lines are skipped and counted.
    bool Open();

    // Append-Only Write
    void Record(const ExecutionResult& result);

    // Newest first (completedAt, then append order)
    std::vector<LedgerEntry> Entries() const;

    std::vector<OutcomeGroup> GroupByDay(int utcOffsetMinutes = 0) const;
    std::vector<OutcomeGroup> GroupByHour(int utcOffsetMinutes = 0) const;

    size_t Size() const;

    // False once a journal write failed; entries are still kept in memory
    bool IsHealthy() const;

    size_t SkippedOnReplay() const;

    // Read-Only Audit Export (JSON array, append order)
    bool ExportLog(const std::filesystem::path& filePath) const;

private:
    std::vector<OutcomeGroup> Group(int utcOffsetMinutes, uint64_t bucketMs, const char* fmt) const;
    std::vector<LedgerEntry> SortedNewestFirst() const; // Caller holds m_mutex

    std::filesystem::path m_journalPath;
    std::ofstream m_journal;
    std::vector<LedgerEntry> m_ledger;
    uint64_t m_nextSequence = 1;
    size_t m_skipped = 0;
    mutable std::mutex m_mutex; // Mutable to allow locking in const methods
    bool m_healthy = true;
};

#endif // PGUARD_OUTCOME_LEDGER_H
