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

#ifndef PGUARD_CAPABILITY_PROBER_H
#define PGUARD_CAPABILITY_PROBER_H

#include "types.h"
#include "access_plan.h"
#include <map>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ProbeReport {
    CapabilityDomain domain = CapabilityDomain::UsageAlert;
    CapabilityTier tier = CapabilityTier::Unavailable;
    std::string mechanism; // Name of the granted mechanism, empty when Unavailable
    std::vector<std::pair<std::string, ProbeVerdict>> attempts;
    uint64_t probedAt = 0;
};

// Process-scoped cache of usable access tiers.
// Populated on first Probe() per domain; only Invalidate() clears an entry.
class CapabilityProber {
public:
    explicit CapabilityProber(AccessPlanTable plans);

    CapabilityProber(const CapabilityProber&) = delete;
    CapabilityProber& operator=(const CapabilityProber&) = delete;

    CapabilityTier Probe(CapabilityDomain domain);

    // Permission-flow signal
    void Invalidate(CapabilityDomain domain);
    void InvalidateAll();

    std::optional<ProbeReport> Cached(CapabilityDomain domain) const;
    std::vector<ProbeReport> Snapshot() const;

private:
    ProbeReport RunPlan(CapabilityDomain domain) const;

    const AccessPlanTable m_plans;

    mutable std::shared_mutex m_cacheMtx;   // Readers: Probe hits, Cached, Snapshot
    std::map<CapabilityDomain, ProbeReport> m_cache;

    std::mutex m_writerMtx;                 // Single writer: probe runs and invalidations
};

#endif // PGUARD_CAPABILITY_PROBER_H
