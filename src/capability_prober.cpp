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

#include "capability_prober.h"
#include "logger.h"
#include "utils.h"

CapabilityProber::CapabilityProber(AccessPlanTable plans)
    : m_plans(std::move(plans))
{
}

CapabilityTier CapabilityProber::Probe(CapabilityDomain domain)
{
    {
        std::shared_lock lk(m_cacheMtx);
        auto it = m_cache.find(domain);
        if (it != m_cache.end()) return it->second.tier;
    }

    std::lock_guard writer(m_writerMtx);

    // Another caller may have finished the same probe while we waited
    {
        std::shared_lock lk(m_cacheMtx);
        auto it = m_cache.find(domain);
        if (it != m_cache.end()) return it->second.tier;
    }

    ProbeReport report = RunPlan(domain);
    CapabilityTier tier = report.tier;

    {
        std::unique_lock lk(m_cacheMtx);
        m_cache[domain] = std::move(report);
    }
    return tier;
}

ProbeReport CapabilityProber::RunPlan(CapabilityDomain domain) const
{
    ProbeReport report;
    report.domain = domain;
    report.probedAt = NowEpochMs();

    auto planIt = m_plans.find(domain);
    if (planIt == m_plans.end() || planIt->second.mechanisms.empty()) {
        Log(std::string("[PROBE] No access plan for ") + DomainName(domain) + ". Marked unavailable.");
        return report;
    }

    for (const auto& mech : planIt->second.mechanisms) {
        ProbeVerdict verdict = ProbeVerdict::Error;
        try {
            verdict = mech.probe ? mech.probe() : ProbeVerdict::NotPresent;
        } catch (const std::exception& e) {
            Log("[PROBE] " + mech.name + " threw: " + e.what());
            verdict = ProbeVerdict::Error;
        }

        report.attempts.emplace_back(mech.name, verdict);
        Log(std::string("[PROBE] ") + DomainName(domain) + " / " + mech.name + " (" +
            TierName(mech.tier) + "): " + VerdictName(verdict));

        if (verdict == ProbeVerdict::Granted) {
            report.tier = mech.tier;
            report.mechanism = mech.name;
            return report;
        }
    }

    report.tier = CapabilityTier::Unavailable;
    Log(std::string("[PROBE] ") + DomainName(domain) + ": all mechanisms failed. Cached as unavailable.");
    return report;
}

void CapabilityProber::Invalidate(CapabilityDomain domain)
{
    std::lock_guard writer(m_writerMtx);
    std::unique_lock lk(m_cacheMtx);
    if (m_cache.erase(domain) > 0) {
        Log(std::string("[PROBE] Invalidated ") + DomainName(domain));
    }
}

void CapabilityProber::InvalidateAll()
{
    std::lock_guard writer(m_writerMtx);
    std::unique_lock lk(m_cacheMtx);
    m_cache.clear();
    Log("[PROBE] Invalidated all domains");
}

std::optional<ProbeReport> CapabilityProber::Cached(CapabilityDomain domain) const
{
    std::shared_lock lk(m_cacheMtx);
    auto it = m_cache.find(domain);
    if (it == m_cache.end()) return std::nullopt;
    return it->second;
}

std::vector<ProbeReport> CapabilityProber::Snapshot() const
{
    std::shared_lock lk(m_cacheMtx);
    std::vector<ProbeReport> out;
    out.reserve(m_cache.size());
    for (const auto& [domain, report] : m_cache) out.push_back(report);
    return out;
}
