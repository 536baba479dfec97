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
#include "capability_prober.h"
#include "constants.h"
#include "test_support.h"
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

AccessPlanTable SingleDomain(CapabilityDomain domain, std::vector<AccessMechanism> mechanisms)
{
    AccessPlanTable table;
    table[domain].mechanisms = std::move(mechanisms);
    return table;
}

TEST(CapabilityProberTest, PrimaryGrantedStopsTheWalk) {
    std::map<CapabilityDomain, ScriptedPlan> plans;
    CapabilityProber prober(ScriptedPlans(plans));

    EXPECT_EQ(prober.Probe(CapabilityDomain::IdleState), CapabilityTier::Primary);
    EXPECT_EQ(*plans[CapabilityDomain::IdleState].primaryCalls, 1);
    EXPECT_EQ(*plans[CapabilityDomain::IdleState].fallbackCalls, 0);

    auto report = prober.Cached(CapabilityDomain::IdleState);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->mechanism, "scripted-primary");
    ASSERT_EQ(report->attempts.size(), 1u);
}

TEST(CapabilityProberTest, AnyNonGrantedVerdictFallsThrough) {
    for (auto verdict : { ProbeVerdict::PermissionDenied, ProbeVerdict::NotPresent, ProbeVerdict::Error }) {
        std::map<CapabilityDomain, ScriptedPlan> plans;
        plans[CapabilityDomain::BackgroundTransfer].primary = verdict;
        CapabilityProber prober(ScriptedPlans(plans));

        EXPECT_EQ(prober.Probe(CapabilityDomain::BackgroundTransfer), CapabilityTier::Fallback)
            << VerdictName(verdict);

        auto report = prober.Cached(CapabilityDomain::BackgroundTransfer);
        ASSERT_TRUE(report.has_value());
        ASSERT_EQ(report->attempts.size(), 2u);
        EXPECT_EQ(report->attempts[0].second, verdict);
        EXPECT_EQ(report->attempts[1].second, ProbeVerdict::Granted);
    }
}

TEST(CapabilityProberTest, UnavailableIsCachedWithoutReprobing) {
    std::map<CapabilityDomain, ScriptedPlan> plans;
    plans[CapabilityDomain::CpuThrottle].primary = ProbeVerdict::PermissionDenied;
    plans[CapabilityDomain::CpuThrottle].fallback = ProbeVerdict::PermissionDenied;
    CapabilityProber prober(ScriptedPlans(plans));

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(prober.Probe(CapabilityDomain::CpuThrottle), CapabilityTier::Unavailable);
    }
    EXPECT_EQ(*plans[CapabilityDomain::CpuThrottle].primaryCalls, 1);
    EXPECT_EQ(*plans[CapabilityDomain::CpuThrottle].fallbackCalls, 1);

    auto report = prober.Cached(CapabilityDomain::CpuThrottle);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->mechanism.empty());
}

TEST(CapabilityProberTest, DomainsAreProbedIndependently) {
    std::map<CapabilityDomain, ScriptedPlan> plans;
    plans[CapabilityDomain::WakeSource].primary = ProbeVerdict::NotPresent;
    plans[CapabilityDomain::WakeSource].fallback = ProbeVerdict::NotPresent;
    CapabilityProber prober(ScriptedPlans(plans));

    EXPECT_EQ(prober.Probe(CapabilityDomain::WakeSource), CapabilityTier::Unavailable);
    EXPECT_EQ(prober.Probe(CapabilityDomain::IdleState), CapabilityTier::Primary);
    EXPECT_EQ(prober.Snapshot().size(), 2u);
    EXPECT_FALSE(prober.Cached(CapabilityDomain::UsageAlert).has_value());
}

TEST(CapabilityProberTest, InvalidateForcesExactlyOneReprobe) {
    std::map<CapabilityDomain, ScriptedPlan> plans;
    CapabilityProber prober(ScriptedPlans(plans));
    auto& idle = plans[CapabilityDomain::IdleState];
    auto& kill = plans[CapabilityDomain::ProcessTermination];

    prober.Probe(CapabilityDomain::IdleState);
    prober.Probe(CapabilityDomain::ProcessTermination);
    prober.Invalidate(CapabilityDomain::IdleState);
    EXPECT_FALSE(prober.Cached(CapabilityDomain::IdleState).has_value());

    prober.Probe(CapabilityDomain::IdleState);
    prober.Probe(CapabilityDomain::IdleState);
    prober.Probe(CapabilityDomain::ProcessTermination);

    EXPECT_EQ(*idle.primaryCalls, 2);
    EXPECT_EQ(*kill.primaryCalls, 1);

    prober.InvalidateAll();
    EXPECT_TRUE(prober.Snapshot().empty());
    prober.Probe(CapabilityDomain::ProcessTermination);
    EXPECT_EQ(*kill.primaryCalls, 2);
}

TEST(CapabilityProberTest, ThrowingProbeCountsAsError) {
    auto table = SingleDomain(CapabilityDomain::IdleState, {
        { CapabilityTier::Primary, "throws", []() -> ProbeVerdict { throw std::runtime_error("binder died"); } },
        { CapabilityTier::Fallback, "works", []() { return ProbeVerdict::Granted; } },
    });
    CapabilityProber prober(std::move(table));

    EXPECT_EQ(prober.Probe(CapabilityDomain::IdleState), CapabilityTier::Fallback);
    auto report = prober.Cached(CapabilityDomain::IdleState);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->attempts[0].second, ProbeVerdict::Error);
    EXPECT_EQ(report->mechanism, "works");
}

TEST(CapabilityProberTest, MissingPlanIsUnavailable) {
    CapabilityProber prober(AccessPlanTable{});
    EXPECT_EQ(prober.Probe(CapabilityDomain::UsageAlert), CapabilityTier::Unavailable);
}

TEST(CapabilityProberTest, ConcurrentFirstProbesRunThePlanOnce) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto table = SingleDomain(CapabilityDomain::BackgroundTransfer, {
        { CapabilityTier::Primary, "slow", [calls]() {
            ++*calls;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            return ProbeVerdict::Granted;
        } },
    });
    CapabilityProber prober(std::move(table));

    std::vector<std::thread> threads;
    std::vector<CapabilityTier> tiers(8, CapabilityTier::Unavailable);
    for (size_t i = 0; i < tiers.size(); ++i) {
        threads.emplace_back([&, i]() { tiers[i] = prober.Probe(CapabilityDomain::BackgroundTransfer); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(calls->load(), 1);
    for (auto tier : tiers) EXPECT_EQ(tier, CapabilityTier::Primary);
}

TEST(AccessPlans, DefaultPlansCoverEveryDomain) {
    auto bridge = std::make_shared<FakeSystemBridge>();
    AccessPlanTable table = BuildDefaultAccessPlans(bridge);

    for (size_t i = 0; i < CAPABILITY_DOMAIN_COUNT; ++i) {
        auto domain = static_cast<CapabilityDomain>(i);
        ASSERT_TRUE(table.count(domain)) << DomainName(domain);
        EXPECT_FALSE(table[domain].mechanisms.empty()) << DomainName(domain);
        EXPECT_EQ(table[domain].mechanisms.front().tier, CapabilityTier::Primary);
    }
    // Building plans must not touch the OS
    EXPECT_EQ(bridge->TotalCalls(), 0u);
}

TEST(AccessPlans, UsageAlertsAreAlwaysPrimary) {
    auto bridge = std::make_shared<FakeSystemBridge>();
    CapabilityProber prober(BuildDefaultAccessPlans(bridge));
    EXPECT_EQ(prober.Probe(CapabilityDomain::UsageAlert), CapabilityTier::Primary);
}

TEST(AccessPlans, OlderPlatformRevisionSelectsLegacyNetpolicyList) {
    auto bridge = std::make_shared<FakeSystemBridge>();
    bridge->apiLevel = 30;
    CapabilityProber prober(BuildDefaultAccessPlans(bridge));

    EXPECT_EQ(prober.Probe(CapabilityDomain::BackgroundTransfer), CapabilityTier::Fallback);
    auto report = prober.Cached(CapabilityDomain::BackgroundTransfer);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->attempts[0].second, ProbeVerdict::NotPresent);
    EXPECT_EQ(report->mechanism, "netpolicy restrict-background-blacklist");

    // Only the legacy query reached the shell
    auto commands = bridge->Commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].back(), "restrict-background-blacklist");
}

TEST(AccessPlans, SecurityExceptionDeniesAndFallsBack) {
    auto bridge = std::make_shared<FakeSystemBridge>();
    bridge->onCommand = [](const std::vector<std::string>& argv) {
        if (argv[0] == "am") return CommandOutput(255, "java.lang.SecurityException: Permission Denial");
        return CommandOutput(0, "");
    };
    CapabilityProber prober(BuildDefaultAccessPlans(bridge));

    EXPECT_EQ(prober.Probe(CapabilityDomain::IdleState), CapabilityTier::Fallback);
    EXPECT_EQ(prober.Cached(CapabilityDomain::IdleState)->attempts[0].second, ProbeVerdict::PermissionDenied);
}

TEST(AccessPlans, CpuThrottleUsesNiceCapabilityFirst) {
    auto bridge = std::make_shared<FakeSystemBridge>();
    bridge->capabilities.insert(CAP_BIT_SYS_NICE);
    CapabilityProber prober(BuildDefaultAccessPlans(bridge));

    EXPECT_EQ(prober.Probe(CapabilityDomain::CpuThrottle), CapabilityTier::Primary);
    EXPECT_TRUE(bridge->Commands().empty());
}

TEST(AccessPlans, NothingWorksMeansUnavailable) {
    auto bridge = std::make_shared<FakeSystemBridge>();
    bridge->apiLevel = 0;
    bridge->onCommand = [](const std::vector<std::string>&) {
        CommandResult missing;
        missing.launched = false;
        return missing;
    };
    CapabilityProber prober(BuildDefaultAccessPlans(bridge));

    EXPECT_EQ(prober.Probe(CapabilityDomain::IdleState), CapabilityTier::Unavailable);
    EXPECT_EQ(prober.Probe(CapabilityDomain::WakeSource), CapabilityTier::Unavailable);
    EXPECT_EQ(prober.Probe(CapabilityDomain::ProcessTermination), CapabilityTier::Unavailable);
}

} // namespace
