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

#include "types.h"
#include "utils.h"

const char* ActionableTypeKey(ActionableType type) {
    switch (type) {
        case ActionableType::SetStandbyBucket:       return "set_standby_bucket";
        case ActionableType::RestrictBackgroundData: return "restrict_background_data";
        case ActionableType::KillApp:                return "kill_app";
        case ActionableType::ManageWakeLocks:        return "manage_wake_locks";
        case ActionableType::ThrottleCpuUsage:       return "throttle_cpu_usage";
        case ActionableType::SetBatteryAlert:        return "set_battery_alert";
        case ActionableType::SetDataAlert:           return "set_data_alert";
        default: return "unknown";
    }
}

std::optional<ActionableType> ParseActionableType(const std::string& key) {
    std::string k = Trim(key);
    asciiLower(k);
    for (size_t i = 0; i < ACTIONABLE_TYPE_COUNT; ++i) {
        auto t = static_cast<ActionableType>(i);
        if (k == ActionableTypeKey(t)) return t;
    }
    return std::nullopt;
}

const char* DomainName(CapabilityDomain domain) {
    switch (domain) {
        case CapabilityDomain::IdleState:          return "idle_state";
        case CapabilityDomain::BackgroundTransfer: return "background_transfer";
        case CapabilityDomain::ProcessTermination: return "process_termination";
        case CapabilityDomain::WakeSource:         return "wake_source";
        case CapabilityDomain::CpuThrottle:        return "cpu_throttle";
        case CapabilityDomain::UsageAlert:         return "usage_alert";
        default: return "unknown";
    }
}

std::optional<CapabilityDomain> ParseDomain(const std::string& name) {
    std::string n = Trim(name);
    asciiLower(n);
    for (size_t i = 0; i < CAPABILITY_DOMAIN_COUNT; ++i) {
        auto d = static_cast<CapabilityDomain>(i);
        if (n == DomainName(d)) return d;
    }
    return std::nullopt;
}

CapabilityDomain DomainOf(ActionableType type) {
    switch (type) {
        case ActionableType::SetStandbyBucket:       return CapabilityDomain::IdleState;
        case ActionableType::RestrictBackgroundData: return CapabilityDomain::BackgroundTransfer;
        case ActionableType::KillApp:                return CapabilityDomain::ProcessTermination;
        case ActionableType::ManageWakeLocks:        return CapabilityDomain::WakeSource;
        case ActionableType::ThrottleCpuUsage:       return CapabilityDomain::CpuThrottle;
        case ActionableType::SetBatteryAlert:
        case ActionableType::SetDataAlert:
        default:
            return CapabilityDomain::UsageAlert;
    }
}

const char* TierName(CapabilityTier tier) {
    switch (tier) {
        case CapabilityTier::Primary:  return "primary";
        case CapabilityTier::Fallback: return "fallback";
        default: return "unavailable";
    }
}

std::optional<CapabilityTier> ParseTier(const std::string& name) {
    if (name == "primary") return CapabilityTier::Primary;
    if (name == "fallback") return CapabilityTier::Fallback;
    if (name == "unavailable") return CapabilityTier::Unavailable;
    return std::nullopt;
}

const char* StatusName(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Success:     return "success";
        case ExecutionStatus::Unsupported: return "unsupported";
        default: return "failed";
    }
}

std::optional<ExecutionStatus> ParseStatus(const std::string& name) {
    if (name == "success") return ExecutionStatus::Success;
    if (name == "failed") return ExecutionStatus::Failed;
    if (name == "unsupported") return ExecutionStatus::Unsupported;
    return std::nullopt;
}

const char* VerdictName(ProbeVerdict verdict) {
    switch (verdict) {
        case ProbeVerdict::Granted:          return "granted";
        case ProbeVerdict::PermissionDenied: return "permission_denied";
        case ProbeVerdict::NotPresent:       return "not_present";
        default: return "error";
    }
}

const char* StateName(RecordState state) {
    switch (state) {
        case RecordState::Received:  return "Received";
        case RecordState::Validated: return "Validated";
        case RecordState::Probed:    return "Probed";
        case RecordState::Executed:  return "Executed";
        case RecordState::Rejected:  return "Rejected";
        default: return "?";
    }
}
