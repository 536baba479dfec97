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

#ifndef PGUARD_TYPES_H
#define PGUARD_TYPES_H

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

// --------------------------------------------------------------------------
// ACTIONABLE TAXONOMY (Closed, Versioned)
// --------------------------------------------------------------------------

// Extending this enum requires a registry binding AND a handler.
enum class ActionableType : uint8_t {
    SetStandbyBucket = 0,
    RestrictBackgroundData,
    KillApp,
    ManageWakeLocks,
    ThrottleCpuUsage,
    SetBatteryAlert,
    SetDataAlert,
    Count // Compile-time fixed size
};

constexpr size_t ACTIONABLE_TYPE_COUNT = static_cast<size_t>(ActionableType::Count);
static_assert(ACTIONABLE_TYPE_COUNT == 7, "ActionableType count");

// Logical OS control surfaces
enum class CapabilityDomain : uint8_t {
    IdleState = 0,
    BackgroundTransfer,
    ProcessTermination,
    WakeSource,
    CpuThrottle,
    UsageAlert,
    Count
};

constexpr size_t CAPABILITY_DOMAIN_COUNT = static_cast<size_t>(CapabilityDomain::Count);

// Per domain, never per instruction
enum class CapabilityTier : uint8_t {
    Primary,
    Fallback,
    Unavailable
};

enum class ExecutionStatus : uint8_t {
    Success,
    Failed,
    Unsupported
};

// Deterministic classification of one access-mechanism attempt
enum class ProbeVerdict : uint8_t {
    Granted,
    PermissionDenied,
    NotPresent,     // Mechanism missing on this platform revision
    Error
};

// --------------------------------------------------------------------------
// DATA MODEL
// --------------------------------------------------------------------------

// Transient: consumed once per batch, never mutated.
struct ActionableRecord {
    std::string id;
    std::string type;                   // Wire key, validated against the taxonomy
    std::optional<std::string> target;  // Absent for device-global instructions
    std::string requestedMode;
    std::string reason;
    std::map<std::string, std::string> parameters;
};

struct ExecutionResult {
    std::string actionableId;
    ExecutionStatus status = ExecutionStatus::Failed;
    std::string detail;
    uint64_t completedAt = 0; // Unix epoch, milliseconds

    // Audit context
    std::string type;
    std::string target;
    CapabilityTier tier = CapabilityTier::Unavailable;
};

// Lifecycle of one record inside ExecuteBatch
enum class RecordState : uint8_t {
    Received,
    Validated,
    Probed,
    Executed,
    Rejected
};

enum class ValidationErrorKind : uint8_t {
    None = 0,
    UnknownType,
    MissingField
};

struct ValidationResult {
    ValidationErrorKind error = ValidationErrorKind::None;
    std::string field; // Set for MissingField

    bool Ok() const { return error == ValidationErrorKind::None; }
};

// Kernel wakeup_sources row
struct WakeSourceStat {
    std::string name;
    uint64_t activeCount = 0;
    uint64_t totalTimeMs = 0;
    uint64_t preventSuspendTimeMs = 0;
};

// --------------------------------------------------------------------------
// NAME TABLES
// --------------------------------------------------------------------------

const char* ActionableTypeKey(ActionableType type);
std::optional<ActionableType> ParseActionableType(const std::string& key);

const char* DomainName(CapabilityDomain domain);
std::optional<CapabilityDomain> ParseDomain(const std::string& name);
CapabilityDomain DomainOf(ActionableType type);

const char* TierName(CapabilityTier tier);
std::optional<CapabilityTier> ParseTier(const std::string& name);

const char* StatusName(ExecutionStatus status);
std::optional<ExecutionStatus> ParseStatus(const std::string& name);

const char* VerdictName(ProbeVerdict verdict);
const char* StateName(RecordState state);

#endif // PGUARD_TYPES_H
