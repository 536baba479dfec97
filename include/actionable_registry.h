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

#ifndef PGUARD_ACTIONABLE_REGISTRY_H
#define PGUARD_ACTIONABLE_REGISTRY_H

#include "types.h"
#include "actionable_handler.h"
#include <array>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class SystemBridge;
class AlertBook;
class NotificationSink;
struct EngineConfig;

// Field names usable in requiredFields
static constexpr char FIELD_TARGET[] = "target";
static constexpr char FIELD_REQUESTED_MODE[] = "requested_mode";
static constexpr char FIELD_REASON[] = "reason";
static constexpr char FIELD_PARAM_PREFIX[] = "param:"; // "param:<key>"

// Closed-world type -> handler binding.
// Registration happens during initialization only; Seal() freezes the table.
class ActionableRegistry {
public:
    struct Entry {
        std::shared_ptr<ActionableHandler> handler;
        std::vector<std::string> requiredFields;
    };

    bool Register(ActionableType type, std::shared_ptr<ActionableHandler> handler,
                  std::vector<std::string> requiredFields);

    void Seal();
    bool IsSealed() const { return m_sealed.load(std::memory_order_acquire); }

    std::shared_ptr<ActionableHandler> Resolve(ActionableType type) const;
    std::shared_ptr<ActionableHandler> Resolve(const std::string& key) const;

    // Unregistered or unknown keys are always UnknownType
    ValidationResult Validate(const ActionableRecord& record) const;

    std::vector<ActionableType> RegisteredTypes() const;

private:
    static bool IsKnownField(const std::string& field);
    static bool HasField(const ActionableRecord& record, const std::string& field);

    std::array<std::optional<Entry>, ACTIONABLE_TYPE_COUNT> m_entries;
    std::atomic<bool> m_sealed{false};
};

// Binds every taxonomy type to its production handler and seals the registry
std::unique_ptr<ActionableRegistry> BuildDefaultRegistry(std::shared_ptr<SystemBridge> bridge,
                                                         const EngineConfig& config,
                                                         std::shared_ptr<AlertBook> alerts,
                                                         std::shared_ptr<NotificationSink> sink);

#endif // PGUARD_ACTIONABLE_REGISTRY_H
