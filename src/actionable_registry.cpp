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

#include "actionable_registry.h"
#include "standby_bucket_handler.h"
#include "background_data_handler.h"
#include "kill_app_handler.h"
#include "wake_lock_handler.h"
#include "cpu_throttle_handler.h"
#include "usage_alert_handler.h"
#include "config.h"
#include "logger.h"
#include "utils.h"

bool ActionableRegistry::Register(ActionableType type, std::shared_ptr<ActionableHandler> handler,
                                  std::vector<std::string> requiredFields)
{
    const std::string key = ActionableTypeKey(type);

    if (IsSealed()) {
        Log("[REGISTRY] Rejected late registration of " + key + " (registry sealed)");
        return false;
    }
    if (type == ActionableType::Count || !handler) {
        Log("[REGISTRY] Rejected registration of " + key + ": no handler");
        return false;
    }
    if (handler->Domain() != DomainOf(type)) {
        Log("[REGISTRY] Rejected " + key + ": handler " + handler->Name() + " serves " +
            DomainName(handler->Domain()) + ", type needs " + DomainName(DomainOf(type)));
        return false;
    }
    for (const auto& f : requiredFields) {
        if (!IsKnownField(f)) {
            Log("[REGISTRY] Rejected " + key + ": unknown required field '" + f + "'");
            return false;
        }
    }

    auto& slot = m_entries[static_cast<size_t>(type)];
    if (slot) {
        Log("[REGISTRY] Rejected duplicate registration of " + key);
        return false;
    }

    slot = Entry{ std::move(handler), std::move(requiredFields) };
    return true;
}

void ActionableRegistry::Seal()
{
    m_sealed.store(true, std::memory_order_release);
    Log("[REGISTRY] Sealed with " + std::to_string(RegisteredTypes().size()) + " types");
}

std::shared_ptr<ActionableHandler> ActionableRegistry::Resolve(ActionableType type) const
{
    if (type == ActionableType::Count) return nullptr;
    const auto& slot = m_entries[static_cast<size_t>(type)];
    return slot ? slot->handler : nullptr;
}

std::shared_ptr<ActionableHandler> ActionableRegistry::Resolve(const std::string& key) const
{
    auto type = ParseActionableType(key);
    if (!type) return nullptr;
    return Resolve(*type);
}

bool ActionableRegistry::IsKnownField(const std::string& field)
{
    if (field == FIELD_TARGET || field == FIELD_REQUESTED_MODE || field == FIELD_REASON) return true;
    const std::string prefix = FIELD_PARAM_PREFIX;
    return field.size() > prefix.size() && field.compare(0, prefix.size(), prefix) == 0;
}

// Presence only: a blank but present target is the handler's concern
bool ActionableRegistry::HasField(const ActionableRecord& record, const std::string& field)
{
    if (field == FIELD_TARGET) return record.target.has_value();
    if (field == FIELD_REQUESTED_MODE) return !Trim(record.requestedMode).empty();
    if (field == FIELD_REASON) return !Trim(record.reason).empty();

    const std::string key = field.substr(std::char_traits<char>::length(FIELD_PARAM_PREFIX));
    return record.parameters.count(key) > 0;
}

ValidationResult ActionableRegistry::Validate(const ActionableRecord& record) const
{
    ValidationResult result;

    auto type = ParseActionableType(record.type);
    if (!type || !m_entries[static_cast<size_t>(*type)]) {
        result.error = ValidationErrorKind::UnknownType;
        return result;
    }

    for (const auto& field : m_entries[static_cast<size_t>(*type)]->requiredFields) {
        if (!HasField(record, field)) {
            result.error = ValidationErrorKind::MissingField;
            result.field = field;
            return result;
        }
    }
    return result;
}

std::vector<ActionableType> ActionableRegistry::RegisteredTypes() const
{
    std::vector<ActionableType> out;
    for (size_t i = 0; i < ACTIONABLE_TYPE_COUNT; ++i) {
        if (m_entries[i]) out.push_back(static_cast<ActionableType>(i));
    }
    return out;
}

std::unique_ptr<ActionableRegistry> BuildDefaultRegistry(std::shared_ptr<SystemBridge> bridge,
                                                         const EngineConfig& config,
                                                         std::shared_ptr<AlertBook> alerts,
                                                         std::shared_ptr<NotificationSink> sink)
{
    auto registry = std::make_unique<ActionableRegistry>();
    const std::vector<std::string> appScoped = { FIELD_TARGET };

    bool ok = true;
    ok &= registry->Register(ActionableType::SetStandbyBucket,
                             std::make_shared<StandbyBucketHandler>(bridge), appScoped);
    ok &= registry->Register(ActionableType::RestrictBackgroundData,
                             std::make_shared<BackgroundDataHandler>(bridge), appScoped);
    ok &= registry->Register(ActionableType::KillApp,
                             std::make_shared<KillAppHandler>(bridge, config), appScoped);
    ok &= registry->Register(ActionableType::ManageWakeLocks,
                             std::make_shared<WakeLockHandler>(bridge), appScoped);
    ok &= registry->Register(ActionableType::ThrottleCpuUsage,
                             std::make_shared<CpuThrottleHandler>(bridge, config), appScoped);
    ok &= registry->Register(ActionableType::SetBatteryAlert,
                             std::make_shared<UsageAlertHandler>(AlertKind::Battery, alerts, sink,
                                                                 config.batteryAlertDefault), {});
    ok &= registry->Register(ActionableType::SetDataAlert,
                             std::make_shared<UsageAlertHandler>(AlertKind::Data, alerts, sink,
                                                                 config.dataAlertDefaultMb), {});
    if (!ok) Log("[REGISTRY] Default registry is incomplete");

    registry->Seal();
    return registry;
}
