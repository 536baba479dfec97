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

#ifndef PGUARD_USAGE_ALERT_HANDLER_H
#define PGUARD_USAGE_ALERT_HANDLER_H

#include "actionable_handler.h"
#include <mutex>
#include <vector>

enum class AlertKind : uint8_t {
    Battery,  // threshold: percent remaining
    Data      // threshold: megabytes used
};

struct UsageAlert {
    AlertKind kind = AlertKind::Battery;
    std::string target;       // Empty for device-wide alerts
    long long threshold = 0;
    uint64_t armedAt = 0;
};

// Where user-facing alert notifications go
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void Post(const std::string& title, const std::string& body) = 0;
};

class LogNotificationSink : public NotificationSink {
public:
    void Post(const std::string& title, const std::string& body) override;
};

// Armed thresholds, one per (kind, target)
class AlertBook {
public:
    // Returns true when an existing alert was replaced
    bool Arm(const UsageAlert& alert);
    bool Disarm(AlertKind kind, const std::string& target);
    std::vector<UsageAlert> Active() const;

private:
    mutable std::mutex m_mtx;
    std::vector<UsageAlert> m_alerts;
};

// Usage-threshold alerting. No OS effect.
class UsageAlertHandler : public ActionableHandler {
public:
    UsageAlertHandler(AlertKind kind, std::shared_ptr<AlertBook> book,
                      std::shared_ptr<NotificationSink> sink, long long defaultThreshold);

    CapabilityDomain Domain() const override { return CapabilityDomain::UsageAlert; }
    const char* Name() const override { return m_kind == AlertKind::Battery ? "BatteryAlert" : "DataAlert"; }

protected:
    std::optional<std::string> CheckPayload(const ActionableRecord& record) const override;
    HandlerOutcome Apply(const ActionableRecord& record, CapabilityTier tier) override;

private:
    const char* ThresholdKey() const { return m_kind == AlertKind::Battery ? "threshold" : "threshold_mb"; }
    std::string Describe(long long threshold) const;

    AlertKind m_kind;
    std::shared_ptr<AlertBook> m_book;
    std::shared_ptr<NotificationSink> m_sink;
    long long m_defaultThreshold;
};

#endif // PGUARD_USAGE_ALERT_HANDLER_H
