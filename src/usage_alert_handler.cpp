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

#include "usage_alert_handler.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>

void LogNotificationSink::Post(const std::string& title, const std::string& body)
{
    Log("[ALERT] " + title + ": " + body);
}

bool AlertBook::Arm(const UsageAlert& alert)
{
    std::lock_guard lk(m_mtx);
    for (auto& a : m_alerts) {
        if (a.kind == alert.kind && a.target == alert.target) {
            a = alert;
            return true;
        }
    }
    m_alerts.push_back(alert);
    return false;
}

bool AlertBook::Disarm(AlertKind kind, const std::string& target)
{
    std::lock_guard lk(m_mtx);
    auto it = std::remove_if(m_alerts.begin(), m_alerts.end(), [&](const UsageAlert& a) {
        return a.kind == kind && a.target == target;
    });
    bool found = it != m_alerts.end();
    m_alerts.erase(it, m_alerts.end());
    return found;
}

std::vector<UsageAlert> AlertBook::Active() const
{
    std::lock_guard lk(m_mtx);
    return m_alerts;
}

UsageAlertHandler::UsageAlertHandler(AlertKind kind, std::shared_ptr<AlertBook> book,
                                     std::shared_ptr<NotificationSink> sink, long long defaultThreshold)
    : m_kind(kind), m_book(std::move(book)), m_sink(std::move(sink)), m_defaultThreshold(defaultThreshold)
{
}

std::optional<std::string> UsageAlertHandler::CheckPayload(const ActionableRecord& record) const
{
    if (!IsBlank(record.target) && !IsValidPackageName(Trim(*record.target))) {
        return "invalid target: " + Trim(*record.target);
    }

    auto it = record.parameters.find(ThresholdKey());
    if (it == record.parameters.end()) return std::nullopt;

    auto value = ParseInteger(it->second);
    if (!value) return std::string("invalid ") + ThresholdKey() + ": " + it->second;
    if (m_kind == AlertKind::Data && *value <= 0) {
        return std::string("invalid ") + ThresholdKey() + ": " + it->second;
    }
    return std::nullopt;
}

std::string UsageAlertHandler::Describe(long long threshold) const
{
    return m_kind == AlertKind::Battery ? std::to_string(threshold) + "%"
                                        : std::to_string(threshold) + " MB";
}

HandlerOutcome UsageAlertHandler::Apply(const ActionableRecord& record, CapabilityTier)
{
    const std::string target = Trim(record.target.value_or(""));
    const std::string scope = target.empty() ? std::string("device") : target;
    const char* label = m_kind == AlertKind::Battery ? "battery alert" : "data alert";

    std::string mode = ToLower(Trim(record.requestedMode));
    if (mode == "cancel" || mode == "clear" || mode == "off" || mode == "disable") {
        bool removed = m_book->Disarm(m_kind, target);
        return HandlerOutcome::Ok(std::string(removed ? "cleared " : "no ") + label +
                                  (removed ? " for " : " armed for ") + scope);
    }

    long long threshold = m_defaultThreshold;
    auto it = record.parameters.find(ThresholdKey());
    if (it != record.parameters.end()) {
        if (auto v = ParseInteger(it->second)) threshold = *v;
    }
    if (m_kind == AlertKind::Battery) threshold = std::clamp<long long>(threshold, 1, 100);

    UsageAlert alert;
    alert.kind = m_kind;
    alert.target = target;
    alert.threshold = threshold;
    alert.armedAt = NowEpochMs();
    bool replaced = m_book->Arm(alert);

    std::string body = std::string(label) + " for " + scope + " at " + Describe(threshold);
    if (!record.reason.empty()) body += " (" + record.reason + ")";
    if (m_sink) m_sink->Post(m_kind == AlertKind::Battery ? "Battery alert set" : "Data alert set", body);

    return HandlerOutcome::Ok(std::string(replaced ? "updated " : "armed ") + label + " for " + scope +
                              " at " + Describe(threshold));
}
