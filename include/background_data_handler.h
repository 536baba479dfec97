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

#ifndef PGUARD_BACKGROUND_DATA_HANDLER_H
#define PGUARD_BACKGROUND_DATA_HANDLER_H

#include "actionable_handler.h"

enum class BackgroundDataPolicy : uint8_t {
    Restrict,
    Allow
};

// Background-transfer restriction through the network policy service.
// The denylist/blacklist rename (Android 12) is the Primary/Fallback split.
class BackgroundDataHandler : public AppScopedHandler {
public:
    using AppScopedHandler::AppScopedHandler;

    CapabilityDomain Domain() const override { return CapabilityDomain::BackgroundTransfer; }
    const char* Name() const override { return "BackgroundData"; }

    // "enabled=false" wins over the mode; unrecognized modes restrict
    static BackgroundDataPolicy ParsePolicy(const std::string& mode, const std::string& enabledParam);

protected:
    HandlerOutcome Apply(const ActionableRecord& record, CapabilityTier tier) override;
};

#endif // PGUARD_BACKGROUND_DATA_HANDLER_H
