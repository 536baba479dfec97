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

#ifndef PGUARD_STANDBY_BUCKET_HANDLER_H
#define PGUARD_STANDBY_BUCKET_HANDLER_H

#include "actionable_handler.h"
#include "constants.h"

// App standby buckets, ordered from least to most restricted
enum class StandbyBucket : int {
    Active = STANDBY_BUCKET_ACTIVE,
    WorkingSet = STANDBY_BUCKET_WORKING_SET,
    Frequent = STANDBY_BUCKET_FREQUENT,
    Rare = STANDBY_BUCKET_RARE,
    Restricted = STANDBY_BUCKET_RESTRICTED
};

// Idle-state assignment.
// Primary: am set-standby-bucket. Fallback: RUN_ANY_IN_BACKGROUND app-op.
class StandbyBucketHandler : public AppScopedHandler {
public:
    using AppScopedHandler::AppScopedHandler;

    CapabilityDomain Domain() const override { return CapabilityDomain::IdleState; }
    const char* Name() const override { return "StandbyBucket"; }

    // Unrecognized names map to Restricted
    static StandbyBucket ParseBucket(const std::string& mode);
    static const char* BucketName(StandbyBucket bucket);

protected:
    HandlerOutcome Apply(const ActionableRecord& record, CapabilityTier tier) override;
};

#endif // PGUARD_STANDBY_BUCKET_HANDLER_H
