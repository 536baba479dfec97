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

#include "standby_bucket_handler.h"
#include "system_bridge.h"
#include "logger.h"
#include "utils.h"

StandbyBucket StandbyBucketHandler::ParseBucket(const std::string& mode)
{
    std::string m = ToLower(Trim(mode));
    if (m == "active") return StandbyBucket::Active;
    if (m == "working_set" || m == "working") return StandbyBucket::WorkingSet;
    if (m == "frequent") return StandbyBucket::Frequent;
    if (m == "rare") return StandbyBucket::Rare;
    if (m == "restricted") return StandbyBucket::Restricted;

    // Numeric bucket values are accepted as well
    if (auto v = ParseInteger(m)) {
        switch (*v) {
            case STANDBY_BUCKET_ACTIVE:      return StandbyBucket::Active;
            case STANDBY_BUCKET_WORKING_SET: return StandbyBucket::WorkingSet;
            case STANDBY_BUCKET_FREQUENT:    return StandbyBucket::Frequent;
            case STANDBY_BUCKET_RARE:        return StandbyBucket::Rare;
            case STANDBY_BUCKET_RESTRICTED:  return StandbyBucket::Restricted;
            default: break;
        }
    }
    return StandbyBucket::Restricted;
}

const char* StandbyBucketHandler::BucketName(StandbyBucket bucket)
{
    switch (bucket) {
        case StandbyBucket::Active:     return "active";
        case StandbyBucket::WorkingSet: return "working_set";
        case StandbyBucket::Frequent:   return "frequent";
        case StandbyBucket::Rare:       return "rare";
        case StandbyBucket::Restricted:
        default:                        return "restricted";
    }
}

HandlerOutcome StandbyBucketHandler::Apply(const ActionableRecord& record, CapabilityTier tier)
{
    const std::string pkg = TargetOf(record);
    const StandbyBucket bucket = ParseBucket(record.requestedMode);

    if (tier == CapabilityTier::Primary)
    {
        CommandResult r = m_bridge->RunCommand({ "am", "set-standby-bucket", pkg, BucketName(bucket) });
        if (ClassifyCommand(r) != ProbeVerdict::Granted) {
            return HandlerOutcome::Fail("set-standby-bucket failed: " + DescribeCommandFailure(r));
        }
        return HandlerOutcome::Ok("standby bucket of " + pkg + " set to " + BucketName(bucket));
    }

    // Legacy path: rare and restricted both mean "no background execution"
    const char* op = static_cast<int>(bucket) >= static_cast<int>(StandbyBucket::Rare) ? "ignore" : "allow";
    CommandResult r = m_bridge->RunCommand({ "cmd", "appops", "set", pkg, "RUN_ANY_IN_BACKGROUND", op });
    if (ClassifyCommand(r) != ProbeVerdict::Granted) {
        return HandlerOutcome::Fail("RUN_ANY_IN_BACKGROUND failed: " + DescribeCommandFailure(r));
    }
    return HandlerOutcome::Ok("background execution of " + pkg + " set to " + op +
                              " (bucket " + BucketName(bucket) + ")");
}
