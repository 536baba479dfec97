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

#ifndef PGUARD_ACCESS_PLAN_H
#define PGUARD_ACCESS_PLAN_H

#include "types.h"
#include <functional>
#include <memory>
#include <map>
#include <string>
#include <vector>

class SystemBridge;

// One named way of reaching a capability domain
struct AccessMechanism {
    CapabilityTier tier;
    std::string name;
    std::function<ProbeVerdict()> probe; // Side-effect free; may throw
};

// Ordered: earlier mechanisms are preferred
struct DomainAccessPlan {
    std::vector<AccessMechanism> mechanisms;
};

using AccessPlanTable = std::map<CapabilityDomain, DomainAccessPlan>;

// Production plans for every domain, probing through 'bridge'
AccessPlanTable BuildDefaultAccessPlans(std::shared_ptr<SystemBridge> bridge);

#endif // PGUARD_ACCESS_PLAN_H
