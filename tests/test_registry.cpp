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

#include <gtest/gtest.h>
#include "actionable_registry.h"
#include "standby_bucket_handler.h"
#include "kill_app_handler.h"
#include "usage_alert_handler.h"
#include "config.h"
#include "test_support.h"

namespace {

class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        bridge = std::make_shared<FakeSystemBridge>();
        registry = BuildDefaultRegistry(bridge, EngineConfig{}, std::make_shared<AlertBook>(),
                                        std::make_shared<LogNotificationSink>());
    }

    std::shared_ptr<FakeSystemBridge> bridge;
    std::unique_ptr<ActionableRegistry> registry;
};

TEST_F(RegistryTest, DefaultRegistryBindsEveryTaxonomyType) {
    EXPECT_TRUE(registry->IsSealed());
    EXPECT_EQ(registry->RegisteredTypes().size(), ACTIONABLE_TYPE_COUNT);

    for (size_t i = 0; i < ACTIONABLE_TYPE_COUNT; ++i) {
        auto type = static_cast<ActionableType>(i);
        auto handler = registry->Resolve(type);
        ASSERT_NE(handler, nullptr) << ActionableTypeKey(type);
        EXPECT_EQ(handler->Domain(), DomainOf(type));
    }
}

TEST_F(RegistryTest, WireKeysResolveCaseInsensitively) {
    EXPECT_NE(registry->Resolve("SET_STANDBY_BUCKET"), nullptr);
    EXPECT_NE(registry->Resolve("  kill_app "), nullptr);
    EXPECT_EQ(registry->Resolve("SET_STANDBY_BUCKET"), registry->Resolve(ActionableType::SetStandbyBucket));
    EXPECT_EQ(registry->Resolve("reboot_device"), nullptr);
    EXPECT_EQ(registry->Resolve(""), nullptr);
}

TEST_F(RegistryTest, UnknownTypeIsReported) {
    auto v = registry->Validate(MakeRecord("1", "ENABLE_TURBO_MODE", "com.example.app"));
    EXPECT_FALSE(v.Ok());
    EXPECT_EQ(v.error, ValidationErrorKind::UnknownType);

    v = registry->Validate(MakeRecord("2", "", "com.example.app"));
    EXPECT_EQ(v.error, ValidationErrorKind::UnknownType);
}

TEST_F(RegistryTest, AbsentTargetIsMissingField) {
    auto v = registry->Validate(MakeRecord("1", "KILL_APP", std::nullopt));
    EXPECT_EQ(v.error, ValidationErrorKind::MissingField);
    EXPECT_EQ(v.field, FIELD_TARGET);
}

TEST_F(RegistryTest, BlankTargetPassesValidation) {
    // Presence is the registry's concern; blankness is the handler's
    auto v = registry->Validate(MakeRecord("1", "SET_STANDBY_BUCKET", ""));
    EXPECT_TRUE(v.Ok());
}

TEST_F(RegistryTest, AlertsNeedNoTarget) {
    EXPECT_TRUE(registry->Validate(MakeRecord("1", "SET_BATTERY_ALERT", std::nullopt)).Ok());
    EXPECT_TRUE(registry->Validate(MakeRecord("2", "set_data_alert", std::nullopt)).Ok());
}

TEST_F(RegistryTest, ValidationMakesNoOsCalls) {
    registry->Validate(MakeRecord("1", "SET_STANDBY_BUCKET", ""));
    registry->Validate(MakeRecord("2", "NOPE", "com.example.app"));
    EXPECT_EQ(bridge->TotalCalls(), 0u);
}

TEST_F(RegistryTest, SealedRegistryRefusesRegistration) {
    auto handler = std::make_shared<StandbyBucketHandler>(bridge);
    EXPECT_FALSE(registry->Register(ActionableType::SetStandbyBucket, handler, { FIELD_TARGET }));
}

TEST(RegistryRegistration, RejectsDomainMismatch) {
    ActionableRegistry registry;
    auto bridge = std::make_shared<FakeSystemBridge>();
    auto handler = std::make_shared<StandbyBucketHandler>(bridge);
    EXPECT_FALSE(registry.Register(ActionableType::KillApp, handler, { FIELD_TARGET }));
    EXPECT_EQ(registry.Resolve(ActionableType::KillApp), nullptr);
}

TEST(RegistryRegistration, RejectsDuplicatesAndNullHandlers) {
    ActionableRegistry registry;
    auto bridge = std::make_shared<FakeSystemBridge>();

    EXPECT_FALSE(registry.Register(ActionableType::SetStandbyBucket, nullptr, {}));
    EXPECT_TRUE(registry.Register(ActionableType::SetStandbyBucket,
                                  std::make_shared<StandbyBucketHandler>(bridge), { FIELD_TARGET }));
    EXPECT_FALSE(registry.Register(ActionableType::SetStandbyBucket,
                                   std::make_shared<StandbyBucketHandler>(bridge), { FIELD_TARGET }));
}

TEST(RegistryRegistration, RejectsUnknownRequiredField) {
    ActionableRegistry registry;
    auto bridge = std::make_shared<FakeSystemBridge>();
    EXPECT_FALSE(registry.Register(ActionableType::SetStandbyBucket,
                                   std::make_shared<StandbyBucketHandler>(bridge), { "colour" }));
    EXPECT_FALSE(registry.Register(ActionableType::SetStandbyBucket,
                                   std::make_shared<StandbyBucketHandler>(bridge), { "param:" }));
}

TEST(RegistryRegistration, UnregisteredTypeIsUnknownEvenIfInTaxonomy) {
    ActionableRegistry registry;
    auto bridge = std::make_shared<FakeSystemBridge>();
    ASSERT_TRUE(registry.Register(ActionableType::SetStandbyBucket,
                                  std::make_shared<StandbyBucketHandler>(bridge), { FIELD_TARGET }));
    registry.Seal();

    EXPECT_EQ(registry.Validate(MakeRecord("1", "KILL_APP", "com.example.app")).error,
              ValidationErrorKind::UnknownType);
}

TEST(RegistryRegistration, ParameterAndModeRequirements) {
    ActionableRegistry registry;
    auto bridge = std::make_shared<FakeSystemBridge>();
    ASSERT_TRUE(registry.Register(ActionableType::SetStandbyBucket,
                                  std::make_shared<StandbyBucketHandler>(bridge),
                                  { FIELD_TARGET, FIELD_REQUESTED_MODE, "param:window" }));
    registry.Seal();

    auto v = registry.Validate(MakeRecord("1", "SET_STANDBY_BUCKET", "com.example.app", "  "));
    EXPECT_EQ(v.error, ValidationErrorKind::MissingField);
    EXPECT_EQ(v.field, FIELD_REQUESTED_MODE);

    v = registry.Validate(MakeRecord("2", "SET_STANDBY_BUCKET", "com.example.app", "rare"));
    EXPECT_EQ(v.error, ValidationErrorKind::MissingField);
    EXPECT_EQ(v.field, "param:window");

    v = registry.Validate(MakeRecord("3", "SET_STANDBY_BUCKET", "com.example.app", "rare", { { "window", "1h" } }));
    EXPECT_TRUE(v.Ok());
}

} // namespace
