//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine.hpp"

#include "config.hpp"
#include "daemon/engine/config_mock.hpp"

#include "registry/registry_gtest_helpers.hpp"

#include "mobreg/registry/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace
{

using namespace mobreg::daemon::engine;  // NOLINT This our main concern here in the unit tests.
using mobreg::registry::ErrorCode;
using mobreg::registry::GetResult;
using mobreg::registry::Position;

using testing::_;
using testing::Eq;
using testing::Field;
using testing::AllOf;
using testing::Return;
using testing::IsEmpty;
using testing::NiceMock;
using testing::Optional;
using testing::HasSubstr;
using testing::ElementsAre;
using testing::SaveArg;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestEngine : public testing::Test
{
protected:
    using NetworkNode = Config::NetworkNode;

    void SetUp() override
    {
        config_mock_ = std::make_shared<NiceMock<ConfigMock>>();

        ON_CALL(*config_mock_, getNetworkNodes()).WillByDefault(Return(std::vector<NetworkNode>{
            {"02:00:00:00:00:00", {1.0, 2.0, 3.0}, true},
            {"02:00:00:00:00:01", {4.0, 5.0, 6.0}, false},
            {"02:00:00:00:00:02", {-7.0, 0.0, 0.5}, true},
        }));
    }

    // NOLINTBEGIN
    std::shared_ptr<NiceMock<ConfigMock>> config_mock_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestEngine, init_seeds_nodes)
{
    Engine engine{config_mock_};
    ASSERT_THAT(engine.init(), Eq(cetl::nullopt));

    auto& registry = engine.registry();
    EXPECT_THAT(registry.capacity(), 3);
    EXPECT_THAT(registry.enabled(), ElementsAre(0, 2));

    EXPECT_THAT(registry.get(0), VariantWith<GetResult::Success>(Position{1.0, 2.0, 3.0}));
    EXPECT_THAT(registry.getByAddress("02:00:00:00:00:02"), VariantWith<GetResult::Success>(Position{-7.0, 0.0, 0.5}));
    EXPECT_THAT(registry.get(1), VariantWith<GetResult::Failure>(Field(&mobreg::registry::Error::code,  //
                                                                       ErrorCode::NodeDisabled)));

    // The configured position of a disabled node is kept for the time it joins.
    EXPECT_THAT(registry.enable(1), Eq(cetl::nullopt));
    EXPECT_THAT(registry.get(1), VariantWith<GetResult::Success>(Position{4.0, 5.0, 6.0}));
}

TEST_F(TestEngine, init_with_extra_capacity)
{
    EXPECT_CALL(*config_mock_, getRegistryCapacity()).WillRepeatedly(Return(10));

    Engine engine{config_mock_};
    ASSERT_THAT(engine.init(), Eq(cetl::nullopt));

    auto& registry = engine.registry();
    EXPECT_THAT(registry.capacity(), 10);
    EXPECT_THAT(registry.enabled(), ElementsAre(0, 2));

    // Extra slots are addressable by index only.
    EXPECT_THAT(registry.enable(9), Eq(cetl::nullopt));
    EXPECT_THAT(registry.set(9, 1.0, 1.0, 1.0), Eq(cetl::nullopt));
}

TEST_F(TestEngine, init_with_insufficient_capacity)
{
    EXPECT_CALL(*config_mock_, getRegistryCapacity()).WillRepeatedly(Return(2));

    Engine engine{config_mock_};
    EXPECT_THAT(engine.init(), Optional(HasSubstr("capacity 2")));
}

TEST_F(TestEngine, init_with_out_of_range_capacity)
{
    {
        EXPECT_CALL(*config_mock_, getRegistryCapacity()).WillOnce(Return(-1));

        Engine engine{config_mock_};
        EXPECT_THAT(engine.init(), Optional(HasSubstr("Registry capacity -1 is out of range")));
    }
    {
        EXPECT_CALL(*config_mock_, getRegistryCapacity()).WillOnce(Return(std::int64_t{1} << 40));

        Engine engine{config_mock_};
        EXPECT_THAT(engine.init(), Optional(HasSubstr("is out of range")));
    }
}

TEST_F(TestEngine, init_without_nodes)
{
    EXPECT_CALL(*config_mock_, getNetworkNodes()).WillRepeatedly(Return(std::vector<NetworkNode>{}));

    Engine engine{config_mock_};
    EXPECT_THAT(engine.init(), Optional(HasSubstr("Zero registry capacity")));
}

TEST_F(TestEngine, init_with_duplicate_addresses)
{
    EXPECT_CALL(*config_mock_, getNetworkNodes())
        .WillRepeatedly(Return(std::vector<NetworkNode>{{"aa", {}, true}, {"aa", {}, true}}));

    Engine engine{config_mock_};
    EXPECT_THAT(engine.init(), Optional(HasSubstr("Duplicate hardware address 'aa'")));
}

TEST_F(TestEngine, init_with_notification_options)
{
    EXPECT_CALL(*config_mock_, getNotificationQueueCapacity()).WillRepeatedly(Return(4));
    EXPECT_CALL(*config_mock_, getNotificationOverflowPolicy()).WillRepeatedly(Return(std::string{"drop_oldest"}));

    Engine engine{config_mock_};
    EXPECT_THAT(engine.init(), Eq(cetl::nullopt));
}

TEST_F(TestEngine, init_with_bad_notification_options)
{
    {
        EXPECT_CALL(*config_mock_, getNotificationOverflowPolicy()).WillOnce(Return(std::string{"drop_newest"}));

        Engine engine{config_mock_};
        EXPECT_THAT(engine.init(), Optional(HasSubstr("'drop_newest'")));
    }
    {
        EXPECT_CALL(*config_mock_, getNotificationQueueCapacity()).WillOnce(Return(0));

        Engine engine{config_mock_};
        EXPECT_THAT(engine.init(), Optional(HasSubstr("Zero notification queue capacity")));
    }
    {
        EXPECT_CALL(*config_mock_, getNotificationQueueCapacity()).WillOnce(Return(-1));

        Engine engine{config_mock_};
        EXPECT_THAT(engine.init(), Optional(HasSubstr("Notification queue capacity -1 is out of range")));
    }
}

TEST_F(TestEngine, run_while)
{
    EXPECT_CALL(*config_mock_, getStatusPeriod()).WillRepeatedly(Return(std::chrono::milliseconds{1}));

    Engine engine{config_mock_};
    ASSERT_THAT(engine.init(), Eq(cetl::nullopt));

    auto& registry = engine.registry();
    EXPECT_THAT(engine.lastEnabled(), ElementsAre(0, 2));

    // Membership changes happen while the engine is running. Flushing puts the change into the engine's queue,
    // so the very next loop iteration consumes it.
    std::size_t iterations = 0;
    engine.runWhile([&] {
        //
        ++iterations;
        switch (iterations)
        {
        case 2:
            EXPECT_THAT(engine.lastEnabled(), ElementsAre(0, 2));
            EXPECT_THAT(registry.enable(1), Eq(cetl::nullopt));
            registry.flushNotifications();
            break;
        case 3:
            EXPECT_THAT(engine.lastEnabled(), ElementsAre(0, 1, 2));
            break;
        case 4:
            EXPECT_THAT(registry.disable(0), Eq(cetl::nullopt));
            registry.flushNotifications();
            break;
        case 5:
            EXPECT_THAT(engine.lastEnabled(), ElementsAre(1, 2));
            break;
        default:
            break;
        }
        return iterations < 8;
    });

    EXPECT_THAT(iterations, 8);
    EXPECT_THAT(registry.enabled(), ElementsAre(1, 2));
    EXPECT_THAT(engine.lastEnabled(), ElementsAre(1, 2));
}

TEST_F(TestEngine, run_while_changes_made_outside_of_loop)
{
    Engine engine{config_mock_};
    ASSERT_THAT(engine.init(), Eq(cetl::nullopt));

    auto& registry = engine.registry();
    EXPECT_THAT(registry.enable(1), Eq(cetl::nullopt));
    EXPECT_THAT(registry.disable(2), Eq(cetl::nullopt));
    registry.flushNotifications();

    // Nothing is consumed until the loop runs.
    EXPECT_THAT(engine.lastEnabled(), ElementsAre(0, 2));

    std::size_t iterations = 0;
    engine.runWhile([&iterations] { return ++iterations <= 2; });

    EXPECT_THAT(engine.lastEnabled(), ElementsAre(0, 1));
}

TEST_F(TestEngine, store_nodes)
{
    Engine engine{config_mock_};
    ASSERT_THAT(engine.init(), Eq(cetl::nullopt));

    auto& registry = engine.registry();
    EXPECT_THAT(registry.setPositionByAddress("02:00:00:00:00:02", {8.0, 8.0, 8.0}), Eq(cetl::nullopt));
    EXPECT_THAT(registry.disable(0), Eq(cetl::nullopt));

    std::vector<Config::NetworkNode> stored;
    EXPECT_CALL(*config_mock_, setNetworkNodes(_)).WillOnce(SaveArg<0>(&stored));
    engine.storeNodes();

    const auto isNode = [](const std::string& address, const Position& position, const bool is_enabled) {
        //
        return AllOf(Field(&NetworkNode::address, address),
                     Field(&NetworkNode::position, position),
                     Field(&NetworkNode::is_enabled, is_enabled));
    };
    EXPECT_THAT(stored,
                ElementsAre(isNode("02:00:00:00:00:00", {1.0, 2.0, 3.0}, false),
                            isNode("02:00:00:00:00:01", {4.0, 5.0, 6.0}, false),
                            isNode("02:00:00:00:00:02", {8.0, 8.0, 8.0}, true)));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
