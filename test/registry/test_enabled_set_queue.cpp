//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "mobreg/registry/enabled_set_queue.hpp"
#include "mobreg/registry/position_registry.hpp"
#include "mobreg/registry/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>

namespace
{

using namespace mobreg::registry;  // NOLINT This our main concern here in the unit tests.

using testing::Eq;
using testing::Optional;
using testing::ElementsAre;

using std::literals::chrono_literals::operator""ms;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestEnabledSetQueue : public testing::Test
{};

// MARK: - Tests:

TEST_F(TestEnabledSetQueue, push_pop_in_order)
{
    const auto queue = EnabledSetQueue::make(4);

    EXPECT_TRUE(queue->push({1}));
    EXPECT_TRUE(queue->push({1, 2}));
    EXPECT_THAT(queue->size(), 2);

    EXPECT_THAT(queue->popFor(0ms), Optional(ElementsAre(1)));
    EXPECT_THAT(queue->popFor(0ms), Optional(ElementsAre(1, 2)));
    EXPECT_THAT(queue->popFor(1ms), Eq(cetl::nullopt));
    EXPECT_THAT(queue->size(), 0);
}

TEST_F(TestEnabledSetQueue, push_waits_for_room)
{
    const auto queue = EnabledSetQueue::make(1);
    EXPECT_TRUE(queue->push({7}));

    auto pusher = std::async(std::launch::async, [queue] { return queue->push({8}); });
    EXPECT_THAT(pusher.wait_for(50ms), std::future_status::timeout);

    EXPECT_THAT(queue->popFor(0ms), Optional(ElementsAre(7)));
    EXPECT_TRUE(pusher.get());
    EXPECT_THAT(queue->popFor(0ms), Optional(ElementsAre(8)));
}

TEST_F(TestEnabledSetQueue, pop_waits_for_push)
{
    const auto queue = EnabledSetQueue::make(1);

    auto popper = std::async(std::launch::async, [queue] { return queue->popFor(std::chrono::seconds{5}); });
    EXPECT_TRUE(queue->push({3}));

    EXPECT_THAT(popper.get(), Optional(ElementsAre(3)));
}

TEST_F(TestEnabledSetQueue, close)
{
    const auto queue = EnabledSetQueue::make(1);
    EXPECT_TRUE(queue->push({1}));

    // Blocked pusher is released with `false`.
    auto pusher = std::async(std::launch::async, [queue] { return queue->push({2}); });
    EXPECT_THAT(pusher.wait_for(20ms), std::future_status::timeout);
    queue->close();
    EXPECT_FALSE(pusher.get());

    // Already queued set is still available.
    EXPECT_THAT(queue->popFor(0ms), Optional(ElementsAre(1)));
    EXPECT_THAT(queue->popFor(std::chrono::seconds{5}), Eq(cetl::nullopt));
    EXPECT_FALSE(queue->push({3}));
}

TEST_F(TestEnabledSetQueue, as_registry_handler)
{
    const auto queue    = EnabledSetQueue::make(8);
    const auto registry = PositionRegistry::make(4);
    registry->registerEnabledChanged(queue->handler());

    EXPECT_THAT(registry->enable(2), Eq(cetl::nullopt));
    EXPECT_THAT(registry->enable(0), Eq(cetl::nullopt));
    registry->flushNotifications();

    EXPECT_THAT(queue->popFor(0ms), Optional(ElementsAre(2)));
    EXPECT_THAT(queue->popFor(0ms), Optional(ElementsAre(0, 2)));

    // Closed queue silently ignores further changes.
    queue->close();
    EXPECT_THAT(registry->disable(0), Eq(cetl::nullopt));
    registry->flushNotifications();
    EXPECT_THAT(queue->size(), 0);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
