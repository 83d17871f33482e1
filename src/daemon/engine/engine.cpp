//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine.hpp"

#include "address_book.hpp"
#include "config.hpp"
#include "logging.hpp"

#include "mobreg/registry/enabled_set_queue.hpp"
#include "mobreg/registry/position_registry.hpp"
#include "mobreg/registry/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace mobreg
{
namespace daemon
{
namespace engine
{
namespace
{

constexpr std::int64_t MaxRegistryCapacity          = 1 << 20;
constexpr std::int64_t MaxNotificationQueueCapacity = 1 << 16;

}  // namespace

Engine::Engine(Config::Ptr config)
    : config_{std::move(config)}
    , status_period_{std::chrono::seconds{5}}  // NOLINT(*-magic-numbers)
{
}

Engine::~Engine()
{
    // The registry dispatcher delivers what is still pending on destruction;
    // a closed queue won't let it block on a full queue which nobody drains anymore.
    if (enabled_queue_)
    {
        enabled_queue_->close();
    }
}

cetl::optional<std::string> Engine::init()
{
    logger_->trace("Initializing engine...");

    // 1. Build the address book from the configured network nodes.
    //
    const auto               nodes = config_->getNetworkNodes();
    std::vector<std::string> addresses;
    addresses.reserve(nodes.size());
    std::transform(nodes.cbegin(), nodes.cend(), std::back_inserter(addresses), [](const auto& node) {
        //
        return node.address;
    });
    auto maybe_address_book = AddressBook::make(addresses);
    if (const auto* const failure = cetl::get_if<AddressBook::MakeResult::Failure>(&maybe_address_book))
    {
        std::string msg = "Invalid network nodes. " + *failure;
        logger_->error(msg);
        return msg;
    }
    address_book_ = cetl::get<AddressBook::MakeResult::Success>(std::move(maybe_address_book));

    // 2. Figure out capacity of the registry.
    //    Slots beyond the configured nodes are addressable by index only.
    //
    std::size_t capacity = nodes.size();
    if (const auto cfg_capacity = config_->getRegistryCapacity())
    {
        if ((cfg_capacity.value() < 0) || (cfg_capacity.value() > MaxRegistryCapacity))
        {
            std::string msg = fmt::format("Registry capacity {} is out of range [0, {}].",
                                          cfg_capacity.value(),
                                          MaxRegistryCapacity);
            logger_->error(msg);
            return msg;
        }
        capacity = static_cast<std::size_t>(cfg_capacity.value());
    }
    if (capacity == 0)
    {
        std::string msg = "Zero registry capacity (no network nodes configured).";
        logger_->error(msg);
        return msg;
    }
    if (capacity < nodes.size())
    {
        std::string msg = fmt::format("Registry capacity {} is less than the number of network nodes {}.",
                                      capacity,
                                      nodes.size());
        logger_->error(msg);
        return msg;
    }

    // 3. Create the registry.
    //
    registry::NotificationOptions options;
    if (auto failure = makeNotificationOptions(options))
    {
        logger_->error(failure.value());
        return failure;
    }
    registry_ = registry::PositionRegistry::make(capacity, address_book_, options);

    // 4. Seed initial state of the nodes, and only then subscribe to membership changes -
    //    the seeding churn is of no interest.
    //
    if (auto failure = seedNodes(nodes))
    {
        logger_->error(failure.value());
        return failure;
    }
    registry_->flushNotifications();
    last_enabled_  = registry_->enabled();
    enabled_queue_ = registry::EnabledSetQueue::make(options.queue_capacity);
    registry_->registerEnabledChanged(enabled_queue_->handler());

    if (const auto status_period = config_->getStatusPeriod())
    {
        status_period_ = std::max(status_period.value(), std::chrono::milliseconds{1});
    }

    logger_->info("Engine is initialized (cap={}, nodes={}, enabled={}).", capacity, nodes.size(), last_enabled_);
    return cetl::nullopt;
}

void Engine::runWhile(const std::function<bool()>& loop_predicate)
{
    using std::chrono_literals::operator""s;

    CETL_DEBUG_ASSERT(enabled_queue_, "");

    auto next_report_time = Clock::now() + status_period_;
    while (loop_predicate())
    {
        const auto now = Clock::now();
        if (now >= next_report_time)
        {
            reportStatus();
            next_report_time = now + status_period_;
        }

        // Wait for membership changes but awake at least once per second.
        const auto timeout = std::min<Clock::duration>(1s, next_report_time - now);
        if (auto enabled = enabled_queue_->popFor(std::chrono::duration_cast<std::chrono::microseconds>(timeout)))
        {
            onEnabledChanged(enabled.value());
        }
    }
    logger_->debug("Run loop predicate is fulfilled.");
}

void Engine::storeNodes()
{
    CETL_DEBUG_ASSERT(registry_, "");

    auto nodes = config_->getNetworkNodes();
    for (registry::NodeIndex index = 0; index < nodes.size(); ++index)
    {
        auto& node = nodes[index];

        // Positions of disabled nodes are not accessible, so their configured positions stay as is.
        const auto maybe_position = registry_->get(index);
        if (const auto* const position = cetl::get_if<registry::GetResult::Success>(&maybe_position))
        {
            node.position = *position;
        }
        node.is_enabled = registry_->isEnabled(index);
    }
    config_->setNetworkNodes(nodes);
    logger_->debug("Stored state of {} network nodes.", nodes.size());
}

cetl::optional<std::string> Engine::makeNotificationOptions(registry::NotificationOptions& options) const
{
    using OverflowPolicy = registry::NotificationOptions::OverflowPolicy;

    if (const auto queue_capacity = config_->getNotificationQueueCapacity())
    {
        if (queue_capacity.value() == 0)
        {
            return std::string{"Zero notification queue capacity."};
        }
        if ((queue_capacity.value() < 0) || (queue_capacity.value() > MaxNotificationQueueCapacity))
        {
            return fmt::format("Notification queue capacity {} is out of range [1, {}].",
                               queue_capacity.value(),
                               MaxNotificationQueueCapacity);
        }
        options.queue_capacity = static_cast<std::size_t>(queue_capacity.value());
    }

    if (const auto policy = config_->getNotificationOverflowPolicy())
    {
        if (policy.value() == "block")
        {
            options.overflow_policy = OverflowPolicy::Block;
        }
        else if (policy.value() == "drop_oldest")
        {
            options.overflow_policy = OverflowPolicy::DropOldest;
        }
        else
        {
            return fmt::format("Unknown notification overflow policy '{}' (expected 'block' or 'drop_oldest').",
                               policy.value());
        }
    }
    return cetl::nullopt;
}

cetl::optional<std::string> Engine::seedNodes(const std::vector<Config::NetworkNode>& nodes)
{
    for (registry::NodeIndex index = 0; index < nodes.size(); ++index)
    {
        const auto& node = nodes[index];

        // Position is writable only while the node is enabled.
        if (auto failure = registry_->enable(index))
        {
            return fmt::format("Failed to enable node {}: {}", describeNode(index), failure.value());
        }
        if (auto failure = registry_->setPositionByAddress(node.address, node.position))
        {
            return fmt::format("Failed to seed position of node {}: {}", describeNode(index), failure.value());
        }
        if (!node.is_enabled)
        {
            if (auto failure = registry_->disable(index))
            {
                return fmt::format("Failed to disable node {}: {}", describeNode(index), failure.value());
            }
        }
        logger_->debug("Node {} is seeded at {} (enabled={}).", describeNode(index), node.position, node.is_enabled);
    }
    return cetl::nullopt;
}

void Engine::onEnabledChanged(const registry::EnabledSet& enabled)
{
    registry::EnabledSet joined;
    std::set_difference(enabled.cbegin(),
                        enabled.cend(),
                        last_enabled_.cbegin(),
                        last_enabled_.cend(),
                        std::back_inserter(joined));
    registry::EnabledSet left;
    std::set_difference(last_enabled_.cbegin(),
                        last_enabled_.cend(),
                        enabled.cbegin(),
                        enabled.cend(),
                        std::back_inserter(left));

    for (const auto index : joined)
    {
        logger_->info("Node {} has joined the network.", describeNode(index));
    }
    for (const auto index : left)
    {
        logger_->info("Node {} has left the network.", describeNode(index));
    }
    logger_->debug("Enabled set is changed (enabled={}).", enabled);

    last_enabled_ = enabled;
}

void Engine::reportStatus() const
{
    logger_->info("Status: {} of {} nodes are enabled.", last_enabled_.size(), registry_->capacity());

    if (logger_->should_log(spdlog::level::debug))
    {
        for (const auto index : registry_->enabled())
        {
            const auto maybe_position = registry_->get(index);
            if (const auto* const position = cetl::get_if<registry::GetResult::Success>(&maybe_position))
            {
                logger_->debug("Node {} is at {}.", describeNode(index), *position);
            }
            else
            {
                logger_->debug("Node {} is not accessible: {}.",
                               describeNode(index),
                               cetl::get<registry::GetResult::Failure>(maybe_position));
            }
        }
    }
}

std::string Engine::describeNode(const registry::NodeIndex index) const
{
    if (const auto address = address_book_->addressOf(index))
    {
        return fmt::format("{} ('{}')", index, address.value());
    }
    return fmt::format("{}", index);
}

}  // namespace engine
}  // namespace daemon
}  // namespace mobreg
