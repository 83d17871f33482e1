//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "mobreg/registry/position_registry.hpp"

#include "logging.hpp"
#include "notification_dispatcher.hpp"
#include "position_table.hpp"

#include "mobreg/registry/address_resolver.hpp"
#include "mobreg/registry/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

namespace mobreg
{
namespace registry
{
namespace
{

class PositionRegistryImpl final : public PositionRegistry
{
public:
    PositionRegistryImpl(const std::size_t capacity, AddressResolver::Ptr resolver, const NotificationOptions& options)
        : logger_{common::getLogger("registry")}
        , table_{capacity}
        , resolver_{std::move(resolver)}
        , dispatcher_{options, logger_}
    {
        logger_->debug("Position registry is created (cap={}, resolver={}, queue_cap={}).",
                       capacity,
                       resolver_ ? "yes" : "no",
                       options.queue_capacity);
    }

    // PositionRegistry

    std::size_t capacity() const noexcept override
    {
        return table_.capacity();
    }

    GetResult::Var get(const NodeIndex index) const override
    {
        return table_.get(index);
    }

    MaybeError set(const NodeIndex index, const double x, const double y, const double height) override
    {
        return setPosition(index, Position{x, y, height});
    }

    MaybeError setPosition(const NodeIndex index, const Position& position) override
    {
        auto failure = table_.set(index, position);
        if (!failure)
        {
            logger_->trace("Position of node {} is updated to {}.", index, position);
        }
        return failure;
    }

    double distance(const NodeIndex index1, const NodeIndex index2) const override
    {
        return table_.distance(index1, index2);
    }

    GetResult::Var getByAddress(const std::string& address) const override
    {
        auto maybe_index = resolve(address);
        if (auto* const failure = cetl::get_if<Error>(&maybe_index))
        {
            return std::move(*failure);
        }
        return get(cetl::get<NodeIndex>(maybe_index));
    }

    MaybeError setByAddress(const std::string& address, const double x, const double y, const double height) override
    {
        return setPositionByAddress(address, Position{x, y, height});
    }

    MaybeError setPositionByAddress(const std::string& address, const Position& position) override
    {
        auto maybe_index = resolve(address);
        if (auto* const failure = cetl::get_if<Error>(&maybe_index))
        {
            return std::move(*failure);
        }
        return setPosition(cetl::get<NodeIndex>(maybe_index), position);
    }

    MaybeError enable(const NodeIndex index) override
    {
        return changeMembership(index, true);
    }

    MaybeError disable(const NodeIndex index) override
    {
        return changeMembership(index, false);
    }

    bool isEnabled(const NodeIndex index) const override
    {
        const std::shared_lock<std::shared_timed_mutex> lock{membership_mutex_};
        return table_.isEnabled(index);
    }

    EnabledSet enabled() const override
    {
        const std::shared_lock<std::shared_timed_mutex> lock{membership_mutex_};
        return table_.collectEnabled();
    }

    void registerEnabledChanged(EnabledChangedHandler handler) override
    {
        CETL_DEBUG_ASSERT(handler, "");

        const std::lock_guard<std::shared_timed_mutex> lock{membership_mutex_};
        dispatcher_.addHandler(std::move(handler));
        logger_->trace("Enabled set handler is registered.");
    }

    void flushNotifications() override
    {
        dispatcher_.flush();
    }

private:
    using ResolveResult = cetl::variant<NodeIndex, Error>;

    ResolveResult resolve(const std::string& address) const
    {
        if (!resolver_)
        {
            return Error{ErrorCode::NoAddressResolver,
                         fmt::format("no address resolver to find node with hardware address {}", address)};
        }
        if (const auto index = resolver_->resolve(address))
        {
            return index.value();
        }
        return Error{ErrorCode::AddressNotFound, fmt::format("node with hardware address {} is not found", address)};
    }

    MaybeError changeMembership(const NodeIndex index, const bool is_enabled)
    {
        if (!table_.isValid(index))
        {
            return Error{ErrorCode::IndexOutOfRange,
                         fmt::format("invalid index {}, capacity is {}", index, table_.capacity())};
        }

        const std::lock_guard<std::shared_timed_mutex> lock{membership_mutex_};

        table_.setEnabled(index, is_enabled);

        auto snapshot = table_.collectEnabled();
        logger_->debug("Node {} is {} (enabled={}).", index, is_enabled ? "enabled" : "disabled", snapshot);

        // Posting under the membership lock keeps snapshots in the order of the changes.
        dispatcher_.post(std::move(snapshot));
        return cetl::nullopt;
    }

    common::LoggerPtr               logger_;
    PositionTable                   table_;
    const AddressResolver::Ptr      resolver_;
    mutable std::shared_timed_mutex membership_mutex_;
    NotificationDispatcher          dispatcher_;

};  // PositionRegistryImpl

}  // namespace

PositionRegistry::Ptr PositionRegistry::make(const std::size_t         capacity,
                                             AddressResolver::Ptr      resolver,
                                             const NotificationOptions options)
{
    return std::make_shared<PositionRegistryImpl>(capacity, std::move(resolver), options);
}

}  // namespace registry
}  // namespace mobreg
