//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_REGISTRY_POSITION_REGISTRY_HPP_INCLUDED
#define MOBREG_REGISTRY_POSITION_REGISTRY_HPP_INCLUDED

#include "address_resolver.hpp"
#include "types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace mobreg
{
namespace registry
{

/// Controls delivery of membership notifications.
///
struct NotificationOptions
{
    /// What an `enable`/`disable` call does when the pending notifications queue is full.
    ///
    enum class OverflowPolicy : std::uint8_t
    {
        /// Wait until the dispatcher makes room. No notification is ever lost.
        Block,

        /// Discard the oldest pending notification (with a warning in the log).
        /// Every notification is a full snapshot, so subscribers still converge to the latest state.
        DropOldest,
    };

    std::size_t    queue_capacity{256};  // NOLINT(*-magic-numbers)
    OverflowPolicy overflow_policy{OverflowPolicy::Block};

};  // NotificationOptions

/// Thread-safe table of node positions and their enabled (membership) flags.
///
/// Each node slot has its own reader/writer lock, so operations on different nodes never contend.
/// Membership flags and the subscribers list are guarded by a separate single lock.
/// Positions of disabled nodes are kept but can't be read or written until the node is enabled again.
///
class PositionRegistry
{
public:
    /// Defines the shared pointer type for the registry.
    ///
    using Ptr = std::shared_ptr<PositionRegistry>;

    /// Creates a new registry with all `capacity` slots disabled and positioned at `(0, 0, 0)`.
    ///
    /// @param capacity Number of node slots. Fixed for the whole lifetime of the registry.
    /// @param resolver Optional address resolver. Without it all the `...ByAddress` operations
    ///                 fail with `ErrorCode::NoAddressResolver`.
    /// @param options Options of the membership notifications delivery.
    ///
    CETL_NODISCARD static Ptr make(const std::size_t         capacity,
                                   AddressResolver::Ptr      resolver = nullptr,
                                   const NotificationOptions options  = {});

    // No copy/move semantics.
    PositionRegistry(PositionRegistry&&)                 = delete;
    PositionRegistry(const PositionRegistry&)            = delete;
    PositionRegistry& operator=(PositionRegistry&&)      = delete;
    PositionRegistry& operator=(const PositionRegistry&) = delete;

    virtual ~PositionRegistry() = default;

    CETL_NODISCARD virtual std::size_t capacity() const noexcept = 0;

    /// Gets a copy of the node position.
    ///
    /// Fails with `IndexOutOfRange` or `NodeDisabled`.
    ///
    CETL_NODISCARD virtual GetResult::Var get(const NodeIndex index) const = 0;

    /// Overwrites all three coordinates of the node at once.
    ///
    /// Concurrent readers of the same node observe either the old or the new position, never a mix.
    ///
    virtual MaybeError set(const NodeIndex index, const double x, const double y, const double height) = 0;

    virtual MaybeError setPosition(const NodeIndex index, const Position& position) = 0;

    /// Calculates Euclidean distance between two nodes.
    ///
    /// @return `SentinelDistance` if any of the nodes is out of range or disabled.
    ///
    CETL_NODISCARD virtual double distance(const NodeIndex index1, const NodeIndex index2) const = 0;

    CETL_NODISCARD virtual GetResult::Var getByAddress(const std::string& address) const = 0;

    virtual MaybeError setByAddress(const std::string& address,
                                    const double       x,
                                    const double       y,
                                    const double       height) = 0;

    virtual MaybeError setPositionByAddress(const std::string& address, const Position& position) = 0;

    /// Marks the node as enabled, and notifies all the subscribers with the new enabled set.
    ///
    /// Subscribers are notified even if the node was already enabled.
    ///
    virtual MaybeError enable(const NodeIndex index) = 0;

    /// Marks the node as disabled, and notifies all the subscribers with the new enabled set.
    ///
    /// Subscribers are notified even if the node was already disabled.
    ///
    virtual MaybeError disable(const NodeIndex index) = 0;

    /// @return `false` for disabled and out of range nodes.
    ///
    CETL_NODISCARD virtual bool isEnabled(const NodeIndex index) const = 0;

    /// @return Ascending list of indices of all enabled nodes.
    ///
    CETL_NODISCARD virtual EnabledSet enabled() const = 0;

    /// Subscribes the handler to all subsequent membership changes.
    ///
    /// The current enabled set is not delivered upon registration.
    /// The handler is invoked from the internal dispatcher thread, one notification at a time,
    /// in the order of `enable`/`disable` calls. It must not call `flushNotifications`.
    /// With `OverflowPolicy::Block` it must not call the membership operations (`enable`, `disable`,
    /// `isEnabled`, `enabled`, `registerEnabledChanged`) either - a blocked mutator holds the membership lock
    /// until the dispatcher makes room in the queue.
    ///
    virtual void registerEnabledChanged(EnabledChangedHandler handler) = 0;

    /// Blocks until every notification posted so far has been delivered to its subscribers.
    ///
    virtual void flushNotifications() = 0;

protected:
    PositionRegistry() = default;

};  // PositionRegistry

}  // namespace registry
}  // namespace mobreg

#endif  // MOBREG_REGISTRY_POSITION_REGISTRY_HPP_INCLUDED
