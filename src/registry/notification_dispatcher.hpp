//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_REGISTRY_NOTIFICATION_DISPATCHER_HPP_INCLUDED
#define MOBREG_REGISTRY_NOTIFICATION_DISPATCHER_HPP_INCLUDED

#include "logging.hpp"

#include "mobreg/registry/position_registry.hpp"
#include "mobreg/registry/types.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mobreg
{
namespace registry
{

/// Delivers enabled set snapshots to the handlers on a dedicated thread.
///
/// Snapshots are delivered in the order they were posted. Each snapshot goes only to
/// the handlers which had been added before it was posted.
///
class NotificationDispatcher final
{
public:
    using OverflowPolicy = NotificationOptions::OverflowPolicy;

    NotificationDispatcher(const NotificationOptions& options, common::LoggerPtr logger);

    NotificationDispatcher(const NotificationDispatcher&)                = delete;
    NotificationDispatcher(NotificationDispatcher&&) noexcept            = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&)     = delete;
    NotificationDispatcher& operator=(NotificationDispatcher&&) noexcept = delete;

    /// Delivers whatever is still pending, and joins the dispatcher thread.
    ~NotificationDispatcher();

    void addHandler(EnabledChangedHandler handler);

    /// Enqueues the snapshot for all currently added handlers.
    ///
    /// Applies the overflow policy if there are already `queue_capacity` snapshots pending.
    ///
    void post(EnabledSet snapshot);

    /// Waits until all the snapshots posted before this call have been delivered.
    ///
    void flush();

    CETL_NODISCARD std::uint64_t droppedCount() const;

private:
    using HandlerPtr = std::shared_ptr<const EnabledChangedHandler>;

    struct Notification
    {
        std::uint64_t sequence;
        EnabledSet    snapshot;
        std::size_t   handlers_count;
    };

    void run();
    void deliver(const Notification& notification, const std::vector<HandlerPtr>& handlers);

    const NotificationOptions options_;
    common::LoggerPtr         logger_;

    mutable std::mutex       mutex_;
    std::condition_variable  has_pending_;
    std::condition_variable  has_room_;
    std::condition_variable  delivered_;
    std::deque<Notification> pending_;
    std::vector<HandlerPtr>  handlers_;
    std::uint64_t            next_sequence_;
    std::uint64_t            delivered_sequence_;
    std::uint64_t            dropped_count_;
    bool                     is_stopping_;

    std::thread thread_;

};  // NotificationDispatcher

}  // namespace registry
}  // namespace mobreg

#endif  // MOBREG_REGISTRY_NOTIFICATION_DISPATCHER_HPP_INCLUDED
