//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "notification_dispatcher.hpp"

#include "logging.hpp"

#include "mobreg/registry/position_registry.hpp"
#include "mobreg/registry/types.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace mobreg
{
namespace registry
{

NotificationDispatcher::NotificationDispatcher(const NotificationOptions& options, common::LoggerPtr logger)
    : options_{std::max<std::size_t>(options.queue_capacity, 1), options.overflow_policy}
    , logger_{std::move(logger)}
    , next_sequence_{1}
    , delivered_sequence_{0}
    , dropped_count_{0}
    , is_stopping_{false}
    , thread_{[this] { run(); }}
{
    CETL_DEBUG_ASSERT(logger_, "");
}

NotificationDispatcher::~NotificationDispatcher()
{
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        is_stopping_ = true;
    }
    has_pending_.notify_all();
    has_room_.notify_all();

    if (thread_.joinable())
    {
        thread_.join();
    }
    logger_->trace("Notification dispatcher is stopped (dropped={}).", dropped_count_);
}

void NotificationDispatcher::addHandler(EnabledChangedHandler handler)
{
    CETL_DEBUG_ASSERT(handler, "");

    const std::lock_guard<std::mutex> lock{mutex_};
    handlers_.push_back(std::make_shared<const EnabledChangedHandler>(std::move(handler)));
}

void NotificationDispatcher::post(EnabledSet snapshot)
{
    std::unique_lock<std::mutex> lock{mutex_};

    if (pending_.size() >= options_.queue_capacity)
    {
        switch (options_.overflow_policy)
        {
        case OverflowPolicy::Block:
            logger_->debug("Notification queue is full (cap={}) - waiting for room...", options_.queue_capacity);
            has_room_.wait(lock, [this] { return is_stopping_ || (pending_.size() < options_.queue_capacity); });
            break;

        case OverflowPolicy::DropOldest:
            ++dropped_count_;
            logger_->warn("Notification queue is full (cap={}) - dropping the oldest snapshot (seq={}, dropped={}).",
                          options_.queue_capacity,
                          pending_.front().sequence,
                          dropped_count_);
            pending_.pop_front();
            break;
        }
    }

    pending_.push_back(Notification{next_sequence_++, std::move(snapshot), handlers_.size()});
    lock.unlock();

    has_pending_.notify_one();
}

void NotificationDispatcher::flush()
{
    std::unique_lock<std::mutex> lock{mutex_};

    CETL_DEBUG_ASSERT(thread_.get_id() != std::this_thread::get_id(), "Can't flush from a handler.");

    const auto last_posted = next_sequence_ - 1;
    delivered_.wait(lock, [this, last_posted] { return delivered_sequence_ >= last_posted; });
}

std::uint64_t NotificationDispatcher::droppedCount() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return dropped_count_;
}

void NotificationDispatcher::run()
{
    std::unique_lock<std::mutex> lock{mutex_};
    while (true)
    {
        has_pending_.wait(lock, [this] { return is_stopping_ || !pending_.empty(); });
        if (pending_.empty())
        {
            break;  // Stopping, and nothing left to deliver.
        }

        const Notification notification = std::move(pending_.front());
        pending_.pop_front();

        // Handlers are only ever appended, so the prefix is exactly the set of handlers at the post time.
        const auto                    first = handlers_.cbegin();
        const std::vector<HandlerPtr> handlers{first, first + static_cast<std::ptrdiff_t>(notification.handlers_count)};

        lock.unlock();
        has_room_.notify_one();

        deliver(notification, handlers);

        lock.lock();
        delivered_sequence_ = notification.sequence;
        delivered_.notify_all();
    }
}

void NotificationDispatcher::deliver(const Notification& notification, const std::vector<HandlerPtr>& handlers)
{
    logger_->trace("Delivering enabled set (seq={}, size={}, handlers={}).",
                   notification.sequence,
                   notification.snapshot.size(),
                   handlers.size());

    std::size_t failures = 0;
    for (const auto& handler : handlers)
    {
        if (!common::performWithoutThrowing(*logger_, "enabled set handler", [&handler, &notification] {
                //
                (*handler)(notification.snapshot);
            }))
        {
            ++failures;
        }
    }
    if (failures > 0)
    {
        logger_->warn("Enabled set (seq={}) is not delivered to {} of {} handlers.",
                      notification.sequence,
                      failures,
                      handlers.size());
    }
}

}  // namespace registry
}  // namespace mobreg
