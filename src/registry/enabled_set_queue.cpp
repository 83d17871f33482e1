//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "mobreg/registry/enabled_set_queue.hpp"

#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>

namespace mobreg
{
namespace registry
{

EnabledSetQueue::Ptr EnabledSetQueue::make(const std::size_t capacity)
{
    return std::make_shared<EnabledSetQueue>(Private(), capacity);
}

EnabledSetQueue::EnabledSetQueue(Private, const std::size_t capacity)
    : capacity_{std::max<std::size_t>(capacity, 1)}
    , is_closed_{false}
{
}

bool EnabledSetQueue::push(EnabledSet enabled)
{
    std::unique_lock<std::mutex> lock{mutex_};
    not_full_.wait(lock, [this] { return is_closed_ || (items_.size() < capacity_); });
    if (is_closed_)
    {
        return false;
    }

    items_.push_back(std::move(enabled));
    lock.unlock();

    not_empty_.notify_one();
    return true;
}

cetl::optional<EnabledSet> EnabledSetQueue::popFor(const std::chrono::microseconds timeout)
{
    std::unique_lock<std::mutex> lock{mutex_};
    if (!not_empty_.wait_for(lock, timeout, [this] { return is_closed_ || !items_.empty(); }))
    {
        return cetl::nullopt;
    }
    if (items_.empty())
    {
        return cetl::nullopt;  // closed
    }

    EnabledSet enabled = std::move(items_.front());
    items_.pop_front();
    lock.unlock();

    not_full_.notify_one();
    return enabled;
}

void EnabledSetQueue::close()
{
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        is_closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

std::size_t EnabledSetQueue::size() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return items_.size();
}

EnabledChangedHandler EnabledSetQueue::handler()
{
    return [self = shared_from_this()](const EnabledSet& enabled) {
        //
        if (!self->push(enabled))
        {
            common::getLogger("registry")->debug("Enabled set is not queued - queue is closed.");
        }
    };
}

}  // namespace registry
}  // namespace mobreg
