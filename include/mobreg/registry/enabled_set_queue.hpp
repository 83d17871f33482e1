//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_REGISTRY_ENABLED_SET_QUEUE_HPP_INCLUDED
#define MOBREG_REGISTRY_ENABLED_SET_QUEUE_HPP_INCLUDED

#include "types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

namespace mobreg
{
namespace registry
{

/// Bounded blocking queue of enabled sets.
///
/// Lets a listener consume membership updates on its own thread:
/// register `handler()` with the registry, then drain the queue with `popFor`.
///
class EnabledSetQueue final : public std::enable_shared_from_this<EnabledSetQueue>
{
    struct Private
    {
        explicit Private() = default;
    };

public:
    using Ptr = std::shared_ptr<EnabledSetQueue>;

    CETL_NODISCARD static Ptr make(const std::size_t capacity);

    EnabledSetQueue(Private, const std::size_t capacity);

    EnabledSetQueue(const EnabledSetQueue&)                = delete;
    EnabledSetQueue(EnabledSetQueue&&) noexcept            = delete;
    EnabledSetQueue& operator=(const EnabledSetQueue&)     = delete;
    EnabledSetQueue& operator=(EnabledSetQueue&&) noexcept = delete;

    ~EnabledSetQueue() = default;

    /// Appends the enabled set, waiting while the queue is full.
    ///
    /// @return `false` if the queue has been closed (the set is not stored then).
    ///
    bool push(EnabledSet enabled);

    /// Takes the oldest enabled set, waiting up to `timeout` for one to arrive.
    ///
    CETL_NODISCARD cetl::optional<EnabledSet> popFor(const std::chrono::microseconds timeout);

    /// Wakes up all waiters. Already queued sets can still be popped.
    ///
    void close();

    CETL_NODISCARD std::size_t size() const;

    /// Adapts the queue into a registry handler. The handler keeps the queue alive.
    ///
    CETL_NODISCARD EnabledChangedHandler handler();

private:
    const std::size_t       capacity_;
    mutable std::mutex      mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<EnabledSet>  items_;
    bool                    is_closed_;

};  // EnabledSetQueue

}  // namespace registry
}  // namespace mobreg

#endif  // MOBREG_REGISTRY_ENABLED_SET_QUEUE_HPP_INCLUDED
