//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_REGISTRY_POSITION_TABLE_HPP_INCLUDED
#define MOBREG_REGISTRY_POSITION_TABLE_HPP_INCLUDED

#include "mobreg/registry/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace mobreg
{
namespace registry
{

/// Fixed size array of node slots, each one with its own reader/writer lock.
///
/// The enabled flag of a slot is written by the membership owner (under its own lock),
/// and is only read here to gate access to the position.
///
class PositionTable final
{
public:
    explicit PositionTable(const std::size_t capacity);

    PositionTable(const PositionTable&)                = delete;
    PositionTable(PositionTable&&) noexcept            = delete;
    PositionTable& operator=(const PositionTable&)     = delete;
    PositionTable& operator=(PositionTable&&) noexcept = delete;

    ~PositionTable() = default;

    CETL_NODISCARD std::size_t capacity() const noexcept
    {
        return capacity_;
    }

    CETL_NODISCARD bool isValid(const NodeIndex index) const noexcept
    {
        return index < capacity_;
    }

    CETL_NODISCARD GetResult::Var get(const NodeIndex index) const;

    MaybeError set(const NodeIndex index, const Position& position);

    CETL_NODISCARD double distance(const NodeIndex index1, const NodeIndex index2) const;

    /// Runs `action(Position&)` while holding exclusive lock of the slot.
    ///
    /// Validation is the same as for `set`; the action is not invoked on failure.
    ///
    template <typename Action>
    MaybeError modify(const NodeIndex index, Action&& action)
    {
        if (auto failure = checkIndex(index))
        {
            return failure;
        }

        auto&                                          slot = slots_[index];
        const std::lock_guard<std::shared_timed_mutex> lock{slot.mutex};
        if (auto failure = checkEnabled(index, slot))
        {
            return failure;
        }

        std::forward<Action>(action)(slot.position);
        return cetl::nullopt;
    }

    /// Precondition: `isValid(index)`.
    void setEnabled(const NodeIndex index, const bool is_enabled) noexcept
    {
        CETL_DEBUG_ASSERT(isValid(index), "");
        slots_[index].is_enabled.store(is_enabled, std::memory_order_release);
    }

    CETL_NODISCARD bool isEnabled(const NodeIndex index) const noexcept
    {
        return isValid(index) && slots_[index].is_enabled.load(std::memory_order_acquire);
    }

    CETL_NODISCARD EnabledSet collectEnabled() const;

private:
    struct Slot
    {
        Position                        position;
        mutable std::shared_timed_mutex mutex;
        std::atomic<bool>               is_enabled{false};
    };

    CETL_NODISCARD MaybeError checkIndex(const NodeIndex index) const;
    CETL_NODISCARD static MaybeError checkEnabled(const NodeIndex index, const Slot& slot);

    const std::size_t       capacity_;
    std::unique_ptr<Slot[]> slots_;  // NOLINT(*-avoid-c-arrays)

};  // PositionTable

}  // namespace registry
}  // namespace mobreg

#endif  // MOBREG_REGISTRY_POSITION_TABLE_HPP_INCLUDED
