//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "position_table.hpp"

#include "mobreg/registry/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cmath>
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <utility>

namespace mobreg
{
namespace registry
{

PositionTable::PositionTable(const std::size_t capacity)
    : capacity_{capacity}
    , slots_{std::make_unique<Slot[]>(capacity)}  // NOLINT(*-avoid-c-arrays)
{
}

GetResult::Var PositionTable::get(const NodeIndex index) const
{
    if (auto failure = checkIndex(index))
    {
        return std::move(*failure);
    }

    const auto&                                     slot = slots_[index];
    const std::shared_lock<std::shared_timed_mutex> lock{slot.mutex};
    if (auto failure = checkEnabled(index, slot))
    {
        return std::move(*failure);
    }
    return slot.position;
}

MaybeError PositionTable::set(const NodeIndex index, const Position& position)
{
    return modify(index, [&position](Position& slot_position) {
        //
        slot_position = position;
    });
}

double PositionTable::distance(const NodeIndex index1, const NodeIndex index2) const
{
    const auto result1 = get(index1);
    const auto result2 = get(index2);

    const auto* const pos1 = cetl::get_if<GetResult::Success>(&result1);
    const auto* const pos2 = cetl::get_if<GetResult::Success>(&result2);
    if ((pos1 == nullptr) || (pos2 == nullptr))
    {
        return SentinelDistance;
    }

    const double dx = pos1->x - pos2->x;
    const double dy = pos1->y - pos2->y;
    const double dh = pos1->height - pos2->height;
    return std::sqrt((dx * dx) + (dy * dy) + (dh * dh));
}

EnabledSet PositionTable::collectEnabled() const
{
    EnabledSet enabled;
    for (NodeIndex index = 0; index < capacity_; ++index)
    {
        if (slots_[index].is_enabled.load(std::memory_order_acquire))
        {
            enabled.push_back(index);
        }
    }
    return enabled;
}

MaybeError PositionTable::checkIndex(const NodeIndex index) const
{
    if (!isValid(index))
    {
        return Error{ErrorCode::IndexOutOfRange, fmt::format("invalid index {}, capacity is {}", index, capacity_)};
    }
    return cetl::nullopt;
}

MaybeError PositionTable::checkEnabled(const NodeIndex index, const Slot& slot)
{
    if (!slot.is_enabled.load(std::memory_order_acquire))
    {
        return Error{ErrorCode::NodeDisabled, fmt::format("node with index {} is disabled", index)};
    }
    return cetl::nullopt;
}

}  // namespace registry
}  // namespace mobreg
