//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_REGISTRY_TYPES_HPP_INCLUDED
#define MOBREG_REGISTRY_TYPES_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstddef>
#include <functional>
#include <limits>
#include <string>
#include <vector>

namespace mobreg
{
namespace registry
{

using NodeIndex  = std::size_t;
using EnabledSet = std::vector<NodeIndex>;

/// Handler which receives the ascending list of all enabled node indices.
///
using EnabledChangedHandler = std::function<void(const EnabledSet& enabled)>;

/// Spatial coordinates of a node. Units are defined by the caller (usually meters).
///
struct Position
{
    double x{0.0};
    double y{0.0};
    double height{0.0};

};  // Position

inline bool operator==(const Position& lhs, const Position& rhs) noexcept
{
    return (lhs.x == rhs.x) && (lhs.y == rhs.y) && (lhs.height == rhs.height);
}

inline bool operator!=(const Position& lhs, const Position& rhs) noexcept
{
    return !(lhs == rhs);
}

/// Distance reported for pairs of nodes which can't be measured (out of range or disabled).
///
constexpr double SentinelDistance = std::numeric_limits<double>::max();

/// Defines error codes of the registry operations.
///
/// Maps to `errno` values, hence `int` inheritance and zero on success.
///
enum class ErrorCode : int  // NOLINT
{
    Success           = 0,
    IndexOutOfRange   = ERANGE,
    NodeDisabled      = EACCES,
    AddressNotFound   = ENOENT,
    NoAddressResolver = ENOTSUP,

};  // ErrorCode

struct Error
{
    ErrorCode   code{ErrorCode::Success};
    std::string description;

};  // Error

/// Result of position read operations.
///
struct GetResult
{
    using Success = Position;
    using Failure = Error;
    using Var     = cetl::variant<Success, Failure>;
};

/// Result of mutating operations; empty on success.
///
using MaybeError = cetl::optional<Error>;

}  // namespace registry
}  // namespace mobreg

#endif  // MOBREG_REGISTRY_TYPES_HPP_INCLUDED
