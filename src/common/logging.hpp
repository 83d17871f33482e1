//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_COMMON_LOGGING_HPP_INCLUDED
#define MOBREG_COMMON_LOGGING_HPP_INCLUDED

#include "mobreg/registry/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace mobreg
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Invokes the action, and logs (instead of propagating) an exception thrown by it.
///
/// @return `false` if the action has thrown.
///
template <typename Action>
bool performWithoutThrowing(Logger& logger, const char* const what, Action&& action) noexcept
{
    try
    {
        std::forward<Action>(action)();
        return true;

    } catch (const std::exception& ex)
    {
        logger.critical("Unexpected exception in {}: {}", what, ex.what());
        return false;

    } catch (...)
    {
        logger.critical("Unexpected non-standard exception in {}.", what);
        return false;
    }
}

inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    auto logger = default_logger->clone(name);
    CETL_DEBUG_ASSERT(logger, name.c_str());

    // Registration fails if another thread has just registered the same name - the clone is still usable.
    performWithoutThrowing(*default_logger, "logger registration", [&logger] {
        //
        spdlog::register_logger(logger);
    });

    return logger;
}

inline const char* errorCodeName(const registry::ErrorCode code) noexcept
{
    using registry::ErrorCode;

    switch (code)
    {
    case ErrorCode::Success:
        return "Success";
    case ErrorCode::IndexOutOfRange:
        return "IndexOutOfRange";
    case ErrorCode::NodeDisabled:
        return "NodeDisabled";
    case ErrorCode::AddressNotFound:
        return "AddressNotFound";
    case ErrorCode::NoAddressResolver:
        return "NoAddressResolver";
    }
    return "Unknown";
}

}  // namespace common
}  // namespace mobreg

template <>
struct fmt::formatter<mobreg::registry::Position> : formatter<string_view>
{
    auto format(const mobreg::registry::Position& pos, format_context& ctx) const
    {
        return format_to(ctx.out(), "(x={}, y={}, h={})", pos.x, pos.y, pos.height);
    }
};

template <>
struct fmt::formatter<mobreg::registry::ErrorCode> : formatter<string_view>
{
    auto format(const mobreg::registry::ErrorCode code, format_context& ctx) const
    {
        return formatter<string_view>::format(mobreg::common::errorCodeName(code), ctx);
    }
};

template <>
struct fmt::formatter<mobreg::registry::Error> : formatter<string_view>
{
    auto format(const mobreg::registry::Error& error, format_context& ctx) const
    {
        return format_to(ctx.out(), "{} ({})", error.description, error.code);
    }
};

#endif  // MOBREG_COMMON_LOGGING_HPP_INCLUDED
