//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_REGISTRY_GTEST_HELPERS_HPP_INCLUDED
#define MOBREG_REGISTRY_GTEST_HELPERS_HPP_INCLUDED

#include "mobreg/registry/types.hpp"

#include <gtest/gtest-printers.h>

#include <ostream>

namespace mobreg
{
namespace registry
{

// MARK: - GTest Printers:

inline void PrintTo(const Position& position, std::ostream* os)
{
    *os << "Position{x=" << position.x << ", y=" << position.y << ", h=" << position.height << "}";
}

inline void PrintTo(const ErrorCode code, std::ostream* os)
{
    switch (code)
    {
    case ErrorCode::Success:
        *os << "Success";
        break;
    case ErrorCode::IndexOutOfRange:
        *os << "IndexOutOfRange";
        break;
    case ErrorCode::NodeDisabled:
        *os << "NodeDisabled";
        break;
    case ErrorCode::AddressNotFound:
        *os << "AddressNotFound";
        break;
    case ErrorCode::NoAddressResolver:
        *os << "NoAddressResolver";
        break;
    default:
        *os << "ErrorCode{" << static_cast<int>(code) << "}";
        break;
    }
}

inline void PrintTo(const Error& error, std::ostream* os)
{
    *os << "Error{code=";
    PrintTo(error.code, os);
    *os << ", '" << error.description << "'}";
}

}  // namespace registry
}  // namespace mobreg

#endif  // MOBREG_REGISTRY_GTEST_HELPERS_HPP_INCLUDED
