//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_REGISTRY_ADDRESS_RESOLVER_HPP_INCLUDED
#define MOBREG_REGISTRY_ADDRESS_RESOLVER_HPP_INCLUDED

#include "types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>

namespace mobreg
{
namespace registry
{

/// Translates opaque hardware (node) addresses into stable node indices.
///
/// The registry only ever reads from a resolver; implementations must be safe
/// for concurrent `resolve` calls.
///
class AddressResolver
{
public:
    using Ptr = std::shared_ptr<const AddressResolver>;

    AddressResolver(AddressResolver&&)                 = delete;
    AddressResolver(const AddressResolver&)            = delete;
    AddressResolver& operator=(AddressResolver&&)      = delete;
    AddressResolver& operator=(const AddressResolver&) = delete;

    virtual ~AddressResolver() = default;

    /// Resolves the given address.
    ///
    /// @return Index of the node, or `nullopt` if the address is unknown.
    ///
    CETL_NODISCARD virtual cetl::optional<NodeIndex> resolve(const std::string& address) const = 0;

protected:
    AddressResolver() = default;

};  // AddressResolver

}  // namespace registry
}  // namespace mobreg

#endif  // MOBREG_REGISTRY_ADDRESS_RESOLVER_HPP_INCLUDED
