//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_DAEMON_ENGINE_ADDRESS_BOOK_HPP_INCLUDED
#define MOBREG_DAEMON_ENGINE_ADDRESS_BOOK_HPP_INCLUDED

#include "mobreg/registry/address_resolver.hpp"
#include "mobreg/registry/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace mobreg
{
namespace daemon
{
namespace engine
{

/// Immutable two-way mapping between hardware addresses and node indices.
///
/// Index of an address is its position in the list the book was made of.
///
class AddressBook final : public registry::AddressResolver
{
    struct Private
    {
        explicit Private() = default;
    };

public:
    using Ptr = std::shared_ptr<const AddressBook>;

    struct MakeResult
    {
        using Success = Ptr;
        using Failure = std::string;  // description
        using Var     = cetl::variant<Success, Failure>;
    };

    /// Fails on empty or duplicate addresses.
    ///
    CETL_NODISCARD static MakeResult::Var make(const std::vector<std::string>& addresses);

    AddressBook(Private, std::vector<std::string> addresses);

    CETL_NODISCARD std::size_t size() const noexcept
    {
        return addresses_.size();
    }

    CETL_NODISCARD cetl::optional<std::string> addressOf(const registry::NodeIndex index) const;

    // AddressResolver

    CETL_NODISCARD cetl::optional<registry::NodeIndex> resolve(const std::string& address) const override;

private:
    std::vector<std::string>                             addresses_;
    std::unordered_map<std::string, registry::NodeIndex> address_to_index_;

};  // AddressBook

}  // namespace engine
}  // namespace daemon
}  // namespace mobreg

#endif  // MOBREG_DAEMON_ENGINE_ADDRESS_BOOK_HPP_INCLUDED
