//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "address_book.hpp"

#include "mobreg/registry/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mobreg
{
namespace daemon
{
namespace engine
{

AddressBook::MakeResult::Var AddressBook::make(const std::vector<std::string>& addresses)
{
    std::unordered_map<std::string, registry::NodeIndex> seen;
    for (registry::NodeIndex index = 0; index < addresses.size(); ++index)
    {
        const auto& address = addresses[index];
        if (address.empty())
        {
            return fmt::format("Empty hardware address of node {}.", index);
        }
        const auto it = seen.emplace(address, index);
        if (!it.second)
        {
            return fmt::format("Duplicate hardware address '{}' (nodes {} and {}).", address, it.first->second, index);
        }
    }

    return std::make_shared<const AddressBook>(Private(), addresses);
}

AddressBook::AddressBook(Private, std::vector<std::string> addresses)
    : addresses_{std::move(addresses)}
{
    address_to_index_.reserve(addresses_.size());
    for (registry::NodeIndex index = 0; index < addresses_.size(); ++index)
    {
        address_to_index_.emplace(addresses_[index], index);
    }
}

cetl::optional<std::string> AddressBook::addressOf(const registry::NodeIndex index) const
{
    if (index < addresses_.size())
    {
        return addresses_[index];
    }
    return cetl::nullopt;
}

cetl::optional<registry::NodeIndex> AddressBook::resolve(const std::string& address) const
{
    const auto it = address_to_index_.find(address);
    if (it != address_to_index_.end())
    {
        return it->second;
    }
    return cetl::nullopt;
}

}  // namespace engine
}  // namespace daemon
}  // namespace mobreg
