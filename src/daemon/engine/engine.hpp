//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_DAEMON_ENGINE_HPP_INCLUDED
#define MOBREG_DAEMON_ENGINE_HPP_INCLUDED

#include "address_book.hpp"
#include "config.hpp"
#include "logging.hpp"

#include "mobreg/registry/enabled_set_queue.hpp"
#include "mobreg/registry/position_registry.hpp"
#include "mobreg/registry/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace mobreg
{
namespace daemon
{
namespace engine
{

class Engine
{
public:
    explicit Engine(Config::Ptr config);

    Engine(const Engine&)                = delete;
    Engine(Engine&&) noexcept            = delete;
    Engine& operator=(const Engine&)     = delete;
    Engine& operator=(Engine&&) noexcept = delete;

    ~Engine();

    CETL_NODISCARD cetl::optional<std::string> init();
    void                                       runWhile(const std::function<bool()>& loop_predicate);

    /// Writes the current state of all nodes back into the configuration (not saved to the file yet).
    ///
    void storeNodes();

    /// Precondition: successful `init()`.
    ///
    CETL_NODISCARD registry::PositionRegistry& registry() const
    {
        CETL_DEBUG_ASSERT(registry_, "");
        return *registry_;
    }

    /// Enabled set as it was last observed by the run loop (or seeded by `init()`).
    ///
    CETL_NODISCARD const registry::EnabledSet& lastEnabled() const noexcept
    {
        return last_enabled_;
    }

private:
    using Clock = std::chrono::steady_clock;

    CETL_NODISCARD cetl::optional<std::string> makeNotificationOptions(registry::NotificationOptions& options) const;
    CETL_NODISCARD cetl::optional<std::string> seedNodes(const std::vector<Config::NetworkNode>& nodes);
    void                                       onEnabledChanged(const registry::EnabledSet& enabled);
    void                                       reportStatus() const;
    CETL_NODISCARD std::string                 describeNode(const registry::NodeIndex index) const;

    Config::Ptr                     config_;
    common::LoggerPtr               logger_{common::getLogger("engine")};
    AddressBook::Ptr                address_book_;
    registry::PositionRegistry::Ptr registry_;
    registry::EnabledSetQueue::Ptr  enabled_queue_;
    registry::EnabledSet            last_enabled_;
    std::chrono::milliseconds       status_period_;

};  // Engine

}  // namespace engine
}  // namespace daemon
}  // namespace mobreg

#endif  // MOBREG_DAEMON_ENGINE_HPP_INCLUDED
