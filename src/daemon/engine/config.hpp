//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
#define MOBREG_DAEMON_ENGINE_CONFIG_HPP_INCLUDED

#include "mobreg/registry/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mobreg
{
namespace daemon
{
namespace engine
{

class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// Initial (and, on save, the last known) state of a simulated node.
    ///
    struct NetworkNode
    {
        std::string        address;
        registry::Position position;
        bool               is_enabled{false};
    };

    /// Parses the TOML file. Throws on I/O or syntax errors.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    /// Writes the configuration back to its file, but only if anything was changed.
    ///
    virtual void save() = 0;

    // Sizes are returned as written in the file (possibly negative); the engine validates them.

    CETL_NODISCARD virtual auto getRegistryCapacity() const -> cetl::optional<std::int64_t>          = 0;
    CETL_NODISCARD virtual auto getNotificationQueueCapacity() const -> cetl::optional<std::int64_t> = 0;
    CETL_NODISCARD virtual auto getNotificationOverflowPolicy() const -> cetl::optional<std::string> = 0;
    CETL_NODISCARD virtual auto getNetworkNodes() const -> std::vector<NetworkNode>                  = 0;
    virtual void                setNetworkNodes(const std::vector<NetworkNode>& nodes)               = 0;
    CETL_NODISCARD virtual auto getStatusPeriod() const -> cetl::optional<std::chrono::milliseconds> = 0;
    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>                = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>               = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string>          = 0;

protected:
    Config() = default;

};  // Config

}  // namespace engine
}  // namespace daemon
}  // namespace mobreg

#endif  // MOBREG_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
