//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include "mobreg/registry/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <ios>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mobreg
{
namespace daemon
{
namespace engine
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    ConfigImpl(std::string file_path, TomlValue&& root)
        : file_path_{std::move(file_path)}
        , root_{std::move(root)}
        , network_nodes_{parseNetworkNodes(root_)}
        , is_dirty_{false}
    {
    }

    // Config

    void save() override
    {
        if (is_dirty_)
        {
            try
            {
                root_["__meta__"]["last_modified"] = std::chrono::system_clock::now();

                const auto    cfg_str = toml::format(root_);
                std::ofstream file{file_path_, std::ios_base::out | std::ios_base::binary};
                file << cfg_str;

                is_dirty_ = false;

            } catch (const std::exception& ex)
            {
                spdlog::error("Failed to save config (path='{}'). Error: {}", file_path_, ex.what());
            }
        }
    }

    auto getRegistryCapacity() const -> cetl::optional<std::int64_t> override
    {
        return findImpl<std::int64_t>("registry", "capacity");
    }

    auto getNotificationQueueCapacity() const -> cetl::optional<std::int64_t> override
    {
        return findImpl<std::int64_t>("registry", "notifications", "queue_capacity");
    }

    auto getNotificationOverflowPolicy() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("registry", "notifications", "overflow_policy");
    }

    auto getNetworkNodes() const -> std::vector<NetworkNode> override
    {
        return network_nodes_;
    }

    void setNetworkNodes(const std::vector<NetworkNode>& nodes) override
    {
        TomlValue toml_nodes{TomlValue::array_type{}};
        for (const auto& node : nodes)
        {
            TomlValue toml_node{TomlValue::table_type{}};
            toml_node["address"] = node.address;
            toml_node["x"]       = node.position.x;
            toml_node["y"]       = node.position.y;
            toml_node["height"]  = node.position.height;
            toml_node["enabled"] = node.is_enabled;
            toml_nodes.as_array().push_back(std::move(toml_node));
        }
        toml_nodes.as_array_fmt().fmt = toml::array_format::array_of_tables;

        root_["network"]["nodes"] = std::move(toml_nodes);
        network_nodes_            = nodes;

        is_dirty_ = true;
    }

    auto getStatusPeriod() const -> cetl::optional<std::chrono::milliseconds> override
    {
        if (const auto period_ms = findImpl<std::int64_t>("engine", "status_period_ms"))
        {
            return std::chrono::milliseconds{period_ms.value()};
        }
        return cetl::nullopt;
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            return cetl::nullopt;
        }
    }

    /// Coordinates may be written either as integers or as floats.
    ///
    static double findCoordinate(const TomlValue& toml_node, const std::string& key)
    {
        if (!toml_node.contains(key))
        {
            return 0.0;
        }
        const auto& value = toml_node.at(key);
        if (value.is_integer())
        {
            return static_cast<double>(value.as_integer());
        }
        return value.as_floating();
    }

    /// Throws on malformed `[[network.nodes]]` entries,
    /// so that a bad node can't silently shift indices of the following ones.
    ///
    static std::vector<NetworkNode> parseNetworkNodes(const TomlValue& root)
    {
        std::vector<NetworkNode> nodes;
        if (!root.contains("network") || !root.at("network").contains("nodes"))
        {
            return nodes;
        }

        for (const auto& toml_node : toml::find(root, "network", "nodes").as_array())
        {
            NetworkNode node;
            node.address         = toml::find<std::string>(toml_node, "address");
            node.position.x      = findCoordinate(toml_node, "x");
            node.position.y      = findCoordinate(toml_node, "y");
            node.position.height = findCoordinate(toml_node, "height");
            node.is_enabled      = toml::find_or(toml_node, "enabled", false);
            nodes.push_back(std::move(node));
        }
        return nodes;
    }

    std::string              file_path_;
    TomlValue                root_;
    std::vector<NetworkNode> network_nodes_;
    bool                     is_dirty_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
    return std::make_shared<ConfigImpl>(std::move(file_path), std::move(root));
}

}  // namespace engine
}  // namespace daemon
}  // namespace mobreg
