//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_DAEMON_ENGINE_CONFIG_MOCK_HPP_INCLUDED
#define MOBREG_DAEMON_ENGINE_CONFIG_MOCK_HPP_INCLUDED

#include "config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mobreg
{
namespace daemon
{
namespace engine
{

class ConfigMock : public Config
{
public:
    MOCK_METHOD(void, save, (), (override));
    MOCK_METHOD(cetl::optional<std::int64_t>, getRegistryCapacity, (), (const, override));
    MOCK_METHOD(cetl::optional<std::int64_t>, getNotificationQueueCapacity, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getNotificationOverflowPolicy, (), (const, override));
    MOCK_METHOD(std::vector<NetworkNode>, getNetworkNodes, (), (const, override));
    MOCK_METHOD(void, setNetworkNodes, (const std::vector<NetworkNode>& nodes), (override));
    MOCK_METHOD(cetl::optional<std::chrono::milliseconds>, getStatusPeriod, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getLoggingFile, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getLoggingLevel, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getLoggingFlushLevel, (), (const, override));

};  // ConfigMock

}  // namespace engine
}  // namespace daemon
}  // namespace mobreg

#endif  // MOBREG_DAEMON_ENGINE_CONFIG_MOCK_HPP_INCLUDED
