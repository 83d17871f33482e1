//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "setup_logging.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <signal.h>  // NOLINT
#include <string>

namespace
{

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running            = 1;
volatile sig_atomic_t g_checkpoint_pending = 0;
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

extern "C" void onSignal(const int sig)
{
    if (sig == SIGHUP)
    {
        g_checkpoint_pending = 1;
    }
    else
    {
        g_running = 0;
    }
}

/// SIGINT & SIGTERM stop the daemon; SIGHUP asks it to checkpoint the node table into the config file.
///
void installSignalHandlers()
{
    struct sigaction action
    {};
    action.sa_handler = &onSignal;
    ::sigemptyset(&action.sa_mask);
    for (const int sig : {SIGINT, SIGTERM, SIGHUP})
    {
        if (::sigaction(sig, &action, nullptr) != 0)
        {
            std::cerr << "Failed to install handler of signal " << sig << ".\n";
        }
    }
}

std::string findConfigFilePath(const int argc, const char** const argv)
{
    const std::string prefix = "CONFIG_FILE=";

    std::string file_path = "./mobregd.toml";
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg.compare(0, prefix.size(), prefix) == 0)
        {
            file_path = arg.substr(prefix.size());
        }
    }
    return file_path;
}

void checkpoint(mobreg::daemon::engine::Engine& engine, const mobreg::daemon::engine::Config::Ptr& config)
{
    engine.storeNodes();
    config->save();
}

}  // namespace

int main(const int argc, const char** const argv)
{
    using mobreg::daemon::engine::Config;
    using mobreg::daemon::engine::Engine;

    installSignalHandlers();

    const auto  cfg_file_path = findConfigFilePath(argc, argv);
    Config::Ptr config;
    try
    {
        config = Config::make(cfg_file_path);

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to load configuration file (path='" << cfg_file_path << "').\n" << ex.what() << '\n';
        return EXIT_FAILURE;
    }
    setupLogging(argc, argv, config);

    spdlog::info("MOBREG daemon started (ver='{}.{}', cfg='{}').", VERSION_MAJOR, VERSION_MINOR, cfg_file_path);

    int exit_code = EXIT_SUCCESS;
    try
    {
        Engine engine{config};
        if (const auto failure_str = engine.init())
        {
            spdlog::critical("Failed to init engine: {}", failure_str.value());
            std::cerr << "Failed to init engine: " << failure_str.value() << '\n';
            return EXIT_FAILURE;
        }

        engine.runWhile([&engine, &config] {
            //
            if (g_checkpoint_pending != 0)
            {
                g_checkpoint_pending = 0;
                spdlog::info("Checkpoint of network nodes is requested.");
                checkpoint(engine, config);
            }
            return g_running != 0;
        });
        spdlog::debug("Received termination signal.");

        checkpoint(engine, config);

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        exit_code = EXIT_FAILURE;
    }

    spdlog::info("MOBREG daemon terminated (code={}).", exit_code);
    return exit_code;
}
