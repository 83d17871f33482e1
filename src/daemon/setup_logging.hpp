//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef MOBREG_DAEMON_SETUP_LOGGING_HPP_INCLUDED
#define MOBREG_DAEMON_SETUP_LOGGING_HPP_INCLUDED

#include "engine/config.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>  // NOLINT
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>

namespace detail
{

/// Applies single flush level (like `warn`) to all the registered loggers.
///
inline void loadFlushLevel(const std::string& flush_level)
{
    const auto level = spdlog::level::from_str(flush_level);
    // Ignore unrecognized level names.
    if (level == spdlog::level::off && flush_level != "off")
    {
        return;
    }
    spdlog::flush_on(level);
}

/// Search for SPDLOG_FLUSH_LEVEL= in the args and use it to init the flush level.
///
inline void loadArgvFlushLevel(const int argc, const char** const argv)
{
    const std::string spdlog_level_prefix = "SPDLOG_FLUSH_LEVEL=";
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg_str.find(spdlog_level_prefix) == 0)
        {
            loadFlushLevel(arg_str.substr(spdlog_level_prefix.size()));
        }
    }
}

}  // namespace detail

/// Sets up the logging system.
///
/// Both stderr and file logging sinks are used.
/// The stderr sink is used for the default logger only (with Info default level),
/// while the file sink is used for all loggers.
///
inline void setupLogging(const int argc, const char** const argv, const mobreg::daemon::engine::Config::Ptr& config)
{
    using spdlog::sinks::rotating_file_sink_mt;
    using spdlog::sinks::stderr_color_sink_mt;

    try
    {
        constexpr std::size_t log_files_max     = 4;
        constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB

        std::string log_file_path = "./mobregd.log";
        if (const auto logging_file = config->getLoggingFile())
        {
            log_file_path = logging_file.value();
        }

        // Drop all existing loggers, including the default one, so that we can reconfigure them.
        spdlog::drop_all();

        // Sinks are multi-threaded b/c the registry notifications are delivered on their own thread.
        const auto file_sink = std::make_shared<rotating_file_sink_mt>(log_file_path, log_file_max_size, log_files_max);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        const auto stderr_sink = std::make_shared<stderr_color_sink_mt>();
        stderr_sink->set_pattern("[%l] '%n' | %v");
        stderr_sink->set_level(spdlog::level::info);

        const std::initializer_list<spdlog::sink_ptr> sinks{stderr_sink, file_sink};
        const auto                                    default_logger = std::make_shared<spdlog::logger>("", sinks);
        spdlog::register_logger(default_logger);
        spdlog::set_default_logger(default_logger);

        // Register specific subsystem loggers - they go to the file sink only.
        //
        spdlog::register_logger(std::make_shared<spdlog::logger>("registry", file_sink));
        spdlog::register_logger(std::make_shared<spdlog::logger>("engine", file_sink));

        // Setup log levels from the configuration file.
        // Also accept `SPDLOG_LEVEL` & `SPDLOG_FLUSH_LEVEL` arguments if any (like `SPDLOG_LEVEL=debug,registry=trace`).
        //
        if (const auto logging_level = config->getLoggingLevel())
        {
            spdlog::cfg::helpers::load_levels(logging_level.value());
        }
        if (const auto logging_flush_level = config->getLoggingFlushLevel())
        {
            detail::loadFlushLevel(logging_flush_level.value());
        }
        spdlog::cfg::load_argv_levels(argc, argv);
        detail::loadArgvFlushLevel(argc, argv);

        // Insert "--…--" just to have clearer separation in the log file between two different process runs.
        //
        if (spdlog::default_logger()->should_log(spdlog::level::info))
        {
            file_sink->log({"", spdlog::level::info, "--------------------------"});
        }

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << '\n';
        std::exit(EXIT_FAILURE);
    }
}

#endif  // MOBREG_DAEMON_SETUP_LOGGING_HPP_INCLUDED
