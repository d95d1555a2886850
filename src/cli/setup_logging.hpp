//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_CLI_SETUP_LOGGING_HPP_INCLUDED
#define BACWALK_CLI_SETUP_LOGGING_HPP_INCLUDED

#include "logging.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>

namespace bacwalk
{
namespace cli
{
namespace detail
{

/// Finds the last `SPDLOG_FLUSH_LEVEL=<level>` argument (f.e. `SPDLOG_FLUSH_LEVEL=debug`).
///
/// @return The parsed level, or `err` (the spdlog default) if there is none or it is invalid.
///
inline spdlog::level::level_enum findFlushLevel(const int argc, const char** const argv)
{
    static const std::string prefix{"SPDLOG_FLUSH_LEVEL="};

    auto flush_level = spdlog::level::err;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg{argv[i]};  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg.compare(0, prefix.size(), prefix) != 0)
        {
            continue;
        }

        const auto level_name = arg.substr(prefix.size());
        const auto level      = spdlog::level::from_str(level_name);
        if ((level != spdlog::level::off) || (level_name == "off"))
        {
            flush_level = level;
        }
    }
    return flush_level;
}

}  // namespace detail

/// Routes all subsystem loggers into one rotating log file.
///
/// `SPDLOG_LEVEL=...` arguments (like `SPDLOG_LEVEL=info,svc=trace`) take precedence over the default level.
///
inline void setupLogging(const int                       argc,
                         const char** const              argv,
                         const std::string&              log_file_path,
                         const spdlog::level::level_enum default_level)
{
    using common::LoggerName;
    using spdlog::sinks::rotating_file_sink_st;

    constexpr std::size_t MaxBackupFiles = 3;
    constexpr std::size_t MaxFileSize    = 2UL * 1024UL * 1024UL;

    try
    {
        spdlog::drop_all();

        const auto file_sink = std::make_shared<rotating_file_sink_st>(log_file_path, MaxFileSize, MaxBackupFiles);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        const auto flush_level = detail::findFlushLevel(argc, argv);

        const auto default_logger = std::make_shared<spdlog::logger>("", file_sink);
        spdlog::set_default_logger(default_logger);
        for (const auto* const name : {LoggerName::Io, LoggerName::Sdk, LoggerName::Svc})
        {
            spdlog::register_logger(std::make_shared<spdlog::logger>(name, file_sink));
        }
        spdlog::apply_all([default_level, flush_level](const std::shared_ptr<spdlog::logger>& logger) {
            //
            logger->set_level(default_level);
            logger->flush_on(flush_level);
        });

        spdlog::cfg::load_argv_levels(argc, argv);

        // Separates runs in the (appended) log file.
        spdlog::info("--------------------------");

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << '\n';
        std::exit(EXIT_FAILURE);
    }
}

}  // namespace cli
}  // namespace bacwalk

#endif  // BACWALK_CLI_SETUP_LOGGING_HPP_INCLUDED
