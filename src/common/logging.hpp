//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_COMMON_LOGGING_HPP_INCLUDED
#define BACWALK_COMMON_LOGGING_HPP_INCLUDED

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <string>

namespace bacwalk
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Names of the subsystem loggers.
///
/// Each can be tuned separately, f.e. `SPDLOG_LEVEL=info,svc=debug`.
///
struct LoggerName final
{
    static constexpr const char* Io  = "io";
    static constexpr const char* Sdk = "sdk";
    static constexpr const char* Svc = "svc";
};

/// Gets (or lazily makes) a subsystem logger.
///
/// A new logger is cloned from the default one, so it shares its sinks, pattern and level
/// (unless the level is overridden by name at startup).
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto existing = spdlog::get(name))
    {
        return existing;
    }

    auto logger = spdlog::default_logger()->clone(name);
#if defined(__cpp_exceptions)
    try
    {
#endif
        spdlog::register_logger(logger);
#if defined(__cpp_exceptions)
    } catch (const std::exception& ex)
    {
        // Lost a registration race (or out of memory) - the unregistered clone is still usable.
        spdlog::warn("Failed to register '{}' logger: {}", name, ex.what());
    }
#endif
    return logger;
}

}  // namespace common
}  // namespace bacwalk

#endif  // BACWALK_COMMON_LOGGING_HPP_INCLUDED
