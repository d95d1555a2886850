//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cli_args.hpp"
#include "report_printer.hpp"
#include "setup_logging.hpp"

#include <bacwalk/platform/defines.hpp>
#include <bacwalk/sdk/execution.hpp>
#include <bacwalk/sdk/object_list_reader.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/common.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <signal.h>  // NOLINT
#include <string>

namespace
{

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

void signalHandler(const int sig)
{
    switch (sig)
    {
    case SIGINT:
    case SIGTERM:
        g_running = 0;
        break;
    default:
        break;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);
}

std::string logFilePath(const bacwalk::cli::CliOptions& options)
{
    if (options.log_file)
    {
        return *options.log_file;
    }
    if (const auto* const env_log_file = std::getenv("BACWALK_LOG_FILE"))
    {
        return env_log_file;
    }
    return "./bacwalk.log";
}

spdlog::level::level_enum logLevel(const bacwalk::cli::CliOptions::Verbosity verbosity)
{
    using Verbosity = bacwalk::cli::CliOptions::Verbosity;

    switch (verbosity)
    {
    case Verbosity::Quiet:
        return spdlog::level::warn;
    case Verbosity::Verbose:
        return spdlog::level::trace;
    default:
        return spdlog::level::info;
    }
}

}  // namespace

int main(const int argc, const char** const argv)
{
    using bacwalk::cli::CliOptions;
    using bacwalk::cli::ParseArgs;
    using bacwalk::sdk::ObjectListReader;
    using Executor = bacwalk::platform::SingleThreadedExecutor;

    const auto args = bacwalk::cli::parseArgs(argc, argv);
    if (cetl::get_if<ParseArgs::Help>(&args) != nullptr)
    {
        bacwalk::cli::printUsage(std::cout, argv[0]);
        return EXIT_SUCCESS;
    }
    if (const auto* const error = cetl::get_if<ParseArgs::Error>(&args))
    {
        std::cerr << argv[0] << ": " << error->message << "\n\n";
        bacwalk::cli::printUsage(std::cerr, argv[0]);
        return EXIT_FAILURE;
    }
    const auto& options = cetl::get<CliOptions>(args);

    setupSignalHandlers();
    bacwalk::cli::setupLogging(argc, argv, logFilePath(options), logLevel(options.verbosity));

    spdlog::info("bacwalk started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_FAILURE;
    try
    {
        auto&    memory = *cetl::pmr::new_delete_resource();
        Executor executor;

        const auto reader = ObjectListReader::make(memory, executor, options.params);
        if (!reader)
        {
            std::cerr << argv[0] << ": invalid address '" << options.params.target_address << "' or '"
                      << options.params.local_address << "'.\n";
            return EXIT_FAILURE;
        }

        auto sender      = reader->read();
        auto read_result = bacwalk::sdk::sync_wait_while<ObjectListReader::Read::Result>(executor, sender, [] {
            //
            return g_running != 0;
        });
        if (!read_result)
        {
            // Cancels the read, and closes its local endpoint.
            sender.reset();

            spdlog::warn("Interrupted by user");
            std::cerr << "Interrupted by user\n";
        }
        else if (const auto* const failure = cetl::get_if<ObjectListReader::Read::Failure>(&*read_result))
        {
            bacwalk::cli::printFailure(std::cerr, *failure);
        }
        else
        {
            bacwalk::cli::printReport(std::cout, cetl::get<ObjectListReader::Read::Success>(*read_result));
            result = EXIT_SUCCESS;
        }

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("bacwalk terminated (result={}).", result);

    return result;
}
