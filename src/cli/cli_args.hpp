//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_CLI_ARGS_HPP_INCLUDED
#define BACWALK_CLI_ARGS_HPP_INCLUDED

#include <bacwalk/sdk/object_list_reader.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <ostream>
#include <string>

namespace bacwalk
{
namespace cli
{

struct CliOptions final
{
    enum class Verbosity : std::uint8_t
    {
        Quiet,
        Normal,
        Verbose,
    };

    sdk::ObjectListReader::Params params;
    cetl::optional<std::string>   log_file;
    Verbosity                     verbosity{Verbosity::Normal};

};  // CliOptions

struct ParseArgs final
{
    struct Help final
    {};

    struct Error final
    {
        std::string message;
    };

    using Var = cetl::variant<CliOptions, Help, Error>;

};  // ParseArgs

/// Parses the command line.
///
/// `SPDLOG_LEVEL=...` and `SPDLOG_FLUSH_LEVEL=...` arguments are skipped - they belong to the logging setup.
///
ParseArgs::Var parseArgs(const int argc, const char* const* const argv);

void printUsage(std::ostream& out, const char* const program);

}  // namespace cli
}  // namespace bacwalk

#endif  // BACWALK_CLI_ARGS_HPP_INCLUDED
