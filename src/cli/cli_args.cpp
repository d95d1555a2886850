//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cli_args.hpp"

#include <bacwalk/bacnet/object_id.hpp>
#include <bacwalk/sdk/object_list_reader.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <string>

namespace bacwalk
{
namespace cli
{
namespace
{

constexpr std::uint32_t MaxTimeoutMs = 600000;

/// Parses whole string as a decimal number within [min, max].
///
bool parseNumber(const std::string& str, const std::uint32_t min, const std::uint32_t max, std::uint32_t& value)
{
    if (str.empty() || (str.find_first_not_of("0123456789") != std::string::npos))
    {
        return false;
    }

    errno            = 0;
    char*      end   = nullptr;
    const auto raw   = std::strtoull(str.c_str(), &end, 10);
    const bool valid = (errno == 0) && (end != nullptr) && (*end == '\0') && (raw >= min) && (raw <= max);
    if (valid)
    {
        value = static_cast<std::uint32_t>(raw);
    }
    return valid;
}

bool startsWith(const std::string& str, const char* const prefix)
{
    return str.rfind(prefix, 0) == 0;
}

ParseArgs::Error invalidValue(const std::string& option, const std::string& value, const char* const expected)
{
    return ParseArgs::Error{"invalid value '" + value + "' for " + option + " (expected " + expected + ")"};
}

}  // namespace

ParseArgs::Var parseArgs(const int argc, const char* const* const argv)
{
    CliOptions options;
    auto&      params = options.params;

    int positional = 0;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        if ((arg == "-h") || (arg == "--help"))
        {
            return ParseArgs::Help{};
        }
        if (startsWith(arg, "SPDLOG_LEVEL=") || startsWith(arg, "SPDLOG_FLUSH_LEVEL="))
        {
            continue;
        }
        if (arg == "--no-names")
        {
            params.resolve_names = false;
            continue;
        }
        if (arg == "--quiet")
        {
            options.verbosity = CliOptions::Verbosity::Quiet;
            continue;
        }
        if (arg == "--verbose")
        {
            options.verbosity = CliOptions::Verbosity::Verbose;
            continue;
        }

        const bool takes_value = (arg == "-d") || (arg == "--device") || (arg == "-l") || (arg == "--local-port") ||
                                 (arg == "--local-ip") || (arg == "--timeout-ms") || (arg == "--log-file");
        if (takes_value)
        {
            if (i + 1 >= argc)
            {
                return ParseArgs::Error{"missing value for " + arg};
            }
            const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

            std::uint32_t number = 0;
            if ((arg == "-d") || (arg == "--device"))
            {
                if (!parseNumber(value, 0, bacnet::ObjectIdentifier::MaxInstance, number))
                {
                    return invalidValue(arg, value, "device instance 0..4194303");
                }
                params.device_instance = number;
            }
            else if ((arg == "-l") || (arg == "--local-port"))
            {
                if (!parseNumber(value, 0, UINT16_MAX, number))
                {
                    return invalidValue(arg, value, "port 0..65535");
                }
                params.local_port = static_cast<std::uint16_t>(number);
            }
            else if (arg == "--local-ip")
            {
                params.local_address = value;
            }
            else if (arg == "--timeout-ms")
            {
                if (!parseNumber(value, 1, MaxTimeoutMs, number))
                {
                    return invalidValue(arg, value, "milliseconds 1..600000");
                }
                params.request_timeout = std::chrono::milliseconds{number};
            }
            else
            {
                options.log_file = value;
            }
            continue;
        }

        if (startsWith(arg, "-"))
        {
            return ParseArgs::Error{"unknown option " + arg};
        }

        switch (positional++)
        {
        case 0:
            params.target_address = arg;
            break;
        case 1: {
            std::uint32_t port = 0;
            if (!parseNumber(arg, 1, UINT16_MAX, port))
            {
                return invalidValue("target port", arg, "port 1..65535");
            }
            params.target_port = static_cast<std::uint16_t>(port);
            break;
        }
        default:
            return ParseArgs::Error{"unexpected argument '" + arg + "'"};
        }
    }

    if (positional == 0)
    {
        return ParseArgs::Error{"missing device address"};
    }
    return options;
}

void printUsage(std::ostream& out, const char* const program)
{
    out << "Usage: " << program << " <ip>[:port] [port] [options]\n"
        << "\n"
        << "Reads object list (and object names) of a BACnet/IP device.\n"
        << "\n"
        << "Options:\n"
        << "  -d, --device N       Device instance (0..4194303); discovered by Who-Is if omitted.\n"
        << "  -l, --local-port N   Local UDP port (default " << sdk::ObjectListReader::DefaultLocalPort << ").\n"
        << "      --local-ip IP    Local IPv4 address to bind to (default all interfaces).\n"
        << "      --timeout-ms N   Per-request timeout in milliseconds (default 3000).\n"
        << "      --no-names       Do not read object names.\n"
        << "      --log-file PATH  Log file (default ./bacwalk.log, or BACWALK_LOG_FILE).\n"
        << "      --quiet          Log warnings and errors only.\n"
        << "      --verbose        Log everything.\n"
        << "  -h, --help           Print this help.\n"
        << "\n"
        << "Default device port is " << sdk::ObjectListReader::DefaultTargetPort << ". "
        << "Log levels may also be set with SPDLOG_LEVEL=... argument.\n";
}

}  // namespace cli
}  // namespace bacwalk
