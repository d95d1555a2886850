//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "device_address.hpp"

#include "logging.hpp"

#include "bacwalk/platform/posix_utils.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <limits>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <utility>

namespace bacwalk
{
namespace common
{
namespace io
{

DeviceAddress::DeviceAddress() noexcept
    : addr_{}
{
    addr_.sin_family = AF_INET;
}

DeviceAddress DeviceAddress::fromRaw(const sockaddr_in& addr) noexcept
{
    DeviceAddress result{};
    result.addr_.sin_addr = addr.sin_addr;
    result.addr_.sin_port = addr.sin_port;
    return result;
}

DeviceAddress DeviceAddress::fromBacnetMac(const BacnetMac& mac) noexcept
{
    DeviceAddress result{};
    std::memcpy(&result.addr_.sin_addr.s_addr, mac.data(), 4);
    std::memcpy(&result.addr_.sin_port, &mac[4], 2);
    return result;
}

std::pair<const sockaddr*, socklen_t> DeviceAddress::getRaw() const noexcept
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const sockaddr*>(&addr_), sizeof(addr_)};
}

DeviceAddress::BacnetMac DeviceAddress::toBacnetMac() const noexcept
{
    BacnetMac mac{};
    std::memcpy(mac.data(), &addr_.sin_addr.s_addr, 4);
    std::memcpy(&mac[4], &addr_.sin_port, 2);
    return mac;
}

std::uint16_t DeviceAddress::port() const noexcept
{
    return ntohs(addr_.sin_port);
}

bool DeviceAddress::isWildcard() const noexcept
{
    return addr_.sin_addr.s_addr == htonl(INADDR_ANY);
}

std::string DeviceAddress::toString() const
{
    std::array<char, INET_ADDRSTRLEN> host{};
    if (::inet_ntop(AF_INET, &addr_.sin_addr, host.data(), host.size()) == nullptr)
    {
        return "?:" + std::to_string(port());
    }
    return std::string{host.data()} + ":" + std::to_string(port());
}

DeviceAddress::SocketResult::Var DeviceAddress::socket() const
{
    auto socket_type = static_cast<unsigned>(SOCK_DGRAM);
#if __linux__
    socket_type |= static_cast<unsigned>(SOCK_NONBLOCK);
    socket_type |= static_cast<unsigned>(SOCK_CLOEXEC);
#endif

    UdpSocket out_socket;
    if (const auto err = platform::posixSyscallError([socket_type, &out_socket] {
            //
            const int fd = ::socket(AF_INET, static_cast<int>(socket_type), IPPROTO_UDP);
            if (fd != -1)
            {
                out_socket = UdpSocket{fd};
            }
            return fd;
        }))
    {
        getLogger(LoggerName::Io)->error("Failed to create socket: {}.", std::strerror(err));
        return err;
    }

    return out_socket;
}

int DeviceAddress::bind(const UdpSocket& socket) const
{
    const int raw_fd = socket.fd();
    CETL_DEBUG_ASSERT(socket.isOpen(), "");

    // Let a restarted client reuse its well-known local port right away,
    // and allow the device to answer with (local) broadcasts.
    for (const int option : {SO_REUSEADDR, SO_BROADCAST})
    {
        if (const auto err = platform::posixSyscallError([raw_fd, option] {
                //
                const int enable = 1;
                return ::setsockopt(raw_fd, SOL_SOCKET, option, &enable, sizeof(enable));
            }))
        {
            getLogger(LoggerName::Io)->error("Failed to set socket option {} (fd={}): {}.",  //
                                             option,
                                             raw_fd,
                                             std::strerror(err));
            return err;
        }
    }

    const auto raw_addr = getRaw();
    const auto err      = platform::posixSyscallError([raw_fd, &raw_addr] {
        //
        return ::bind(raw_fd, raw_addr.first, raw_addr.second);
    });
    if (err != 0)
    {
        getLogger(LoggerName::Io)->error("Failed to bind socket to '{}': {}.", toString(), std::strerror(err));
    }
    return err;
}

DeviceAddress::ParseResult::Var DeviceAddress::parse(const std::string& str, const std::uint16_t port_hint)
{
    std::string   host;
    std::uint16_t port = port_hint;
    if (const auto err = extractHostAndPort(str, host, port))
    {
        return err;
    }

    DeviceAddress result{};
    result.addr_.sin_port = htons(port);

    if (host == "*")
    {
        result.addr_.sin_addr.s_addr = htonl(INADDR_ANY);
        return result;
    }

    const int convert_result = ::inet_pton(AF_INET, host.c_str(), &result.addr_.sin_addr);
    switch (convert_result)
    {
    case 1: {
        return result;
    }
    case 0: {
        getLogger(LoggerName::Io)->error("Unsupported address; expected IPv4 dotted quad (addr='{}').", host);
        return EINVAL;
    }
    default: {
        const int err = errno;
        getLogger(LoggerName::Io)->error("Failed to parse address (addr='{}'): {}", host, std::strerror(err));
        return err;
    }
    }
}

int DeviceAddress::extractHostAndPort(const std::string& str, std::string& host, std::uint16_t& port)
{
    std::string port_part;

    const auto colon_pos = str.find_first_of(':');
    if (colon_pos != std::string::npos)
    {
        host      = str.substr(0, colon_pos);
        port_part = str.substr(colon_pos + 1);
        if (port_part.empty())
        {
            getLogger(LoggerName::Io)->error("Missing port number after ':' (addr='{}').", str);
            return EINVAL;
        }
    }
    else
    {
        host = str;
    }

    if (host.empty())
    {
        getLogger(LoggerName::Io)->error("Missing host (addr='{}').", str);
        return EINVAL;
    }

    // Parse the port if any; otherwise keep untouched (hint).
    //
    if (!port_part.empty())
    {
        char*               end_ptr    = nullptr;
        const std::uint64_t maybe_port = std::strtoull(port_part.c_str(), &end_ptr, 10);
        if ((*end_ptr != '\0') || (port_part.front() == '-') || (port_part.front() == '+'))
        {
            getLogger(LoggerName::Io)->error("Invalid port number (port='{}').", port_part);
            return EINVAL;
        }
        if (maybe_port > std::numeric_limits<std::uint16_t>::max())
        {
            getLogger(LoggerName::Io)->error("Port number is too large (port={}).", maybe_port);
            return EINVAL;
        }
        port = static_cast<std::uint16_t>(maybe_port);
    }

    return 0;
}

}  // namespace io
}  // namespace common
}  // namespace bacwalk
