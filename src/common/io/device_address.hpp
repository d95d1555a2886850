//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_COMMON_IO_DEVICE_ADDRESS_HPP_INCLUDED
#define BACWALK_COMMON_IO_DEVICE_ADDRESS_HPP_INCLUDED

#include "udp_socket.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cstdint>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <utility>

namespace bacwalk
{
namespace common
{
namespace io
{

/// Immutable BACnet/IP endpoint - an IPv4 address and a UDP port.
///
class DeviceAddress final
{
public:
    /// BACnet/IP "MAC" address - 4 bytes of IPv4 address followed by 2 bytes of port, both in network order.
    using BacnetMac = std::array<std::uint8_t, 6>;

    struct ParseResult
    {
        using Failure = int;  // aka errno
        using Success = DeviceAddress;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Parses "a.b.c.d[:port]" string; the `port_hint` is used when there is no port suffix.
    ///
    /// The "*" host stands for the wildcard address (all local interfaces).
    ///
    static ParseResult::Var parse(const std::string& str, const std::uint16_t port_hint);

    static DeviceAddress fromRaw(const sockaddr_in& addr) noexcept;
    static DeviceAddress fromBacnetMac(const BacnetMac& mac) noexcept;

    DeviceAddress() noexcept;

    std::pair<const sockaddr*, socklen_t> getRaw() const noexcept;

    BacnetMac     toBacnetMac() const noexcept;
    std::uint16_t port() const noexcept;
    bool          isWildcard() const noexcept;

    /// Makes "a.b.c.d:port" string.
    std::string toString() const;

    struct SocketResult
    {
        using Failure = int;  // aka errno
        using Success = UdpSocket;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Makes a new non-blocking UDP socket suitable for this address.
    SocketResult::Var socket() const;

    /// Binds the socket to this (local) address.
    ///
    /// @return `0` on success, otherwise errno.
    ///
    int bind(const UdpSocket& socket) const;

    friend bool operator==(const DeviceAddress& lhs, const DeviceAddress& rhs) noexcept
    {
        return (lhs.addr_.sin_addr.s_addr == rhs.addr_.sin_addr.s_addr) && (lhs.addr_.sin_port == rhs.addr_.sin_port);
    }
    friend bool operator!=(const DeviceAddress& lhs, const DeviceAddress& rhs) noexcept
    {
        return !(lhs == rhs);
    }

private:
    static int extractHostAndPort(const std::string& str, std::string& host, std::uint16_t& port);

    sockaddr_in addr_;

};  // DeviceAddress

}  // namespace io
}  // namespace common
}  // namespace bacwalk

#endif  // BACWALK_COMMON_IO_DEVICE_ADDRESS_HPP_INCLUDED
