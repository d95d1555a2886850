//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_COMMON_IO_UDP_SOCKET_HPP_INCLUDED
#define BACWALK_COMMON_IO_UDP_SOCKET_HPP_INCLUDED

#include <utility>

namespace bacwalk
{
namespace common
{
namespace io
{

/// Owns a datagram socket descriptor; the socket is closed on destruction.
///
/// Made by `DeviceAddress::socket()`.
///
class UdpSocket final
{
public:
    UdpSocket() = default;

    explicit UdpSocket(const int fd) noexcept
        : fd_{fd}
    {
    }

    UdpSocket(UdpSocket&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)}
    {
    }

    UdpSocket& operator=(UdpSocket&& other) noexcept
    {
        if (this != &other)
        {
            close();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    UdpSocket(const UdpSocket&)            = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    ~UdpSocket()
    {
        close();
    }

    int fd() const noexcept
    {
        return fd_;
    }

    bool isOpen() const noexcept
    {
        return fd_ >= 0;
    }

    /// Closes the socket (if open). Failures are only logged.
    void close() noexcept;

private:
    int fd_{-1};

};  // UdpSocket

}  // namespace io
}  // namespace common
}  // namespace bacwalk

#endif  // BACWALK_COMMON_IO_UDP_SOCKET_HPP_INCLUDED
