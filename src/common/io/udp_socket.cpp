//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "udp_socket.hpp"

#include "logging.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace bacwalk
{
namespace common
{
namespace io
{

void UdpSocket::close() noexcept
{
    if (!isOpen())
    {
        return;
    }

    // No retry on EINTR - the descriptor is released anyway on Linux.
    const int fd = std::exchange(fd_, -1);
    if (::close(fd) < 0)
    {
        const int err = errno;
        getLogger(LoggerName::Io)->warn("Failed to close UDP socket (fd={}): {}.", fd, std::strerror(err));
    }
}

}  // namespace io
}  // namespace common
}  // namespace bacwalk
