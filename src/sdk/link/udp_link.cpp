//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "udp_link.hpp"

#include "bacnet/bvll.hpp"
#include "bacnet/encoding.hpp"
#include "io/device_address.hpp"
#include "io/udp_socket.hpp"
#include "logging.hpp"

#include "bacwalk/platform/posix_executor_extension.hpp"
#include "bacwalk/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <memory>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <utility>

namespace bacwalk
{
namespace sdk
{
namespace link
{

CETL_NODISCARD Link::Ptr UdpLink::make(cetl::pmr::memory_resource&      memory,
                                       libcyphal::IExecutor&            executor,
                                       const common::io::DeviceAddress& local_address)
{
    return std::make_unique<UdpLink>(memory, executor, local_address);
}

UdpLink::UdpLink(cetl::pmr::memory_resource&      memory,
                 libcyphal::IExecutor&            executor,
                 const common::io::DeviceAddress& local_address)
    : posix_executor_ext_{cetl::rtti_cast<platform::IPosixExecutorExtension*>(&executor)}
    , logger_{common::getLogger(common::LoggerName::Io)}
    , local_address_{local_address}
    , rx_buffer_{MaxDatagramSize, 0, Buffer::allocator_type{&memory}}
{
}

UdpLink::~UdpLink()
{
    if (socket_.isOpen())
    {
        logger_->debug("Closing local endpoint '{}' (fd={}).", local_address_.toString(), socket_.fd());
    }
}

int UdpLink::start(Handler handler)
{
    CETL_DEBUG_ASSERT(handler, "");
    CETL_DEBUG_ASSERT(!socket_.isOpen(), "Link is already started.");

    if (posix_executor_ext_ == nullptr)
    {
        logger_->error("Executor can't await file descriptors (local='{}').", local_address_.toString());
        return ENOTSUP;
    }

    using SocketResult = common::io::DeviceAddress::SocketResult;

    auto maybe_socket = local_address_.socket();
    if (const auto* const err = cetl::get_if<SocketResult::Failure>(&maybe_socket))
    {
        return *err;
    }
    auto socket = cetl::get<SocketResult::Success>(std::move(maybe_socket));

    if (const auto err = local_address_.bind(socket))
    {
        return err;
    }

    socket_callback_ = posix_executor_ext_->registerAwaitableCallback(  //
        [this](const auto&) {
            //
            handleReceive();
        },
        platform::IPosixExecutorExtension::Trigger::Readable{socket.fd()});
    if (!socket_callback_.has_value())
    {
        return EIO;
    }

    socket_  = std::move(socket);
    handler_ = std::move(handler);

    logger_->debug("Local endpoint '{}' is open (fd={}).", local_address_.toString(), socket_.fd());
    return 0;
}

int UdpLink::send(const common::io::DeviceAddress& destination,
                  const common::bacnet::BytesView  apdu,
                  const bool                       expecting_reply)
{
    if (!socket_.isOpen())
    {
        return EBADF;
    }

    tx_buffer_.clear();
    common::bacnet::encodeUnicastFrame(apdu, expecting_reply, tx_buffer_);

    const auto raw_addr = destination.getRaw();
    if (const auto err = platform::posixSyscallError([this, &raw_addr] {
            //
            return ::sendto(socket_.fd(),
                            tx_buffer_.data(),
                            tx_buffer_.size(),
                            MSG_NOSIGNAL,
                            raw_addr.first,
                            raw_addr.second);
        }))
    {
        logger_->error("Failed to send datagram to '{}' (size={}): {}.",
                       destination.toString(),
                       tx_buffer_.size(),
                       std::strerror(err));
        return err;
    }

    logger_->trace("Sent datagram to '{}' (size={}).", destination.toString(), tx_buffer_.size());
    return 0;
}

void UdpLink::handleReceive()
{
    // Drain everything what is pending - the socket is awaited level-triggered,
    // so a leftover datagram would just wake us up again.
    while (socket_.isOpen())
    {
        sockaddr_in addr{};
        socklen_t   addr_len = sizeof(addr);
        ssize_t     received = -1;

        const auto err = platform::posixSyscallError([this, &addr, &addr_len, &received] {
            //
            received = ::recvfrom(socket_.fd(),
                                  rx_buffer_.data(),
                                  rx_buffer_.size(),
                                  MSG_TRUNC,
                                  reinterpret_cast<sockaddr*>(&addr),  // NOLINT(*-reinterpret-cast)
                                  &addr_len);
            return received;
        });
        if ((err == EAGAIN) || (err == EWOULDBLOCK))
        {
            return;
        }
        if (err != 0)
        {
            logger_->warn("Failed to receive datagram (fd={}): {}.", socket_.fd(), std::strerror(err));
            return;
        }

        const auto sender = common::io::DeviceAddress::fromRaw(addr);
        const auto size   = static_cast<std::size_t>(received);
        if (size > rx_buffer_.size())
        {
            logger_->warn("Dropping oversized datagram from '{}' (size={}).", sender.toString(), size);
            continue;
        }

        handleDatagram(sender, {rx_buffer_.data(), size});
    }
}

void UdpLink::handleDatagram(const common::io::DeviceAddress& sender, const common::bacnet::BytesView datagram) const
{
    using FrameParseResult = common::bacnet::FrameParseResult;

    const auto maybe_frame = common::bacnet::parseFrame(datagram);
    if (const auto* const err = cetl::get_if<FrameParseResult::Failure>(&maybe_frame))
    {
        logger_->debug("Ignoring datagram from '{}' (size={}): {}.",
                       sender.toString(),
                       datagram.size(),
                       std::strerror(*err));
        return;
    }
    const auto& frame = cetl::get<FrameParseResult::Success>(maybe_frame);

    const auto source = frame.forwarded_from ? common::io::DeviceAddress::fromBacnetMac(*frame.forwarded_from)  //
                                             : sender;
    logger_->trace("Received APDU from '{}' (size={}).", source.toString(), frame.apdu.size());

    handler_(Datagram{source, frame.apdu});
}

}  // namespace link
}  // namespace sdk
}  // namespace bacwalk
