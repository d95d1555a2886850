//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_LINK_UDP_LINK_HPP_INCLUDED
#define BACWALK_SDK_LINK_UDP_LINK_HPP_INCLUDED

#include "link.hpp"

#include "bacnet/encoding.hpp"
#include "io/device_address.hpp"
#include "io/udp_socket.hpp"
#include "logging.hpp"

#include "bacwalk/platform/posix_executor_extension.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <cstdint>
#include <vector>

namespace bacwalk
{
namespace sdk
{
namespace link
{

/// BACnet/IP (Annex J) data link over a non-blocking UDP socket.
///
class UdpLink final : public Link
{
public:
    /// Largest BACnet/IP datagram: BVLL (forwarded) + NPDU (routed) headers and the largest APDU.
    static constexpr std::size_t MaxDatagramSize = 1497;

    /// Makes a new (not yet started) link.
    ///
    /// The executor has to support `IPosixExecutorExtension`.
    ///
    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource&      memory,
                                   libcyphal::IExecutor&            executor,
                                   const common::io::DeviceAddress& local_address);

    UdpLink(cetl::pmr::memory_resource&      memory,
            libcyphal::IExecutor&            executor,
            const common::io::DeviceAddress& local_address);

    UdpLink(const UdpLink&)                = delete;
    UdpLink(UdpLink&&) noexcept            = delete;
    UdpLink& operator=(const UdpLink&)     = delete;
    UdpLink& operator=(UdpLink&&) noexcept = delete;

    ~UdpLink() override;

    // MARK: Link

    CETL_NODISCARD int start(Handler handler) override;
    CETL_NODISCARD int send(const common::io::DeviceAddress& destination,
                            const common::bacnet::BytesView  apdu,
                            const bool                       expecting_reply) override;

private:
    using Buffer = std::vector<std::uint8_t, cetl::pmr::polymorphic_allocator<std::uint8_t>>;

    void handleReceive();
    void handleDatagram(const common::io::DeviceAddress& sender, const common::bacnet::BytesView datagram) const;

    platform::IPosixExecutorExtension* const posix_executor_ext_;
    common::LoggerPtr                        logger_;
    const common::io::DeviceAddress          local_address_;
    common::io::UdpSocket                    socket_;
    libcyphal::IExecutor::Callback::Any      socket_callback_;
    Handler                                  handler_;
    Buffer                                   rx_buffer_;
    common::bacnet::Bytes                    tx_buffer_;

};  // UdpLink

}  // namespace link
}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_LINK_UDP_LINK_HPP_INCLUDED
