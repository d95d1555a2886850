//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_LINK_LINK_HPP_INCLUDED
#define BACWALK_SDK_LINK_LINK_HPP_INCLUDED

#include "bacnet/encoding.hpp"
#include "io/device_address.hpp"

#include <cetl/cetl.hpp>

#include <functional>
#include <memory>

namespace bacwalk
{
namespace sdk
{
namespace link
{

/// Abstract BACnet data link - exchanges APDUs with remote devices.
///
class Link
{
public:
    using Ptr = std::unique_ptr<Link>;

    struct Datagram final
    {
        /// Effective source of the APDU (the originating node for BBMD-forwarded messages).
        common::io::DeviceAddress source;
        common::bacnet::BytesView apdu;
    };

    using Handler = std::function<void(const Datagram&)>;

    Link(const Link&)                = delete;
    Link(Link&&) noexcept            = delete;
    Link& operator=(const Link&)     = delete;
    Link& operator=(Link&&) noexcept = delete;

    virtual ~Link() = default;

    /// Opens the local endpoint; from now on each received APDU is passed to the `handler`.
    ///
    /// @return `0` on success, otherwise `errno`-like error code.
    ///
    CETL_NODISCARD virtual int start(Handler handler) = 0;

    /// Sends one APDU to the destination.
    ///
    /// @return `0` on success, otherwise `errno`-like error code (nothing was sent).
    ///
    CETL_NODISCARD virtual int send(const common::io::DeviceAddress& destination,
                                    const common::bacnet::BytesView  apdu,
                                    const bool                       expecting_reply) = 0;

protected:
    Link() = default;

};  // Link

}  // namespace link
}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_LINK_LINK_HPP_INCLUDED
