//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_COMMON_BACNET_BVLL_HPP_INCLUDED
#define BACWALK_COMMON_BACNET_BVLL_HPP_INCLUDED

#include "encoding.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cstdint>

namespace bacwalk
{
namespace common
{
namespace bacnet
{

/// BACnet Virtual Link Control functions (Annex J.2) which this client deals with.
///
enum class BvlcFunction : std::uint8_t
{
    Result                = 0x00,
    ForwardedNpdu         = 0x04,
    OriginalUnicastNpdu   = 0x0A,
    OriginalBroadcastNpdu = 0x0B,
};

/// Link-level ("MAC") address of a BACnet/IP node - IPv4 address and UDP port, in network order.
using BacnetIpMac = std::array<std::uint8_t, 6>;

/// An APDU extracted from a received BACnet/IP datagram.
///
struct Frame final
{
    /// Originating node of a Forwarded-NPDU (it is a BBMD which has sent the datagram itself).
    cetl::optional<BacnetIpMac> forwarded_from;

    bool expecting_reply;

    BytesView apdu;

};  // Frame

struct FrameParseResult
{
    /// `EBADMSG` for malformed datagrams, `ENOTSUP` for network layer messages and other BVLC functions.
    using Failure = int;
    using Success = Frame;
    using Var     = cetl::variant<Success, Failure>;
};
FrameParseResult::Var parseFrame(const BytesView datagram);

/// Wraps the APDU into an Original-Unicast-NPDU datagram (BVLL + NPDU headers), appending to `out`.
///
void encodeUnicastFrame(const BytesView apdu, const bool expecting_reply, Bytes& out);

}  // namespace bacnet
}  // namespace common
}  // namespace bacwalk

#endif  // BACWALK_COMMON_BACNET_BVLL_HPP_INCLUDED
