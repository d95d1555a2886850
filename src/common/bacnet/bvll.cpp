//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "bvll.hpp"

#include "encoding.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>

namespace bacwalk
{
namespace common
{
namespace bacnet
{
namespace
{

constexpr std::uint8_t BvllTypeBacnetIp = 0x81;
constexpr std::size_t  BvllHeaderSize   = 4;
constexpr std::size_t  ForwardedMacSize = 6;

constexpr std::uint8_t NpduVersion = 0x01;

// NPDU control octet bits (clause 6.2.2).
constexpr std::uint8_t NpduNetworkMessage  = 0x80;
constexpr std::uint8_t NpduDestinationSpec = 0x20;
constexpr std::uint8_t NpduSourceSpec      = 0x08;
constexpr std::uint8_t NpduExpectingReply  = 0x04;

/// Skips NET(2) + LEN(1) + ADR(LEN) of a routed NPDU; `false` if there is not enough data.
bool skipNetworkAddress(const BytesView npdu, std::size_t& offset)
{
    if ((npdu.size() - offset) < 3)
    {
        return false;
    }
    const std::size_t address_length = npdu[offset + 2];
    offset += 3;
    if ((npdu.size() - offset) < address_length)
    {
        return false;
    }
    offset += address_length;
    return true;
}

}  // namespace

FrameParseResult::Var parseFrame(const BytesView datagram)
{
    if ((datagram.size() < BvllHeaderSize) || (datagram[0] != BvllTypeBacnetIp))
    {
        return EBADMSG;
    }

    const std::size_t bvll_length = (static_cast<std::size_t>(datagram[2]) << 8U) | datagram[3];
    if ((bvll_length < BvllHeaderSize) || (bvll_length > datagram.size()))
    {
        return EBADMSG;
    }

    Frame       frame{cetl::nullopt, false, {}};
    std::size_t offset = BvllHeaderSize;
    switch (static_cast<BvlcFunction>(datagram[1]))
    {
    case BvlcFunction::OriginalUnicastNpdu:
    case BvlcFunction::OriginalBroadcastNpdu: {
        break;
    }
    case BvlcFunction::ForwardedNpdu: {
        if ((bvll_length - offset) < ForwardedMacSize)
        {
            return EBADMSG;
        }
        BacnetIpMac origin{};
        std::copy_n(datagram.begin() + static_cast<std::ptrdiff_t>(offset), origin.size(), origin.begin());
        frame.forwarded_from = origin;
        offset += ForwardedMacSize;
        break;
    }
    default: {
        return ENOTSUP;
    }
    }

    const auto npdu = datagram.subspan(offset, bvll_length - offset);
    if ((npdu.size() < 2) || (npdu[0] != NpduVersion))
    {
        return EBADMSG;
    }

    const std::uint8_t control = npdu[1];
    if ((control & NpduNetworkMessage) != 0)
    {
        return ENOTSUP;
    }
    frame.expecting_reply = (control & NpduExpectingReply) != 0;

    std::size_t npdu_offset = 2;
    if (((control & NpduDestinationSpec) != 0) && !skipNetworkAddress(npdu, npdu_offset))
    {
        return EBADMSG;
    }
    if (((control & NpduSourceSpec) != 0) && !skipNetworkAddress(npdu, npdu_offset))
    {
        return EBADMSG;
    }
    if ((control & NpduDestinationSpec) != 0)
    {
        // Hop count.
        if (npdu_offset >= npdu.size())
        {
            return EBADMSG;
        }
        ++npdu_offset;
    }

    if (npdu_offset >= npdu.size())
    {
        return EBADMSG;
    }
    frame.apdu = npdu.subspan(npdu_offset);
    return frame;
}

void encodeUnicastFrame(const BytesView apdu, const bool expecting_reply, Bytes& out)
{
    const std::size_t total_length = BvllHeaderSize + 2 + apdu.size();

    out.reserve(out.size() + total_length);
    out.push_back(BvllTypeBacnetIp);
    out.push_back(static_cast<std::uint8_t>(BvlcFunction::OriginalUnicastNpdu));
    out.push_back(static_cast<std::uint8_t>(total_length >> 8U));
    out.push_back(static_cast<std::uint8_t>(total_length));

    out.push_back(NpduVersion);
    out.push_back(expecting_reply ? NpduExpectingReply : 0);

    out.insert(out.end(), apdu.begin(), apdu.end());
}

}  // namespace bacnet
}  // namespace common
}  // namespace bacwalk
