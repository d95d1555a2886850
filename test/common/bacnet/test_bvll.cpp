//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "bacnet/bvll.hpp"
#include "bacnet/encoding.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>

namespace
{

using namespace bacwalk::common::bacnet;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::ElementsAre;
using testing::Optional;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestBvll : public testing::Test
{
protected:
    static FrameParseResult::Var parse(const Bytes& datagram)
    {
        return parseFrame({datagram.data(), datagram.size()});
    }

    static Bytes apduOf(const FrameParseResult::Var& result)
    {
        const auto* const frame = cetl::get_if<FrameParseResult::Success>(&result);
        EXPECT_THAT(frame, testing::NotNull());
        return (frame != nullptr) ? Bytes{frame->apdu.begin(), frame->apdu.end()} : Bytes{};
    }
};

// MARK: - Tests:

TEST_F(TestBvll, encode_unicast_frame)
{
    const Bytes apdu{0x10, 0x08};

    Bytes datagram;
    encodeUnicastFrame({apdu.data(), apdu.size()}, false, datagram);
    EXPECT_THAT(datagram, ElementsAre(0x81, 0x0A, 0x00, 0x08, 0x01, 0x00, 0x10, 0x08));

    datagram.clear();
    encodeUnicastFrame({apdu.data(), apdu.size()}, true, datagram);
    EXPECT_THAT(datagram, ElementsAre(0x81, 0x0A, 0x00, 0x08, 0x01, 0x04, 0x10, 0x08));

    const auto result = parse(datagram);
    ASSERT_THAT(result, VariantWith<FrameParseResult::Success>(_));
    const auto& frame = cetl::get<FrameParseResult::Success>(result);
    EXPECT_TRUE(frame.expecting_reply);
    EXPECT_FALSE(frame.forwarded_from.has_value());
    EXPECT_THAT(apduOf(result), ElementsAre(0x10, 0x08));
}

TEST_F(TestBvll, parse_broadcast_and_forwarded)
{
    EXPECT_THAT(apduOf(parse({0x81, 0x0B, 0x00, 0x08, 0x01, 0x00, 0x10, 0x08})), ElementsAre(0x10, 0x08));

    const auto result = parse({0x81, 0x04, 0x00, 0x0E, 192, 168, 1, 10, 0xBA, 0xC0, 0x01, 0x00, 0x10, 0x08});
    ASSERT_THAT(result, VariantWith<FrameParseResult::Success>(_));
    EXPECT_THAT(cetl::get<FrameParseResult::Success>(result).forwarded_from,
                Optional(ElementsAre(192, 168, 1, 10, 0xBA, 0xC0)));
    EXPECT_THAT(apduOf(result), ElementsAre(0x10, 0x08));
}

TEST_F(TestBvll, parse_routed_npdu)
{
    // With source network address (SNET=5, SADR=7).
    EXPECT_THAT(apduOf(parse({0x81, 0x0A, 0x00, 0x0C, 0x01, 0x08, 0x00, 0x05, 0x01, 0x07, 0x10, 0x08})),
                ElementsAre(0x10, 0x08));

    // With global broadcast destination, and the hop count.
    EXPECT_THAT(apduOf(parse({0x81, 0x0A, 0x00, 0x0C, 0x01, 0x20, 0xFF, 0xFF, 0x00, 0xFF, 0x10, 0x08})),
                ElementsAre(0x10, 0x08));
}

TEST_F(TestBvll, parse_bvll_length_limits_datagram)
{
    // Trailing octets beyond the BVLL length are not a part of the APDU.
    EXPECT_THAT(apduOf(parse({0x81, 0x0A, 0x00, 0x08, 0x01, 0x00, 0x10, 0x08, 0xAA, 0xBB})),
                ElementsAre(0x10, 0x08));
}

TEST_F(TestBvll, parse_failures)
{
    // Not BACnet/IP.
    EXPECT_THAT(parse({0x82, 0x0A, 0x00, 0x08, 0x01, 0x00, 0x10, 0x08}), VariantWith<FrameParseResult::Failure>(EBADMSG));
    // Too short.
    EXPECT_THAT(parse({0x81, 0x0A}), VariantWith<FrameParseResult::Failure>(EBADMSG));
    // BVLL length beyond the datagram.
    EXPECT_THAT(parse({0x81, 0x0A, 0x00, 0x10, 0x01, 0x00, 0x10, 0x08}), VariantWith<FrameParseResult::Failure>(EBADMSG));
    // Wrong NPDU version.
    EXPECT_THAT(parse({0x81, 0x0A, 0x00, 0x08, 0x02, 0x00, 0x10, 0x08}), VariantWith<FrameParseResult::Failure>(EBADMSG));
    // No APDU at all.
    EXPECT_THAT(parse({0x81, 0x0A, 0x00, 0x06, 0x01, 0x00}), VariantWith<FrameParseResult::Failure>(EBADMSG));
    // Truncated source address.
    EXPECT_THAT(parse({0x81, 0x0A, 0x00, 0x09, 0x01, 0x08, 0x00, 0x05, 0x03}),
                VariantWith<FrameParseResult::Failure>(EBADMSG));
    // Truncated forwarded address.
    EXPECT_THAT(parse({0x81, 0x04, 0x00, 0x08, 192, 168, 1, 10}), VariantWith<FrameParseResult::Failure>(EBADMSG));
}

TEST_F(TestBvll, parse_unsupported)
{
    // BVLC-Result
    EXPECT_THAT(parse({0x81, 0x00, 0x00, 0x06, 0x00, 0x00}), VariantWith<FrameParseResult::Failure>(ENOTSUP));
    // Network layer message (Who-Is-Router-To-Network).
    EXPECT_THAT(parse({0x81, 0x0A, 0x00, 0x07, 0x01, 0x80, 0x00}), VariantWith<FrameParseResult::Failure>(ENOTSUP));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
