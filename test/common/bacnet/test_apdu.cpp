//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "bacnet/apdu.hpp"
#include "bacnet/encoding.hpp"

#include <bacwalk/bacnet/object_id.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>

namespace
{

using namespace bacwalk::common::bacnet;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::ElementsAre;
using testing::NotNull;
using testing::Optional;
using testing::SizeIs;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestApdu : public testing::Test
{
protected:
    static DecodeResult::Var decode(const Bytes& apdu)
    {
        return decodeApdu({apdu.data(), apdu.size()});
    }

    template <typename Pdu>
    static Pdu decodeAs(const Bytes& apdu)
    {
        const auto result  = decode(apdu);
        const auto* const decoded = cetl::get_if<DecodeResult::Success>(&result);
        EXPECT_THAT(decoded, NotNull());
        const auto* const pdu = (decoded != nullptr) ? cetl::get_if<Pdu>(decoded) : nullptr;
        EXPECT_THAT(pdu, NotNull());
        return (pdu != nullptr) ? *pdu : Pdu{};
    }

    const ObjectIdentifier device42_{ObjectType::Device, 42};
};

// MARK: - Tests:

TEST_F(TestApdu, encode_who_is)
{
    Bytes global;
    encodeWhoIs({}, global);
    EXPECT_THAT(global, ElementsAre(0x10, 0x08));

    Bytes ranged;
    encodeWhoIs({42, 42}, ranged);
    EXPECT_THAT(ranged, ElementsAre(0x10, 0x08, 0x09, 0x2A, 0x19, 0x2A));

    const auto who_is = decodeAs<WhoIsRequest>(ranged);
    EXPECT_THAT(who_is.low_limit, Optional(42));
    EXPECT_THAT(who_is.high_limit, Optional(42));
}

TEST_F(TestApdu, encode_read_property)
{
    Bytes apdu;
    encodeReadProperty(1, {device42_, PropertyIdentifier::ObjectList, cetl::nullopt}, apdu);
    EXPECT_THAT(apdu, ElementsAre(0x00, 0x04, 0x01, 0x0C, 0x0C, 0x02, 0x00, 0x00, 0x2A, 0x19, 0x4C));

    apdu.clear();
    encodeReadProperty(7, {{ObjectType::AnalogInput, 1}, PropertyIdentifier::ObjectName, 0}, apdu);
    EXPECT_THAT(apdu, ElementsAre(0x00, 0x04, 0x07, 0x0C, 0x0C, 0x00, 0x00, 0x00, 0x01, 0x19, 0x4D, 0x29, 0x00));

    const auto request = decodeAs<ConfirmedReadProperty>(apdu);
    EXPECT_THAT(request.invoke_id, 7);
    EXPECT_THAT(request.request.object_id, (ObjectIdentifier{ObjectType::AnalogInput, 1}));
    EXPECT_THAT(request.request.property, PropertyIdentifier::ObjectName);
    EXPECT_THAT(request.request.array_index, Optional(0));
}

TEST_F(TestApdu, decode_i_am)
{
    const Bytes apdu{0x10, 0x00, 0xC4, 0x02, 0x00, 0x00, 0x2A, 0x22, 0x04, 0x00, 0x91, 0x03, 0x22, 0x01, 0x04};

    const auto i_am = decodeAs<IAmRequest>(apdu);
    EXPECT_THAT(i_am.device, device42_);
    EXPECT_THAT(i_am.max_apdu_length, 1024);
    EXPECT_THAT(i_am.segmentation, SegmentationNone);
    EXPECT_THAT(i_am.vendor_id, 260);

    // Vendor id is missing.
    EXPECT_THAT(decode({0x10, 0x00, 0xC4, 0x02, 0x00, 0x00, 0x2A, 0x22, 0x04, 0x00, 0x91, 0x03}),
                VariantWith<DecodeResult::Failure>(EBADMSG));
}

TEST_F(TestApdu, decode_read_property_ack)
{
    const Bytes apdu{0x30, 0x01, 0x0C, 0x0C, 0x02, 0x00, 0x00, 0x2A, 0x19, 0x4C, 0x3E,
                     0xC4, 0x00, 0x00, 0x00, 0x01, 0xC4, 0x01, 0x00, 0x00, 0x02, 0x3F};

    const auto ack = decodeAs<ReadPropertyAck>(apdu);
    EXPECT_THAT(ack.invoke_id, 1);
    EXPECT_THAT(ack.object_id, device42_);
    EXPECT_THAT(ack.property, PropertyIdentifier::ObjectList);
    EXPECT_FALSE(ack.array_index.has_value());
    ASSERT_THAT(ack.values, SizeIs(2));
    EXPECT_THAT(cetl::get<ObjectIdentifier>(ack.values[0]), (ObjectIdentifier{ObjectType::AnalogInput, 1}));
    EXPECT_THAT(cetl::get<ObjectIdentifier>(ack.values[1]), (ObjectIdentifier{ObjectType::BinaryOutput, 2}));

    Bytes encoded;
    encodeReadPropertyAck(ack, encoded);
    EXPECT_THAT(encoded, ElementsAre(0x30, 0x01, 0x0C, 0x0C, 0x02, 0x00, 0x00, 0x2A, 0x19, 0x4C, 0x3E,
                                     0xC4, 0x00, 0x00, 0x00, 0x01, 0xC4, 0x01, 0x00, 0x00, 0x02, 0x3F));
}

TEST_F(TestApdu, decode_empty_list_ack)
{
    const auto ack = decodeAs<ReadPropertyAck>({0x30, 0x02, 0x0C, 0x0C, 0x02, 0x00, 0x00, 0x2A, 0x19, 0x4C, 0x3E, 0x3F});
    EXPECT_THAT(ack.invoke_id, 2);
    EXPECT_THAT(ack.values, SizeIs(0));
}

TEST_F(TestApdu, malformed_ack_keeps_its_header)
{
    // The closing tag is missing.
    const Bytes apdu{0x30, 0x05, 0x0C, 0x0C, 0x02, 0x00, 0x00, 0x2A, 0x19, 0x4C, 0x3E, 0x21, 0x01};

    EXPECT_THAT(decode(apdu), VariantWith<DecodeResult::Failure>(EBADMSG));

    const auto header = peekApduHeader({apdu.data(), apdu.size()});
    ASSERT_TRUE(header.has_value());
    EXPECT_THAT(header->type, PduType::ComplexAck);
    EXPECT_FALSE(header->segmented);
    EXPECT_THAT(header->invoke_id, Optional(5));
    EXPECT_THAT(header->service, Optional(12));
}

TEST_F(TestApdu, segmented_ack)
{
    const Bytes apdu{0x38, 0x03, 0x00, 0x04, 0x0C, 0x0C, 0x02, 0x00};

    const auto header = peekApduHeader({apdu.data(), apdu.size()});
    ASSERT_TRUE(header.has_value());
    EXPECT_TRUE(header->segmented);
    EXPECT_THAT(header->invoke_id, Optional(3));
    EXPECT_THAT(header->service, Optional(12));

    const auto segment = decodeAs<SegmentedAck>(apdu);
    EXPECT_THAT(segment.invoke_id, 3);
}

TEST_F(TestApdu, decode_negative_responses)
{
    const auto error = decodeAs<ErrorPdu>({0x50, 0x01, 0x0C, 0x91, 0x02, 0x91, 0x20});
    EXPECT_THAT(error.invoke_id, 1);
    EXPECT_THAT(error.service, 12);
    EXPECT_THAT(errorClassName(error.error_class), "property");
    EXPECT_THAT(errorCodeName(error.error_code), "unknown-property");

    const auto wrapped = decodeAs<ErrorPdu>({0x50, 0x02, 0x0C, 0x0E, 0x91, 0x01, 0x91, 0x1F, 0x0F});
    EXPECT_THAT(errorClassName(wrapped.error_class), "object");
    EXPECT_THAT(errorCodeName(wrapped.error_code), "unknown-object");

    const auto reject = decodeAs<RejectPdu>({0x60, 0x05, 0x09});
    EXPECT_THAT(reject.invoke_id, 5);
    EXPECT_THAT(rejectReasonName(reject.reason), "unrecognized-service");

    const auto abort = decodeAs<AbortPdu>({0x71, 0x06, 0x04});
    EXPECT_TRUE(abort.from_server);
    EXPECT_THAT(abort.invoke_id, 6);
    EXPECT_THAT(abortReasonName(abort.reason), "segmentation-not-supported");
}

TEST_F(TestApdu, encode_negative_responses)
{
    Bytes apdu;
    encodeError({1, 12, 2, 32}, apdu);
    EXPECT_THAT(apdu, ElementsAre(0x50, 0x01, 0x0C, 0x91, 0x02, 0x91, 0x20));

    apdu.clear();
    encodeReject({5, 9}, apdu);
    EXPECT_THAT(apdu, ElementsAre(0x60, 0x05, 0x09));

    apdu.clear();
    encodeAbort({false, 3, static_cast<std::uint8_t>(AbortReason::SegmentationNotSupported)}, apdu);
    EXPECT_THAT(apdu, ElementsAre(0x70, 0x03, 0x04));
}

TEST_F(TestApdu, other_pdus)
{
    // ReadPropertyMultiple acknowledgement.
    const auto other = decodeAs<OtherPdu>({0x30, 0x01, 0x0E, 0x0C, 0x02, 0x00, 0x00, 0x2A});
    EXPECT_THAT(other.type, PduType::ComplexAck);
    EXPECT_THAT(other.service, Optional(14));

    const auto simple = decodeAs<SimpleAck>({0x20, 0x04, 0x0F});
    EXPECT_THAT(simple.invoke_id, 4);
    EXPECT_THAT(simple.service, 15);

    EXPECT_THAT(decode({}), VariantWith<DecodeResult::Failure>(EBADMSG));
    EXPECT_THAT(decode({0x30, 0x01}), VariantWith<DecodeResult::Failure>(EBADMSG));
    EXPECT_THAT(decode({0xF0, 0x01, 0x02}), VariantWith<DecodeResult::Failure>(EBADMSG));
}

TEST_F(TestApdu, names)
{
    EXPECT_THAT(propertyName(PropertyIdentifier::ObjectList), "objectList");
    EXPECT_THAT(propertyName(PropertyIdentifier::ObjectName), "objectName");
    EXPECT_THAT(propertyName(static_cast<PropertyIdentifier>(85)), "85");

    EXPECT_THAT(errorClassName(100), "100");
    EXPECT_THAT(errorCodeName(999), "999");
    EXPECT_THAT(rejectReasonName(0), "other");
    EXPECT_THAT(abortReasonName(200), "200");
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
