//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <bacwalk/bacnet/object_id.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>

namespace
{

using namespace bacwalk::bacnet;  // NOLINT This our main concern here in the unit tests.

using testing::IsNull;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestObjectId : public testing::Test
{};

// MARK: - Tests:

TEST_F(TestObjectId, encode_decode)
{
    EXPECT_THAT((ObjectIdentifier{ObjectType::Device, 42}).encode(), 0x0200002AU);
    EXPECT_THAT((ObjectIdentifier{ObjectType::AnalogInput, 1}).encode(), 0x00000001U);
    EXPECT_THAT((ObjectIdentifier{ObjectType::Device, ObjectIdentifier::MaxInstance}).encode(), 0x023FFFFFU);

    const auto decoded = ObjectIdentifier::decode(0x0100000AU);
    EXPECT_THAT(decoded.type, ObjectType::BinaryOutput);
    EXPECT_THAT(decoded.instance, 10);

    // Proprietary type 700 and the largest instance.
    const auto proprietary = ObjectIdentifier::decode(0xAF3FFFFFU);
    EXPECT_THAT(static_cast<std::uint32_t>(proprietary.type), 700);
    EXPECT_THAT(proprietary.instance, ObjectIdentifier::MaxInstance);
}

TEST_F(TestObjectId, to_string)
{
    EXPECT_THAT((ObjectIdentifier{ObjectType::AnalogInput, 1}).toString(), "analogInput:1");
    EXPECT_THAT((ObjectIdentifier{ObjectType::Device, 4194303}).toString(), "device:4194303");
    EXPECT_THAT((ObjectIdentifier{ObjectType::Lift, 2}).toString(), "lift:2");
    EXPECT_THAT((ObjectIdentifier{static_cast<ObjectType>(700), 5}).toString(), "700:5");
}

TEST_F(TestObjectId, type_names)
{
    EXPECT_STREQ(objectTypeName(ObjectType::BinaryValue), "binaryValue");
    EXPECT_STREQ(objectTypeName(ObjectType::NetworkPort), "networkPort");
    EXPECT_THAT(objectTypeName(static_cast<ObjectType>(128)), IsNull());
}

TEST_F(TestObjectId, equality)
{
    EXPECT_TRUE((ObjectIdentifier{ObjectType::AnalogValue, 3}) == (ObjectIdentifier{ObjectType::AnalogValue, 3}));
    EXPECT_TRUE((ObjectIdentifier{ObjectType::AnalogValue, 3}) != (ObjectIdentifier{ObjectType::AnalogValue, 4}));
    EXPECT_TRUE((ObjectIdentifier{ObjectType::AnalogValue, 3}) != (ObjectIdentifier{ObjectType::AnalogInput, 3}));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
