//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "bacnet/encoding.hpp"

#include <bacwalk/bacnet/object_id.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <string>

namespace
{

using namespace bacwalk::common::bacnet;  // NOLINT This our main concern here in the unit tests.

using testing::ElementsAre;
using testing::ElementsAreArray;
using testing::Optional;
using testing::SizeIs;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestEncoding : public testing::Test
{
protected:
    static Bytes encode(const Value& value)
    {
        Bytes   buffer;
        Encoder encoder{buffer};
        encoder.appValue(value);
        return buffer;
    }

    /// Decodes exactly one application value; the whole input is expected to be consumed.
    static cetl::optional<Value> decode(const Bytes& bytes, int* const error = nullptr)
    {
        Decoder decoder{{bytes.data(), bytes.size()}};
        auto    value = decoder.readAppValue();
        if (error != nullptr)
        {
            *error = decoder.error();
        }
        EXPECT_TRUE(!value || decoder.empty());
        return value;
    }

    static std::string decodeText(const Bytes& bytes)
    {
        const auto value = decode(bytes);
        EXPECT_TRUE(value.has_value());
        const auto* const text = value ? cetl::get_if<CharacterString>(&*value) : nullptr;
        EXPECT_THAT(text, testing::NotNull());
        return (text != nullptr) ? text->text : std::string{};
    }
};

// MARK: - Tests:

TEST_F(TestEncoding, application_primitives)
{
    EXPECT_THAT(encode(Null{}), ElementsAre(0x00));
    EXPECT_THAT(encode(Boolean{true}), ElementsAre(0x11));
    EXPECT_THAT(encode(Boolean{false}), ElementsAre(0x10));
    EXPECT_THAT(encode(Unsigned{42}), ElementsAre(0x21, 0x2A));
    EXPECT_THAT(encode(Unsigned{256}), ElementsAre(0x22, 0x01, 0x00));
    EXPECT_THAT(encode(Unsigned{0}), ElementsAre(0x21, 0x00));
    EXPECT_THAT(encode(Signed{-1}), ElementsAre(0x31, 0xFF));
    EXPECT_THAT(encode(Signed{128}), ElementsAre(0x32, 0x00, 0x80));
    EXPECT_THAT(encode(Real{1.0F}), ElementsAre(0x44, 0x3F, 0x80, 0x00, 0x00));
    EXPECT_THAT(encode(Enumerated{77}), ElementsAre(0x91, 0x4D));
    EXPECT_THAT(encode(Date{124, 3, 15, 5}), ElementsAre(0xA4, 124, 3, 15, 5));
    EXPECT_THAT(encode(ObjectIdentifier{ObjectType::Device, 42}), ElementsAre(0xC4, 0x02, 0x00, 0x00, 0x2A));
    EXPECT_THAT(encode(CharacterString{"Temp"}), ElementsAre(0x75, 0x05, 0x00, 'T', 'e', 'm', 'p'));
    EXPECT_THAT(encode(BitString{4, {0xF0}}), ElementsAre(0x82, 0x04, 0xF0));
}

TEST_F(TestEncoding, context_and_constructed_tags)
{
    Bytes   buffer;
    Encoder encoder{buffer};
    encoder.contextObjectId(0, {ObjectType::AnalogInput, 1});
    encoder.contextUnsigned(1, 77);
    encoder.opening(3);
    encoder.closing(3);
    encoder.contextUnsigned(20, 1);

    EXPECT_THAT(buffer, ElementsAre(0x0C, 0x00, 0x00, 0x00, 0x01, 0x19, 0x4D, 0x3E, 0x3F, 0xF9, 0x14, 0x01));

    Decoder decoder{{buffer.data(), buffer.size()}};
    EXPECT_THAT(decoder.readContextObjectId(0), Optional(ObjectIdentifier{ObjectType::AnalogInput, 1}));
    EXPECT_THAT(decoder.readContextUnsigned(1), Optional(77));
    EXPECT_TRUE(decoder.readOpening(3));
    EXPECT_TRUE(decoder.nextIs(Tag::Kind::Closing, 3));
    EXPECT_TRUE(decoder.readClosing(3));
    EXPECT_THAT(decoder.readContextUnsigned(20), Optional(1));
    EXPECT_TRUE(decoder.empty());
    EXPECT_THAT(decoder.error(), 0);
}

TEST_F(TestEncoding, unexpected_context_tag)
{
    const Bytes bytes{0x19, 0x4D};

    Decoder decoder{{bytes.data(), bytes.size()}};
    EXPECT_FALSE(decoder.readContextUnsigned(2).has_value());
    EXPECT_THAT(decoder.error(), EBADMSG);
    EXPECT_THAT(decoder.offset(), 0);

    int error = 0;
    EXPECT_FALSE(decode(bytes, &error).has_value());
    EXPECT_THAT(error, EBADMSG);
}

TEST_F(TestEncoding, decode_primitives)
{
    const auto signed_value = decode({0x31, 0xFF});
    ASSERT_TRUE(signed_value.has_value());
    EXPECT_THAT(cetl::get<Signed>(*signed_value).value, -1);

    const auto negative = decode({0x32, 0xFF, 0x7F});
    ASSERT_TRUE(negative.has_value());
    EXPECT_THAT(cetl::get<Signed>(*negative).value, -129);

    const auto real = decode({0x44, 0x3F, 0x80, 0x00, 0x00});
    ASSERT_TRUE(real.has_value());
    EXPECT_FLOAT_EQ(cetl::get<Real>(*real).value, 1.0F);

    const auto boolean = decode({0x11});
    ASSERT_TRUE(boolean.has_value());
    EXPECT_TRUE(cetl::get<Boolean>(*boolean).value);

    const auto object_id = decode({0xC4, 0x01, 0x00, 0x00, 0x02});
    ASSERT_TRUE(object_id.has_value());
    EXPECT_THAT(cetl::get<ObjectIdentifier>(*object_id), (ObjectIdentifier{ObjectType::BinaryOutput, 2}));
}

TEST_F(TestEncoding, character_sets)
{
    EXPECT_THAT(decodeText({0x75, 0x05, 0x00, 'T', 'e', 'm', 'p'}), "Temp");

    // ISO 8859-1 "café"
    EXPECT_THAT(decodeText({0x75, 0x05, 0x05, 'c', 'a', 'f', 0xE9}), "caf\xC3\xA9");

    // UCS-2 "AB"
    EXPECT_THAT(decodeText({0x75, 0x05, 0x04, 0x00, 'A', 0x00, 'B'}), "AB");

    // UCS-4 euro sign
    EXPECT_THAT(decodeText({0x75, 0x05, 0x03, 0x00, 0x00, 0x20, 0xAC}), "\xE2\x82\xAC");

    // Trailing NUL padding is dropped.
    EXPECT_THAT(decodeText({0x74, 0x00, 'A', 0x00, 0x00}), "A");

    // Empty string still carries the character set octet.
    EXPECT_THAT(decodeText({0x71, 0x00}), "");
}

TEST_F(TestEncoding, unsupported_character_set)
{
    int error = 0;
    EXPECT_FALSE(decode({0x73, 0x01, 0x82, 0xA0}, &error).has_value());
    EXPECT_THAT(error, ENOTSUP);

    EXPECT_FALSE(decode({0x72, 0x04, 0x00}, &error).has_value());
    EXPECT_THAT(error, EBADMSG);
}

TEST_F(TestEncoding, extended_length)
{
    const std::string long_text(300, 'x');

    const auto bytes = encode(CharacterString{long_text});
    ASSERT_THAT(bytes, SizeIs(4 + 301));
    EXPECT_THAT(bytes[0], 0x75);
    EXPECT_THAT(bytes[1], 254);
    EXPECT_THAT(bytes[2], 0x01);
    EXPECT_THAT(bytes[3], 0x2D);

    EXPECT_THAT(decodeText(bytes), long_text);
}

TEST_F(TestEncoding, malformed_values)
{
    int error = 0;

    // Truncated content.
    EXPECT_FALSE(decode({0x22, 0x01}, &error).has_value());
    EXPECT_THAT(error, EBADMSG);

    // Reserved application tag.
    EXPECT_FALSE(decode({0xD0}, &error).has_value());
    EXPECT_THAT(error, EBADMSG);

    // Object identifier of a wrong size.
    EXPECT_FALSE(decode({0xC3, 0x00, 0x00, 0x01}, &error).has_value());
    EXPECT_THAT(error, EBADMSG);

    // Zero length unsigned.
    EXPECT_FALSE(decode({0x20}, &error).has_value());
    EXPECT_THAT(error, EBADMSG);

    // Opening tag with application class.
    EXPECT_FALSE(decode({0x36}, &error).has_value());
    EXPECT_THAT(error, EBADMSG);

    // Missing extended length octets.
    EXPECT_FALSE(decode({0x75, 0xFE, 0x01}, &error).has_value());
    EXPECT_THAT(error, EBADMSG);
}

TEST_F(TestEncoding, value_type_names)
{
    EXPECT_STREQ(valueTypeName(Unsigned{1}), "unsigned");
    EXPECT_STREQ(valueTypeName(CharacterString{"x"}), "characterString");
    EXPECT_STREQ(valueTypeName(ObjectIdentifier{ObjectType::Device, 1}), "objectIdentifier");
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
