//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "encoding.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <utility>

namespace bacwalk
{
namespace common
{
namespace bacnet
{
namespace
{

// Application tag numbers (clause 20.2.1.4).
enum AppTag : std::uint8_t
{
    AppTagNull            = 0,
    AppTagBoolean         = 1,
    AppTagUnsigned        = 2,
    AppTagSigned          = 3,
    AppTagReal            = 4,
    AppTagDouble          = 5,
    AppTagOctetString     = 6,
    AppTagCharacterString = 7,
    AppTagBitString       = 8,
    AppTagEnumerated      = 9,
    AppTagDate            = 10,
    AppTagTime            = 11,
    AppTagObjectId        = 12,
};

constexpr std::uint8_t ClassContextBit   = 0x08;
constexpr std::uint8_t LvtMask           = 0x07;
constexpr std::uint8_t LvtExtended       = 5;
constexpr std::uint8_t LvtOpening        = 6;
constexpr std::uint8_t LvtClosing        = 7;
constexpr std::uint8_t TagNumberExtended = 0x0F;
constexpr std::uint8_t MaxInlineTag      = 14;
constexpr std::uint8_t MaxInlineLength   = 4;
constexpr std::uint8_t LengthExtended16  = 254;
constexpr std::uint8_t LengthExtended32  = 255;

std::size_t minimalUnsignedLength(const std::uint64_t value)
{
    std::size_t length = 1;
    while ((length < sizeof(value)) && ((value >> (length * 8U)) != 0))
    {
        ++length;
    }
    return length;
}

std::size_t minimalSignedLength(const std::int64_t value)
{
    std::size_t length = 1;
    while (length < sizeof(value))
    {
        const auto limit = static_cast<std::int64_t>(1) << ((length * 8U) - 1U);
        if ((value >= -limit) && (value < limit))
        {
            break;
        }
        ++length;
    }
    return length;
}

void appendUtf8(std::string& out, const std::uint32_t code_point)
{
    // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
    if (code_point < 0x80)
    {
        out.push_back(static_cast<char>(code_point));
    }
    else if (code_point < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
    else if (code_point < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | ((code_point >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
    // NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
}

std::uint64_t bigEndianValue(const BytesView bytes)
{
    std::uint64_t value = 0;
    for (const auto byte : bytes)
    {
        value = (value << 8U) | byte;
    }
    return value;
}

struct ValueTypeName
{
    const char* operator()(const Null&) const
    {
        return "null";
    }
    const char* operator()(const Boolean&) const
    {
        return "boolean";
    }
    const char* operator()(const Unsigned&) const
    {
        return "unsigned";
    }
    const char* operator()(const Signed&) const
    {
        return "signed";
    }
    const char* operator()(const Real&) const
    {
        return "real";
    }
    const char* operator()(const Double&) const
    {
        return "double";
    }
    const char* operator()(const OctetString&) const
    {
        return "octetString";
    }
    const char* operator()(const CharacterString&) const
    {
        return "characterString";
    }
    const char* operator()(const BitString&) const
    {
        return "bitString";
    }
    const char* operator()(const Enumerated&) const
    {
        return "enumerated";
    }
    const char* operator()(const Date&) const
    {
        return "date";
    }
    const char* operator()(const Time&) const
    {
        return "time";
    }
    const char* operator()(const ObjectIdentifier&) const
    {
        return "objectIdentifier";
    }

};  // ValueTypeName

}  // namespace

const char* valueTypeName(const Value& value) noexcept
{
    return cetl::visit(ValueTypeName{}, value);
}

// MARK: - Encoder

void Encoder::appValue(const Value& value)
{
    cetl::visit([this](const auto& primitive) { app(primitive); }, value);
}

void Encoder::appUnsigned(const std::uint64_t value)
{
    const auto length = minimalUnsignedLength(value);
    tag(AppTagUnsigned, false, static_cast<std::uint32_t>(length));
    bigEndian(value, length);
}

void Encoder::appEnumerated(const std::uint32_t value)
{
    const auto length = minimalUnsignedLength(value);
    tag(AppTagEnumerated, false, static_cast<std::uint32_t>(length));
    bigEndian(value, length);
}

void Encoder::appObjectId(const ObjectIdentifier& object_id)
{
    tag(AppTagObjectId, false, 4);
    bigEndian(object_id.encode(), 4);
}

void Encoder::appCharacterString(const std::string& utf8_text)
{
    tag(AppTagCharacterString, false, static_cast<std::uint32_t>(utf8_text.size() + 1));
    buffer_.push_back(static_cast<std::uint8_t>(CharacterSet::Utf8));
    buffer_.insert(buffer_.end(), utf8_text.begin(), utf8_text.end());
}

void Encoder::contextUnsigned(const std::uint8_t tag_number, const std::uint64_t value)
{
    const auto length = minimalUnsignedLength(value);
    tag(tag_number, true, static_cast<std::uint32_t>(length));
    bigEndian(value, length);
}

void Encoder::contextObjectId(const std::uint8_t tag_number, const ObjectIdentifier& object_id)
{
    tag(tag_number, true, 4);
    bigEndian(object_id.encode(), 4);
}

void Encoder::opening(const std::uint8_t tag_number)
{
    tag(tag_number, true, 0);
    buffer_[buffer_.size() - ((tag_number > MaxInlineTag) ? 2 : 1)] |= LvtOpening;
}

void Encoder::closing(const std::uint8_t tag_number)
{
    tag(tag_number, true, 0);
    buffer_[buffer_.size() - ((tag_number > MaxInlineTag) ? 2 : 1)] |= LvtClosing;
}

void Encoder::app(const Null&)
{
    tag(AppTagNull, false, 0);
}

void Encoder::app(const Boolean& boolean)
{
    // The application boolean carries its value in the length field.
    tag(AppTagBoolean, false, boolean.value ? 1 : 0);
}

void Encoder::app(const Unsigned& value)
{
    appUnsigned(value.value);
}

void Encoder::app(const Signed& value)
{
    const auto length = minimalSignedLength(value.value);
    tag(AppTagSigned, false, static_cast<std::uint32_t>(length));
    bigEndian(static_cast<std::uint64_t>(value.value), length);
}

void Encoder::app(const Real& real)
{
    std::uint32_t raw = 0;
    static_assert(sizeof(raw) == sizeof(real.value), "IEEE-754 single precision is expected.");
    std::memcpy(&raw, &real.value, sizeof(raw));
    tag(AppTagReal, false, sizeof(raw));
    bigEndian(raw, sizeof(raw));
}

void Encoder::app(const Double& real)
{
    std::uint64_t raw = 0;
    static_assert(sizeof(raw) == sizeof(real.value), "IEEE-754 double precision is expected.");
    std::memcpy(&raw, &real.value, sizeof(raw));
    tag(AppTagDouble, false, sizeof(raw));
    bigEndian(raw, sizeof(raw));
}

void Encoder::app(const OctetString& octets)
{
    tag(AppTagOctetString, false, static_cast<std::uint32_t>(octets.bytes.size()));
    bytes({octets.bytes.data(), octets.bytes.size()});
}

void Encoder::app(const CharacterString& string)
{
    appCharacterString(string.text);
}

void Encoder::app(const BitString& bits)
{
    tag(AppTagBitString, false, static_cast<std::uint32_t>(bits.bytes.size() + 1));
    buffer_.push_back(bits.unused_bits);
    bytes({bits.bytes.data(), bits.bytes.size()});
}

void Encoder::app(const Enumerated& value)
{
    appEnumerated(value.value);
}

void Encoder::app(const Date& date)
{
    tag(AppTagDate, false, 4);
    buffer_.insert(buffer_.end(), {date.year_since_1900, date.month, date.day, date.weekday});
}

void Encoder::app(const Time& time)
{
    tag(AppTagTime, false, 4);
    buffer_.insert(buffer_.end(), {time.hour, time.minute, time.second, time.hundredths});
}

void Encoder::app(const ObjectIdentifier& object_id)
{
    appObjectId(object_id);
}

void Encoder::tag(const std::uint8_t number, const bool is_context, const std::uint32_t length)
{
    std::uint8_t initial = is_context ? ClassContextBit : 0;
    initial |= (number <= MaxInlineTag) ? static_cast<std::uint8_t>(number << 4U)
                                        : static_cast<std::uint8_t>(TagNumberExtended << 4U);
    initial |= (length <= MaxInlineLength) ? static_cast<std::uint8_t>(length) : LvtExtended;

    buffer_.push_back(initial);
    if (number > MaxInlineTag)
    {
        buffer_.push_back(number);
    }

    if (length > MaxInlineLength)
    {
        if (length < LengthExtended16)
        {
            buffer_.push_back(static_cast<std::uint8_t>(length));
        }
        else if (length <= std::numeric_limits<std::uint16_t>::max())
        {
            buffer_.push_back(LengthExtended16);
            bigEndian(length, 2);
        }
        else
        {
            buffer_.push_back(LengthExtended32);
            bigEndian(length, 4);
        }
    }
}

void Encoder::bigEndian(const std::uint64_t value, const std::size_t length)
{
    for (std::size_t index = length; index > 0; --index)
    {
        buffer_.push_back(static_cast<std::uint8_t>(value >> ((index - 1) * 8U)));
    }
}

void Encoder::bytes(const BytesView content)
{
    buffer_.insert(buffer_.end(), content.begin(), content.end());
}

// MARK: - Decoder

cetl::optional<Tag> Decoder::peekTag() const
{
    std::size_t offset = offset_;
    return decodeTag(offset);
}

cetl::optional<Tag> Decoder::readTag()
{
    std::size_t offset = offset_;
    const auto  tag    = decodeTag(offset);
    if (!tag)
    {
        return fail<Tag>(EBADMSG);
    }
    offset_ = offset;
    return tag;
}

bool Decoder::nextIs(const Tag::Kind kind, const std::uint8_t number) const
{
    const auto tag = peekTag();
    return tag && (tag->kind == kind) && (tag->number == number);
}

bool Decoder::readOpening(const std::uint8_t tag_number)
{
    if (!nextIs(Tag::Kind::Opening, tag_number))
    {
        error_ = EBADMSG;
        return false;
    }
    return readTag().has_value();
}

bool Decoder::readClosing(const std::uint8_t tag_number)
{
    if (!nextIs(Tag::Kind::Closing, tag_number))
    {
        error_ = EBADMSG;
        return false;
    }
    return readTag().has_value();
}

cetl::optional<std::uint64_t> Decoder::readContextUnsigned(const std::uint8_t tag_number)
{
    if (!nextIs(Tag::Kind::Context, tag_number))
    {
        return fail<std::uint64_t>(EBADMSG);
    }
    const auto tag = readTag();
    return readUnsignedContent(tag->length);
}

cetl::optional<ObjectIdentifier> Decoder::readContextObjectId(const std::uint8_t tag_number)
{
    if (!nextIs(Tag::Kind::Context, tag_number))
    {
        return fail<ObjectIdentifier>(EBADMSG);
    }
    const auto tag = readTag();
    if (tag->length != 4)
    {
        return fail<ObjectIdentifier>(EBADMSG);
    }
    const auto raw = readUnsignedContent(tag->length);
    if (!raw)
    {
        return cetl::nullopt;
    }
    return ObjectIdentifier::decode(static_cast<std::uint32_t>(*raw));
}

cetl::optional<Value> Decoder::readAppValue()
{
    const auto tag = readTag();
    if (!tag)
    {
        return cetl::nullopt;
    }
    if (tag->kind != Tag::Kind::Application)
    {
        return fail<Value>(EBADMSG);
    }

    const auto length = tag->length;
    switch (tag->number)
    {
    case AppTagNull: {
        if (length != 0)
        {
            return fail<Value>(EBADMSG);
        }
        return Value{Null{}};
    }
    case AppTagBoolean: {
        if (length > 1)
        {
            return fail<Value>(EBADMSG);
        }
        return Value{Boolean{length == 1}};
    }
    case AppTagUnsigned: {
        const auto value = readUnsignedContent(length);
        if (!value)
        {
            return cetl::nullopt;
        }
        return Value{Unsigned{*value}};
    }
    case AppTagSigned: {
        const auto raw = readUnsignedContent(length);
        if (!raw)
        {
            return cetl::nullopt;
        }
        // Sign-extend from the most significant content bit.
        const auto shift = static_cast<unsigned>((sizeof(std::uint64_t) - length) * 8U);
        return Value{Signed{static_cast<std::int64_t>(*raw << shift) >> shift}};
    }
    case AppTagReal: {
        const auto raw = (length == sizeof(float)) ? readUnsignedContent(length) : fail<std::uint64_t>(EBADMSG);
        if (!raw)
        {
            return cetl::nullopt;
        }
        const auto raw32 = static_cast<std::uint32_t>(*raw);
        Real       real{};
        std::memcpy(&real.value, &raw32, sizeof(raw32));
        return Value{real};
    }
    case AppTagDouble: {
        const auto raw = (length == sizeof(double)) ? readUnsignedContent(length) : fail<std::uint64_t>(EBADMSG);
        if (!raw)
        {
            return cetl::nullopt;
        }
        Double real{};
        std::memcpy(&real.value, &*raw, sizeof(real.value));
        return Value{real};
    }
    case AppTagOctetString: {
        const auto content = readContent(length);
        if (!content)
        {
            return cetl::nullopt;
        }
        return Value{OctetString{Bytes{content->begin(), content->end()}}};
    }
    case AppTagCharacterString: {
        return readCharacterStringContent(length);
    }
    case AppTagBitString: {
        const auto content = readContent(length);
        if (!content || content->empty() || ((*content)[0] > 7))
        {
            return fail<Value>(EBADMSG);
        }
        return Value{BitString{(*content)[0], Bytes{content->begin() + 1, content->end()}}};
    }
    case AppTagEnumerated: {
        if (length > sizeof(std::uint32_t))
        {
            return fail<Value>(EBADMSG);
        }
        const auto value = readUnsignedContent(length);
        if (!value)
        {
            return cetl::nullopt;
        }
        return Value{Enumerated{static_cast<std::uint32_t>(*value)}};
    }
    case AppTagDate:
    case AppTagTime: {
        const auto content = (length == 4) ? readContent(length) : fail<BytesView>(EBADMSG);
        if (!content)
        {
            return cetl::nullopt;
        }
        const auto& c = *content;
        if (tag->number == AppTagDate)
        {
            return Value{Date{c[0], c[1], c[2], c[3]}};
        }
        return Value{Time{c[0], c[1], c[2], c[3]}};
    }
    case AppTagObjectId: {
        const auto raw = (length == 4) ? readUnsignedContent(length) : fail<std::uint64_t>(EBADMSG);
        if (!raw)
        {
            return cetl::nullopt;
        }
        return Value{ObjectIdentifier::decode(static_cast<std::uint32_t>(*raw))};
    }
    default: {
        // Reserved application tags (13..15).
        return fail<Value>(EBADMSG);
    }
    }
}

cetl::optional<std::uint64_t> Decoder::readAppUnsigned()
{
    const auto value = readAppValue();
    if (!value)
    {
        return cetl::nullopt;
    }
    if (const auto* const unsigned_value = cetl::get_if<Unsigned>(&*value))
    {
        return unsigned_value->value;
    }
    return fail<std::uint64_t>(EBADMSG);
}

cetl::optional<std::uint32_t> Decoder::readAppEnumerated()
{
    const auto value = readAppValue();
    if (!value)
    {
        return cetl::nullopt;
    }
    if (const auto* const enumerated = cetl::get_if<Enumerated>(&*value))
    {
        return enumerated->value;
    }
    return fail<std::uint32_t>(EBADMSG);
}

cetl::optional<ObjectIdentifier> Decoder::readAppObjectId()
{
    const auto value = readAppValue();
    if (!value)
    {
        return cetl::nullopt;
    }
    if (const auto* const object_id = cetl::get_if<ObjectIdentifier>(&*value))
    {
        return *object_id;
    }
    return fail<ObjectIdentifier>(EBADMSG);
}

cetl::optional<std::uint8_t> Decoder::readOctet()
{
    if (empty())
    {
        return fail<std::uint8_t>(EBADMSG);
    }
    return data_[offset_++];
}

cetl::optional<Tag> Decoder::decodeTag(std::size_t& offset) const
{
    if (offset >= data_.size())
    {
        return cetl::nullopt;
    }

    const std::uint8_t initial    = data_[offset++];
    std::uint8_t       number     = initial >> 4U;
    const bool         is_context = (initial & ClassContextBit) != 0;
    const std::uint8_t lvt        = initial & LvtMask;

    if (number == TagNumberExtended)
    {
        if (offset >= data_.size())
        {
            return cetl::nullopt;
        }
        number = data_[offset++];
        if (number == std::numeric_limits<std::uint8_t>::max())
        {
            return cetl::nullopt;
        }
    }

    if ((lvt == LvtOpening) || (lvt == LvtClosing))
    {
        // Only context tags may open or close a constructed value.
        if (!is_context)
        {
            return cetl::nullopt;
        }
        return Tag{(lvt == LvtOpening) ? Tag::Kind::Opening : Tag::Kind::Closing, number, 0};
    }

    std::uint32_t length = lvt;
    if (lvt == LvtExtended)
    {
        if (offset >= data_.size())
        {
            return cetl::nullopt;
        }
        const std::uint8_t extended = data_[offset++];

        std::size_t extra = 0;
        if (extended == LengthExtended16)
        {
            extra = 2;
        }
        else if (extended == LengthExtended32)
        {
            extra = 4;
        }

        if (extra == 0)
        {
            length = extended;
        }
        else
        {
            if ((data_.size() - offset) < extra)
            {
                return cetl::nullopt;
            }
            length = static_cast<std::uint32_t>(bigEndianValue(data_.subspan(offset, extra)));
            offset += extra;
        }
    }

    return Tag{is_context ? Tag::Kind::Context : Tag::Kind::Application, number, length};
}

cetl::optional<BytesView> Decoder::readContent(const std::uint32_t length)
{
    if ((data_.size() - offset_) < length)
    {
        return fail<BytesView>(EBADMSG);
    }
    const auto content = data_.subspan(offset_, length);
    offset_ += length;
    return content;
}

cetl::optional<std::uint64_t> Decoder::readUnsignedContent(const std::uint32_t length)
{
    if ((length == 0) || (length > sizeof(std::uint64_t)))
    {
        return fail<std::uint64_t>(EBADMSG);
    }
    const auto content = readContent(length);
    if (!content)
    {
        return cetl::nullopt;
    }
    return bigEndianValue(*content);
}

cetl::optional<Value> Decoder::readCharacterStringContent(const std::uint32_t length)
{
    const auto content = readContent(length);
    if (!content || content->empty())
    {
        return fail<Value>(EBADMSG);
    }

    const auto  charset = static_cast<CharacterSet>((*content)[0]);
    const auto  text    = content->subspan(1);
    std::string utf8;
    switch (charset)
    {
    case CharacterSet::Utf8: {
        utf8.assign(text.begin(), text.end());
        break;
    }
    case CharacterSet::Iso8859_1: {
        for (const auto byte : text)
        {
            appendUtf8(utf8, byte);
        }
        break;
    }
    case CharacterSet::Ucs2: {
        if ((text.size() % 2) != 0)
        {
            return fail<Value>(EBADMSG);
        }
        for (std::size_t index = 0; index < text.size(); index += 2)
        {
            appendUtf8(utf8, static_cast<std::uint32_t>(bigEndianValue(text.subspan(index, 2))));
        }
        break;
    }
    case CharacterSet::Ucs4: {
        if ((text.size() % 4) != 0)
        {
            return fail<Value>(EBADMSG);
        }
        for (std::size_t index = 0; index < text.size(); index += 4)
        {
            appendUtf8(utf8, static_cast<std::uint32_t>(bigEndianValue(text.subspan(index, 4))));
        }
        break;
    }
    default: {
        return fail<Value>(ENOTSUP);
    }
    }

    // Some devices pad names with trailing NULs.
    while (!utf8.empty() && (utf8.back() == '\0'))
    {
        utf8.pop_back();
    }

    return Value{CharacterString{std::move(utf8)}};
}

}  // namespace bacnet
}  // namespace common
}  // namespace bacwalk
