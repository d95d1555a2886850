//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_COMMON_BACNET_ENCODING_HPP_INCLUDED
#define BACWALK_COMMON_BACNET_ENCODING_HPP_INCLUDED

#include "bacwalk/bacnet/object_id.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bacwalk
{
namespace common
{
namespace bacnet
{

using bacwalk::bacnet::ObjectIdentifier;
using bacwalk::bacnet::ObjectType;

using Bytes     = std::vector<std::uint8_t>;
using BytesView = cetl::span<const std::uint8_t>;

/// Application-tagged primitive values (ASHRAE 135, clause 20.2).
///
struct Null final
{};
struct Boolean final
{
    bool value;
};
struct Unsigned final
{
    std::uint64_t value;
};
struct Signed final
{
    std::int64_t value;
};
struct Real final
{
    float value;
};
struct Double final
{
    double value;
};
struct OctetString final
{
    Bytes bytes;
};
/// Always kept in UTF-8, whatever the character set on the wire was.
struct CharacterString final
{
    std::string text;
};
struct BitString final
{
    std::uint8_t unused_bits;
    Bytes        bytes;
};
struct Enumerated final
{
    std::uint32_t value;
};
/// Fields equal to 0xFF are "unspecified".
struct Date final
{
    std::uint8_t year_since_1900;
    std::uint8_t month;
    std::uint8_t day;
    std::uint8_t weekday;
};
struct Time final
{
    std::uint8_t hour;
    std::uint8_t minute;
    std::uint8_t second;
    std::uint8_t hundredths;
};

using Value = cetl::variant<Null,
                            Boolean,
                            Unsigned,
                            Signed,
                            Real,
                            Double,
                            OctetString,
                            CharacterString,
                            BitString,
                            Enumerated,
                            Date,
                            Time,
                            ObjectIdentifier>;

/// Gets the BACnet application datatype name of a value, f.e. "characterString".
const char* valueTypeName(const Value& value) noexcept;

enum class CharacterSet : std::uint8_t
{
    Utf8      = 0,
    Dbcs      = 1,
    Jis       = 2,
    Ucs4      = 3,
    Ucs2      = 4,
    Iso8859_1 = 5,
};

struct Tag final
{
    enum class Kind : std::uint8_t
    {
        Application,
        Context,
        Opening,
        Closing,
    };

    Kind         kind;
    std::uint8_t number;

    /// Content length in octets; for the application boolean it is the value itself.
    std::uint32_t length;

};  // Tag

/// Appends tagged values to a byte buffer.
///
class Encoder final
{
public:
    explicit Encoder(Bytes& buffer)
        : buffer_{buffer}
    {
    }

    void appValue(const Value& value);
    void appUnsigned(const std::uint64_t value);
    void appEnumerated(const std::uint32_t value);
    void appObjectId(const ObjectIdentifier& object_id);
    void appCharacterString(const std::string& utf8_text);

    void contextUnsigned(const std::uint8_t tag_number, const std::uint64_t value);
    void contextObjectId(const std::uint8_t tag_number, const ObjectIdentifier& object_id);
    void opening(const std::uint8_t tag_number);
    void closing(const std::uint8_t tag_number);

private:
    void app(const Null&);
    void app(const Boolean& boolean);
    void app(const Unsigned& value);
    void app(const Signed& value);
    void app(const Real& real);
    void app(const Double& real);
    void app(const OctetString& octets);
    void app(const CharacterString& string);
    void app(const BitString& bits);
    void app(const Enumerated& value);
    void app(const Date& date);
    void app(const Time& time);
    void app(const ObjectIdentifier& object_id);

    void tag(const std::uint8_t number, const bool is_context, const std::uint32_t length);
    void bigEndian(const std::uint64_t value, const std::size_t length);
    void bytes(const BytesView bytes);

    Bytes& buffer_;

};  // Encoder

/// Reads tagged values from a byte span.
///
/// Failed reads return `nullopt`/`false` and leave `error()` set to `EBADMSG` (malformed data)
/// or `ENOTSUP` (valid but unsupported encoding, f.e. a DBCS character string).
///
class Decoder final
{
public:
    explicit Decoder(const BytesView data)
        : data_{data}
    {
    }

    bool empty() const noexcept
    {
        return offset_ >= data_.size();
    }

    std::size_t offset() const noexcept
    {
        return offset_;
    }

    int error() const noexcept
    {
        return error_;
    }

    cetl::optional<Tag> peekTag() const;
    cetl::optional<Tag> readTag();

    bool nextIs(const Tag::Kind kind, const std::uint8_t number) const;
    bool readOpening(const std::uint8_t tag_number);
    bool readClosing(const std::uint8_t tag_number);

    cetl::optional<std::uint64_t>    readContextUnsigned(const std::uint8_t tag_number);
    cetl::optional<ObjectIdentifier> readContextObjectId(const std::uint8_t tag_number);

    cetl::optional<Value>            readAppValue();
    cetl::optional<std::uint64_t>    readAppUnsigned();
    cetl::optional<std::uint32_t>    readAppEnumerated();
    cetl::optional<ObjectIdentifier> readAppObjectId();

    /// Reads the raw octet, for the fixed (non-tagged) parts of PDU headers.
    cetl::optional<std::uint8_t> readOctet();

private:
    cetl::optional<Tag>           decodeTag(std::size_t& offset) const;
    cetl::optional<BytesView>     readContent(const std::uint32_t length);
    cetl::optional<std::uint64_t> readUnsignedContent(const std::uint32_t length);
    cetl::optional<Value>         readCharacterStringContent(const std::uint32_t length);

    template <typename T>
    cetl::optional<T> fail(const int error)
    {
        error_ = error;
        return cetl::nullopt;
    }

    BytesView   data_;
    std::size_t offset_{0};
    int         error_{0};

};  // Decoder

}  // namespace bacnet
}  // namespace common
}  // namespace bacwalk

#endif  // BACWALK_COMMON_BACNET_ENCODING_HPP_INCLUDED
