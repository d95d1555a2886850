//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "apdu.hpp"

#include "encoding.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace bacwalk
{
namespace common
{
namespace bacnet
{
namespace
{

constexpr std::uint8_t PduTypeShift    = 4;
constexpr std::uint8_t FlagSegmented   = 0x08;
constexpr std::uint8_t FlagAbortServer = 0x01;
constexpr std::uint8_t MaxApduCode1024 = 4;

// Context tags of the ReadProperty service (clause 15.5.1).
constexpr std::uint8_t TagObjectId   = 0;
constexpr std::uint8_t TagProperty   = 1;
constexpr std::uint8_t TagArrayIndex = 2;
constexpr std::uint8_t TagValue      = 3;

// Context tags of the Who-Is service (clause 16.10.1).
constexpr std::uint8_t TagLowLimit  = 0;
constexpr std::uint8_t TagHighLimit = 1;

static_assert(MaxApduLengthAccepted == 1024, "Keep in sync with `MaxApduCode1024`.");

std::uint8_t pduHeaderOctet(const PduType type, const std::uint8_t flags = 0)
{
    return static_cast<std::uint8_t>((static_cast<std::uint8_t>(type) << PduTypeShift) | flags);
}

template <std::size_t N>
std::string nameOrNumber(const std::array<const char*, N>& names, const std::uint32_t value)
{
    if (value < names.size())
    {
        return names[value];  // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
    }
    return std::to_string(value);
}

DecodeResult::Var failureOf(const Decoder& decoder)
{
    return (decoder.error() != 0) ? decoder.error() : EBADMSG;
}

cetl::optional<ReadPropertyRequest> readPropertyReference(Decoder& decoder)
{
    const auto object_id = decoder.readContextObjectId(TagObjectId);
    const auto property  = object_id ? decoder.readContextUnsigned(TagProperty) : cetl::nullopt;
    if (!property)
    {
        return cetl::nullopt;
    }

    ReadPropertyRequest reference{*object_id, static_cast<PropertyIdentifier>(*property), cetl::nullopt};
    if (decoder.nextIs(Tag::Kind::Context, TagArrayIndex))
    {
        const auto index = decoder.readContextUnsigned(TagArrayIndex);
        if (!index)
        {
            return cetl::nullopt;
        }
        reference.array_index = static_cast<std::uint32_t>(*index);
    }
    return reference;
}

void writePropertyReference(Encoder& encoder, const ReadPropertyRequest& reference)
{
    encoder.contextObjectId(TagObjectId, reference.object_id);
    encoder.contextUnsigned(TagProperty, static_cast<std::uint32_t>(reference.property));
    if (reference.array_index)
    {
        encoder.contextUnsigned(TagArrayIndex, *reference.array_index);
    }
}

DecodeResult::Var decodeUnconfirmed(const std::uint8_t service, Decoder& decoder)
{
    switch (static_cast<ServiceChoice>(service))
    {
    case ServiceChoice::WhoIs: {
        WhoIsRequest request{};
        if (!decoder.empty())
        {
            const auto low  = decoder.readContextUnsigned(TagLowLimit);
            const auto high = low ? decoder.readContextUnsigned(TagHighLimit) : cetl::nullopt;
            if (!high || !decoder.empty())
            {
                return failureOf(decoder);
            }
            request.low_limit  = static_cast<std::uint32_t>(*low);
            request.high_limit = static_cast<std::uint32_t>(*high);
        }
        return Apdu{request};
    }
    case ServiceChoice::IAm: {
        const auto device       = decoder.readAppObjectId();
        const auto max_apdu     = device ? decoder.readAppUnsigned() : cetl::nullopt;
        const auto segmentation = max_apdu ? decoder.readAppEnumerated() : cetl::nullopt;
        const auto vendor_id    = segmentation ? decoder.readAppUnsigned() : cetl::nullopt;
        if (!vendor_id)
        {
            return failureOf(decoder);
        }
        return Apdu{IAmRequest{*device,
                               static_cast<std::uint32_t>(*max_apdu),
                               *segmentation,
                               static_cast<std::uint32_t>(*vendor_id)}};
    }
    default: {
        return Apdu{OtherPdu{PduType::UnconfirmedRequest, cetl::nullopt, service}};
    }
    }
}

DecodeResult::Var decodeReadPropertyAck(const std::uint8_t invoke_id, Decoder& decoder)
{
    const auto reference = readPropertyReference(decoder);
    if (!reference || !decoder.readOpening(TagValue))
    {
        return failureOf(decoder);
    }

    ReadPropertyAck ack{invoke_id, reference->object_id, reference->property, reference->array_index, {}};
    while (!decoder.nextIs(Tag::Kind::Closing, TagValue))
    {
        auto value = decoder.readAppValue();
        if (!value)
        {
            return failureOf(decoder);
        }
        ack.values.push_back(std::move(*value));
    }
    if (!decoder.readClosing(TagValue) || !decoder.empty())
    {
        return failureOf(decoder);
    }

    return Apdu{std::move(ack)};
}

DecodeResult::Var decodeError(const ApduHeader& header, Decoder& decoder)
{
    // Some services wrap the error into a constructed value.
    const bool is_wrapped = decoder.nextIs(Tag::Kind::Opening, 0);
    if (is_wrapped && !decoder.readOpening(0))
    {
        return failureOf(decoder);
    }

    const auto error_class = decoder.readAppEnumerated();
    const auto error_code  = error_class ? decoder.readAppEnumerated() : cetl::nullopt;
    if (!error_code || (is_wrapped && !decoder.readClosing(0)))
    {
        return failureOf(decoder);
    }

    return Apdu{ErrorPdu{*header.invoke_id, *header.service, *error_class, *error_code}};
}

}  // namespace

std::string propertyName(const PropertyIdentifier property)
{
    switch (property)
    {
    case PropertyIdentifier::ObjectList:
        return "objectList";
    case PropertyIdentifier::ObjectName:
        return "objectName";
    default:
        return std::to_string(static_cast<std::uint32_t>(property));
    }
}

cetl::optional<ApduHeader> peekApduHeader(const BytesView apdu)
{
    if (apdu.empty())
    {
        return cetl::nullopt;
    }

    const std::uint8_t first     = apdu[0];
    const auto         type      = static_cast<PduType>(first >> PduTypeShift);
    const bool         segmented = (first & FlagSegmented) != 0;

    ApduHeader header{type, false, cetl::nullopt, cetl::nullopt};
    switch (type)
    {
    case PduType::ConfirmedRequest: {
        // type+flags, max segments/APDU, invoke id, [sequence number, window size], service
        header.segmented                 = segmented;
        const std::size_t service_offset = segmented ? 5 : 3;
        if (apdu.size() <= service_offset)
        {
            return cetl::nullopt;
        }
        header.invoke_id = apdu[2];
        header.service   = apdu[service_offset];
        break;
    }
    case PduType::UnconfirmedRequest: {
        if (apdu.size() < 2)
        {
            return cetl::nullopt;
        }
        header.service = apdu[1];
        break;
    }
    case PduType::SimpleAck:
    case PduType::Error: {
        if (apdu.size() < 3)
        {
            return cetl::nullopt;
        }
        header.invoke_id = apdu[1];
        header.service   = apdu[2];
        break;
    }
    case PduType::ComplexAck: {
        // type+flags, invoke id, [sequence number, window size], service
        header.segmented                 = segmented;
        const std::size_t service_offset = segmented ? 4 : 2;
        if (apdu.size() <= service_offset)
        {
            return cetl::nullopt;
        }
        header.invoke_id = apdu[1];
        header.service   = apdu[service_offset];
        break;
    }
    case PduType::SegmentAck:
    case PduType::Reject:
    case PduType::Abort: {
        if (apdu.size() < 3)
        {
            return cetl::nullopt;
        }
        header.invoke_id = apdu[1];
        break;
    }
    default: {
        return cetl::nullopt;
    }
    }
    return header;
}

DecodeResult::Var decodeApdu(const BytesView apdu)
{
    const auto header = peekApduHeader(apdu);
    if (!header)
    {
        return EBADMSG;
    }

    switch (header->type)
    {
    case PduType::ConfirmedRequest: {
        if (header->segmented || (static_cast<ServiceChoice>(*header->service) != ServiceChoice::ReadProperty))
        {
            return Apdu{OtherPdu{header->type, header->invoke_id, header->service}};
        }
        Decoder    decoder{apdu.subspan(4)};
        const auto request = readPropertyReference(decoder);
        if (!request || !decoder.empty())
        {
            return failureOf(decoder);
        }
        return Apdu{ConfirmedReadProperty{*header->invoke_id, *request}};
    }
    case PduType::UnconfirmedRequest: {
        Decoder decoder{apdu.subspan(2)};
        return decodeUnconfirmed(*header->service, decoder);
    }
    case PduType::SimpleAck: {
        return Apdu{SimpleAck{*header->invoke_id, *header->service}};
    }
    case PduType::ComplexAck: {
        if (header->segmented)
        {
            return Apdu{SegmentedAck{*header->invoke_id, *header->service}};
        }
        if (static_cast<ServiceChoice>(*header->service) != ServiceChoice::ReadProperty)
        {
            return Apdu{OtherPdu{header->type, header->invoke_id, header->service}};
        }
        Decoder decoder{apdu.subspan(3)};
        return decodeReadPropertyAck(*header->invoke_id, decoder);
    }
    case PduType::Error: {
        Decoder decoder{apdu.subspan(3)};
        return decodeError(*header, decoder);
    }
    case PduType::Reject: {
        return Apdu{RejectPdu{*header->invoke_id, apdu[2]}};
    }
    case PduType::Abort: {
        return Apdu{AbortPdu{(apdu[0] & FlagAbortServer) != 0, *header->invoke_id, apdu[2]}};
    }
    default: {
        return Apdu{OtherPdu{header->type, header->invoke_id, header->service}};
    }
    }
}

void encodeWhoIs(const WhoIsRequest& request, Bytes& out)
{
    CETL_DEBUG_ASSERT(request.low_limit.has_value() == request.high_limit.has_value(), "Limits go in pairs.");

    out.push_back(pduHeaderOctet(PduType::UnconfirmedRequest));
    out.push_back(static_cast<std::uint8_t>(ServiceChoice::WhoIs));
    if (request.low_limit && request.high_limit)
    {
        Encoder encoder{out};
        encoder.contextUnsigned(TagLowLimit, *request.low_limit);
        encoder.contextUnsigned(TagHighLimit, *request.high_limit);
    }
}

void encodeIAm(const IAmRequest& request, Bytes& out)
{
    out.push_back(pduHeaderOctet(PduType::UnconfirmedRequest));
    out.push_back(static_cast<std::uint8_t>(ServiceChoice::IAm));

    Encoder encoder{out};
    encoder.appObjectId(request.device);
    encoder.appUnsigned(request.max_apdu_length);
    encoder.appEnumerated(request.segmentation);
    encoder.appUnsigned(request.vendor_id);
}

void encodeReadProperty(const std::uint8_t invoke_id, const ReadPropertyRequest& request, Bytes& out)
{
    // Segmented responses are not accepted, hence no "SA" flag, and zero "max segments".
    out.push_back(pduHeaderOctet(PduType::ConfirmedRequest));
    out.push_back(MaxApduCode1024);
    out.push_back(invoke_id);
    out.push_back(static_cast<std::uint8_t>(ServiceChoice::ReadProperty));

    Encoder encoder{out};
    writePropertyReference(encoder, request);
}

void encodeReadPropertyAck(const ReadPropertyAck& ack, Bytes& out)
{
    out.push_back(pduHeaderOctet(PduType::ComplexAck));
    out.push_back(ack.invoke_id);
    out.push_back(static_cast<std::uint8_t>(ServiceChoice::ReadProperty));

    Encoder encoder{out};
    writePropertyReference(encoder, {ack.object_id, ack.property, ack.array_index});
    encoder.opening(TagValue);
    for (const auto& value : ack.values)
    {
        encoder.appValue(value);
    }
    encoder.closing(TagValue);
}

void encodeError(const ErrorPdu& error, Bytes& out)
{
    out.push_back(pduHeaderOctet(PduType::Error));
    out.push_back(error.invoke_id);
    out.push_back(error.service);

    Encoder encoder{out};
    encoder.appEnumerated(error.error_class);
    encoder.appEnumerated(error.error_code);
}

void encodeReject(const RejectPdu& reject, Bytes& out)
{
    out.push_back(pduHeaderOctet(PduType::Reject));
    out.push_back(reject.invoke_id);
    out.push_back(reject.reason);
}

void encodeAbort(const AbortPdu& abort, Bytes& out)
{
    out.push_back(pduHeaderOctet(PduType::Abort, abort.from_server ? FlagAbortServer : 0));
    out.push_back(abort.invoke_id);
    out.push_back(abort.reason);
}

std::string errorClassName(const std::uint32_t error_class)
{
    static constexpr std::array<const char*, 8> names{
        "device",
        "object",
        "property",
        "resources",
        "security",
        "services",
        "vt",
        "communication",
    };
    return nameOrNumber(names, error_class);
}

std::string errorCodeName(const std::uint32_t error_code)
{
    static constexpr std::array<const char*, 43> names{
        "other",
        "authentication-failed",
        "configuration-in-progress",
        "device-busy",
        "dynamic-creation-not-supported",
        "file-access-denied",
        "incompatible-security-levels",
        "inconsistent-parameters",
        "inconsistent-selection-criterion",
        "invalid-data-type",
        "invalid-file-access-method",
        "invalid-file-start-position",
        "invalid-operator-name",
        "invalid-parameter-data-type",
        "invalid-time-stamp",
        "key-generation-error",
        "missing-required-parameter",
        "no-objects-of-specified-type",
        "no-space-for-object",
        "no-space-to-add-list-element",
        "no-space-to-write-property",
        "no-vt-sessions-available",
        "property-is-not-a-list",
        "object-deletion-not-permitted",
        "object-identifier-already-exists",
        "operational-problem",
        "password-failure",
        "read-access-denied",
        "security-not-supported",
        "service-request-denied",
        "timeout",
        "unknown-object",
        "unknown-property",
        "33",  // removed from the standard
        "unknown-vt-class",
        "unknown-vt-session",
        "unsupported-object-type",
        "value-out-of-range",
        "vt-session-already-closed",
        "vt-session-termination-failure",
        "write-access-denied",
        "character-set-not-supported",
        "invalid-array-index",
    };
    return nameOrNumber(names, error_code);
}

std::string rejectReasonName(const std::uint8_t reason)
{
    static constexpr std::array<const char*, 10> names{
        "other",
        "buffer-overflow",
        "inconsistent-parameters",
        "invalid-parameter-data-type",
        "invalid-tag",
        "missing-required-parameter",
        "parameter-out-of-range",
        "too-many-arguments",
        "undefined-enumeration",
        "unrecognized-service",
    };
    return nameOrNumber(names, reason);
}

std::string abortReasonName(const std::uint8_t reason)
{
    static constexpr std::array<const char*, 12> names{
        "other",
        "buffer-overflow",
        "invalid-apdu-in-this-state",
        "preempted-by-higher-priority-task",
        "segmentation-not-supported",
        "security-error",
        "insufficient-security",
        "window-size-out-of-range",
        "application-exceeded-reply-time",
        "out-of-resources",
        "tsm-timeout",
        "apdu-too-long",
    };
    return nameOrNumber(names, reason);
}

}  // namespace bacnet
}  // namespace common
}  // namespace bacwalk
