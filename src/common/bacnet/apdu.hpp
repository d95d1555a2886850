//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_COMMON_BACNET_APDU_HPP_INCLUDED
#define BACWALK_COMMON_BACNET_APDU_HPP_INCLUDED

#include "encoding.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace bacwalk
{
namespace common
{
namespace bacnet
{

enum class PduType : std::uint8_t
{
    ConfirmedRequest   = 0,
    UnconfirmedRequest = 1,
    SimpleAck          = 2,
    ComplexAck         = 3,
    SegmentAck         = 4,
    Error              = 5,
    Reject             = 6,
    Abort              = 7,
};

enum class ServiceChoice : std::uint8_t
{
    // Unconfirmed services.
    IAm   = 0,
    WhoIs = 8,

    // Confirmed services.
    ReadProperty = 12,
};

enum class PropertyIdentifier : std::uint32_t
{
    ObjectList = 76,
    ObjectName = 77,
};

/// Gets the standard name of a property, f.e. "objectList"; unknown ones are printed as their number.
std::string propertyName(const PropertyIdentifier property);

/// `BACnetAbortReason` values used by this client.
enum class AbortReason : std::uint8_t
{
    Other                    = 0,
    SegmentationNotSupported = 4,
};

/// Largest APDU this client accepts, and its encoding in a confirmed request header.
constexpr std::uint32_t MaxApduLengthAccepted = 1024;

/// Devices announce segmentation support with these `BACnetSegmentation` values.
constexpr std::uint32_t SegmentationNone = 3;

struct WhoIsRequest final
{
    cetl::optional<std::uint32_t> low_limit;
    cetl::optional<std::uint32_t> high_limit;
};

struct IAmRequest final
{
    ObjectIdentifier device;
    std::uint32_t    max_apdu_length;
    std::uint32_t    segmentation;
    std::uint32_t    vendor_id;
};

struct ReadPropertyRequest final
{
    ObjectIdentifier              object_id;
    PropertyIdentifier            property;
    cetl::optional<std::uint32_t> array_index;
};

/// An incoming confirmed ReadProperty request.
struct ConfirmedReadProperty final
{
    std::uint8_t        invoke_id;
    ReadPropertyRequest request;
};

struct ReadPropertyAck final
{
    std::uint8_t                  invoke_id;
    ObjectIdentifier              object_id;
    PropertyIdentifier            property;
    cetl::optional<std::uint32_t> array_index;
    std::vector<Value>            values;
};

struct SimpleAck final
{
    std::uint8_t invoke_id;
    std::uint8_t service;
};

/// A segment of a segmented complex acknowledgement; its content is not decoded.
struct SegmentedAck final
{
    std::uint8_t invoke_id;
    std::uint8_t service;
};

struct ErrorPdu final
{
    std::uint8_t  invoke_id;
    std::uint8_t  service;
    std::uint32_t error_class;
    std::uint32_t error_code;
};

struct RejectPdu final
{
    std::uint8_t invoke_id;
    std::uint8_t reason;
};

struct AbortPdu final
{
    bool         from_server;
    std::uint8_t invoke_id;
    std::uint8_t reason;
};

/// Any well-formed PDU which this client has no use for (other services, segment acks etc.).
struct OtherPdu final
{
    PduType                      type;
    cetl::optional<std::uint8_t> invoke_id;
    cetl::optional<std::uint8_t> service;
};

using Apdu = cetl::variant<WhoIsRequest,
                           IAmRequest,
                           ConfirmedReadProperty,
                           ReadPropertyAck,
                           SimpleAck,
                           SegmentedAck,
                           ErrorPdu,
                           RejectPdu,
                           AbortPdu,
                           OtherPdu>;

/// Fixed part of an APDU - enough to correlate it with an outstanding request
/// even when its service part turns out to be malformed.
///
struct ApduHeader final
{
    PduType                      type;
    bool                         segmented;
    cetl::optional<std::uint8_t> invoke_id;
    cetl::optional<std::uint8_t> service;
};

cetl::optional<ApduHeader> peekApduHeader(const BytesView apdu);

struct DecodeResult
{
    using Success = Apdu;
    using Failure = int;  // `EBADMSG` or `ENOTSUP`
    using Var     = cetl::variant<Success, Failure>;
};
DecodeResult::Var decodeApdu(const BytesView apdu);

void encodeWhoIs(const WhoIsRequest& request, Bytes& out);
void encodeIAm(const IAmRequest& request, Bytes& out);
void encodeReadProperty(const std::uint8_t invoke_id, const ReadPropertyRequest& request, Bytes& out);
void encodeReadPropertyAck(const ReadPropertyAck& ack, Bytes& out);
void encodeError(const ErrorPdu& error, Bytes& out);
void encodeReject(const RejectPdu& reject, Bytes& out);
void encodeAbort(const AbortPdu& abort, Bytes& out);

// Human-readable names of standard enumerations; unknown values are printed as their number.
//
std::string errorClassName(const std::uint32_t error_class);
std::string errorCodeName(const std::uint32_t error_code);
std::string rejectReasonName(const std::uint8_t reason);
std::string abortReasonName(const std::uint8_t reason);

}  // namespace bacnet
}  // namespace common
}  // namespace bacwalk

#endif  // BACWALK_COMMON_BACNET_APDU_HPP_INCLUDED
