//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_BACNET_OBJECT_ID_HPP_INCLUDED
#define BACWALK_BACNET_OBJECT_ID_HPP_INCLUDED

#include <cstdint>
#include <string>

namespace bacwalk
{
namespace bacnet
{

/// Standard BACnet object types (ASHRAE 135, clause 21 `BACnetObjectType`).
///
/// Values above `Lift` (up to 1023) are valid on the wire as well - they are just not named here.
///
enum class ObjectType : std::uint16_t
{
    AnalogInput           = 0,
    AnalogOutput          = 1,
    AnalogValue           = 2,
    BinaryInput           = 3,
    BinaryOutput          = 4,
    BinaryValue           = 5,
    Calendar              = 6,
    Command               = 7,
    Device                = 8,
    EventEnrollment       = 9,
    File                  = 10,
    Group                 = 11,
    Loop                  = 12,
    MultiStateInput       = 13,
    MultiStateOutput      = 14,
    NotificationClass     = 15,
    Program               = 16,
    Schedule              = 17,
    Averaging             = 18,
    MultiStateValue       = 19,
    TrendLog              = 20,
    LifeSafetyPoint       = 21,
    LifeSafetyZone        = 22,
    Accumulator           = 23,
    PulseConverter        = 24,
    EventLog              = 25,
    GlobalGroup           = 26,
    TrendLogMultiple      = 27,
    LoadControl           = 28,
    StructuredView        = 29,
    AccessDoor            = 30,
    Timer                 = 31,
    AccessCredential      = 32,
    AccessPoint           = 33,
    AccessRights          = 34,
    AccessUser            = 35,
    AccessZone            = 36,
    CredentialDataInput   = 37,
    NetworkSecurity       = 38,
    BitstringValue        = 39,
    CharacterstringValue  = 40,
    DatePatternValue      = 41,
    DateValue             = 42,
    DatetimePatternValue  = 43,
    DatetimeValue         = 44,
    IntegerValue          = 45,
    LargeAnalogValue      = 46,
    OctetstringValue      = 47,
    PositiveIntegerValue  = 48,
    TimePatternValue      = 49,
    TimeValue             = 50,
    NotificationForwarder = 51,
    AlertEnrollment       = 52,
    Channel               = 53,
    LightingOutput        = 54,
    BinaryLightingOutput  = 55,
    NetworkPort           = 56,
    ElevatorGroup         = 57,
    Escalator             = 58,
    Lift                  = 59,

};  // ObjectType

/// Gets the standard camel-case name of an object type (like "analogInput").
///
/// @return `nullptr` for types which have no standard name (f.e. proprietary ones).
///
const char* objectTypeName(const ObjectType type) noexcept;

/// Identifies one addressable object inside a device - a pair of object type and instance number.
///
struct ObjectIdentifier final
{
    static constexpr std::uint32_t MaxInstance = 0x3FFFFF;  // 22 bits
    static constexpr std::uint16_t MaxType     = 0x3FF;     // 10 bits

    ObjectType    type{ObjectType::Device};
    std::uint32_t instance{0};

    /// Packs the identifier into its 32-bit wire representation.
    std::uint32_t encode() const noexcept;

    static ObjectIdentifier decode(const std::uint32_t raw) noexcept;

    /// Makes "<typeName>:<instance>" string, f.e. "analogInput:1" or "700:5" for proprietary types.
    ///
    std::string toString() const;

    friend bool operator==(const ObjectIdentifier& lhs, const ObjectIdentifier& rhs) noexcept
    {
        return (lhs.type == rhs.type) && (lhs.instance == rhs.instance);
    }
    friend bool operator!=(const ObjectIdentifier& lhs, const ObjectIdentifier& rhs) noexcept
    {
        return !(lhs == rhs);
    }

};  // ObjectIdentifier

}  // namespace bacnet
}  // namespace bacwalk

#endif  // BACWALK_BACNET_OBJECT_ID_HPP_INCLUDED
