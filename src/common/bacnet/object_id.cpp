//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "bacwalk/bacnet/object_id.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace bacwalk
{
namespace bacnet
{
namespace
{

// Indexed by the numeric value of `ObjectType`.
constexpr std::array<const char*, 60> ObjectTypeNames{
    "analogInput",           "analogOutput",         "analogValue",
    "binaryInput",           "binaryOutput",         "binaryValue",
    "calendar",              "command",              "device",
    "eventEnrollment",       "file",                 "group",
    "loop",                  "multiStateInput",      "multiStateOutput",
    "notificationClass",     "program",              "schedule",
    "averaging",             "multiStateValue",      "trendLog",
    "lifeSafetyPoint",       "lifeSafetyZone",       "accumulator",
    "pulseConverter",        "eventLog",             "globalGroup",
    "trendLogMultiple",      "loadControl",          "structuredView",
    "accessDoor",            "timer",                "accessCredential",
    "accessPoint",           "accessRights",         "accessUser",
    "accessZone",            "credentialDataInput",  "networkSecurity",
    "bitstringValue",        "characterstringValue", "datePatternValue",
    "dateValue",             "datetimePatternValue", "datetimeValue",
    "integerValue",          "largeAnalogValue",     "octetstringValue",
    "positiveIntegerValue",  "timePatternValue",     "timeValue",
    "notificationForwarder", "alertEnrollment",      "channel",
    "lightingOutput",        "binaryLightingOutput", "networkPort",
    "elevatorGroup",         "escalator",            "lift",
};

constexpr unsigned InstanceBits = 22;

}  // namespace

const char* objectTypeName(const ObjectType type) noexcept
{
    const auto index = static_cast<std::size_t>(type);
    if (index >= ObjectTypeNames.size())
    {
        return nullptr;
    }
    return ObjectTypeNames[index];  // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
}

std::uint32_t ObjectIdentifier::encode() const noexcept
{
    const auto raw_type = static_cast<std::uint32_t>(type) & MaxType;
    return (raw_type << InstanceBits) | (instance & MaxInstance);
}

ObjectIdentifier ObjectIdentifier::decode(const std::uint32_t raw) noexcept
{
    return {static_cast<ObjectType>((raw >> InstanceBits) & MaxType), raw & MaxInstance};
}

std::string ObjectIdentifier::toString() const
{
    if (const auto* const name = objectTypeName(type))
    {
        return std::string{name} + ":" + std::to_string(instance);
    }
    return std::to_string(static_cast<std::uint32_t>(type)) + ":" + std::to_string(instance);
}

}  // namespace bacnet
}  // namespace bacwalk
