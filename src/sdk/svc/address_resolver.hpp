//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_SVC_ADDRESS_RESOLVER_HPP_INCLUDED
#define BACWALK_SDK_SVC_ADDRESS_RESOLVER_HPP_INCLUDED

#include "io/device_address.hpp"

#include "bacwalk/bacnet/object_id.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>

namespace bacwalk
{
namespace sdk
{
namespace svc
{

/// Holds the network address of the target device, and its instance number (once known).
///
/// The address never changes. The instance is either given upfront or learned exactly once by discovery.
///
class Target final
{
public:
    Target(const common::io::DeviceAddress& address, const cetl::optional<std::uint32_t>& instance)
        : address_{address}
        , instance_{instance}
    {
    }

    const common::io::DeviceAddress& address() const noexcept
    {
        return address_;
    }

    const cetl::optional<std::uint32_t>& instance() const noexcept
    {
        return instance_;
    }

    bool isResolved() const noexcept
    {
        return instance_.has_value();
    }

    /// Records the discovered instance number.
    ///
    /// @return `false` if the target was already resolved (its instance stays unchanged).
    ///
    bool resolve(const std::uint32_t instance);

    /// Gets identifier of the device object. Only valid for a resolved target.
    bacnet::ObjectIdentifier deviceObject() const;

private:
    common::io::DeviceAddress     address_;
    cetl::optional<std::uint32_t> instance_;

};  // Target

struct AddressResolver final
{
    /// Makes the target out of the device address and an optionally known instance number.
    ///
    /// An instance outside of the valid range (0..4194303) is dropped with a warning,
    /// so that the target gets discovered instead.
    ///
    static Target resolve(const common::io::DeviceAddress& address, const cetl::optional<std::uint32_t>& instance);

};  // AddressResolver

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_SVC_ADDRESS_RESOLVER_HPP_INCLUDED
