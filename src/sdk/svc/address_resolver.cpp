//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "address_resolver.hpp"

#include "io/device_address.hpp"
#include "logging.hpp"

#include "bacwalk/bacnet/object_id.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>

namespace bacwalk
{
namespace sdk
{
namespace svc
{

bool Target::resolve(const std::uint32_t instance)
{
    if (instance_)
    {
        const auto logger = common::getLogger(common::LoggerName::Svc);
        logger->warn("Target '{}' is already resolved to instance {} (ignoring {}).",
                     address_.toString(),
                     *instance_,
                     instance);
        return false;
    }

    instance_ = instance;
    return true;
}

bacnet::ObjectIdentifier Target::deviceObject() const
{
    CETL_DEBUG_ASSERT(instance_, "");

    return bacnet::ObjectIdentifier{bacnet::ObjectType::Device, instance_.value_or(0)};
}

Target AddressResolver::resolve(const common::io::DeviceAddress&     address,
                                const cetl::optional<std::uint32_t>& instance)
{
    if (instance && (*instance > bacnet::ObjectIdentifier::MaxInstance))
    {
        const auto logger = common::getLogger(common::LoggerName::Svc);
        logger->warn("Device instance {} is out of range (max {}) - discovering it instead.",
                     *instance,
                     bacnet::ObjectIdentifier::MaxInstance);
        return Target{address, cetl::nullopt};
    }
    return Target{address, instance};
}

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk
