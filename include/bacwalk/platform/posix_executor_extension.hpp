//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
#define BACWALK_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

namespace bacwalk
{
namespace platform
{

/// Extension of an executor which lets callbacks await readiness of POSIX file descriptors.
///
/// Discovered at runtime with `cetl::rtti_cast<IPosixExecutorExtension*>(&executor)`.
///
class IPosixExecutorExtension
{
    // 3B9A61D4-0E27-4F58-9C1B-A4D7E2835F06
    using TypeIdType = cetl::
        type_id_type<0x3B, 0x9A, 0x61, 0xD4, 0x0E, 0x27, 0x4F, 0x58, 0x9C, 0x1B, 0xA4, 0xD7, 0xE2, 0x83, 0x5F, 0x06>;

public:
    IPosixExecutorExtension(const IPosixExecutorExtension&)                = delete;
    IPosixExecutorExtension(IPosixExecutorExtension&&) noexcept            = delete;
    IPosixExecutorExtension& operator=(const IPosixExecutorExtension&)     = delete;
    IPosixExecutorExtension& operator=(IPosixExecutorExtension&&) noexcept = delete;

    struct Trigger
    {
        struct Readable
        {
            int fd;
        };
        struct Writable
        {
            int fd;
        };

        using Variant = cetl::variant<Readable, Writable>;
    };

    /// Registers a callback which is scheduled whenever the trigger's descriptor becomes ready.
    ///
    /// The descriptor stops being awaited as soon as the returned callback handle is destroyed.
    ///
    CETL_NODISCARD virtual libcyphal::IExecutor::Callback::Any registerAwaitableCallback(
        libcyphal::IExecutor::Callback::Function&& function,
        const Trigger::Variant&                    trigger) = 0;

    // MARK: RTTI

    static constexpr cetl::type_id _get_type_id_() noexcept
    {
        return cetl::type_id_type_value<TypeIdType>();
    }

protected:
    IPosixExecutorExtension()  = default;
    ~IPosixExecutorExtension() = default;

};  // IPosixExecutorExtension

}  // namespace platform
}  // namespace bacwalk

#endif  // BACWALK_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
