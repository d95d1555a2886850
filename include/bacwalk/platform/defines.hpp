//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_PLATFORM_DEFINES_HPP_INCLUDED
#define BACWALK_PLATFORM_DEFINES_HPP_INCLUDED

#include "linux/epoll_single_threaded_executor.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstring>

namespace bacwalk
{
namespace platform
{

using SingleThreadedExecutor = Linux::EpollSingleThreadedExecutor;

/// Spins the executor (and polls its awaitable resources) until the predicate holds.
///
/// The predicate is re-checked at least once per second, so it may also watch external state
/// (like a termination signal flag).
///
/// @param deadline Optional point in time after which waiting is given up.
/// @return `true` if the predicate holds, `false` if the deadline has passed first.
///
template <typename Executor, typename Predicate>
bool waitPollingUntil(Executor&                                  executor,
                      Predicate                                  predicate,
                      const cetl::optional<libcyphal::TimePoint> deadline = cetl::nullopt)
{
    constexpr libcyphal::Duration MaxPollTimeout{std::chrono::seconds{1}};

    while (!predicate())
    {
        if (deadline && (executor.now() >= *deadline))
        {
            spdlog::debug("Gave up waiting - the deadline has passed.");
            return false;
        }

        const auto spin_result = executor.spinOnce();
        if (predicate())
        {
            break;
        }

        auto timeout = MaxPollTimeout;
        if (spin_result.next_exec_time)
        {
            timeout = std::min(timeout, *spin_result.next_exec_time - executor.now());
        }
        if (deadline)
        {
            timeout = std::min(timeout, *deadline - executor.now());
        }
        timeout = std::max(timeout, libcyphal::Duration::zero());

        if (const auto poll_failure = executor.pollAwaitableResourcesFor(cetl::make_optional(timeout)))
        {
            spdlog::warn("Failed to poll awaitable resources: {}.", std::strerror(*poll_failure));
        }
    }
    return true;
}

}  // namespace platform
}  // namespace bacwalk

#endif  // BACWALK_PLATFORM_DEFINES_HPP_INCLUDED
