//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
#define BACWALK_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED

#include "bacwalk/platform/posix_executor_extension.hpp"
#include "bacwalk/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/platform/single_threaded_executor.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <sys/epoll.h>
#include <unistd.h>
#include <utility>

namespace bacwalk
{
namespace platform
{
namespace Linux
{

/// Single-threaded executor which awaits file descriptors with `epoll`.
///
class EpollSingleThreadedExecutor final : public libcyphal::platform::SingleThreadedExecutor,
                                          public IPosixExecutorExtension
{
public:
    EpollSingleThreadedExecutor()
        : epollfd_{::epoll_create1(EPOLL_CLOEXEC)}
    {
        if (epollfd_ < 0)
        {
            const int err = errno;
            spdlog::critical("Failed to create epoll instance: {}.", std::strerror(err));
        }
    }

    EpollSingleThreadedExecutor(const EpollSingleThreadedExecutor&)                = delete;
    EpollSingleThreadedExecutor(EpollSingleThreadedExecutor&&) noexcept            = delete;
    EpollSingleThreadedExecutor& operator=(const EpollSingleThreadedExecutor&)     = delete;
    EpollSingleThreadedExecutor& operator=(EpollSingleThreadedExecutor&&) noexcept = delete;

    ~EpollSingleThreadedExecutor()
    {
        if (epollfd_ >= 0)
        {
            ::close(epollfd_);
        }
    }

    /// Waits for readiness of the awaited descriptors, and schedules their callbacks.
    ///
    /// Interruption by a signal is not a failure - it just ends the wait earlier.
    ///
    /// @return `errno` of a failed wait, or `nullopt` on success.
    ///
    CETL_NODISCARD cetl::optional<int> pollAwaitableResourcesFor(const cetl::optional<libcyphal::Duration> timeout)
    {
        if (epollfd_ < 0)
        {
            return EBADF;
        }

        int timeout_ms = -1;
        if (timeout)
        {
            using std::chrono::duration_cast;
            using std::chrono::milliseconds;

            // Whole milliseconds, rounded up; a sub-millisecond timeout must not become a zero one.
            const auto timeout_us = std::max(timeout->count(), static_cast<libcyphal::Duration::rep>(0));
            const auto rounded_ms = duration_cast<milliseconds>(libcyphal::Duration{timeout_us + 999}).count();
            timeout_ms = static_cast<int>(std::min<std::int64_t>(rounded_ms, std::numeric_limits<int>::max()));
        }

        std::array<epoll_event, MaxEvents> events{};
        const int epoll_result = ::epoll_wait(epollfd_, events.data(), static_cast<int>(events.size()), timeout_ms);
        if (epoll_result < 0)
        {
            const int err = errno;
            if (err == EINTR)
            {
                return cetl::nullopt;
            }
            return err;
        }

        const auto now_time = now();
        for (std::size_t index = 0; index < static_cast<std::size_t>(epoll_result); ++index)
        {
            // NOLINTNEXTLINE(*-union-access)
            auto* const awaitable_node = static_cast<AwaitableNode*>(events[index].data.ptr);
            if (awaitable_node != nullptr)
            {
                awaitable_node->schedule(Callback::Schedule::Once{now_time});
            }
        }

        return cetl::nullopt;
    }

    // MARK: - IExecutor

    CETL_NODISCARD libcyphal::TimePoint now() const noexcept override
    {
        const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
        return libcyphal::TimePoint{std::chrono::duration_cast<libcyphal::Duration>(since_epoch)};
    }

    // MARK: - IPosixExecutorExtension

    CETL_NODISCARD Callback::Any registerAwaitableCallback(Callback::Function&&    function,
                                                           const Trigger::Variant& trigger) override
    {
        AwaitableNode new_node{*this, std::move(function)};

        const bool is_awaited = cetl::visit(cetl::make_overloaded(
                                                [&new_node](const Trigger::Readable& readable) {
                                                    //
                                                    return new_node.setup(readable.fd, EPOLLIN);
                                                },
                                                [&new_node](const Trigger::Writable& writable) {
                                                    //
                                                    return new_node.setup(writable.fd, EPOLLOUT);
                                                }),
                                            trigger);
        if (!is_awaited)
        {
            return {};
        }

        insertCallbackNode(new_node);
        return {std::move(new_node)};
    }

protected:
    /// Callback node which also owns the `epoll` registration of its file descriptor.
    ///
    /// Destruction of the node (f.e. by resetting its `Callback::Any`) is what stops awaiting the descriptor.
    ///
    class AwaitableNode final : public CallbackNode
    {
        using Base = CallbackNode;

    public:
        AwaitableNode(EpollSingleThreadedExecutor& executor, Callback::Function&& function)
            : Base{executor, std::move(function)}
        {
        }

        ~AwaitableNode() override
        {
            if (fd_ < 0)
            {
                return;
            }

            // The descriptor might be already closed, in which case the kernel has dropped it anyway.
            if (::epoll_ctl(getExecutor().epollfd_, EPOLL_CTL_DEL, fd_, nullptr) < 0)
            {
                const int err = errno;
                if (err != EBADF)
                {
                    spdlog::warn("Failed to stop awaiting file descriptor (fd={}): {}.", fd_, std::strerror(err));
                }
            }
        }

        AwaitableNode(AwaitableNode&& other) noexcept
            : Base(std::move(static_cast<Base&&>(other)))
            , fd_{std::exchange(other.fd_, -1)}
            , events_{std::exchange(other.events_, 0)}
        {
            if (fd_ >= 0)
            {
                // The node has moved, so `epoll` has to point to its new location.
                ::epoll_event event{};
                event.events   = events_;
                event.data.ptr = this;  // NOLINT(*-union-access)
                if (::epoll_ctl(getExecutor().epollfd_, EPOLL_CTL_MOD, fd_, &event) < 0)
                {
                    const int err = errno;
                    spdlog::error("Failed to re-await file descriptor (fd={}): {}.", fd_, std::strerror(err));
                }
            }
        }

        AwaitableNode(const AwaitableNode&)                = delete;
        AwaitableNode& operator=(const AwaitableNode&)     = delete;
        AwaitableNode& operator=(AwaitableNode&&) noexcept = delete;

        CETL_NODISCARD bool setup(const int fd, const std::uint32_t events) noexcept
        {
            CETL_DEBUG_ASSERT(fd >= 0, "");
            CETL_DEBUG_ASSERT(fd_ < 0, "Awaitable node is already set up.");

            ::epoll_event event{};
            event.events   = events;
            event.data.ptr = this;  // NOLINT(*-union-access)
            if (const auto err = posixSyscallError([this, fd, &event] {
                    //
                    return ::epoll_ctl(getExecutor().epollfd_, EPOLL_CTL_ADD, fd, &event);
                }))
            {
                spdlog::error("Failed to await file descriptor (fd={}): {}.", fd, std::strerror(err));
                return false;
            }

            fd_     = fd;
            events_ = events;
            return true;
        }

    private:
        EpollSingleThreadedExecutor& getExecutor() noexcept
        {
            // Only this executor ever creates awaitable nodes.
            return static_cast<EpollSingleThreadedExecutor&>(executor());  // NOLINT(*-static-cast-downcast)
        }

        int           fd_{-1};
        std::uint32_t events_{0};

    };  // AwaitableNode

    // MARK: - RTTI

    CETL_NODISCARD void* _cast_(const cetl::type_id& id) & noexcept override
    {
        if (id == IPosixExecutorExtension::_get_type_id_())
        {
            return static_cast<IPosixExecutorExtension*>(this);
        }
        return Base::_cast_(id);
    }

    CETL_NODISCARD const void* _cast_(const cetl::type_id& id) const& noexcept override
    {
        if (id == IPosixExecutorExtension::_get_type_id_())
        {
            return static_cast<const IPosixExecutorExtension*>(this);
        }
        return Base::_cast_(id);
    }

private:
    using Base = libcyphal::platform::SingleThreadedExecutor;

    static constexpr std::size_t MaxEvents = 16;

    int epollfd_;

};  // EpollSingleThreadedExecutor

}  // namespace Linux
}  // namespace platform
}  // namespace bacwalk

#endif  // BACWALK_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
