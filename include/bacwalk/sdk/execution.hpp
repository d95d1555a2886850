//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_EXECUTION_HPP_INCLUDED
#define BACWALK_SDK_EXECUTION_HPP_INCLUDED

#include "bacwalk/platform/defines.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <utility>

namespace bacwalk
{
namespace sdk
{

/// Internal implementation details.
/// Not supposed to be used directly by the users of the SDK.
///
namespace detail
{

/// Holds the (future) result of a sender.
///
/// Shared between the waiting side and the receiver, so that a late emission
/// (f.e. after the waiter gave up) still lands in a valid object.
///
template <typename Result>
struct Completion final
{
    cetl::optional<Result> maybe_result;

    static std::function<void(Result&&)> receiverOf(const std::shared_ptr<Completion>& completion)
    {
        return [completion](Result&& result) { completion->maybe_result.emplace(std::move(result)); };
    }

};  // Completion

}  // namespace detail

/// Abstract interface of a result sender.
///
/// Destroying a sender before it has emitted its result cancels the operation.
/// The result is emitted at most once, and never synchronously from within `submit`.
///
template <typename Result_>
class SenderOf
{
public:
    using Ptr    = std::unique_ptr<SenderOf>;
    using Result = Result_;

    SenderOf(SenderOf&&)                 = delete;
    SenderOf(const SenderOf&)            = delete;
    SenderOf& operator=(SenderOf&&)      = delete;
    SenderOf& operator=(const SenderOf&) = delete;

    virtual ~SenderOf() = default;

    /// Starts the operation; the receiver is consumed.
    ///
    template <typename Receiver>
    void submit(Receiver&& receiver)
    {
        submitImpl([receive = std::forward<Receiver>(receiver)](Result&& result) mutable {
            //
            receive(std::move(result));
        });
    }

protected:
    SenderOf() = default;

    virtual void submitImpl(std::function<void(Result&&)>&& receiver) = 0;

};  // SenderOf

template <typename Sender, typename Receiver>
void submit(std::unique_ptr<Sender>& sender_ptr, Receiver&& receiver)
{
    sender_ptr->submit(std::forward<Receiver>(receiver));
}

/// Synchronously runs the executor until the sender emits its result, or until `keep_waiting` turns `false`.
///
/// The `keep_waiting` predicate is checked at least once per second (and on every signal delivery).
/// On abandon the caller is expected to destroy the sender in order to cancel the operation.
///
/// @return The emitted result, or `nullopt` if the wait was abandoned.
///
template <typename Result, typename Executor, typename Sender, typename Predicate>
cetl::optional<Result> sync_wait_while(Executor& executor, Sender& sender, Predicate keep_waiting)
{
    const auto completion = std::make_shared<detail::Completion<Result>>();
    submit(sender, detail::Completion<Result>::receiverOf(completion));

    platform::waitPollingUntil(executor, [&completion, &keep_waiting] {
        //
        return completion->maybe_result.has_value() || !keep_waiting();
    });

    return std::move(completion->maybe_result);
}

}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_EXECUTION_HPP_INCLUDED
