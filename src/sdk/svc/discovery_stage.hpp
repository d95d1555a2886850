//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_SVC_DISCOVERY_STAGE_HPP_INCLUDED
#define BACWALK_SDK_SVC_DISCOVERY_STAGE_HPP_INCLUDED

#include "address_resolver.hpp"
#include "logging.hpp"
#include "request_correlator.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace bacwalk
{
namespace sdk
{
namespace svc
{

/// Learns the instance number of the target device by a directed Who-Is.
///
/// Does nothing (and completes immediately) if the target is already resolved.
/// Only the first I-Am from the target address counts.
///
class DiscoveryStage final
{
public:
    enum class State : std::uint8_t
    {
        AwaitingAddressKnown,
        SendingDiscoveryRequest,
        AwaitingDiscoveryReply,
        Resolved,
        Failed,
    };

    struct Result final
    {
        struct Success final
        {
            std::uint32_t instance;
        };

        struct Failure final
        {
            /// F.e. "timeout" or "transmit error: Network is unreachable".
            std::string reason;
        };

        using Var = cetl::variant<Success, Failure>;

    };  // Result

    using Completion = std::function<void(Result::Var&&)>;

    DiscoveryStage(RequestCorrelator& correlator, Target& target);

    DiscoveryStage(const DiscoveryStage&)                = delete;
    DiscoveryStage(DiscoveryStage&&) noexcept            = delete;
    DiscoveryStage& operator=(const DiscoveryStage&)     = delete;
    DiscoveryStage& operator=(DiscoveryStage&&) noexcept = delete;

    ~DiscoveryStage() = default;

    /// Starts the stage. The completion is called exactly once - possibly even before `start` returns.
    void start(Completion completion);

    State state() const noexcept
    {
        return state_;
    }

private:
    void handleOutcome(RequestCorrelator::Outcome::Var&& outcome);
    void succeed(const std::uint32_t instance);
    void fail(std::string reason);

    RequestCorrelator& correlator_;
    Target&            target_;
    common::LoggerPtr  logger_;
    State              state_{State::AwaitingAddressKnown};
    Completion         completion_;

};  // DiscoveryStage

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_SVC_DISCOVERY_STAGE_HPP_INCLUDED
