//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "discovery_stage.hpp"

#include "address_resolver.hpp"
#include "bacnet/apdu.hpp"
#include "logging.hpp"
#include "request_correlator.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>

namespace bacwalk
{
namespace sdk
{
namespace svc
{

DiscoveryStage::DiscoveryStage(RequestCorrelator& correlator, Target& target)
    : correlator_{correlator}
    , target_{target}
    , logger_{common::getLogger(common::LoggerName::Svc)}
{
}

void DiscoveryStage::start(Completion completion)
{
    CETL_DEBUG_ASSERT(completion, "");
    CETL_DEBUG_ASSERT(state_ == State::AwaitingAddressKnown, "");

    completion_ = std::move(completion);

    if (const auto& instance = target_.instance())
    {
        logger_->debug("Device instance {} is known - skipping discovery.", *instance);
        succeed(*instance);
        return;
    }

    logger_->info("Discovering device instance at '{}'...", target_.address().toString());

    state_ = State::SendingDiscoveryRequest;
    if (const auto err = correlator_.send(RequestCorrelator::Request::WhoIs{},
                                          target_.address(),
                                          [this](RequestCorrelator::Outcome::Var&& outcome) {
                                              //
                                              handleOutcome(std::move(outcome));
                                          }))
    {
        fail(std::string{"transmit error: "} + std::strerror(err));
        return;
    }
    state_ = State::AwaitingDiscoveryReply;
}

void DiscoveryStage::handleOutcome(RequestCorrelator::Outcome::Var&& outcome)
{
    using Outcome = RequestCorrelator::Outcome;

    cetl::visit(cetl::make_overloaded(
                    [this](const Outcome::Success& success) {
                        //
                        const auto* const i_am = cetl::get_if<common::bacnet::IAmRequest>(&success.response);
                        if (i_am == nullptr)
                        {
                            fail("unexpected response");
                            return;
                        }
                        if (!target_.resolve(i_am->device.instance))
                        {
                            fail("target is already resolved");
                            return;
                        }
                        logger_->info("Discovered device {} (max_apdu={}, vendor={}).",
                                      i_am->device.instance,
                                      i_am->max_apdu_length,
                                      i_am->vendor_id);
                        succeed(i_am->device.instance);
                    },
                    [this](const Outcome::ProtocolError& error) {
                        //
                        fail(error.toString());
                    },
                    [this](const Outcome::Timeout&) {
                        //
                        fail("timeout");
                    }),
                outcome);
}

void DiscoveryStage::succeed(const std::uint32_t instance)
{
    state_          = State::Resolved;
    auto completion = std::move(completion_);
    completion(Result::Success{instance});
}

void DiscoveryStage::fail(std::string reason)
{
    logger_->warn("Discovery at '{}' has failed ({}).", target_.address().toString(), reason);

    state_          = State::Failed;
    auto completion = std::move(completion_);
    completion(Result::Failure{std::move(reason)});
}

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk
