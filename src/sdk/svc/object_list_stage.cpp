//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "object_list_stage.hpp"

#include "address_resolver.hpp"
#include "bacnet/apdu.hpp"
#include "bacnet/encoding.hpp"
#include "logging.hpp"
#include "request_correlator.hpp"

#include "bacwalk/bacnet/object_id.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace bacwalk
{
namespace sdk
{
namespace svc
{

namespace
{

using Failure = ObjectListStage::Result::Failure;

}  // namespace

ObjectListStage::ObjectListStage(RequestCorrelator& correlator, const Target& target)
    : correlator_{correlator}
    , target_{target}
    , logger_{common::getLogger(common::LoggerName::Svc)}
{
}

void ObjectListStage::start(Completion completion)
{
    CETL_DEBUG_ASSERT(completion, "");
    CETL_DEBUG_ASSERT(target_.isResolved(), "");

    completion_ = std::move(completion);

    const RequestCorrelator::Request::ReadProperty request{target_.deviceObject(),
                                                           common::bacnet::PropertyIdentifier::ObjectList,
                                                           cetl::nullopt};
    logger_->info("Reading object list of device {}...", request.object_id.instance);

    if (const auto err = correlator_.send(request, target_.address(), [this](RequestCorrelator::Outcome::Var&& outcome) {
            //
            handleOutcome(std::move(outcome));
        }))
    {
        complete(Failure{Failure::Kind::Request, std::string{"transmit error: "} + std::strerror(err)});
    }
}

ObjectListStage::Result::Var ObjectListStage::extractObjectIds(const std::vector<common::bacnet::Value>& values)
{
    std::vector<bacnet::ObjectIdentifier> object_ids;
    object_ids.reserve(values.size());
    for (const auto& value : values)
    {
        const auto* const object_id = cetl::get_if<bacnet::ObjectIdentifier>(&value);
        if (object_id == nullptr)
        {
            return Failure{Failure::Kind::Decoding,
                           std::string{"object-list value is not a list of object identifiers (found "} +
                               common::bacnet::valueTypeName(value) + ")"};
        }
        object_ids.push_back(*object_id);
    }
    return Result::Success{std::move(object_ids)};
}

void ObjectListStage::handleOutcome(RequestCorrelator::Outcome::Var&& outcome)
{
    using Outcome = RequestCorrelator::Outcome;

    cetl::visit(cetl::make_overloaded(
                    [this](const Outcome::Success& success) {
                        //
                        const auto* const ack = cetl::get_if<common::bacnet::ReadPropertyAck>(&success.response);
                        if (ack == nullptr)
                        {
                            complete(Failure{Failure::Kind::Decoding, "unexpected response"});
                            return;
                        }
                        complete(extractObjectIds(ack->values));
                    },
                    [this](const Outcome::ProtocolError& error) {
                        //
                        if (error.kind == Outcome::ProtocolError::Kind::Malformed)
                        {
                            complete(Failure{Failure::Kind::Decoding, error.detail});
                            return;
                        }
                        complete(Failure{Failure::Kind::Request, error.toString()});
                    },
                    [this](const Outcome::Timeout&) {
                        //
                        complete(Failure{Failure::Kind::Request, "timeout"});
                    }),
                outcome);
}

void ObjectListStage::complete(Result::Var&& result)
{
    if (const auto* const success = cetl::get_if<Result::Success>(&result))
    {
        logger_->info("Device has {} object(s).", success->object_ids.size());
    }
    else
    {
        logger_->warn("Object list read has failed ({}).", cetl::get<Failure>(result).reason);
    }

    auto completion = std::move(completion_);
    completion(std::move(result));
}

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk
