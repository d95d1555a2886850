//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "session.hpp"

#include "address_resolver.hpp"
#include "discovery_stage.hpp"
#include "link/link.hpp"
#include "logging.hpp"
#include "name_enumeration_stage.hpp"
#include "object_list_stage.hpp"
#include "request_correlator.hpp"
#include "result_aggregator.hpp"

#include "bacwalk/sdk/object_list_reader.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

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

Session::Session(libcyphal::IExecutor& executor,
                 link::Link::Ptr       link,
                 const Params&         params,
                 common::LoggerPtr     logger)
    : executor_{executor}
    , link_{std::move(link)}
    , logger_{std::move(logger)}
    , correlator_{executor, *link_, params.request_timeout}
    , target_{params.target}
    , discovery_{correlator_, target_}
    , object_list_stage_{correlator_, target_}
    , names_{correlator_, target_.address(), params.resolve_names}
    , aggregator_{logger_}
{
    CETL_DEBUG_ASSERT(link_, "");
}

Session::~Session()
{
    if ((state_ != State::Idle) && (state_ != State::Completed) && (state_ != State::Failed))
    {
        logger_->info("Session with '{}' is cancelled (sent={}, pending={}).",
                      target_.address().toString(),
                      correlator_.sentCount(),
                      names_.pendingCount());

        names_.cancel();
        correlator_.abandon();
    }
}

void Session::start(Completion completion)
{
    CETL_DEBUG_ASSERT(completion, "");
    CETL_DEBUG_ASSERT(state_ == State::Idle, "");

    completion_ = std::move(completion);

    if (const auto err = link_->start([this](const link::Link::Datagram& datagram) {
            //
            correlator_.onDatagram(datagram);
        }))
    {
        fail(Stage::Transport, std::string{"failed to open local endpoint ("} + std::strerror(err) + ")");
        return;
    }

    state_ = State::Discovering;
    discovery_.start([this](DiscoveryStage::Result::Var&& result) {
        //
        handleDiscovery(std::move(result));
    });
}

void Session::handleDiscovery(DiscoveryStage::Result::Var&& result)
{
    if (const auto* const failure = cetl::get_if<DiscoveryStage::Result::Failure>(&result))
    {
        fail(Stage::Discovery, "device did not respond to discovery (" + failure->reason + ")");
        return;
    }

    state_ = State::ReadingObjectList;
    object_list_stage_.start([this](ObjectListStage::Result::Var&& list_result) {
        //
        handleObjectList(std::move(list_result));
    });
}

void Session::handleObjectList(ObjectListStage::Result::Var&& result)
{
    using Failure = ObjectListStage::Result::Failure;

    if (const auto* const failure = cetl::get_if<Failure>(&result))
    {
        if (failure->kind == Failure::Kind::Decoding)
        {
            fail(Stage::ObjectList, "decoding error (" + failure->reason + ")");
            return;
        }
        fail(Stage::ObjectList, "object-list read failed (" + failure->reason + ")");
        return;
    }

    object_list_ = std::move(cetl::get<ObjectListStage::Result::Success>(result).object_ids);

    state_ = State::EnumeratingNames;
    names_.start(object_list_, [this](std::vector<ObjectRecord>&& records) {
        //
        handleNames(std::move(records));
    });
}

void Session::handleNames(std::vector<ObjectRecord>&& records)
{
    CETL_DEBUG_ASSERT(target_.isResolved(), "");

    auto report = aggregator_.aggregate(target_.address(),
                                        target_.instance().value_or(0),
                                        object_list_,
                                        std::move(records));
    state_ = State::Completed;
    finish(std::move(report));
}

void Session::fail(const Stage stage, std::string reason)
{
    logger_->error("Reading '{}' has failed at {} stage: {}.", target_.address().toString(), stageName(stage), reason);

    state_ = State::Failed;
    finish(ObjectListReader::Read::Failure{stage, std::move(reason)});
}

void Session::finish(Result&& result)
{
    CETL_DEBUG_ASSERT(!final_result_, "");

    correlator_.abandon();

    // We might be deep inside of a link or timeout callback here, so the result goes out later.
    final_result_.emplace(std::move(result));
    completion_callback_ = executor_.registerCallback([this](const auto&) {
        //
        deliver();
    });
    completion_callback_.schedule(libcyphal::IExecutor::Callback::Schedule::Once{executor_.now()});
}

void Session::deliver()
{
    CETL_DEBUG_ASSERT(final_result_, "");

    if (link_)
    {
        logger_->debug("Releasing local endpoint of the session with '{}'.", target_.address().toString());
        link_.reset();
    }

    auto completion = std::move(completion_);
    auto result     = std::move(*final_result_);
    final_result_.reset();

    // Nothing may touch `this` after the call - the completion is free to destroy the session.
    completion(std::move(result));
}

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk
