//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "name_enumeration_stage.hpp"

#include "bacnet/apdu.hpp"
#include "bacnet/encoding.hpp"
#include "io/device_address.hpp"
#include "logging.hpp"
#include "request_correlator.hpp"

#include "bacwalk/bacnet/object_id.hpp"
#include "bacwalk/sdk/object_list_reader.hpp"

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

std::string describe(const ObjectRecord::Name& name)
{
    return cetl::visit(cetl::make_overloaded(
                           [](const ObjectRecord::NotRequested&) -> std::string {
                               //
                               return "-";
                           },
                           [](const ObjectRecord::Resolved& resolved) -> std::string {
                               //
                               return "'" + resolved.name + "'";
                           },
                           [](const ObjectRecord::Failed& failed) -> std::string {
                               //
                               return "(" + failed.reason + ")";
                           }),
                       name);
}

}  // namespace

NameEnumerationStage::NameEnumerationStage(RequestCorrelator&               correlator,
                                           const common::io::DeviceAddress& address,
                                           const bool                       resolve_names)
    : correlator_{correlator}
    , address_{address}
    , resolve_names_{resolve_names}
    , logger_{common::getLogger(common::LoggerName::Svc)}
{
}

void NameEnumerationStage::start(const std::vector<bacnet::ObjectIdentifier>& object_ids, Completion completion)
{
    CETL_DEBUG_ASSERT(completion, "");
    CETL_DEBUG_ASSERT(!context_, "");

    completion_ = std::move(completion);
    total_      = object_ids.size();

    context_.emplace();
    context_->pending.assign(object_ids.begin(), object_ids.end());
    context_->completed.reserve(object_ids.size());

    if (resolve_names_)
    {
        logger_->info("Reading names of {} object(s)...", total_);
    }
    step();
}

void NameEnumerationStage::cancel()
{
    if (context_)
    {
        logger_->debug("Name enumeration is cancelled (pending={}).", context_->pending.size());
    }
    context_.reset();
    in_flight_.reset();
    completion_ = nullptr;
}

void NameEnumerationStage::step()
{
    while (context_)
    {
        if (context_->pending.empty())
        {
            auto records = std::move(context_->completed);
            context_.reset();

            auto completion = std::move(completion_);
            completion(std::move(records));
            return;
        }

        const auto object_id = context_->pending.front();
        context_->pending.pop_front();

        if (!resolve_names_)
        {
            append(object_id, ObjectRecord::NotRequested{});
            continue;
        }

        in_flight_ = object_id;
        const RequestCorrelator::Request::ReadProperty request{object_id,
                                                               common::bacnet::PropertyIdentifier::ObjectName,
                                                               cetl::nullopt};
        const auto err = correlator_.send(request, address_, [this](RequestCorrelator::Outcome::Var&& outcome) {
            //
            handleOutcome(std::move(outcome));
        });
        if (err == 0)
        {
            // Resumed by the outcome.
            return;
        }

        in_flight_.reset();
        append(object_id, ObjectRecord::Failed{std::string{"transmit error: "} + std::strerror(err)});
    }
}

void NameEnumerationStage::handleOutcome(RequestCorrelator::Outcome::Var&& outcome)
{
    if (!context_ || !in_flight_)
    {
        return;
    }

    const auto object_id = *in_flight_;
    in_flight_.reset();
    append(object_id, toName(outcome));

    step();
}

ObjectRecord::Name NameEnumerationStage::toName(const RequestCorrelator::Outcome::Var& outcome)
{
    using Outcome = RequestCorrelator::Outcome;

    return cetl::visit(cetl::make_overloaded(
                           [](const Outcome::Success& success) -> ObjectRecord::Name {
                               //
                               const auto* const ack =
                                   cetl::get_if<common::bacnet::ReadPropertyAck>(&success.response);
                               if ((ack == nullptr) || (ack->values.size() != 1))
                               {
                                   return ObjectRecord::Failed{"decoding error: objectName is not a single value"};
                               }
                               const auto& value = ack->values.front();
                               if (const auto* const str = cetl::get_if<common::bacnet::CharacterString>(&value))
                               {
                                   return ObjectRecord::Resolved{str->text};
                               }
                               return ObjectRecord::Failed{
                                   std::string{"decoding error: objectName is not a character string (found "} +
                                   common::bacnet::valueTypeName(value) + ")"};
                           },
                           [](const Outcome::ProtocolError& error) -> ObjectRecord::Name {
                               //
                               return ObjectRecord::Failed{error.toString()};
                           },
                           [](const Outcome::Timeout&) -> ObjectRecord::Name {
                               //
                               return ObjectRecord::Failed{"timeout"};
                           }),
                       outcome);
}

void NameEnumerationStage::append(const bacnet::ObjectIdentifier& object_id, ObjectRecord::Name&& name)
{
    CETL_DEBUG_ASSERT(context_, "");

    logger_->debug("{:3}/{}. {} {}.", context_->completed.size() + 1, total_, object_id.toString(), describe(name));

    context_->completed.push_back(ObjectRecord{object_id, std::move(name)});
}

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk
