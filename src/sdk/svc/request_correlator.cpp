//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "request_correlator.hpp"

#include "bacnet/apdu.hpp"
#include "bacnet/encoding.hpp"
#include "io/device_address.hpp"
#include "link/link.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cerrno>
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
namespace
{

namespace bacnet = common::bacnet;

using ProtocolError = RequestCorrelator::Outcome::ProtocolError;

std::string describe(const RequestCorrelator::Request::Var& request)
{
    return cetl::visit(cetl::make_overloaded(
                           [](const RequestCorrelator::Request::WhoIs&) -> std::string {
                               //
                               return "Who-Is";
                           },
                           [](const RequestCorrelator::Request::ReadProperty& read) -> std::string {
                               //
                               return "ReadProperty(" + read.object_id.toString() + ", " +
                                      bacnet::propertyName(read.property) + ")";
                           }),
                       request);
}

ProtocolError malformed(const std::string& what)
{
    return ProtocolError{ProtocolError::Kind::Malformed, what};
}

}  // namespace

std::string RequestCorrelator::Outcome::ProtocolError::toString() const
{
    switch (kind)
    {
    case Kind::Error:
        return "error: " + detail;
    case Kind::Reject:
        return "rejected: " + detail;
    case Kind::Abort:
        return "aborted: " + detail;
    default:
        return "decoding error: " + detail;
    }
}

RequestCorrelator::RequestCorrelator(libcyphal::IExecutor&     executor,
                                     link::Link&               link,
                                     const libcyphal::Duration timeout)
    : executor_{executor}
    , link_{link}
    , timeout_{timeout}
    , logger_{common::getLogger(common::LoggerName::Svc)}
{
    timeout_callback_ = executor_.registerCallback([this](const auto&) {
        //
        handleTimeout();
    });
}

int RequestCorrelator::send(const Request::Var&              request,
                            const common::io::DeviceAddress& destination,
                            Receiver                         receiver)
{
    CETL_DEBUG_ASSERT(receiver, "");

    if (outstanding_)
    {
        logger_->critical("Request {} is issued while {} is still outstanding.",
                          describe(request),
                          describe(outstanding_->request));
        return EBUSY;
    }

    tx_buffer_.clear();
    std::uint8_t invoke_id       = 0;
    bool         expecting_reply = false;
    cetl::visit(cetl::make_overloaded(
                    [this](const Request::WhoIs&) {
                        //
                        bacnet::encodeWhoIs({}, tx_buffer_);
                    },
                    [this, &invoke_id, &expecting_reply](const Request::ReadProperty& read) {
                        //
                        invoke_id       = next_invoke_id_++;
                        expecting_reply = true;
                        bacnet::encodeReadProperty(invoke_id, read, tx_buffer_);
                    }),
                request);

    if (const auto err = link_.send(destination, {tx_buffer_.data(), tx_buffer_.size()}, expecting_reply))
    {
        logger_->warn("Failed to send {} to '{}': {}.", describe(request), destination.toString(), std::strerror(err));
        return err;
    }
    ++sent_count_;

    const auto deadline = executor_.now() + timeout_;
    outstanding_.emplace(Outstanding{request, destination, invoke_id, deadline, std::move(receiver)});
    timeout_callback_.schedule(libcyphal::IExecutor::Callback::Schedule::Once{deadline});

    logger_->debug("Sent {} to '{}' (invoke_id={}).", describe(request), destination.toString(), invoke_id);
    return 0;
}

void RequestCorrelator::abandon()
{
    if (outstanding_)
    {
        logger_->debug("Abandoning outstanding {} (invoke_id={}).",
                       describe(outstanding_->request),
                       outstanding_->invoke_id);
        outstanding_.reset();
    }
}

void RequestCorrelator::onDatagram(const link::Link::Datagram& datagram)
{
    if (!outstanding_)
    {
        logger_->debug("Ignoring APDU from '{}' while idle (size={}).",
                       datagram.source.toString(),
                       datagram.apdu.size());
        return;
    }
    if (datagram.source != outstanding_->destination)
    {
        logger_->debug("Ignoring APDU from unrelated '{}' (size={}).",
                       datagram.source.toString(),
                       datagram.apdu.size());
        return;
    }

    if (cetl::get_if<Request::WhoIs>(&outstanding_->request) != nullptr)
    {
        handleDiscoveryResponse(datagram.apdu);
    }
    else
    {
        handlePropertyResponse(datagram.apdu);
    }
}

void RequestCorrelator::handleDiscoveryResponse(const common::bacnet::BytesView apdu)
{
    const auto        result  = bacnet::decodeApdu(apdu);
    const auto* const decoded = cetl::get_if<bacnet::DecodeResult::Success>(&result);
    if (decoded == nullptr)
    {
        logger_->debug("Ignoring undecodable APDU while awaiting I-Am (size={}).", apdu.size());
        return;
    }

    const auto* const i_am = cetl::get_if<bacnet::IAmRequest>(decoded);
    if ((i_am == nullptr) || (i_am->device.type != bacnet::ObjectType::Device))
    {
        logger_->debug("Ignoring unrelated APDU while awaiting I-Am (size={}).", apdu.size());
        return;
    }

    complete(Outcome::Success{*i_am});
}

void RequestCorrelator::handlePropertyResponse(const common::bacnet::BytesView apdu)
{
    const auto header = bacnet::peekApduHeader(apdu);
    if (!header || !header->invoke_id || (*header->invoke_id != outstanding_->invoke_id))
    {
        logger_->debug("Ignoring APDU which does not match invoke_id={} (size={}).",
                       outstanding_->invoke_id,
                       apdu.size());
        return;
    }

    switch (header->type)
    {
    case bacnet::PduType::SimpleAck:
    case bacnet::PduType::ComplexAck:
    case bacnet::PduType::Error:
    case bacnet::PduType::Reject:
    case bacnet::PduType::Abort:
        break;
    default: {
        logger_->debug("Ignoring APDU of type {} (invoke_id={}).",
                       static_cast<int>(header->type),
                       outstanding_->invoke_id);
        return;
    }
    }

    // Segmentation is not supported - the server is told so, and the request fails.
    if ((header->type == bacnet::PduType::ComplexAck) && header->segmented)
    {
        sendAbort(*header->invoke_id, bacnet::AbortReason::SegmentationNotSupported);
        complete(ProtocolError{ProtocolError::Kind::Abort,
                               bacnet::abortReasonName(
                                   static_cast<std::uint8_t>(bacnet::AbortReason::SegmentationNotSupported))});
        return;
    }

    const auto result = bacnet::decodeApdu(apdu);
    if (const auto* const err = cetl::get_if<bacnet::DecodeResult::Failure>(&result))
    {
        complete(malformed((*err == ENOTSUP) ? "unsupported value encoding" : "malformed acknowledgement"));
        return;
    }
    const auto& decoded = cetl::get<bacnet::DecodeResult::Success>(result);

    const auto& request = cetl::get<Request::ReadProperty>(outstanding_->request);
    cetl::visit(cetl::make_overloaded(
                    [this, &request](const bacnet::ReadPropertyAck& ack) {
                        //
                        if ((ack.object_id != request.object_id) || (ack.property != request.property))
                        {
                            complete(malformed("acknowledgement is for " + ack.object_id.toString() + " " +
                                               bacnet::propertyName(ack.property)));
                            return;
                        }
                        complete(Outcome::Success{ack});
                    },
                    [this](const bacnet::ErrorPdu& error) {
                        //
                        complete(ProtocolError{ProtocolError::Kind::Error,
                                               bacnet::errorClassName(error.error_class) + "/" +
                                                   bacnet::errorCodeName(error.error_code)});
                    },
                    [this](const bacnet::RejectPdu& reject) {
                        //
                        complete(ProtocolError{ProtocolError::Kind::Reject, bacnet::rejectReasonName(reject.reason)});
                    },
                    [this](const bacnet::AbortPdu& abort) {
                        //
                        complete(ProtocolError{ProtocolError::Kind::Abort, bacnet::abortReasonName(abort.reason)});
                    },
                    [this](const bacnet::SimpleAck&) {
                        //
                        complete(malformed("unexpected simple acknowledgement"));
                    },
                    [this](const bacnet::OtherPdu& other) {
                        //
                        complete(malformed("unexpected acknowledgement of service " +
                                           std::to_string(other.service.value_or(0))));
                    },
                    [this](const auto&) {
                        //
                        complete(malformed("unexpected response"));
                    }),
                decoded);
}

void RequestCorrelator::handleTimeout()
{
    // The callback may fire for an already completed request (it is re-armed, not cancelled).
    if (!outstanding_ || (executor_.now() < outstanding_->deadline))
    {
        return;
    }

    logger_->debug("Timed out {} (invoke_id={}).", describe(outstanding_->request), outstanding_->invoke_id);
    complete(Outcome::Timeout{});
}

void RequestCorrelator::sendAbort(const std::uint8_t invoke_id, const common::bacnet::AbortReason reason)
{
    tx_buffer_.clear();
    bacnet::encodeAbort({false, invoke_id, static_cast<std::uint8_t>(reason)}, tx_buffer_);
    if (const auto err = link_.send(outstanding_->destination, {tx_buffer_.data(), tx_buffer_.size()}, false))
    {
        logger_->warn("Failed to send Abort (invoke_id={}): {}.", invoke_id, std::strerror(err));
    }
}

void RequestCorrelator::complete(Outcome::Var&& outcome)
{
    CETL_DEBUG_ASSERT(outstanding_, "");

    // Become idle before the receiver runs - it is allowed to send the next request.
    auto receiver = std::move(outstanding_->receiver);
    outstanding_.reset();

    receiver(std::move(outcome));
}

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk
