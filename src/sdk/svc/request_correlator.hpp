//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_SVC_REQUEST_CORRELATOR_HPP_INCLUDED
#define BACWALK_SDK_SVC_REQUEST_CORRELATOR_HPP_INCLUDED

#include "bacnet/apdu.hpp"
#include "bacnet/encoding.hpp"
#include "io/device_address.hpp"
#include "link/link.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace bacwalk
{
namespace sdk
{
namespace svc
{

/// Sends one request at a time to a device, and delivers exactly one outcome for it.
///
/// The outcome is either the matching response, an explicit negative response (error, reject, abort),
/// a malformed response, or a timeout. Anything which does not match the outstanding request
/// (including everything received while idle) is ignored.
///
class RequestCorrelator final
{
public:
    struct Request final
    {
        /// Directed device discovery; answered by an I-Am.
        struct WhoIs final
        {};

        using ReadProperty = common::bacnet::ReadPropertyRequest;

        using Var = cetl::variant<WhoIs, ReadProperty>;

    };  // Request

    struct Outcome final
    {
        using Response = cetl::variant<common::bacnet::IAmRequest, common::bacnet::ReadPropertyAck>;

        struct Success final
        {
            Response response;
        };

        struct ProtocolError final
        {
            enum class Kind : std::uint8_t
            {
                Error,
                Reject,
                Abort,
                Malformed,
            };

            Kind kind;

            /// F.e. "property/unknown-property", "unrecognized-service" or "malformed acknowledgement".
            std::string detail;

            /// Makes the error marker, f.e. "error: property/unknown-property", "rejected: unrecognized-service",
            /// "aborted: segmentation-not-supported" or "decoding error: malformed acknowledgement".
            std::string toString() const;
        };

        struct Timeout final
        {};

        using Var = cetl::variant<Success, ProtocolError, Timeout>;

    };  // Outcome

    using Receiver = std::function<void(Outcome::Var&&)>;

    RequestCorrelator(libcyphal::IExecutor& executor, link::Link& link, const libcyphal::Duration timeout);

    RequestCorrelator(const RequestCorrelator&)                = delete;
    RequestCorrelator(RequestCorrelator&&) noexcept            = delete;
    RequestCorrelator& operator=(const RequestCorrelator&)     = delete;
    RequestCorrelator& operator=(RequestCorrelator&&) noexcept = delete;

    ~RequestCorrelator() = default;

    /// Sends the request to the destination, and arms the response timeout.
    ///
    /// The receiver is called exactly once (and only if the request was sent), after the correlator
    /// has become idle again - so it may issue the next request right away.
    ///
    /// @return `0` if the request was sent; `EBUSY` if another request is still outstanding (a contract
    ///         violation); otherwise an `errno`-like error code of the link.
    ///
    CETL_NODISCARD int send(const Request::Var&              request,
                            const common::io::DeviceAddress& destination,
                            Receiver                         receiver);

    /// Gives up the outstanding request (if any) without calling its receiver.
    void abandon();

    /// Passes a received APDU - the `link::Link` handler is expected to forward everything here.
    void onDatagram(const link::Link::Datagram& datagram);

    bool isIdle() const noexcept
    {
        return !outstanding_.has_value();
    }

    /// Gets the number of requests sent so far.
    std::size_t sentCount() const noexcept
    {
        return sent_count_;
    }

private:
    struct Outstanding final
    {
        Request::Var              request;
        common::io::DeviceAddress destination;
        std::uint8_t              invoke_id;
        libcyphal::TimePoint      deadline;
        Receiver                  receiver;
    };

    void handleDiscoveryResponse(const common::bacnet::BytesView apdu);
    void handlePropertyResponse(const common::bacnet::BytesView apdu);
    void handleTimeout();
    void sendAbort(const std::uint8_t invoke_id, const common::bacnet::AbortReason reason);
    void complete(Outcome::Var&& outcome);

    libcyphal::IExecutor&               executor_;
    link::Link&                         link_;
    const libcyphal::Duration           timeout_;
    common::LoggerPtr                   logger_;
    libcyphal::IExecutor::Callback::Any timeout_callback_;
    cetl::optional<Outstanding>         outstanding_;
    std::uint8_t                        next_invoke_id_{0};
    std::size_t                         sent_count_{0};
    common::bacnet::Bytes               tx_buffer_;

};  // RequestCorrelator

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_SVC_REQUEST_CORRELATOR_HPP_INCLUDED
