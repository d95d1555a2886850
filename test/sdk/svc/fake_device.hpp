//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_SVC_FAKE_DEVICE_HPP_INCLUDED
#define BACWALK_SDK_SVC_FAKE_DEVICE_HPP_INCLUDED

#include "bacnet/apdu.hpp"
#include "bacnet/encoding.hpp"
#include "io/device_address.hpp"
#include "link/link.hpp"
#include "virtual_time_executor.hpp"

#include <bacwalk/bacnet/object_id.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/types.hpp>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace bacwalk
{
namespace sdk
{
namespace svc
{

/// Scripted BACnet device on the other side of a fake link.
///
/// Replies are delivered through the virtual time executor after a fixed latency.
/// The device also watches the "one request at a time" rule: a request which arrives while
/// the previous one is neither answered nor timed out is counted as an overlap.
///
class FakeDevice final
{
public:
    struct Behaviour final
    {
        struct Values final
        {
            std::vector<common::bacnet::Value> values;
        };
        struct Error final
        {
            std::uint32_t error_class;
            std::uint32_t error_code;
        };
        struct Reject final
        {
            std::uint8_t reason;
        };
        struct Abort final
        {
            std::uint8_t reason;
        };
        /// Sent as is; its invoke id is patched to match the request.
        struct Raw final
        {
            common::bacnet::Bytes apdu;
        };
        struct Silence final
        {};

        using Var = cetl::variant<Values, Error, Reject, Abort, Raw, Silence>;

    };  // Behaviour

    static constexpr std::uint32_t ErrorClassObject       = 1;
    static constexpr std::uint32_t ErrorCodeUnknownObject = 31;

    FakeDevice(VirtualTimeExecutor&             executor,
               const common::io::DeviceAddress& address,
               const std::uint32_t              instance,
               const libcyphal::Duration        request_timeout)
        : executor_{executor}
        , address_{address}
        , instance_{instance}
        , request_timeout_{request_timeout}
    {
    }

    FakeDevice(const FakeDevice&)                = delete;
    FakeDevice(FakeDevice&&) noexcept            = delete;
    FakeDevice& operator=(const FakeDevice&)     = delete;
    FakeDevice& operator=(FakeDevice&&) noexcept = delete;

    ~FakeDevice() = default;

    // MARK: Script

    void setDiscoverable(const bool discoverable)
    {
        discoverable_ = discoverable;
    }

    void setLatency(const libcyphal::Duration latency)
    {
        latency_ = latency;
    }

    void setStartError(const int start_error)
    {
        start_error_ = start_error;
    }

    void on(const bacnet::ObjectIdentifier&          object_id,
            const common::bacnet::PropertyIdentifier property,
            Behaviour::Var                           behaviour)
    {
        behaviours_[key(object_id, property)] = std::move(behaviour);
    }

    void setObjectList(const std::vector<bacnet::ObjectIdentifier>& object_ids)
    {
        std::vector<common::bacnet::Value> values;
        for (const auto& object_id : object_ids)
        {
            values.emplace_back(object_id);
        }
        on(deviceObject(), common::bacnet::PropertyIdentifier::ObjectList, Behaviour::Values{std::move(values)});
    }

    void setName(const bacnet::ObjectIdentifier& object_id, const std::string& name)
    {
        on(object_id,
           common::bacnet::PropertyIdentifier::ObjectName,
           Behaviour::Values{{common::bacnet::CharacterString{name}}});
    }

    bacnet::ObjectIdentifier deviceObject() const
    {
        return {bacnet::ObjectType::Device, instance_};
    }

    /// Makes the link of a client talking to this device.
    link::Link::Ptr makeLink()
    {
        return std::make_unique<FakeLink>(*this);
    }

    // MARK: Observations

    std::size_t requestCount() const noexcept
    {
        return request_count_;
    }

    std::size_t whoIsCount() const noexcept
    {
        return who_is_count_;
    }

    std::size_t overlapCount() const noexcept
    {
        return overlap_count_;
    }

    std::size_t abortCount() const noexcept
    {
        return abort_count_;
    }

    bool isLinkOpen() const noexcept
    {
        return link_open_;
    }

    const std::vector<common::bacnet::ReadPropertyRequest>& reads() const noexcept
    {
        return reads_;
    }

    std::size_t readCount(const common::bacnet::PropertyIdentifier property) const
    {
        std::size_t count = 0;
        for (const auto& read : reads_)
        {
            count += (read.property == property) ? 1 : 0;
        }
        return count;
    }

    /// Sends an APDU to the client, as if it came from the given source address.
    void inject(const common::io::DeviceAddress& source, common::bacnet::Bytes apdu)
    {
        deliverAt(executor_.now(), source, std::move(apdu));
    }

private:
    class FakeLink final : public link::Link
    {
    public:
        explicit FakeLink(FakeDevice& device)
            : device_{device}
        {
        }

        FakeLink(const FakeLink&)                = delete;
        FakeLink(FakeLink&&) noexcept            = delete;
        FakeLink& operator=(const FakeLink&)     = delete;
        FakeLink& operator=(FakeLink&&) noexcept = delete;

        ~FakeLink() override
        {
            device_.link_open_ = false;
            device_.handler_   = nullptr;
        }

        int start(Handler handler) override
        {
            if (device_.start_error_ != 0)
            {
                return device_.start_error_;
            }
            device_.link_open_ = true;
            device_.handler_   = std::move(handler);
            return 0;
        }

        int send(const common::io::DeviceAddress& destination,
                 const common::bacnet::BytesView  apdu,
                 const bool) override
        {
            if (!device_.link_open_)
            {
                return ENOTCONN;
            }
            device_.receive(destination, apdu);
            return 0;
        }

    private:
        FakeDevice& device_;

    };  // FakeLink

    static std::pair<std::uint32_t, std::uint32_t> key(const bacnet::ObjectIdentifier&          object_id,
                                                       const common::bacnet::PropertyIdentifier property)
    {
        return {object_id.encode(), static_cast<std::uint32_t>(property)};
    }

    void receive(const common::io::DeviceAddress& destination, const common::bacnet::BytesView apdu)
    {
        namespace bacnet = common::bacnet;

        ++request_count_;
        const auto now = executor_.now();
        if (now < busy_until_)
        {
            ++overlap_count_;
        }
        busy_until_ = now + request_timeout_;

        if (destination != address_)
        {
            return;
        }

        const auto decoded = bacnet::decodeApdu(apdu);
        const auto* const pdu = cetl::get_if<bacnet::DecodeResult::Success>(&decoded);
        if (pdu == nullptr)
        {
            return;
        }

        if (cetl::get_if<bacnet::WhoIsRequest>(pdu) != nullptr)
        {
            ++who_is_count_;
            if (discoverable_)
            {
                bacnet::Bytes reply;
                bacnet::encodeIAm({deviceObject(), bacnet::MaxApduLengthAccepted, bacnet::SegmentationNone, 260},
                                  reply);
                replyLater(std::move(reply));
            }
            return;
        }
        if (cetl::get_if<bacnet::AbortPdu>(pdu) != nullptr)
        {
            ++abort_count_;
            busy_until_ = now;
            return;
        }
        const auto* const confirmed = cetl::get_if<bacnet::ConfirmedReadProperty>(pdu);
        if (confirmed == nullptr)
        {
            return;
        }
        reads_.push_back(confirmed->request);

        const auto& request   = confirmed->request;
        const auto  invoke_id = confirmed->invoke_id;
        const auto  found     = behaviours_.find(key(request.object_id, request.property));
        const Behaviour::Var behaviour =
            (found != behaviours_.end())
                ? found->second
                : Behaviour::Var{Behaviour::Error{ErrorClassObject, ErrorCodeUnknownObject}};

        const auto service = static_cast<std::uint8_t>(bacnet::ServiceChoice::ReadProperty);
        bacnet::Bytes reply;
        cetl::visit(cetl::make_overloaded(
                        [&](const Behaviour::Values& values) {
                            //
                            bacnet::encodeReadPropertyAck({invoke_id,
                                                           request.object_id,
                                                           request.property,
                                                           request.array_index,
                                                           values.values},
                                                          reply);
                        },
                        [&](const Behaviour::Error& error) {
                            //
                            bacnet::encodeError({invoke_id, service, error.error_class, error.error_code}, reply);
                        },
                        [&](const Behaviour::Reject& reject) {
                            //
                            bacnet::encodeReject({invoke_id, reject.reason}, reply);
                        },
                        [&](const Behaviour::Abort& abort) {
                            //
                            bacnet::encodeAbort({true, invoke_id, abort.reason}, reply);
                        },
                        [&](const Behaviour::Raw& raw) {
                            //
                            reply = raw.apdu;
                            patchInvokeId(reply, invoke_id);
                        },
                        [](const Behaviour::Silence&) {}),
                    behaviour);

        if (!reply.empty())
        {
            replyLater(std::move(reply));
        }
    }

    /// Replies from the device address after the latency; the request is answered at that time.
    void replyLater(common::bacnet::Bytes apdu)
    {
        const auto at = executor_.now() + latency_;
        busy_until_   = at;
        deliverAt(at, address_, std::move(apdu));
    }

    void deliverAt(const libcyphal::TimePoint at, const common::io::DeviceAddress& source, common::bacnet::Bytes apdu)
    {
        auto shared_apdu = std::make_shared<common::bacnet::Bytes>(std::move(apdu));
        executor_.scheduleAt(at, [this, source, shared_apdu] {
            //
            if (handler_)
            {
                handler_(link::Link::Datagram{source, {shared_apdu->data(), shared_apdu->size()}});
            }
        });
    }

    /// Invoke id sits right after the first octet of all acknowledgement and error PDUs.
    static void patchInvokeId(common::bacnet::Bytes& apdu, const std::uint8_t invoke_id)
    {
        if (apdu.size() > 1)
        {
            apdu[1] = invoke_id;
        }
    }

    using BehaviourMap = std::map<std::pair<std::uint32_t, std::uint32_t>, Behaviour::Var>;

    VirtualTimeExecutor&                             executor_;
    const common::io::DeviceAddress                  address_;
    const std::uint32_t                              instance_;
    const libcyphal::Duration                        request_timeout_;
    libcyphal::Duration                              latency_{std::chrono::milliseconds{10}};
    bool                                             discoverable_{true};
    int                                              start_error_{0};
    bool                                             link_open_{false};
    link::Link::Handler                              handler_;
    BehaviourMap                                     behaviours_;
    libcyphal::TimePoint                             busy_until_{};
    std::vector<common::bacnet::ReadPropertyRequest> reads_;
    std::size_t                                      request_count_{0};
    std::size_t                                      who_is_count_{0};
    std::size_t                                      overlap_count_{0};
    std::size_t                                      abort_count_{0};

};  // FakeDevice

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_SVC_FAKE_DEVICE_HPP_INCLUDED
