//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <bacwalk/sdk/object_list_reader.hpp>

#include "io/device_address.hpp"
#include "link/link.hpp"
#include "link/udp_link.hpp"
#include "logging.hpp"
#include "sdk_factory.hpp"
#include "svc/address_resolver.hpp"
#include "svc/session.hpp"

#include "bacwalk/platform/defines.hpp"
#include "bacwalk/sdk/execution.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cerrno>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace bacwalk
{
namespace sdk
{
namespace
{

/// Fails every read right away - used when the link could not be made.
///
class NullLink final : public link::Link
{
public:
    CETL_NODISCARD int start(Handler) override
    {
        return ENODEV;
    }

    CETL_NODISCARD int send(const common::io::DeviceAddress&, const common::bacnet::BytesView, const bool) override
    {
        return ENODEV;
    }

};  // NullLink

class ObjectListReaderImpl final : public ObjectListReader
{
public:
    ObjectListReaderImpl(libcyphal::IExecutor& executor, svc::Session::Params session_params, Factory::LinkMaker link_maker)
        : executor_{executor}
        , session_params_{std::move(session_params)}
        , link_maker_{std::move(link_maker)}
        , logger_{common::getLogger(common::LoggerName::Sdk)}
    {
    }

    // ObjectListReader

    SenderOf<Read::Result>::Ptr read() override
    {
        return std::make_unique<ReadSender>(*this);
    }

private:
    /// Owns the session of one read - destroying the sender cancels the read.
    ///
    class ReadSender final : public SenderOf<Read::Result>
    {
    public:
        explicit ReadSender(ObjectListReaderImpl& reader)
            : reader_{reader}
        {
        }

        void submitImpl(std::function<void(Read::Result&&)>&& receiver) override
        {
            CETL_DEBUG_ASSERT(!session_, "");

            auto link = reader_.link_maker_();
            if (!link)
            {
                link = std::make_unique<NullLink>();
            }

            session_ = std::make_unique<svc::Session>(reader_.executor_,
                                                      std::move(link),
                                                      reader_.session_params_,
                                                      reader_.logger_);
            session_->start(std::move(receiver));
        }

    private:
        ObjectListReaderImpl&         reader_;
        std::unique_ptr<svc::Session> session_;

    };  // ReadSender

    libcyphal::IExecutor& executor_;
    svc::Session::Params  session_params_;
    Factory::LinkMaker    link_maker_;
    common::LoggerPtr     logger_;

};  // ObjectListReaderImpl

}  // namespace

CETL_NODISCARD ObjectListReader::Ptr ObjectListReader::make(cetl::pmr::memory_resource&       memory,
                                                            platform::SingleThreadedExecutor& executor,
                                                            const Params&                     params)
{
    using common::io::DeviceAddress;

    const auto local_result = DeviceAddress::parse(params.local_address, params.local_port);
    const auto* const local = cetl::get_if<DeviceAddress::ParseResult::Success>(&local_result);
    if (local == nullptr)
    {
        common::getLogger(common::LoggerName::Sdk)->error("Invalid local address '{}'.", params.local_address);
        return nullptr;
    }

    const auto target_result = DeviceAddress::parse(params.target_address, params.target_port);
    if (const auto* const target = cetl::get_if<DeviceAddress::ParseResult::Success>(&target_result))
    {
        if (local->isWildcard() && (local->port() == target->port()))
        {
            const auto logger = common::getLogger(common::LoggerName::Sdk);
            logger->warn("Local port {} is the same as the target one - "
                         "replies from a device on this host may be missed.",
                         local->port());
        }
    }

    return Factory::makeObjectListReader(executor, params, [&memory, &executor, local_address = *local] {
        //
        return link::UdpLink::make(memory, executor, local_address);
    });
}

CETL_NODISCARD ObjectListReader::Ptr Factory::makeObjectListReader(libcyphal::IExecutor&           executor,
                                                                   const ObjectListReader::Params& params,
                                                                   LinkMaker                       link_maker)
{
    using common::io::DeviceAddress;

    auto logger = common::getLogger(common::LoggerName::Sdk);

    const auto target_result = DeviceAddress::parse(params.target_address, params.target_port);
    const auto* const target = cetl::get_if<DeviceAddress::ParseResult::Success>(&target_result);
    if ((target == nullptr) || target->isWildcard())
    {
        logger->error("Invalid target address '{}'.", params.target_address);
        return nullptr;
    }

    const auto timeout = std::chrono::duration_cast<libcyphal::Duration>(params.request_timeout);
    if (timeout <= libcyphal::Duration::zero())
    {
        logger->error("Invalid request timeout ({} ms).", params.request_timeout.count());
        return nullptr;
    }

    svc::Session::Params session_params{svc::AddressResolver::resolve(*target, params.device_instance),
                                        timeout,
                                        params.resolve_names};

    return std::make_unique<ObjectListReaderImpl>(executor, std::move(session_params), std::move(link_maker));
}

const char* stageName(const ObjectListReader::Read::Stage stage) noexcept
{
    switch (stage)
    {
    case ObjectListReader::Read::Stage::Transport:
        return "transport";
    case ObjectListReader::Read::Stage::Discovery:
        return "discovery";
    case ObjectListReader::Read::Stage::ObjectList:
        return "object-list";
    default:
        return "?";
    }
}

}  // namespace sdk
}  // namespace bacwalk
