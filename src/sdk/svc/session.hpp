//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_SVC_SESSION_HPP_INCLUDED
#define BACWALK_SDK_SVC_SESSION_HPP_INCLUDED

#include "address_resolver.hpp"
#include "discovery_stage.hpp"
#include "link/link.hpp"
#include "logging.hpp"
#include "name_enumeration_stage.hpp"
#include "object_list_stage.hpp"
#include "request_correlator.hpp"
#include "result_aggregator.hpp"

#include "bacwalk/bacnet/object_id.hpp"
#include "bacwalk/sdk/object_list_reader.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace bacwalk
{
namespace sdk
{
namespace svc
{

/// Reads the object list of one device, from discovery up to the final report.
///
/// The session exclusively owns its link (and so its local endpoint) and drives the stages in fixed order:
/// discovery -> object list -> name enumeration -> aggregation. Any failure of the first two stages is fatal.
/// The link is released right before the completion is called.
/// Destroying a session which has not yet completed abandons the outstanding request (if any).
///
class Session final
{
public:
    enum class State : std::uint8_t
    {
        Idle,
        Discovering,
        ReadingObjectList,
        EnumeratingNames,
        Completed,
        Failed,
    };

    using Result     = ObjectListReader::Read::Result;
    using Completion = std::function<void(Result&&)>;

    struct Params final
    {
        Target              target;
        libcyphal::Duration request_timeout;
        bool                resolve_names;
    };

    Session(libcyphal::IExecutor& executor, link::Link::Ptr link, const Params& params, common::LoggerPtr logger);

    Session(const Session&)                = delete;
    Session(Session&&) noexcept            = delete;
    Session& operator=(const Session&)     = delete;
    Session& operator=(Session&&) noexcept = delete;

    ~Session();

    /// Starts the session.
    ///
    /// The completion is called exactly once (unless the session is destroyed first), and always
    /// from an executor callback of its own - never from within `start`. So the completion may destroy the session.
    ///
    void start(Completion completion);

    State state() const noexcept
    {
        return state_;
    }

    /// Gets the number of requests sent so far.
    std::size_t requestsSent() const noexcept
    {
        return correlator_.sentCount();
    }

private:
    using Stage = ObjectListReader::Read::Stage;

    void handleDiscovery(DiscoveryStage::Result::Var&& result);
    void handleObjectList(ObjectListStage::Result::Var&& result);
    void handleNames(std::vector<ObjectRecord>&& records);
    void fail(const Stage stage, std::string reason);
    void finish(Result&& result);
    void deliver();

    libcyphal::IExecutor&                 executor_;
    link::Link::Ptr                       link_;
    common::LoggerPtr                     logger_;
    RequestCorrelator                     correlator_;
    Target                                target_;
    DiscoveryStage                        discovery_;
    ObjectListStage                       object_list_stage_;
    NameEnumerationStage                  names_;
    ResultAggregator                      aggregator_;
    std::vector<bacnet::ObjectIdentifier> object_list_;
    State                                 state_{State::Idle};
    Completion                            completion_;
    cetl::optional<Result>                final_result_;
    libcyphal::IExecutor::Callback::Any   completion_callback_;

};  // Session

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_SVC_SESSION_HPP_INCLUDED
