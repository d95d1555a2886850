//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_SVC_NAME_ENUMERATION_STAGE_HPP_INCLUDED
#define BACWALK_SDK_SVC_NAME_ENUMERATION_STAGE_HPP_INCLUDED

#include "io/device_address.hpp"
#include "logging.hpp"
#include "request_correlator.hpp"

#include "bacwalk/bacnet/object_id.hpp"
#include "bacwalk/sdk/object_list_reader.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <vector>

namespace bacwalk
{
namespace sdk
{
namespace svc
{

/// Traversal state of the name enumeration.
///
/// Every object identifier is either still pending, in flight (at most one), or completed.
///
struct EnumerationContext final
{
    std::deque<bacnet::ObjectIdentifier> pending;
    std::vector<ObjectRecord>            completed;

};  // EnumerationContext

/// Reads `objectName` of each object, strictly one request at a time and in the object-list order.
///
/// A failure to resolve one name is recorded against that object, and the traversal goes on.
///
class NameEnumerationStage final
{
public:
    using Completion = std::function<void(std::vector<ObjectRecord>&&)>;

    NameEnumerationStage(RequestCorrelator& correlator, const common::io::DeviceAddress& address, const bool resolve_names);

    NameEnumerationStage(const NameEnumerationStage&)                = delete;
    NameEnumerationStage(NameEnumerationStage&&) noexcept            = delete;
    NameEnumerationStage& operator=(const NameEnumerationStage&)     = delete;
    NameEnumerationStage& operator=(NameEnumerationStage&&) noexcept = delete;

    ~NameEnumerationStage() = default;

    /// Starts the traversal. The completion gets one record per object identifier, in the same order.
    void start(const std::vector<bacnet::ObjectIdentifier>& object_ids, Completion completion);

    /// Stops the traversal without calling the completion.
    void cancel();

    std::size_t pendingCount() const noexcept
    {
        return context_ ? context_->pending.size() : 0;
    }

    std::size_t completedCount() const noexcept
    {
        return context_ ? context_->completed.size() : 0;
    }

    /// Converts the outcome of an `objectName` read into the record name.
    static ObjectRecord::Name toName(const RequestCorrelator::Outcome::Var& outcome);

private:
    void step();
    void handleOutcome(RequestCorrelator::Outcome::Var&& outcome);
    void append(const bacnet::ObjectIdentifier& object_id, ObjectRecord::Name&& name);

    RequestCorrelator&                       correlator_;
    const common::io::DeviceAddress          address_;
    const bool                               resolve_names_;
    common::LoggerPtr                        logger_;
    std::size_t                              total_{0};
    cetl::optional<EnumerationContext>       context_;
    cetl::optional<bacnet::ObjectIdentifier> in_flight_;
    Completion                               completion_;

};  // NameEnumerationStage

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_SVC_NAME_ENUMERATION_STAGE_HPP_INCLUDED
