//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_SVC_OBJECT_LIST_STAGE_HPP_INCLUDED
#define BACWALK_SDK_SVC_OBJECT_LIST_STAGE_HPP_INCLUDED

#include "address_resolver.hpp"
#include "bacnet/encoding.hpp"
#include "logging.hpp"
#include "request_correlator.hpp"

#include "bacwalk/bacnet/object_id.hpp"

#include <cetl/pf17/cetlpf.hpp>

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

/// Reads the whole `objectList` property of a resolved target device with a single request.
///
class ObjectListStage final
{
public:
    struct Result final
    {
        struct Success final
        {
            std::vector<bacnet::ObjectIdentifier> object_ids;
        };

        struct Failure final
        {
            enum class Kind : std::uint8_t
            {
                /// The request itself failed: timeout, transmit error, or an error/reject/abort response.
                Request,
                /// The response was received but could not be understood.
                Decoding,
            };

            Kind        kind;
            std::string reason;
        };

        using Var = cetl::variant<Success, Failure>;

    };  // Result

    using Completion = std::function<void(Result::Var&&)>;

    ObjectListStage(RequestCorrelator& correlator, const Target& target);

    ObjectListStage(const ObjectListStage&)                = delete;
    ObjectListStage(ObjectListStage&&) noexcept            = delete;
    ObjectListStage& operator=(const ObjectListStage&)     = delete;
    ObjectListStage& operator=(ObjectListStage&&) noexcept = delete;

    ~ObjectListStage() = default;

    void start(Completion completion);

    /// Extracts object identifiers out of the decoded property values.
    ///
    /// @return Failure of `Decoding` kind if any of the values is not an object identifier.
    ///
    static Result::Var extractObjectIds(const std::vector<common::bacnet::Value>& values);

private:
    void handleOutcome(RequestCorrelator::Outcome::Var&& outcome);
    void complete(Result::Var&& result);

    RequestCorrelator& correlator_;
    const Target&      target_;
    common::LoggerPtr  logger_;
    Completion         completion_;

};  // ObjectListStage

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_SVC_OBJECT_LIST_STAGE_HPP_INCLUDED
