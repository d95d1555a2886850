//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_SDK_SVC_RESULT_AGGREGATOR_HPP_INCLUDED
#define BACWALK_SDK_SVC_RESULT_AGGREGATOR_HPP_INCLUDED

#include "io/device_address.hpp"
#include "logging.hpp"

#include "bacwalk/bacnet/object_id.hpp"
#include "bacwalk/sdk/object_list_reader.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace bacwalk
{
namespace sdk
{
namespace svc
{

class ResultAggregator final
{
public:
    using Report = ObjectListReader::Read::Report;

    explicit ResultAggregator(common::LoggerPtr logger)
        : logger_{std::move(logger)}
    {
    }

    /// Assembles the final report, with exactly one record per object-list entry and in the object-list order.
    ///
    /// Records normally arrive already in order. Should any be missing, its entry gets a failure marker.
    ///
    Report aggregate(const common::io::DeviceAddress&             address,
                     const std::uint32_t                          device_instance,
                     const std::vector<bacnet::ObjectIdentifier>& object_list,
                     std::vector<ObjectRecord>&&                  records) const;

private:
    static std::vector<ObjectRecord> reorder(const std::vector<bacnet::ObjectIdentifier>& object_list,
                                             std::vector<ObjectRecord>&&                  records);

    void logReport(const Report& report) const;

    common::LoggerPtr logger_;

};  // ResultAggregator

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk

#endif  // BACWALK_SDK_SVC_RESULT_AGGREGATOR_HPP_INCLUDED
