//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "result_aggregator.hpp"

#include "io/device_address.hpp"
#include "logging.hpp"

#include "bacwalk/bacnet/object_id.hpp"
#include "bacwalk/sdk/object_list_reader.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace bacwalk
{
namespace sdk
{
namespace svc
{

ResultAggregator::Report ResultAggregator::aggregate(const common::io::DeviceAddress&             address,
                                                     const std::uint32_t                          device_instance,
                                                     const std::vector<bacnet::ObjectIdentifier>& object_list,
                                                     std::vector<ObjectRecord>&&                  records) const
{
    const bool in_order = std::equal(object_list.begin(),
                                     object_list.end(),
                                     records.begin(),
                                     records.end(),
                                     [](const auto& object_id, const auto& record) {
                                         //
                                         return object_id == record.object_id;
                                     });
    if (!in_order)
    {
        logger_->error("Object records do not follow the object list (objects={}, records={}) - reordering.",
                       object_list.size(),
                       records.size());
        records = reorder(object_list, std::move(records));
    }

    Report report{address.toString(), device_instance, std::move(records)};
    logReport(report);
    return report;
}

std::vector<ObjectRecord> ResultAggregator::reorder(const std::vector<bacnet::ObjectIdentifier>& object_list,
                                                    std::vector<ObjectRecord>&&                  records)
{
    std::vector<bool> used(records.size(), false);

    std::vector<ObjectRecord> ordered;
    ordered.reserve(object_list.size());
    for (const auto& object_id : object_list)
    {
        // Duplicated identifiers are matched in their order of appearance.
        std::size_t index = 0;
        while ((index < records.size()) && (used[index] || (records[index].object_id != object_id)))
        {
            ++index;
        }
        if (index == records.size())
        {
            ordered.push_back(ObjectRecord{object_id, ObjectRecord::Failed{"missing"}});
            continue;
        }
        used[index] = true;
        ordered.push_back(std::move(records[index]));
    }
    return ordered;
}

void ResultAggregator::logReport(const Report& report) const
{
    std::size_t resolved = 0;
    std::size_t failed   = 0;

    logger_->info("--- Object List start ---");
    for (std::size_t i = 0; i < report.records.size(); ++i)
    {
        const auto& record = report.records[i];
        if (const auto* const name = cetl::get_if<ObjectRecord::Resolved>(&record.name))
        {
            ++resolved;
            logger_->info("{:3}. {} '{}'", i + 1, record.object_id.toString(), name->name);
        }
        else if (const auto* const failure = cetl::get_if<ObjectRecord::Failed>(&record.name))
        {
            ++failed;
            logger_->info("{:3}. {} name unavailable: {}", i + 1, record.object_id.toString(), failure->reason);
        }
        else
        {
            logger_->info("{:3}. {}", i + 1, record.object_id.toString());
        }
    }
    logger_->info("--- Object List end ---");

    logger_->info("Device {} at '{}': {} object(s), {} name(s) resolved, {} failed.",
                  report.device_instance,
                  report.device_address,
                  report.records.size(),
                  resolved,
                  failed);
}

}  // namespace svc
}  // namespace sdk
}  // namespace bacwalk
