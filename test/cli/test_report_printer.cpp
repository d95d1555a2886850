//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "report_printer.hpp"

#include <bacwalk/bacnet/object_id.hpp>
#include <bacwalk/sdk/object_list_reader.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>

namespace
{

using namespace bacwalk::cli;  // NOLINT This our main concern here in the unit tests.
using bacwalk::bacnet::ObjectIdentifier;
using bacwalk::bacnet::ObjectType;
using bacwalk::sdk::ObjectRecord;

using Read = bacwalk::sdk::ObjectListReader::Read;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestReportPrinter : public testing::Test
{};

// MARK: - Tests:

TEST_F(TestReportPrinter, report)
{
    Read::Report report{"192.168.1.20:47808", 1234, {}};
    report.records.push_back({{ObjectType::Device, 1234}, ObjectRecord::Resolved{"Main Controller"}});
    report.records.push_back({{ObjectType::AnalogInput, 1}, ObjectRecord::Failed{"timeout"}});
    report.records.push_back({{ObjectType::BinaryValue, 7}, ObjectRecord::NotRequested{}});

    std::ostringstream out;
    printReport(out, report);

    EXPECT_THAT(out.str(),
                "Device 1234 at 192.168.1.20:47808: 3 object(s)\n"
                "  1. device:1234 'Main Controller'\n"
                "  2. analogInput:1 name unavailable: timeout\n"
                "  3. binaryValue:7\n");
}

TEST_F(TestReportPrinter, control_characters_in_names_are_escaped)
{
    Read::Report report{"10.0.0.1:47808", 7, {}};
    report.records.push_back({{ObjectType::AnalogInput, 1}, ObjectRecord::Resolved{"Temp\x1B[2J\r\nFake"}});
    report.records.push_back({{ObjectType::AnalogInput, 2}, ObjectRecord::Resolved{"Del\x7F Äpfel"}});

    std::ostringstream out;
    printReport(out, report);

    EXPECT_THAT(out.str(),
                "Device 7 at 10.0.0.1:47808: 2 object(s)\n"
                "  1. analogInput:1 'Temp\\x1B[2J\\x0D\\x0AFake'\n"
                "  2. analogInput:2 'Del\\x7F Äpfel'\n");
}

TEST_F(TestReportPrinter, empty_report)
{
    const Read::Report report{"10.0.0.1:47808", 7, {}};

    std::ostringstream out;
    printReport(out, report);

    EXPECT_THAT(out.str(), "Device 7 at 10.0.0.1:47808: 0 object(s)\n");
}

TEST_F(TestReportPrinter, failure)
{
    std::ostringstream out;
    printFailure(out, {Read::Stage::Discovery, "device did not respond to discovery (timeout)"});

    EXPECT_THAT(out.str(), "discovery failed: device did not respond to discovery (timeout)\n");
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
