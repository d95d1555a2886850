//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BACWALK_CLI_REPORT_PRINTER_HPP_INCLUDED
#define BACWALK_CLI_REPORT_PRINTER_HPP_INCLUDED

#include <bacwalk/sdk/object_list_reader.hpp>

#include <ostream>

namespace bacwalk
{
namespace cli
{

/// Prints the device header line, then one numbered line per object.
///
void printReport(std::ostream& out, const sdk::ObjectListReader::Read::Report& report);

/// Prints "<stage> failed: <reason>" line.
///
void printFailure(std::ostream& out, const sdk::ObjectListReader::Read::Failure& failure);

}  // namespace cli
}  // namespace bacwalk

#endif  // BACWALK_CLI_REPORT_PRINTER_HPP_INCLUDED
