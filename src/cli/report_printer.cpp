//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "report_printer.hpp"

#include <bacwalk/sdk/object_list_reader.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <cstddef>
#include <iomanip>
#include <ostream>
#include <string>

namespace bacwalk
{
namespace cli
{
namespace
{

/// Writes device supplied text, with control characters as `\xNN`.
///
void writeEscaped(std::ostream& out, const std::string& text)
{
    constexpr char HexDigits[] = "0123456789ABCDEF";

    for (const char ch : text)
    {
        const auto byte = static_cast<unsigned char>(ch);
        if ((byte < 0x20U) || (byte == 0x7FU))
        {
            out << "\\x" << HexDigits[byte >> 4U] << HexDigits[byte & 0x0FU];
            continue;
        }
        out << ch;
    }
}

}  // namespace

void printReport(std::ostream& out, const sdk::ObjectListReader::Read::Report& report)
{
    using sdk::ObjectRecord;

    out << "Device " << report.device_instance << " at " << report.device_address << ": " << report.records.size()
        << " object(s)\n";

    for (std::size_t i = 0; i < report.records.size(); ++i)
    {
        const auto& record = report.records[i];
        out << std::setw(3) << (i + 1) << ". " << record.object_id.toString();

        cetl::visit(cetl::make_overloaded(
                        [](const ObjectRecord::NotRequested&) {},
                        [&out](const ObjectRecord::Resolved& resolved) {
                            //
                            out << " '";
                            writeEscaped(out, resolved.name);
                            out << "'";
                        },
                        [&out](const ObjectRecord::Failed& failed) {
                            //
                            out << " name unavailable: " << failed.reason;
                        }),
                    record.name);
        out << '\n';
    }
}

void printFailure(std::ostream& out, const sdk::ObjectListReader::Read::Failure& failure)
{
    out << sdk::stageName(failure.stage) << " failed: " << failure.reason << '\n';
}

}  // namespace cli
}  // namespace bacwalk
