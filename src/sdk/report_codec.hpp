//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_REPORT_CODEC_HPP_INCLUDED
#define IECMMS_SDK_REPORT_CODEC_HPP_INCLUDED

#include "mms/mms_types.hpp"
#include "sdk_helpers.hpp"

#include "iecmms/sdk/report.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <vector>

namespace iecmms
{
namespace sdk
{

/// One attribute write of a report control block update.
///
struct ReportControlWrite final
{
    std::string name;  // like `RptEna`
    TypedValue  value;
};

/// Reads the attributes of a report control block from the value of the whole control block.
///
Outcome<ReportControlBlock> parseReportControlBlock(std::string       reference,
                                                    const bool        buffered,
                                                    const TypedValue& value);

/// Lists the attribute writes of an update in writing order.
///
/// Bit strings are sized after the discovered type of the control block; an attribute which
/// the control block does not have (like `Resv` of a buffered one) fails with `TypeMismatch`.
///
Outcome<std::vector<ReportControlWrite>> buildReportControlWrites(const TypeDescriptor&           rcb_type,
                                                                  const ReportControlBlockUpdate& update);

/// Reports are information reports of the `RPT` variable list.
///
bool isReport(const common::mms::InformationReport& report);

/// Decodes a report, following its `OptFlds` and inclusion bit string.
///
Outcome<Report> parseReport(const common::mms::InformationReport& report);

/// Converts a data set reference (`D1/LLN0.Events`, `@Events`) to the MMS text of `DatSet` and back.
///
Outcome<std::string> dataSetToMmsText(const std::string& reference);
std::string          dataSetFromMmsText(const std::string& text);

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_REPORT_CODEC_HPP_INCLUDED
