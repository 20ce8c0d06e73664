//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_CONTROL_CODEC_HPP_INCLUDED
#define IECMMS_SDK_CONTROL_CODEC_HPP_INCLUDED

#include "mms/mms_types.hpp"
#include "sdk_helpers.hpp"

#include "iecmms/sdk/control.hpp"
#include "iecmms/sdk/typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace iecmms
{
namespace sdk
{

/// Builds the value of an `Oper`, `SBOw` or `Cancel` attribute following the discovered structure.
///
/// Known components are `ctlVal`, `operTm`, `origin` (`orCat`, `orIdent`), `ctlNum`, `T`, `Test` and `Check`;
/// any other component fails with `TypeMismatch`.
///
Outcome<TypedValue> buildControlValue(const TypeDescriptor& type,
                                      const ControlCommand& command,
                                      const std::uint8_t    ctl_num,
                                      const value::UtcTime& now);

/// Converts a wall clock time point to an IEC 61850 timestamp (with 10 bits of time accuracy).
///
value::UtcTime toUtcTime(const std::chrono::system_clock::time_point time_point);

/// Decodes a `LastApplError` information report; nothing if the report is about something else.
///
cetl::optional<LastApplError> parseLastApplError(const common::mms::InformationReport& report);

/// MMS form of the control object reference carried by `LastApplError`, e.g. `D1/CSWI1$CO$Pos`.
///
std::string controlObjectName(const std::string&              logical_device,
                              const std::string&              logical_node,
                              const std::vector<std::string>& names);

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_CONTROL_CODEC_HPP_INCLUDED
