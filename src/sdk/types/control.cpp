//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "iecmms/sdk/control.hpp"

#include <array>
#include <cstddef>

namespace iecmms
{
namespace sdk
{

const char* toString(const ControlModel model) noexcept
{
    switch (model)
    {
    case ControlModel::StatusOnly:
        return "status-only";
    case ControlModel::DirectNormal:
        return "direct-with-normal-security";
    case ControlModel::SboNormal:
        return "sbo-with-normal-security";
    case ControlModel::DirectEnhanced:
        return "direct-with-enhanced-security";
    case ControlModel::SboEnhanced:
        return "sbo-with-enhanced-security";
    default:
        return "?";
    }
}

const char* toString(const ControlAddCause cause) noexcept
{
    static constexpr std::array<const char*, 28> Names{{
        "unknown",
        "not-supported",
        "blocked-by-switching-hierarchy",
        "select-failed",
        "invalid-position",
        "position-reached",
        "parameter-change-in-execution",
        "step-limit",
        "blocked-by-mode",
        "blocked-by-process",
        "blocked-by-interlocking",
        "blocked-by-synchrocheck",
        "command-already-in-execution",
        "blocked-by-health",
        "1-of-n-control",
        "abortion-by-cancel",
        "time-limit-over",
        "abortion-by-trip",
        "object-not-selected",
        "object-already-selected",
        "no-access-authority",
        "ended-with-overshoot",
        "abortion-due-to-deviation",
        "abortion-by-communication-loss",
        "blocked-by-command",
        "none",
        "inconsistent-parameters",
        "locked-by-other-client",
    }};

    const auto index = static_cast<std::size_t>(cause);
    return (index < Names.size()) ? Names[index] : "?";
}

}  // namespace sdk
}  // namespace iecmms
