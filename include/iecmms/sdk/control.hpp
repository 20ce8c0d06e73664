//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_CONTROL_HPP_INCLUDED
#define IECMMS_SDK_CONTROL_HPP_INCLUDED

#include "typed_value.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>

namespace iecmms
{
namespace sdk
{

/// Value of the `CF.ctlModel` attribute of a controllable data object.
///
enum class ControlModel : std::uint8_t
{
    StatusOnly     = 0,
    DirectNormal   = 1,
    SboNormal      = 2,
    DirectEnhanced = 3,
    SboEnhanced    = 4,

};  // ControlModel

enum class OriginatorCategory : std::uint8_t
{
    NotSupported     = 0,
    BayControl       = 1,
    StationControl   = 2,
    RemoteControl    = 3,
    AutomaticBay     = 4,
    AutomaticStation = 5,
    AutomaticRemote  = 6,
    Maintenance      = 7,
    Process          = 8,

};  // OriginatorCategory

/// `AddCause` of the `LastApplError` control feedback.
///
enum class ControlAddCause : std::uint8_t
{
    Unknown                     = 0,
    NotSupported                = 1,
    BlockedBySwitchingHierarchy = 2,
    SelectFailed                = 3,
    InvalidPosition             = 4,
    PositionReached             = 5,
    ParameterChangeInExecution  = 6,
    StepLimit                   = 7,
    BlockedByMode               = 8,
    BlockedByProcess            = 9,
    BlockedByInterlocking       = 10,
    BlockedBySynchrocheck       = 11,
    CommandAlreadyInExecution   = 12,
    BlockedByHealth             = 13,
    OneOfNControl               = 14,
    AbortionByCancel            = 15,
    TimeLimitOver               = 16,
    AbortionByTrip              = 17,
    ObjectNotSelected           = 18,
    ObjectAlreadySelected       = 19,
    NoAccessAuthority           = 20,
    EndedWithOvershoot          = 21,
    AbortionDueToDeviation      = 22,
    AbortionByCommunicationLoss = 23,
    BlockedByCommand            = 24,
    None                        = 25,
    InconsistentParameters      = 26,
    LockedByOtherClient         = 27,

};  // ControlAddCause

const char* toString(const ControlModel model) noexcept;
const char* toString(const ControlAddCause cause) noexcept;

/// Parameters of a select-with-value, operate or cancel request.
///
struct ControlCommand final
{
    TypedValue                     ctl_val;
    OriginatorCategory             or_cat{OriginatorCategory::RemoteControl};
    std::string                    or_ident;
    bool                           test{false};
    bool                           synchro_check{false};
    bool                           interlock_check{false};
    cetl::optional<value::UtcTime> oper_time;

};  // ControlCommand

/// Control feedback reported by the server through the `LastApplError` information report.
///
struct LastApplError final
{
    std::string        control_object;
    std::int32_t       error{0};
    OriginatorCategory or_cat{OriginatorCategory::NotSupported};
    std::string        or_ident;
    std::uint8_t       ctl_num{0};
    ControlAddCause    add_cause{ControlAddCause::Unknown};

};  // LastApplError

struct ControlResult final
{
    std::string  reference;
    ControlModel model{ControlModel::StatusOnly};
    std::uint8_t ctl_num{0};

};  // ControlResult

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_CONTROL_HPP_INCLUDED
