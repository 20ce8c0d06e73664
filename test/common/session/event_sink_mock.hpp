//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_EVENT_SINK_MOCK_HPP_INCLUDED
#define IECMMS_SDK_EVENT_SINK_MOCK_HPP_INCLUDED

#include "iecmms/sdk/events.hpp"

#include <gmock/gmock.h>

namespace iecmms
{
namespace sdk
{

class EventSinkMock : public EventSink
{
public:
    MOCK_METHOD(void, onEvent, (const SessionEvent::Var& event), (override));

};  // EventSinkMock

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_EVENT_SINK_MOCK_HPP_INCLUDED
