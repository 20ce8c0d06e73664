//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_IO_TCP_CHANNEL_HPP_INCLUDED
#define IECMMS_COMMON_IO_TCP_CHANNEL_HPP_INCLUDED

#include "byte_channel.hpp"

#include <cetl/cetl.hpp>

namespace iecmms
{
namespace common
{
namespace io
{

/// Makes a byte channel on top of a POSIX TCP socket.
///
class TcpChannel final
{
public:
    CETL_NODISCARD static ByteChannel::Ptr make();

    TcpChannel() = delete;

};  // TcpChannel

}  // namespace io
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_IO_TCP_CHANNEL_HPP_INCLUDED
