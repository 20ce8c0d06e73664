//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_ISO_ISO_CLIENT_HPP_INCLUDED
#define IECMMS_COMMON_ISO_ISO_CLIENT_HPP_INCLUDED

#include "iso_link.hpp"

#include "io/byte_channel.hpp"

#include <cetl/cetl.hpp>

namespace iecmms
{
namespace common
{
namespace iso
{

/// Makes the client side ISO stack (COTP / session / presentation / ACSE) over a byte channel.
///
class IsoClient final
{
public:
    CETL_NODISCARD static IsoLink::Ptr make(io::ByteChannel::Ptr channel);

    IsoClient() = delete;

};  // IsoClient

}  // namespace iso
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_ISO_ISO_CLIENT_HPP_INCLUDED
