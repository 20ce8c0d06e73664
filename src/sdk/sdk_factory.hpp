//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_SDK_FACTORY_HPP_INCLUDED
#define IECMMS_SDK_FACTORY_HPP_INCLUDED

#include "session/session.hpp"

#include "iecmms/sdk/client.hpp"

#include <cetl/cetl.hpp>

namespace iecmms
{
namespace sdk
{

struct Factory
{
    /// Makes a client on top of an already made session (f.e. one over an in-memory link).
    ///
    CETL_NODISCARD static Client::Ptr makeClient(ClientOptions options, common::session::Session::Ptr session);

};  // Factory

}  // namespace sdk
}  // namespace iecmms

#endif  // IECMMS_SDK_FACTORY_HPP_INCLUDED
