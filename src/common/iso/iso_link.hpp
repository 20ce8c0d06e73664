//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_ISO_ISO_LINK_HPP_INCLUDED
#define IECMMS_COMMON_ISO_ISO_LINK_HPP_INCLUDED

#include "ber/ber_value.hpp"

#include "iecmms/sdk/errors.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace iecmms
{
namespace common
{
namespace iso
{

/// Abstract ISO upper layer link which transfers whole (encoded) MMS PDUs.
///
/// `send` and `receive` may be used concurrently from different threads,
/// but each of them by at most one thread at a time.
///
class IsoLink
{
public:
    using Ptr = std::unique_ptr<IsoLink>;

    IsoLink(const IsoLink&)                = delete;
    IsoLink(IsoLink&&) noexcept            = delete;
    IsoLink& operator=(const IsoLink&)     = delete;
    IsoLink& operator=(IsoLink&&) noexcept = delete;

    virtual ~IsoLink() = default;

    struct AssociateParams final
    {
        std::string endpoint;
        std::string password;
    };

    struct Associate
    {
        using Success = ber::BerValue;  // MMS initiate response (or initiate error) PDU
        using Failure = sdk::error::Connect;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Establishes the transport connection, and the session/presentation/ACSE association
    /// which carries the given MMS initiate request.
    ///
    virtual Associate::Var associate(const AssociateParams&          params,
                                     const ber::BerValue&            initiate_request,
                                     const std::chrono::milliseconds timeout) = 0;

    /// Sends one encoded MMS PDU.
    ///
    /// @return Zero on success, or an `errno`-like code (`ESHUTDOWN` when the link is closed).
    ///
    CETL_NODISCARD virtual int send(const ber::Bytes& mms_pdu) = 0;

    struct Receive
    {
        using Success = ber::Bytes;  // encoded MMS PDU
        using Failure = int;         // ESHUTDOWN when closed, EPROTO on a framing violation
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Blocks until the next whole MMS PDU arrives.
    ///
    virtual Receive::Var receive() = 0;

    /// Sends a session abort (best effort) and closes the link.
    ///
    virtual void abort() = 0;

    /// Closes the link. Unblocks a pending `receive`.
    ///
    virtual void close() = 0;

protected:
    IsoLink() = default;

};  // IsoLink

}  // namespace iso
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_ISO_ISO_LINK_HPP_INCLUDED
