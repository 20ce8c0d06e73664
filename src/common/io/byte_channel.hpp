//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_IO_BYTE_CHANNEL_HPP_INCLUDED
#define IECMMS_COMMON_IO_BYTE_CHANNEL_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace iecmms
{
namespace common
{
namespace io
{

/// Abstract duplex byte stream towards the server (the transport boundary of the stack).
///
/// All failures are `errno`-like codes:
/// - `ETIMEDOUT` when a connect or receive timeout has expired;
/// - `ESHUTDOWN` when the stream was closed (locally or by the peer).
///
class ByteChannel
{
public:
    using Ptr = std::unique_ptr<ByteChannel>;

    ByteChannel(const ByteChannel&)                = delete;
    ByteChannel(ByteChannel&&) noexcept            = delete;
    ByteChannel& operator=(const ByteChannel&)     = delete;
    ByteChannel& operator=(ByteChannel&&) noexcept = delete;

    virtual ~ByteChannel() = default;

    CETL_NODISCARD virtual int connect(const std::string& endpoint, const std::chrono::milliseconds timeout) = 0;

    /// Sends all bytes (blocking until they are accepted by the transport).
    ///
    CETL_NODISCARD virtual int send(const cetl::span<const std::uint8_t> data) = 0;

    struct Receive
    {
        using Success = std::size_t;
        using Failure = int;  // aka errno
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Receives at least one byte into the buffer.
    ///
    /// @param timeout Maximum time to wait for data; waits indefinitely if not specified.
    ///
    virtual Receive::Result receive(const cetl::span<std::uint8_t>                  buffer,
                                    const cetl::optional<std::chrono::milliseconds> timeout) = 0;

    /// Closes the stream. Safe to call from another thread while `receive` is blocked (which then fails).
    ///
    virtual void close() = 0;

protected:
    ByteChannel() = default;

};  // ByteChannel

}  // namespace io
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_IO_BYTE_CHANNEL_HPP_INCLUDED
