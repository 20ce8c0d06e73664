//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_IO_HPP_INCLUDED
#define IECMMS_COMMON_IO_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstddef>
#include <utility>

namespace iecmms
{
namespace common
{
namespace io
{

/// RAII wrapper for a file descriptor.
///
class OwnFd final
{
public:
    OwnFd()
        : fd_{-1}
    {
    }

    explicit OwnFd(const int fd)
        : fd_{fd}
    {
    }

    OwnFd(OwnFd&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)}
    {
    }

    OwnFd& operator=(OwnFd&& other) noexcept
    {
        const OwnFd old{std::move(*this)};
        fd_ = std::exchange(other.fd_, -1);
        return *this;
    }

    OwnFd& operator=(std::nullptr_t)
    {
        const OwnFd old{std::move(*this)};
        return *this;
    }

    // Disallow copy.
    OwnFd(const OwnFd&)            = delete;
    OwnFd& operator=(const OwnFd&) = delete;

    int get() const noexcept
    {
        return fd_;
    }

    bool valid() const noexcept
    {
        return fd_ >= 0;
    }

    void reset() noexcept;

    ~OwnFd();

private:
    int fd_;

};  // OwnFd

/// Waits until the descriptor is ready for the given `poll` events.
///
/// @param timeout Maximum time to wait; waits indefinitely if not specified.
/// @return Zero when ready, `ETIMEDOUT` if the timeout has expired, or other `errno` of the failed `poll`.
///
int waitReady(const OwnFd& fd, const short events, const cetl::optional<std::chrono::milliseconds> timeout);

}  // namespace io
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_IO_HPP_INCLUDED
