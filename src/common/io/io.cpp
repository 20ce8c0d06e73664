//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io.hpp"

#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <limits>
#include <poll.h>
#include <unistd.h>

namespace iecmms
{
namespace common
{
namespace io
{

void OwnFd::reset() noexcept
{
    if (fd_ >= 0)
    {
        // Do not use `posixSyscallError` here b/c `close` should not be repeated on `EINTR`.
        if (::close(fd_) < 0)
        {
            const int err = errno;
            getLogger("io")->error("Failed to close file descriptor {}: {}.", fd_, std::strerror(err));
        }

        fd_ = -1;
    }
}

OwnFd::~OwnFd()
{
    reset();
}

int waitReady(const OwnFd& fd, const short events, const cetl::optional<std::chrono::milliseconds> timeout)
{
    using Clock = std::chrono::steady_clock;

    const auto deadline = timeout ? cetl::make_optional(Clock::now() + *timeout) : cetl::nullopt;
    while (true)
    {
        int timeout_ms = -1;
        if (deadline)
        {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
            timeout_ms      = static_cast<int>(
                std::min<std::chrono::milliseconds::rep>(std::max<std::chrono::milliseconds::rep>(left.count(), 0),
                                                         std::numeric_limits<int>::max()));
        }

        pollfd poll_fd{fd.get(), events, 0};
        const int result = ::poll(&poll_fd, 1, timeout_ms);
        if (result > 0)
        {
            // Errors and hang-ups are reported by the following `recv`/`send`/`getsockopt` call.
            return 0;
        }
        if (result == 0)
        {
            return ETIMEDOUT;
        }

        const int err = errno;
        if (err != EINTR)
        {
            getLogger("io")->warn("Failed to poll (fd={}, err={}): {}.", fd.get(), err, std::strerror(err));
            return err;
        }
    }
}

}  // namespace io
}  // namespace common
}  // namespace iecmms
