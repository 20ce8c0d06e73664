//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "tcp_channel.hpp"

#include "byte_channel.hpp"
#include "io.hpp"
#include "logging.hpp"
#include "socket_address.hpp"
#include "iecmms/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>

namespace iecmms
{
namespace common
{
namespace io
{
namespace
{

class TcpChannelImpl final : public ByteChannel
{
public:
    TcpChannelImpl()
        : logger_{getLogger("io")}
        , is_closed_{true}
    {
    }

    TcpChannelImpl(const TcpChannelImpl&)                = delete;
    TcpChannelImpl(TcpChannelImpl&&) noexcept            = delete;
    TcpChannelImpl& operator=(const TcpChannelImpl&)     = delete;
    TcpChannelImpl& operator=(TcpChannelImpl&&) noexcept = delete;

    ~TcpChannelImpl() override
    {
        close();
    }

    // MARK: ByteChannel

    int connect(const std::string& endpoint, const std::chrono::milliseconds timeout) override
    {
        auto maybe_address = SocketAddress::parse(endpoint);
        if (const auto* const err = cetl::get_if<SocketAddress::ParseResult::Failure>(&maybe_address))
        {
            return *err;
        }
        const auto& address = cetl::get<SocketAddress::ParseResult::Success>(maybe_address);

        auto maybe_socket = address.socket();
        if (const auto* const err = cetl::get_if<SocketAddress::SocketResult::Failure>(&maybe_socket))
        {
            return *err;
        }
        auto socket_fd = cetl::get<SocketAddress::SocketResult::Success>(std::move(maybe_socket));

        if (const auto err = address.connect(socket_fd))
        {
            return err;
        }

        // Non-blocking connect completes when the socket becomes writable.
        //
        if (const auto err = waitReady(socket_fd, POLLOUT, timeout))
        {
            logger_->warn("Failed to connect (endpoint='{}', err={}): {}.", endpoint, err, std::strerror(err));
            return err;
        }
        int       connect_err = 0;
        socklen_t err_len     = sizeof(connect_err);
        if (const auto err = platform::posixSyscallError([&socket_fd, &connect_err, &err_len] {
                //
                return ::getsockopt(socket_fd.get(), SOL_SOCKET, SO_ERROR, &connect_err, &err_len);
            }))
        {
            return err;
        }
        if (connect_err != 0)
        {
            logger_->warn("Failed to connect (endpoint='{}', err={}): {}.",
                          endpoint,
                          connect_err,
                          std::strerror(connect_err));
            return connect_err;
        }

        logger_->debug("Connected (endpoint='{}', fd={}).", endpoint, socket_fd.get());
        socket_fd_ = std::move(socket_fd);
        is_closed_ = false;
        return 0;
    }

    int send(const cetl::span<const std::uint8_t> data) override
    {
        std::size_t sent = 0;
        while (sent < data.size())
        {
            if (is_closed_)
            {
                return ESHUTDOWN;
            }

            ssize_t result = 0;
            if (const auto err = platform::posixSyscallError([this, &data, sent, &result] {
                    //
                    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                    result = ::send(socket_fd_.get(), data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
                    return result;
                }))
            {
                if ((err == EAGAIN) || (err == EWOULDBLOCK))
                {
                    if (const auto wait_err = waitReady(socket_fd_, POLLOUT, cetl::nullopt))
                    {
                        return wait_err;
                    }
                    continue;
                }
                logger_->warn("Failed to send (fd={}, err={}): {}.", socket_fd_.get(), err, std::strerror(err));
                return (err == EPIPE) ? ESHUTDOWN : err;
            }
            sent += static_cast<std::size_t>(result);
        }
        return 0;
    }

    Receive::Result receive(const cetl::span<std::uint8_t>                  buffer,
                            const cetl::optional<std::chrono::milliseconds> timeout) override
    {
        while (true)
        {
            if (is_closed_)
            {
                return ESHUTDOWN;
            }
            if (const auto err = waitReady(socket_fd_, POLLIN, timeout))
            {
                return err;
            }

            ssize_t result = 0;
            if (const auto err = platform::posixSyscallError([this, &buffer, &result] {
                    //
                    result = ::recv(socket_fd_.get(), buffer.data(), buffer.size(), 0);
                    return result;
                }))
            {
                if ((err == EAGAIN) || (err == EWOULDBLOCK))
                {
                    continue;
                }
                logger_->debug("Failed to receive (fd={}, err={}): {}.", socket_fd_.get(), err, std::strerror(err));
                return (err == ECONNRESET) ? ESHUTDOWN : err;
            }
            if (result == 0)
            {
                logger_->debug("End of stream (fd={}).", socket_fd_.get());
                return ESHUTDOWN;
            }
            return static_cast<std::size_t>(result);
        }
    }

    void close() override
    {
        if (!is_closed_.exchange(true) && socket_fd_.valid())
        {
            // Only shut the socket down here; a concurrent `receive` may still poll the descriptor.
            // The descriptor itself is released by the destructor (or the next `connect`).
            ::shutdown(socket_fd_.get(), SHUT_RDWR);
            logger_->debug("Closed (fd={}).", socket_fd_.get());
        }
    }

private:
    LoggerPtr         logger_;
    OwnFd             socket_fd_;
    std::atomic<bool> is_closed_;

};  // TcpChannelImpl

}  // namespace

CETL_NODISCARD ByteChannel::Ptr TcpChannel::make()
{
    return std::make_unique<TcpChannelImpl>();
}

}  // namespace io
}  // namespace common
}  // namespace iecmms
