//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef IECMMS_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
#define IECMMS_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED

#include "io.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <utility>

namespace iecmms
{
namespace common
{
namespace io
{

/// TCP endpoint of an MMS server.
///
class SocketAddress final
{
public:
    /// ISO transport service on top of TCP (RFC 1006).
    static constexpr std::uint16_t IsoTsapPort = 102;

    struct ParseResult
    {
        using Failure = int;  // aka errno
        using Success = SocketAddress;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Parses `host[:port]`, `[ipv6-host]:port` or bare IPv6 literal; host names are resolved.
    ///
    static ParseResult::Var parse(const std::string& str, const std::uint16_t port_hint = IsoTsapPort);

    SocketAddress() noexcept;

    std::pair<const sockaddr*, socklen_t> getRaw() const noexcept;

    bool isInet6() const noexcept
    {
        return asGenericAddr().sa_family == AF_INET6;
    }

    std::uint16_t port() const noexcept;

    struct SocketResult
    {
        using Failure = int;  // aka errno
        using Success = OwnFd;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Creates a non-blocking TCP socket of the address family.
    ///
    SocketResult::Var socket() const;

    /// Starts connecting; `EINPROGRESS` is considered a success.
    ///
    int connect(const OwnFd& socket_fd) const;

private:
    static void configureNoDelay(const OwnFd& fd);
    static int  extractFamilyHostAndPort(const std::string& str, std::string& host, std::uint16_t& port);
    static ParseResult::Var resolveHost(const std::string& host, const std::uint16_t port);

    sockaddr& asGenericAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr&>(addr_storage_);
    }
    const sockaddr& asGenericAddr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr&>(addr_storage_);
    }
    sockaddr_in& asInetAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_in&>(addr_storage_);
    }
    sockaddr_in6& asInet6Addr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_in6&>(addr_storage_);
    }

    socklen_t        addr_len_;
    sockaddr_storage addr_storage_;

};  // SocketAddress

}  // namespace io
}  // namespace common
}  // namespace iecmms

#endif  // IECMMS_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
