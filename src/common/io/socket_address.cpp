//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_address.hpp"

#include "io.hpp"
#include "logging.hpp"
#include "iecmms/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <utility>

namespace iecmms
{
namespace common
{
namespace io
{

constexpr std::uint16_t SocketAddress::IsoTsapPort;

SocketAddress::SocketAddress() noexcept
    : addr_len_{0}
    , addr_storage_{}
{
}

std::pair<const sockaddr*, socklen_t> SocketAddress::getRaw() const noexcept
{
    return {&asGenericAddr(), addr_len_};
}

std::uint16_t SocketAddress::port() const noexcept
{
    if (isInet6())
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return ntohs(reinterpret_cast<const sockaddr_in6&>(addr_storage_).sin6_port);
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return ntohs(reinterpret_cast<const sockaddr_in&>(addr_storage_).sin_port);
}

SocketAddress::SocketResult::Var SocketAddress::socket() const
{
    uint socket_type = SOCK_STREAM;
#if __linux__
    socket_type |= static_cast<uint>(SOCK_NONBLOCK);
    socket_type |= static_cast<uint>(SOCK_CLOEXEC);
#endif

    OwnFd out_fd;

    const auto& addr_generic = asGenericAddr();
    if (const auto err = platform::posixSyscallError([socket_type, &addr_generic, &out_fd] {
            //
            const int fd = ::socket(addr_generic.sa_family, static_cast<int>(socket_type), 0);
            if (fd != -1)
            {
                out_fd = OwnFd{fd};
            }
            return fd;
        }))
    {
        getLogger("io")->error("Failed to create socket: {}.", std::strerror(err));
        return err;
    }

    // MMS requests are small and latency sensitive.
    configureNoDelay(out_fd);

    return out_fd;
}

int SocketAddress::connect(const OwnFd& socket_fd) const
{
    const int raw_fd = socket_fd.get();
    CETL_DEBUG_ASSERT(raw_fd != -1, "");

    const auto err = platform::posixSyscallError([this, raw_fd] {
        //
        return ::connect(raw_fd, &asGenericAddr(), addr_len_);
    });
    switch (err)
    {
    case 0:
    case EINPROGRESS: {
        return 0;
    }
    default: {
        getLogger("io")->error("Failed to connect to server: {}.", std::strerror(err));
        return err;
    }
    }
}

void SocketAddress::configureNoDelay(const OwnFd& fd)
{
    constexpr int enable = 1;

    if (const auto err = platform::posixSyscallError([&fd, &enable] {
            //
            return ::setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable));
        }))
    {
        getLogger("io")->warn("Failed to set TCP_NODELAY={} (fd={}, err={}): {}.",
                              enable,
                              fd.get(),
                              err,
                              std::strerror(err));
    }
}

SocketAddress::ParseResult::Var SocketAddress::parse(const std::string& str, const std::uint16_t port_hint)
{
    // Extract the family, host, and port.
    //
    std::string   host;
    std::uint16_t port   = port_hint;
    const int     family = extractFamilyHostAndPort(str, host, port);
    if (family == AF_UNSPEC)
    {
        return EINVAL;
    }

    // Convert the host string to inet address.
    //
    SocketAddress result{};
    void*         addr_target = nullptr;
    if (family == AF_INET6)
    {
        auto& result_inet6       = result.asInet6Addr();
        result.addr_len_         = sizeof(result_inet6);
        result_inet6.sin6_family = AF_INET6;
        result_inet6.sin6_port   = htons(port);
        addr_target              = &result_inet6.sin6_addr;
    }
    else
    {
        auto& result_inet4      = result.asInetAddr();
        result.addr_len_        = sizeof(result_inet4);
        result_inet4.sin_family = AF_INET;
        result_inet4.sin_port   = htons(port);
        addr_target             = &result_inet4.sin_addr;
    }
    const int convert_result = ::inet_pton(family, host.c_str(), addr_target);
    switch (convert_result)
    {
    case 1: {
        return result;
    }
    case 0: {
        // Not a numeric address - try it as a host name.
        return (family == AF_INET) ? resolveHost(host, port) : ParseResult::Var{EINVAL};
    }
    default: {
        const int err = errno;
        getLogger("io")->error("Failed to parse address (addr='{}'): {}", host, std::strerror(err));
        return err;
    }
    }
}

SocketAddress::ParseResult::Var SocketAddress::resolveHost(const std::string& host, const std::uint16_t port)
{
    if (host.empty())
    {
        getLogger("io")->error("Empty host name.");
        return EINVAL;
    }

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* info_list = nullptr;
    const int gai_err   = ::getaddrinfo(host.c_str(), nullptr, &hints, &info_list);
    if ((gai_err != 0) || (info_list == nullptr))
    {
        getLogger("io")->error("Failed to resolve host (host='{}'): {}.", host, ::gai_strerror(gai_err));
        return EHOSTUNREACH;
    }

    SocketAddress result{};
    if (info_list->ai_addrlen <= sizeof(result.addr_storage_))
    {
        std::memcpy(&result.addr_storage_, info_list->ai_addr, info_list->ai_addrlen);
        result.addr_len_ = info_list->ai_addrlen;
    }
    ::freeaddrinfo(info_list);

    switch (result.asGenericAddr().sa_family)
    {
    case AF_INET:
        result.asInetAddr().sin_port = htons(port);
        return result;
    case AF_INET6:
        result.asInet6Addr().sin6_port = htons(port);
        return result;
    default:
        getLogger("io")->error("Unsupported address family of resolved host (host='{}').", host);
        return EAFNOSUPPORT;
    }
}

int SocketAddress::extractFamilyHostAndPort(const std::string& str, std::string& host, std::uint16_t& port)
{
    int         family = AF_INET;
    std::string port_part;

    if (0 == str.find_first_of('['))
    {
        // IPv6 starts with a bracket when with a port.
        family = AF_INET6;

        const auto end_bracket_pos = str.find_last_of(']');
        if (end_bracket_pos == std::string::npos)
        {
            getLogger("io")->error("Invalid IPv6 address; unclosed '[' (addr='{}').", str);
            return AF_UNSPEC;
        }
        host = str.substr(1, end_bracket_pos - 1);

        if (str.size() > end_bracket_pos + 1)
        {
            const auto expected_colon_pos = end_bracket_pos + 1;
            if (str[expected_colon_pos] != ':')
            {
                getLogger("io")->error("Invalid IPv6 address; expected port suffix after ']': (addr='{}').", str);
                return AF_UNSPEC;
            }
            port_part = str.substr(end_bracket_pos + 2);
        }
    }
    else
    {
        const auto colon_pos = str.find_first_of(':');
        if (colon_pos != std::string::npos)
        {
            if (str.find_first_of(':', colon_pos + 1) != std::string::npos)
            {
                // At least two colons - IPv6 address without port.
                family = AF_INET6;
                host   = str;
            }
            else
            {
                host      = str.substr(0, colon_pos);
                port_part = str.substr(colon_pos + 1);
            }
        }
        else
        {
            host = str;
        }
    }

    // Parse the port if any; otherwise keep untouched (hint).
    //
    if (!port_part.empty())
    {
        char*               end_ptr    = nullptr;
        const std::uint64_t maybe_port = std::strtoull(port_part.c_str(), &end_ptr, 10);
        if (*end_ptr != '\0')
        {
            getLogger("io")->error("Invalid port number (port='{}').", port_part);
            return AF_UNSPEC;
        }
        if ((maybe_port == 0) || (maybe_port > std::numeric_limits<std::uint16_t>::max()))
        {
            getLogger("io")->error("Port number is out of range (port={}).", maybe_port);
            return AF_UNSPEC;
        }
        port = static_cast<std::uint16_t>(maybe_port);
    }

    return family;
}

}  // namespace io
}  // namespace common
}  // namespace iecmms
