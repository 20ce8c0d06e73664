//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io/socket_address.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>

namespace
{

using namespace iecmms::common::io;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestSocketAddress : public testing::Test
{};

// MARK: - Tests:

TEST_F(TestSocketAddress, parse_ipv4)
{
    using Result = SocketAddress::ParseResult;

    {
        const std::string test_addr         = "127.0.0.1";
        auto              maybe_socket_addr = SocketAddress::parse(test_addr, 0x1234);
        ASSERT_THAT(maybe_socket_addr, VariantWith<Result::Success>(_));
        auto              socket_address      = cetl::get<Result::Success>(maybe_socket_addr);
        auto              raw_address_and_len = socket_address.getRaw();
        const auto* const addr_in = reinterpret_cast<const sockaddr_in*>(raw_address_and_len.first);  // NOLINT
        EXPECT_FALSE(socket_address.isInet6());
        EXPECT_THAT(raw_address_and_len.second, sizeof(sockaddr_in));
        EXPECT_THAT(addr_in->sin_family, AF_INET);
        EXPECT_THAT(socket_address.port(), 0x1234);
        EXPECT_THAT(ntohl(addr_in->sin_addr.s_addr), 0x7F000001);
    }

    // try with port
    {
        const std::string test_addr         = "192.168.1.123:10102";
        auto              maybe_socket_addr = SocketAddress::parse(test_addr);
        ASSERT_THAT(maybe_socket_addr, VariantWith<Result::Success>(_));
        auto              socket_address      = cetl::get<Result::Success>(maybe_socket_addr);
        auto              raw_address_and_len = socket_address.getRaw();
        const auto* const addr_in = reinterpret_cast<const sockaddr_in*>(raw_address_and_len.first);  // NOLINT
        EXPECT_THAT(addr_in->sin_family, AF_INET);
        EXPECT_THAT(ntohs(addr_in->sin_port), 10102);
        EXPECT_THAT(ntohl(addr_in->sin_addr.s_addr), 0xC0A8017B);
    }
}

TEST_F(TestSocketAddress, parse_uses_iso_tsap_port_by_default)
{
    using Result = SocketAddress::ParseResult;

    auto maybe_socket_addr = SocketAddress::parse("10.0.0.5");
    ASSERT_THAT(maybe_socket_addr, VariantWith<Result::Success>(_));
    EXPECT_THAT(cetl::get<Result::Success>(maybe_socket_addr).port(), SocketAddress::IsoTsapPort);
    EXPECT_THAT(SocketAddress::IsoTsapPort, 102);
}

TEST_F(TestSocketAddress, parse_ipv6)
{
    using Result = SocketAddress::ParseResult;

    {
        const std::string test_addr         = "::1";
        auto              maybe_socket_addr = SocketAddress::parse(test_addr, 0x1234);
        ASSERT_THAT(maybe_socket_addr, VariantWith<Result::Success>(_));
        auto              socket_address      = cetl::get<Result::Success>(maybe_socket_addr);
        auto              raw_address_and_len = socket_address.getRaw();
        const auto* const addr_in6 = reinterpret_cast<const sockaddr_in6*>(raw_address_and_len.first);  // NOLINT
        EXPECT_TRUE(socket_address.isInet6());
        EXPECT_THAT(addr_in6->sin6_family, AF_INET6);
        EXPECT_THAT(socket_address.port(), 0x1234);
        EXPECT_THAT(addr_in6->sin6_addr.s6_addr,  //
                    testing::ElementsAre(0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1));
    }

    // try with port
    {
        const std::string test_addr         = "[2001:db8::1]:8102";
        auto              maybe_socket_addr = SocketAddress::parse(test_addr);
        ASSERT_THAT(maybe_socket_addr, VariantWith<Result::Success>(_));
        auto              socket_address      = cetl::get<Result::Success>(maybe_socket_addr);
        auto              raw_address_and_len = socket_address.getRaw();
        const auto* const addr_in6 = reinterpret_cast<const sockaddr_in6*>(raw_address_and_len.first);  // NOLINT
        EXPECT_THAT(addr_in6->sin6_family, AF_INET6);
        EXPECT_THAT(ntohs(addr_in6->sin6_port), 8102);
        EXPECT_THAT(addr_in6->sin6_addr.s6_addr,  //
                    testing::ElementsAre(0x20, 0x01, 0x0D, 0xB8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1));
    }

    // bracketed without port
    {
        auto maybe_socket_addr = SocketAddress::parse("[::1]");
        ASSERT_THAT(maybe_socket_addr, VariantWith<Result::Success>(_));
        EXPECT_THAT(cetl::get<Result::Success>(maybe_socket_addr).port(), 102);
    }
}

TEST_F(TestSocketAddress, parse_invalid)
{
    using Result = SocketAddress::ParseResult;

    // missing closing bracket
    EXPECT_THAT(SocketAddress::parse("[::1"), VariantWith<Result::Failure>(EINVAL));

    // missing colon after bracket
    EXPECT_THAT(SocketAddress::parse("[::1]102"), VariantWith<Result::Failure>(EINVAL));

    // invalid port number
    EXPECT_THAT(SocketAddress::parse("127.0.0.1:1_02"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("[::1]:10x"), VariantWith<Result::Failure>(EINVAL));

    // port out of range
    EXPECT_THAT(SocketAddress::parse("127.0.0.1:0"), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("[::1]:65536"), VariantWith<Result::Failure>(EINVAL));

    // host names are only resolved as IPv4 form
    EXPECT_THAT(SocketAddress::parse("[ied.example]:102"), VariantWith<Result::Failure>(EINVAL));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
