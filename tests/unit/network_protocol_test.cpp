/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2024-2025, kcenon
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.

2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

3. Neither the name of the copyright holder nor the names of its
   contributors may be used to endorse or promote products derived from
   this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*****************************************************************************/

#include "netkit/protocol/network_protocol.h"
#include <gtest/gtest.h>

namespace proto = netkit::protocol;
using proto::network_protocol;

/**
 * @file network_protocol_test.cpp
 * @brief Unit tests for protocol names, numeric codes, families and
 *        host:port handling
 */

// ============================================================================
// Parsing Tests
// ============================================================================

class NetworkProtocolParseTest : public ::testing::Test
{
};

TEST_F(NetworkProtocolParseTest, ParsesEveryName)
{
	EXPECT_EQ(proto::parse_network_protocol("unix"), network_protocol::unix_stream);
	EXPECT_EQ(proto::parse_network_protocol("tcp"), network_protocol::tcp);
	EXPECT_EQ(proto::parse_network_protocol("tcp4"), network_protocol::tcp4);
	EXPECT_EQ(proto::parse_network_protocol("tcp6"), network_protocol::tcp6);
	EXPECT_EQ(proto::parse_network_protocol("udp"), network_protocol::udp);
	EXPECT_EQ(proto::parse_network_protocol("udp4"), network_protocol::udp4);
	EXPECT_EQ(proto::parse_network_protocol("udp6"), network_protocol::udp6);
	EXPECT_EQ(proto::parse_network_protocol("ip"), network_protocol::ip);
	EXPECT_EQ(proto::parse_network_protocol("ip4"), network_protocol::ip4);
	EXPECT_EQ(proto::parse_network_protocol("ip6"), network_protocol::ip6);
	EXPECT_EQ(proto::parse_network_protocol("unixgram"), network_protocol::unixgram);
}

TEST_F(NetworkProtocolParseTest, IgnoresCaseSpacesAndQuotes)
{
	EXPECT_EQ(proto::parse_network_protocol("TCP"), network_protocol::tcp);
	EXPECT_EQ(proto::parse_network_protocol("  Udp4 "), network_protocol::udp4);
	EXPECT_EQ(proto::parse_network_protocol("\"unixgram\""), network_protocol::unixgram);
	EXPECT_EQ(proto::parse_network_protocol("'tcp6'"), network_protocol::tcp6);
	EXPECT_EQ(proto::parse_network_protocol(" \"UNIX\" "), network_protocol::unix_stream);
}

TEST_F(NetworkProtocolParseTest, UnknownNamesAreEmpty)
{
	EXPECT_EQ(proto::parse_network_protocol(""), network_protocol::empty);
	EXPECT_EQ(proto::parse_network_protocol("sctp"), network_protocol::empty);
	EXPECT_EQ(proto::parse_network_protocol("tcp 4"), network_protocol::empty);
}

TEST_F(NetworkProtocolParseTest, ToStringRoundTripsNames)
{
	EXPECT_EQ(proto::to_string(network_protocol::unix_stream), "unix");
	EXPECT_EQ(proto::to_string(network_protocol::unixgram), "unixgram");
	EXPECT_EQ(proto::to_string(network_protocol::tcp6), "tcp6");
	EXPECT_EQ(proto::to_string(network_protocol::empty), "");
}

// ============================================================================
// Numeric Code Tests
// ============================================================================

class NetworkProtocolCodeTest : public ::testing::Test
{
};

TEST_F(NetworkProtocolCodeTest, StableValues)
{
	EXPECT_EQ(proto::to_int(network_protocol::empty), 0);
	EXPECT_EQ(proto::to_int(network_protocol::unix_stream), 1);
	EXPECT_EQ(proto::to_int(network_protocol::tcp), 2);
	EXPECT_EQ(proto::to_int(network_protocol::udp), 5);
	EXPECT_EQ(proto::to_int(network_protocol::unixgram), 11);
}

TEST_F(NetworkProtocolCodeTest, FromIntRejectsOutOfRange)
{
	EXPECT_EQ(proto::from_int(2), network_protocol::tcp);
	EXPECT_EQ(proto::from_int(11), network_protocol::unixgram);
	EXPECT_EQ(proto::from_int(0), network_protocol::empty);
	EXPECT_EQ(proto::from_int(-3), network_protocol::empty);
	EXPECT_EQ(proto::from_int(12), network_protocol::empty);
}

// ============================================================================
// Family Tests
// ============================================================================

class NetworkProtocolFamilyTest : public ::testing::Test
{
};

TEST_F(NetworkProtocolFamilyTest, Families)
{
	EXPECT_TRUE(proto::is_tcp_family(network_protocol::tcp4));
	EXPECT_FALSE(proto::is_tcp_family(network_protocol::udp));
	EXPECT_TRUE(proto::is_udp_family(network_protocol::udp6));
	EXPECT_TRUE(proto::is_unix_family(network_protocol::unixgram));
	EXPECT_TRUE(proto::is_unix_family(network_protocol::unix_stream));
	EXPECT_TRUE(proto::is_ip_family(network_protocol::ip6));
	EXPECT_FALSE(proto::is_ip_family(network_protocol::empty));
}

TEST_F(NetworkProtocolFamilyTest, DatagramTransports)
{
	EXPECT_TRUE(proto::is_datagram(network_protocol::udp));
	EXPECT_TRUE(proto::is_datagram(network_protocol::unixgram));
	EXPECT_FALSE(proto::is_datagram(network_protocol::tcp));
	EXPECT_FALSE(proto::is_datagram(network_protocol::unix_stream));
}

// ============================================================================
// Host/Port Tests
// ============================================================================

class HostPortTest : public ::testing::Test
{
};

TEST_F(HostPortTest, SplitsPlainAddress)
{
	auto parts = proto::split_host_port("127.0.0.1:8080");

	ASSERT_TRUE(parts.is_ok());
	EXPECT_EQ(parts.value().host, "127.0.0.1");
	EXPECT_EQ(parts.value().port, "8080");
}

TEST_F(HostPortTest, SplitsWildcardHost)
{
	auto parts = proto::split_host_port(":9000");

	ASSERT_TRUE(parts.is_ok());
	EXPECT_TRUE(parts.value().host.empty());
	EXPECT_EQ(parts.value().port, "9000");
}

TEST_F(HostPortTest, SplitsBracketedIpv6)
{
	auto parts = proto::split_host_port("[::1]:443");

	ASSERT_TRUE(parts.is_ok());
	EXPECT_EQ(parts.value().host, "::1");
	EXPECT_EQ(parts.value().port, "443");
}

TEST_F(HostPortTest, RejectsMalformedAddresses)
{
	using netkit::error_codes::socket::invalid_address;

	for (const char* bad : {"", "localhost", "::1:80", "[::1", "[::1]80", "host:"})
	{
		auto parts = proto::split_host_port(bad);
		ASSERT_TRUE(parts.is_err()) << bad;
		EXPECT_EQ(parts.error().code, invalid_address) << bad;
	}
}

TEST_F(HostPortTest, JoinBracketsIpv6)
{
	EXPECT_EQ(proto::join_host_port("::1", "80"), "[::1]:80");
	EXPECT_EQ(proto::join_host_port("localhost", "80"), "localhost:80");
	EXPECT_EQ(proto::join_host_port("", "80"), ":80");
}
