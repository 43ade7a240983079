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

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "netkit/core/socket_factory.h"

#include "../helpers/server_runner.h"
#include "../helpers/test_certificates.h"

namespace core = netkit::core;
namespace cfg = netkit::config;
namespace codes = netkit::error_codes;
namespace utils = netkit::utils;
using netkit::protocol::network_protocol;
using netkit::testing::server_runner;
using namespace std::chrono_literals;

/**
 * @file socket_factory_test.cpp
 * @brief Tests for make_server and make_client dispatch and validation
 */

class SocketFactoryTest : public ::testing::Test
{
protected:
	static auto bounded() -> utils::cancel_context
	{
		return utils::cancel_context::with_timeout(utils::cancel_context::background(), 5s);
	}
};

// ============================================================================
// Validation
// ============================================================================

TEST_F(SocketFactoryTest, ServerRejectsEmptyNetwork)
{
	cfg::server_config config;
	config.address = "127.0.0.1:0";

	auto server = core::make_server(config, netkit::testing::echo_once);
	ASSERT_TRUE(server.is_err());
	EXPECT_EQ(server.error().code, codes::socket::invalid_protocol);
}

TEST_F(SocketFactoryTest, ServerRejectsGroupOutOfRange)
{
	cfg::server_config config;
	config.network = network_protocol::unix_stream;
	config.address = netkit::testing::socket_path("factory-group");
	config.group_perm = 99999;

	auto server = core::make_server(config, netkit::testing::echo_once);
	ASSERT_TRUE(server.is_err());
	EXPECT_EQ(server.error().code, codes::socket::invalid_group);
}

TEST_F(SocketFactoryTest, ServerRejectsTlsWithoutCertificates)
{
	cfg::server_config config;
	config.network = network_protocol::tcp;
	config.address = "127.0.0.1:0";
	config.tls.enabled = true;

	auto server = core::make_server(config, netkit::testing::echo_once);
	ASSERT_TRUE(server.is_err());
	EXPECT_EQ(server.error().code, codes::socket::invalid_tls_config);
}

TEST_F(SocketFactoryTest, ServerRejectsMissingHandler)
{
	cfg::server_config config;
	config.network = network_protocol::udp;
	config.address = "127.0.0.1:0";

	auto server = core::make_server(config, nullptr);
	ASSERT_TRUE(server.is_err());
	EXPECT_EQ(server.error().code, codes::socket::invalid_handler);
}

TEST_F(SocketFactoryTest, ClientRejectsTlsOffTcp)
{
	cfg::client_config config;
	config.network = network_protocol::udp;
	config.address = "127.0.0.1:9";
	config.tls.enabled = true;
	config.tls.server_name = "localhost";

	auto client = core::make_client(config);
	ASSERT_TRUE(client.is_err());
	EXPECT_EQ(client.error().code, codes::socket::invalid_tls_config);
}

TEST_F(SocketFactoryTest, ClientRejectsUnresolvableAddress)
{
	cfg::client_config config;
	config.network = network_protocol::tcp;
	config.address = "no-port-here";

	auto client = core::make_client(config);
	ASSERT_TRUE(client.is_err());
	EXPECT_EQ(client.error().code, codes::socket::address_resolution_failed);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(SocketFactoryTest, BuildsServerPerNetwork)
{
	cfg::server_config tcp;
	tcp.network = network_protocol::tcp4;
	tcp.address = "127.0.0.1:0";
	auto tcp_server = core::make_server(tcp, netkit::testing::echo_once);
	ASSERT_TRUE(tcp_server.is_ok());
	EXPECT_EQ(tcp_server.value()->listener().network, "tcp4");

	cfg::server_config udp;
	udp.network = network_protocol::udp;
	udp.address = "127.0.0.1:0";
	auto udp_server = core::make_server(udp, netkit::testing::echo_once);
	ASSERT_TRUE(udp_server.is_ok());
	EXPECT_EQ(udp_server.value()->listener().network, "udp");
	EXPECT_FALSE(udp_server.value()->listener().tls);
}

TEST_F(SocketFactoryTest, TcpRoundTrip)
{
	cfg::server_config server_config;
	server_config.network = network_protocol::tcp;
	server_config.address = "127.0.0.1:0";

	auto server = core::make_server(server_config, netkit::testing::echo_once);
	ASSERT_TRUE(server.is_ok());

	server_runner runner(server.value());
	ASSERT_TRUE(runner.start());

	cfg::client_config client_config;
	client_config.network = network_protocol::tcp;
	client_config.address = server.value()->local_address();

	auto client = core::make_client(client_config);
	ASSERT_TRUE(client.is_ok());

	std::string reply;
	auto result = client.value()->once(bounded(), netkit::testing::to_bytes("factory"),
									   [&reply](netkit::io::reader& r)
									   { reply = netkit::testing::read_all(r); });
	ASSERT_TRUE(result.is_ok()) << netkit::to_string(result.error());
	EXPECT_EQ(reply, "factory");
}

TEST_F(SocketFactoryTest, TlsRoundTrip)
{
	const auto& pair = netkit::testing::test_certificate_generator::shared();

	cfg::server_config server_config;
	server_config.network = network_protocol::tcp;
	server_config.address = "127.0.0.1:0";
	server_config.tls.enabled = true;
	server_config.tls.config.certificates.push_back(
		cfg::certificate_pair::from_pem(pair.certificate_pem, pair.private_key_pem));

	auto server = core::make_server(server_config, netkit::testing::echo_once);
	ASSERT_TRUE(server.is_ok()) << netkit::to_string(server.error());
	EXPECT_TRUE(server.value()->listener().tls);

	server_runner runner(server.value());
	ASSERT_TRUE(runner.start());

	cfg::client_config client_config;
	client_config.network = network_protocol::tcp;
	client_config.address = server.value()->local_address();
	client_config.tls.enabled = true;
	client_config.tls.server_name = "localhost";
	client_config.tls.config.root_ca_pem.push_back(pair.certificate_pem);
	client_config.tls.config.verify_mode = cfg::certificate_verification::verify_peer;

	auto client = core::make_client(client_config);
	ASSERT_TRUE(client.is_ok()) << netkit::to_string(client.error());

	std::string reply;
	auto result = client.value()->once(bounded(), netkit::testing::to_bytes("sealed"),
									   [&reply](netkit::io::reader& r)
									   { reply = netkit::testing::read_all(r); });
	ASSERT_TRUE(result.is_ok()) << netkit::to_string(result.error());
	EXPECT_EQ(reply, "sealed");
}
