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

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "netkit/core/tcp_client.h"
#include "netkit/core/tcp_server.h"

#include "../helpers/server_runner.h"
#include "../helpers/test_certificates.h"

namespace core = netkit::core;
namespace cfg = netkit::config;
namespace codes = netkit::error_codes;
namespace utils = netkit::utils;
using netkit::protocol::network_protocol;
using netkit::testing::server_runner;
using netkit::testing::test_certificate_generator;
using namespace std::chrono_literals;

/**
 * @file tcp_socket_test.cpp
 * @brief End-to-end tests for tcp_server and tcp_client, plain and TLS
 */

namespace
{
	auto plain_config() -> cfg::server_config
	{
		cfg::server_config config;
		config.network = network_protocol::tcp;
		config.address = "127.0.0.1:0";
		return config;
	}

	auto server_tls() -> cfg::tls_config
	{
		const auto& pair = test_certificate_generator::shared();
		cfg::tls_config tls;
		tls.certificates.push_back(
			cfg::certificate_pair::from_pem(pair.certificate_pem, pair.private_key_pem));
		return tls;
	}

	auto client_tls() -> cfg::tls_config
	{
		cfg::tls_config tls;
		tls.root_ca_pem.push_back(test_certificate_generator::shared().certificate_pem);
		tls.verify_mode = cfg::certificate_verification::verify_peer;
		return tls;
	}

	auto bounded(std::chrono::milliseconds timeout = 5s) -> utils::cancel_context
	{
		return utils::cancel_context::with_timeout(utils::cancel_context::background(), timeout);
	}
} // namespace

// ============================================================================
// Server Creation Tests
// ============================================================================

class TcpServerCreateTest : public ::testing::Test
{
};

TEST_F(TcpServerCreateTest, RejectsMissingHandler)
{
	auto server = core::tcp_server::create(plain_config(), nullptr);

	ASSERT_TRUE(server.is_err());
	EXPECT_EQ(server.error().code, codes::socket::invalid_handler);
}

TEST_F(TcpServerCreateTest, RejectsMissingAddress)
{
	auto config = plain_config();
	config.address.clear();

	auto server = core::tcp_server::create(config, netkit::testing::echo_once);
	ASSERT_TRUE(server.is_err());
	EXPECT_EQ(server.error().code, codes::socket::invalid_address);
}

TEST_F(TcpServerCreateTest, RejectsNonTcpNetwork)
{
	auto config = plain_config();
	config.network = network_protocol::udp;

	auto server = core::tcp_server::create(config, netkit::testing::echo_once);
	ASSERT_TRUE(server.is_err());
	EXPECT_EQ(server.error().code, codes::socket::invalid_protocol);
}

TEST_F(TcpServerCreateTest, RejectsTlsWithoutCertificates)
{
	auto server = core::tcp_server::create(plain_config(), netkit::testing::echo_once);
	ASSERT_TRUE(server.is_ok());

	auto result = server.value()->set_tls(true, cfg::tls_config{});
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, codes::socket::invalid_tls_config);
	EXPECT_FALSE(server.value()->listener().tls);
}

// ============================================================================
// Lifecycle Tests
// ============================================================================

class TcpServerLifecycleTest : public ::testing::Test
{
};

TEST_F(TcpServerLifecycleTest, GoneBeforeListen)
{
	auto server = core::tcp_server::create(plain_config(), netkit::testing::echo_once);
	ASSERT_TRUE(server.is_ok());

	EXPECT_TRUE(server.value()->is_gone());
	EXPECT_FALSE(server.value()->is_running());
	EXPECT_EQ(server.value()->open_connections(), 0);
	EXPECT_TRUE(server.value()->local_address().empty());
}

TEST_F(TcpServerLifecycleTest, CloseBeforeListenIsNoop)
{
	auto server = core::tcp_server::create(plain_config(), netkit::testing::echo_once);
	ASSERT_TRUE(server.is_ok());

	EXPECT_TRUE(server.value()->close().is_ok());
	EXPECT_TRUE(server.value()->close().is_ok());
}

TEST_F(TcpServerLifecycleTest, ShutdownBeforeListenIsNoop)
{
	auto created = core::tcp_server::create(plain_config(), netkit::testing::echo_once);
	ASSERT_TRUE(created.is_ok());
	auto server = created.value();

	EXPECT_TRUE(server->shutdown(bounded()).is_ok());
	EXPECT_TRUE(server->is_gone());
	EXPECT_FALSE(server->is_running());

	server_runner runner(server);
	ASSERT_TRUE(runner.start());

	auto client = core::tcp_client::create(server->local_address());
	ASSERT_TRUE(client.is_ok());

	std::string reply;
	auto result = client.value()->once(bounded(), netkit::testing::to_bytes("still alive"),
									   [&reply](netkit::io::reader& r)
									   { reply = netkit::testing::read_all(r); });
	ASSERT_TRUE(result.is_ok()) << netkit::to_string(result.error());
	EXPECT_EQ(reply, "still alive");
	EXPECT_TRUE(server->is_running());
}

TEST_F(TcpServerLifecycleTest, ListenThenShutdown)
{
	auto created = core::tcp_server::create(plain_config(), netkit::testing::echo_once);
	ASSERT_TRUE(created.is_ok());
	auto server = created.value();

	std::vector<std::string> messages;
	std::mutex messages_mutex;
	server->register_server_info_callback([&](const std::string& message) {
		std::lock_guard<std::mutex> lock(messages_mutex);
		messages.push_back(message);
	});

	server_runner runner(server);
	ASSERT_TRUE(runner.start());

	EXPECT_FALSE(server->is_gone());
	const auto address = server->local_address();
	EXPECT_EQ(address.rfind("127.0.0.1:", 0), 0u);
	EXPECT_NE(address, "127.0.0.1:0");

	EXPECT_TRUE(server->shutdown(bounded()).is_ok());
	runner.join();

	ASSERT_TRUE(runner.result().has_value());
	EXPECT_TRUE(runner.result()->is_ok());
	EXPECT_FALSE(server->is_running());
	EXPECT_TRUE(server->is_gone());
	EXPECT_TRUE(server->local_address().empty());

	std::lock_guard<std::mutex> lock(messages_mutex);
	ASSERT_GE(messages.size(), 2u);
	EXPECT_NE(messages.front().find("listening"), std::string::npos);
}

TEST_F(TcpServerLifecycleTest, CancelledContextStopsListen)
{
	auto created = core::tcp_server::create(plain_config(), netkit::testing::echo_once);
	ASSERT_TRUE(created.is_ok());
	auto server = created.value();

	server_runner runner(server);
	ASSERT_TRUE(runner.start());

	runner.context().cancel();

	EXPECT_TRUE(server->wait_for_stop(5000ms));
	runner.join();
	EXPECT_TRUE(server->is_gone());
}

TEST_F(TcpServerLifecycleTest, CloseIsIdempotent)
{
	auto created = core::tcp_server::create(plain_config(), netkit::testing::echo_once);
	ASSERT_TRUE(created.is_ok());
	auto server = created.value();

	server_runner runner(server);
	ASSERT_TRUE(runner.start());

	EXPECT_TRUE(server->close().is_ok());
	EXPECT_TRUE(server->close().is_ok());
	runner.join();
	EXPECT_FALSE(server->is_running());
}

TEST_F(TcpServerLifecycleTest, SecondListenIsRejected)
{
	auto created = core::tcp_server::create(plain_config(), netkit::testing::echo_once);
	ASSERT_TRUE(created.is_ok());
	auto server = created.value();

	server_runner runner(server);
	ASSERT_TRUE(runner.start());

	auto concurrent = server->listen(bounded(100ms));
	ASSERT_TRUE(concurrent.is_err());
	EXPECT_EQ(concurrent.error().code, codes::socket::server_already_running);

	auto tls = server->set_tls(true, server_tls());
	ASSERT_TRUE(tls.is_err());
	EXPECT_EQ(tls.error().code, codes::socket::server_already_running);

	ASSERT_TRUE(server->shutdown(bounded()).is_ok());
	runner.join();

	auto again = server->listen(bounded(100ms));
	ASSERT_TRUE(again.is_err());
	EXPECT_EQ(again.error().code, codes::socket::invalid_instance);
}

TEST_F(TcpServerLifecycleTest, BindFailureIsReported)
{
	auto first = core::tcp_server::create(plain_config(), netkit::testing::echo_once);
	ASSERT_TRUE(first.is_ok());
	server_runner runner(first.value());
	ASSERT_TRUE(runner.start());

	auto config = plain_config();
	config.address = first.value()->local_address();
	auto second = core::tcp_server::create(config, netkit::testing::echo_once);
	ASSERT_TRUE(second.is_ok());

	auto result = second.value()->listen(bounded());
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, codes::socket::bind_failed);
	EXPECT_FALSE(second.value()->is_running());
}

// ============================================================================
// Client Tests
// ============================================================================

class TcpClientTest : public ::testing::Test
{
};

TEST_F(TcpClientTest, CreateValidatesAddress)
{
	auto empty = core::tcp_client::create("");
	ASSERT_TRUE(empty.is_err());
	EXPECT_EQ(empty.error().code, codes::socket::invalid_address);

	auto wrong = core::tcp_client::create("127.0.0.1:80", network_protocol::udp);
	ASSERT_TRUE(wrong.is_err());
	EXPECT_EQ(wrong.error().code, codes::socket::invalid_protocol);

	auto unresolved = core::tcp_client::create("no-port-here");
	ASSERT_TRUE(unresolved.is_err());
	EXPECT_EQ(unresolved.error().code, codes::socket::address_resolution_failed);
}

TEST_F(TcpClientTest, IoBeforeConnectFails)
{
	auto client = core::tcp_client::create("127.0.0.1:1");
	ASSERT_TRUE(client.is_ok());

	std::vector<std::uint8_t> buffer(16);
	auto read = client.value()->read(buffer);
	ASSERT_TRUE(read.is_err());
	EXPECT_EQ(read.error().code, codes::socket::not_connected);

	auto written = client.value()->write(buffer);
	ASSERT_TRUE(written.is_err());
	EXPECT_EQ(written.error().code, codes::socket::not_connected);

	EXPECT_FALSE(client.value()->is_connected());
	EXPECT_TRUE(client.value()->close().is_ok());
	EXPECT_TRUE(client.value()->close().is_ok());
}

TEST_F(TcpClientTest, TlsNeedsServerName)
{
	auto client = core::tcp_client::create("127.0.0.1:1");
	ASSERT_TRUE(client.is_ok());

	auto result = client.value()->set_tls(true, client_tls(), "");
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, codes::socket::invalid_tls_config);
}

TEST_F(TcpClientTest, ConnectRefusedReportsError)
{
	// Bind then release a port so nothing listens on it.
	std::string address;
	{
		auto created = core::tcp_server::create(plain_config(), netkit::testing::echo_once);
		ASSERT_TRUE(created.is_ok());
		server_runner runner(created.value());
		ASSERT_TRUE(runner.start());
		address = created.value()->local_address();
	}

	auto client = core::tcp_client::create(address);
	ASSERT_TRUE(client.is_ok());

	std::vector<netkit::error_info> errors;
	client.value()->register_error_callback(
		[&errors](const std::vector<netkit::error_info>& list) {
			errors.insert(errors.end(), list.begin(), list.end());
		});

	auto connected = client.value()->connect(bounded());
	ASSERT_TRUE(connected.is_err());
	EXPECT_EQ(connected.error().code, codes::socket::connection_failed);
	EXPECT_FALSE(errors.empty());
	EXPECT_FALSE(client.value()->is_connected());
}

// ============================================================================
// End-to-End Tests
// ============================================================================

class TcpEchoTest : public ::testing::Test
{
};

TEST_F(TcpEchoTest, OnceRoundTrip)
{
	std::atomic<int> updates{0};
	auto created = core::tcp_server::create(plain_config(), netkit::testing::echo_once,
											[&updates](int handle) {
												if (handle >= 0)
												{
													updates.fetch_add(1);
												}
											});
	ASSERT_TRUE(created.is_ok());
	auto server = created.value();

	std::vector<core::conn_state> states;
	std::mutex states_mutex;
	server->register_info_callback(
		[&](const std::string&, const std::string&, core::conn_state state) {
			std::lock_guard<std::mutex> lock(states_mutex);
			states.push_back(state);
		});

	server_runner runner(server);
	ASSERT_TRUE(runner.start());

	auto client = core::tcp_client::create(server->local_address());
	ASSERT_TRUE(client.is_ok());

	std::string reply;
	auto request = netkit::testing::to_bytes("hello netkit");
	auto result = client.value()->once(bounded(), request, [&reply](netkit::io::reader& r) {
		reply = netkit::testing::read_all(r);
	});

	ASSERT_TRUE(result.is_ok()) << netkit::to_string(result.error());
	EXPECT_EQ(reply, "hello netkit");
	EXPECT_FALSE(client.value()->is_connected());
	EXPECT_EQ(updates.load(), 1);

	EXPECT_TRUE(netkit::testing::wait_until([&server] { return server->open_connections() == 0; }));

	std::lock_guard<std::mutex> lock(states_mutex);
	auto has = [&states](core::conn_state wanted) {
		for (auto state : states)
		{
			if (state == wanted)
			{
				return true;
			}
		}
		return false;
	};
	EXPECT_TRUE(has(core::conn_state::new_connection));
	EXPECT_TRUE(has(core::conn_state::handler));
	EXPECT_TRUE(has(core::conn_state::read));
	EXPECT_TRUE(has(core::conn_state::write));
	EXPECT_TRUE(has(core::conn_state::close));
}

TEST_F(TcpEchoTest, ConnectReadWrite)
{
	auto created = core::tcp_server::create(plain_config(), netkit::testing::echo_once);
	ASSERT_TRUE(created.is_ok());
	server_runner runner(created.value());
	ASSERT_TRUE(runner.start());

	auto client = core::tcp_client::create(created.value()->local_address());
	ASSERT_TRUE(client.is_ok());

	std::vector<core::conn_state> states;
	client.value()->register_info_callback(
		[&states](const std::string&, const std::string&, core::conn_state state) {
			states.push_back(state);
		});

	ASSERT_TRUE(client.value()->connect(bounded()).is_ok());
	EXPECT_TRUE(client.value()->is_connected());
	EXPECT_TRUE(netkit::testing::wait_until(
		[&created] { return created.value()->open_connections() == 1; }));

	auto written = client.value()->write(netkit::testing::to_bytes("ping"));
	ASSERT_TRUE(written.is_ok());
	EXPECT_EQ(written.value(), 4u);

	std::vector<std::uint8_t> buffer(16);
	auto n = client.value()->read(buffer);
	ASSERT_TRUE(n.is_ok());
	EXPECT_EQ(std::string(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n.value())),
			  "ping");

	auto eof = client.value()->read(buffer);
	EXPECT_TRUE(netkit::io::is_eof(eof));

	EXPECT_TRUE(client.value()->close().is_ok());
	ASSERT_GE(states.size(), 2u);
	EXPECT_EQ(states.front(), core::conn_state::dial);
	EXPECT_EQ(states[1], core::conn_state::new_connection);
	EXPECT_EQ(states.back(), core::conn_state::close);
}

TEST_F(TcpEchoTest, ShutdownWaitsForHandlers)
{
	std::atomic<bool> handler_done{false};
	auto created = core::tcp_server::create(plain_config(), [&handler_done](core::socket_context& ctx) {
		netkit::testing::echo_once(ctx);
		std::this_thread::sleep_for(100ms);
		handler_done.store(true);
	});
	ASSERT_TRUE(created.is_ok());
	auto server = created.value();
	server_runner runner(server);
	ASSERT_TRUE(runner.start());

	auto client = core::tcp_client::create(server->local_address());
	ASSERT_TRUE(client.is_ok());
	ASSERT_TRUE(client.value()->once(bounded(), netkit::testing::to_bytes("x"), nullptr).is_ok());
	ASSERT_TRUE(netkit::testing::wait_until([&server] { return server->open_connections() == 1; }));

	EXPECT_TRUE(server->shutdown(bounded()).is_ok());
	EXPECT_TRUE(handler_done.load());
	EXPECT_EQ(server->open_connections(), 0);
}

TEST_F(TcpEchoTest, ShutdownTimesOutOnStuckHandler)
{
	std::atomic<bool> release{false};
	auto created = core::tcp_server::create(plain_config(), [&release](core::socket_context&) {
		while (!release.load())
		{
			std::this_thread::sleep_for(5ms);
		}
	});
	ASSERT_TRUE(created.is_ok());
	auto server = created.value();
	server_runner runner(server);
	ASSERT_TRUE(runner.start());

	auto client = core::tcp_client::create(server->local_address());
	ASSERT_TRUE(client.is_ok());
	ASSERT_TRUE(client.value()->connect(bounded()).is_ok());
	ASSERT_TRUE(netkit::testing::wait_until([&server] { return server->open_connections() == 1; }));

	auto result = server->shutdown(bounded(50ms));
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, codes::socket::shutdown_timeout);

	release.store(true);
	EXPECT_TRUE(client.value()->close().is_ok());
}

TEST_F(TcpEchoTest, HandlerExceptionIsReported)
{
	auto created = core::tcp_server::create(plain_config(), [](core::socket_context&) {
		throw std::runtime_error("handler failure");
	});
	ASSERT_TRUE(created.is_ok());
	auto server = created.value();

	std::atomic<int> internal_errors{0};
	server->register_error_callback([&internal_errors](const std::vector<netkit::error_info>& list) {
		for (const auto& err : list)
		{
			if (err.code == codes::common_errors::internal_error)
			{
				internal_errors.fetch_add(1);
			}
		}
	});

	server_runner runner(server);
	ASSERT_TRUE(runner.start());

	auto client = core::tcp_client::create(server->local_address());
	ASSERT_TRUE(client.is_ok());
	ASSERT_TRUE(client.value()->once(bounded(), netkit::testing::to_bytes("x"), nullptr).is_ok());

	EXPECT_TRUE(netkit::testing::wait_until([&internal_errors] { return internal_errors.load() == 1; }));
	EXPECT_TRUE(server->is_running());
}

TEST_F(TcpEchoTest, IdleConnectionIsClosed)
{
	auto config = plain_config();
	config.con_idle_timeout = 1s;

	std::atomic<int> idle_errors{0};
	auto created = core::tcp_server::create(config, [&idle_errors](core::socket_context& ctx) {
		std::vector<std::uint8_t> buffer(16);
		auto n = ctx.read(buffer);
		if (n.is_err() && n.error().code == codes::socket::idle_timeout)
		{
			idle_errors.fetch_add(1);
		}
	});
	ASSERT_TRUE(created.is_ok());
	server_runner runner(created.value());
	ASSERT_TRUE(runner.start());

	auto client = core::tcp_client::create(created.value()->local_address());
	ASSERT_TRUE(client.is_ok());
	ASSERT_TRUE(client.value()->connect(bounded()).is_ok());

	EXPECT_TRUE(netkit::testing::wait_until([&idle_errors] { return idle_errors.load() == 1; }, 5s));
	EXPECT_TRUE(client.value()->close().is_ok());
}

// ============================================================================
// TLS Tests
// ============================================================================

class TcpTlsTest : public ::testing::Test
{
};

TEST_F(TcpTlsTest, EchoOverTls)
{
	auto config = plain_config();
	config.tls.enabled = true;
	config.tls.config = server_tls();

	auto created = core::tcp_server::create(config, netkit::testing::echo_once);
	ASSERT_TRUE(created.is_ok()) << netkit::to_string(created.error());
	auto server = created.value();
	EXPECT_TRUE(server->listener().tls);

	server_runner runner(server);
	ASSERT_TRUE(runner.start());

	auto client = core::tcp_client::create(server->local_address());
	ASSERT_TRUE(client.is_ok());
	ASSERT_TRUE(client.value()->set_tls(true, client_tls(), "localhost").is_ok());

	std::string reply;
	auto result = client.value()->once(bounded(), netkit::testing::to_bytes("secret"),
									   [&reply](netkit::io::reader& r) {
										   std::vector<std::uint8_t> buffer(64);
										   auto n = r.read(buffer);
										   if (n.is_ok())
										   {
											   reply.assign(buffer.begin(),
															buffer.begin() +
																static_cast<std::ptrdiff_t>(n.value()));
										   }
									   });

	ASSERT_TRUE(result.is_ok()) << netkit::to_string(result.error());
	EXPECT_EQ(reply, "secret");
}

TEST_F(TcpTlsTest, WrongServerNameFailsHandshake)
{
	auto config = plain_config();
	config.tls.enabled = true;
	config.tls.config = server_tls();

	auto created = core::tcp_server::create(config, netkit::testing::echo_once);
	ASSERT_TRUE(created.is_ok());
	server_runner runner(created.value());
	ASSERT_TRUE(runner.start());

	auto client = core::tcp_client::create(created.value()->local_address());
	ASSERT_TRUE(client.is_ok());
	ASSERT_TRUE(client.value()->set_tls(true, client_tls(), "other.example").is_ok());

	auto connected = client.value()->connect(bounded());
	ASSERT_TRUE(connected.is_err());
	EXPECT_EQ(connected.error().code, codes::socket::tls_handshake_failed);
	EXPECT_FALSE(client.value()->is_connected());
}

TEST_F(TcpTlsTest, PlainClientIsNotServed)
{
	auto config = plain_config();
	config.tls.enabled = true;
	config.tls.config = server_tls();

	std::atomic<int> handled{0};
	auto created = core::tcp_server::create(config, [&handled](core::socket_context&) {
		handled.fetch_add(1);
	});
	ASSERT_TRUE(created.is_ok());
	server_runner runner(created.value());
	ASSERT_TRUE(runner.start());

	auto client = core::tcp_client::create(created.value()->local_address());
	ASSERT_TRUE(client.is_ok());
	auto result = client.value()->once(bounded(), netkit::testing::to_bytes("plain text please"),
									   [](netkit::io::reader& r) { netkit::testing::read_all(r); });
	(void)result;

	EXPECT_TRUE(netkit::testing::wait_until(
		[&created] { return created.value()->open_connections() == 0; }));
	EXPECT_EQ(handled.load(), 0);
}
