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

/**
 * @file resolver.h
 * @brief "host:port" resolution for the tcp and udp families and unix
 *        socket path checks.
 */

#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>

#include "netkit/protocol/network_protocol.h"
#include "netkit/types/result.h"

namespace netkit::detail
{
	//! \brief Longest unix socket path accepted by sockaddr_un.
	inline constexpr std::size_t max_unix_path = 107;

	template<typename Endpoint>
	auto format_endpoint(const Endpoint& endpoint) -> std::string
	{
		return protocol::join_host_port(endpoint.address().to_string(),
										std::to_string(endpoint.port()));
	}

#if defined(ASIO_HAS_LOCAL_SOCKETS)
	inline auto format_endpoint(const asio::local::stream_protocol::endpoint& endpoint)
		-> std::string
	{
		return endpoint.path();
	}

	inline auto format_endpoint(const asio::local::datagram_protocol::endpoint& endpoint)
		-> std::string
	{
		return endpoint.path();
	}
#endif

	//! \brief Local or remote endpoint of \p socket, empty when unavailable.
	template<typename Socket>
	auto local_endpoint_string(const Socket& socket) -> std::string
	{
		asio::error_code ec;
		auto endpoint = socket.local_endpoint(ec);
		return ec ? std::string() : format_endpoint(endpoint);
	}

	template<typename Socket>
	auto remote_endpoint_string(const Socket& socket) -> std::string
	{
		asio::error_code ec;
		auto endpoint = socket.remote_endpoint(ec);
		return ec ? std::string() : format_endpoint(endpoint);
	}

	/*!
	 * \brief Resolves \p address for \p Protocol (asio::ip::tcp or udp).
	 *
	 * The family restriction comes from \p network (tcp4 only yields IPv4
	 * endpoints). \p passive resolves an empty host to the wildcard address
	 * for binding.
	 *
	 * \return address_resolution_failed with the resolver message in
	 *         details.
	 */
	template<typename Protocol>
	auto resolve(protocol::network_protocol network, std::string_view address, bool passive)
		-> Result<std::vector<typename Protocol::endpoint>>
	{
		using endpoints = std::vector<typename Protocol::endpoint>;
		using error_codes::socket::address_resolution_failed;

		auto parts = protocol::split_host_port(address);
		if (parts.is_err())
		{
			return error<endpoints>(address_resolution_failed, "cannot resolve address",
									"resolver", to_string(parts.error()));
		}

		const auto& port = parts.value().port;
		bool numeric = !port.empty();
		for (char c : port)
		{
			numeric = numeric && std::isdigit(static_cast<unsigned char>(c));
		}
		if (numeric && (port.size() > 5 || std::stoul(port) > 65535))
		{
			return error<endpoints>(address_resolution_failed, "cannot resolve address",
									"resolver", "invalid port " + port);
		}

		asio::io_context io;
		typename Protocol::resolver resolver(io);
		asio::error_code ec;

		auto flags = passive ? asio::ip::resolver_base::passive : asio::ip::resolver_base::flags();
		if (numeric)
		{
			flags |= asio::ip::resolver_base::numeric_service;
		}

		const auto& host = parts.value().host;
		typename Protocol::resolver::results_type results;
		if (network == protocol::network_protocol::tcp4 || network == protocol::network_protocol::udp4)
		{
			results = resolver.resolve(Protocol::v4(), host, port, flags, ec);
		}
		else if (network == protocol::network_protocol::tcp6 ||
				 network == protocol::network_protocol::udp6)
		{
			results = resolver.resolve(Protocol::v6(), host, port, flags, ec);
		}
		else
		{
			results = resolver.resolve(host, port, flags, ec);
		}

		if (ec)
		{
			return error<endpoints>(address_resolution_failed, "cannot resolve address",
									"resolver", ec.message());
		}

		endpoints found;
		for (const auto& entry : results)
		{
			found.push_back(entry.endpoint());
		}
		if (found.empty())
		{
			return error<endpoints>(address_resolution_failed, "cannot resolve address",
									"resolver", "no address for " + std::string(address));
		}
		return ok(std::move(found));
	}

	//! \brief Non-empty path that fits in sockaddr_un.
	inline auto check_unix_path(std::string_view path) -> VoidResult
	{
		using error_codes::socket::invalid_address;

		if (path.empty())
		{
			return error_void(invalid_address, "missing unix socket path", "resolver");
		}
		if (path.size() > max_unix_path)
		{
			return error_void(invalid_address, "unix socket path too long", "resolver",
							  std::string(path));
		}
		return ok();
	}

} // namespace netkit::detail
