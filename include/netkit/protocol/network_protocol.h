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
 * @file network_protocol.h
 * @brief Transport kinds understood by netkit servers and clients
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "netkit/types/result.h"

namespace netkit::protocol
{
	/*!
	 * \enum network_protocol
	 * \brief Transport selector for configs, servers and clients.
	 *
	 * Numeric values are stable and used by from_int()/to_int() for
	 * configuration stores that persist the protocol as a number.
	 */
	enum class network_protocol : std::uint8_t
	{
		empty = 0,
		unix_stream = 1,
		tcp = 2,
		tcp4 = 3,
		tcp6 = 4,
		udp = 5,
		udp4 = 6,
		udp6 = 7,
		ip = 8,
		ip4 = 9,
		ip6 = 10,
		unixgram = 11,
	};

	/*!
	 * \brief Parses a protocol name.
	 *
	 * Case-insensitive. Surrounding whitespace and one level of matching
	 * quotes (", ' or `) are stripped. Unknown names yield
	 * network_protocol::empty.
	 */
	auto parse_network_protocol(std::string_view name) -> network_protocol;

	//! \brief Lower-case code ("tcp4", "unixgram"), empty string for empty.
	auto to_string(network_protocol proto) -> std::string;

	//! \brief Inverse of to_int(); values outside the enum yield empty.
	auto from_int(std::int64_t value) -> network_protocol;
	auto to_int(network_protocol proto) -> std::int64_t;

	auto is_tcp_family(network_protocol proto) -> bool;
	auto is_udp_family(network_protocol proto) -> bool;
	auto is_unix_family(network_protocol proto) -> bool;
	auto is_ip_family(network_protocol proto) -> bool;

	//! \brief Connectionless transports: the udp family and unixgram.
	auto is_datagram(network_protocol proto) -> bool;

	/*!
	 * \struct host_port
	 * \brief Split form of an "host:port" address.
	 */
	struct host_port
	{
		std::string host;
		std::string port;
	};

	/*!
	 * \brief Splits "host:port", ":port" or "[v6]:port".
	 * \return invalid_address when the port separator is missing, the
	 *         port is empty or the brackets are unbalanced.
	 */
	auto split_host_port(std::string_view address) -> Result<host_port>;

	//! \brief Joins host and port, bracketing IPv6 literals.
	auto join_host_port(std::string_view host, std::string_view port) -> std::string;

} // namespace netkit::protocol
