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

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace netkit::protocol
{
	namespace
	{
		constexpr std::array<std::pair<std::string_view, network_protocol>, 11> kNames{{
			{"unix", network_protocol::unix_stream},
			{"tcp", network_protocol::tcp},
			{"tcp4", network_protocol::tcp4},
			{"tcp6", network_protocol::tcp6},
			{"udp", network_protocol::udp},
			{"udp4", network_protocol::udp4},
			{"udp6", network_protocol::udp6},
			{"ip", network_protocol::ip},
			{"ip4", network_protocol::ip4},
			{"ip6", network_protocol::ip6},
			{"unixgram", network_protocol::unixgram},
		}};

		auto trim(std::string_view value) -> std::string_view
		{
			while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
			{
				value.remove_prefix(1);
			}
			while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
			{
				value.remove_suffix(1);
			}
			return value;
		}

		auto unquote(std::string_view value) -> std::string_view
		{
			if (value.size() >= 2)
			{
				const char first = value.front();
				if ((first == '"' || first == '\'' || first == '`') && value.back() == first)
				{
					return value.substr(1, value.size() - 2);
				}
			}
			return value;
		}
	} // namespace

	auto parse_network_protocol(std::string_view name) -> network_protocol
	{
		auto cleaned = trim(unquote(trim(name)));

		std::string lowered(cleaned);
		std::transform(lowered.begin(), lowered.end(), lowered.begin(),
					   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

		for (const auto& [code, proto] : kNames)
		{
			if (lowered == code)
			{
				return proto;
			}
		}
		return network_protocol::empty;
	}

	auto to_string(network_protocol proto) -> std::string
	{
		for (const auto& [code, value] : kNames)
		{
			if (value == proto)
			{
				return std::string(code);
			}
		}
		return {};
	}

	auto from_int(std::int64_t value) -> network_protocol
	{
		if (value <= 0 || value > static_cast<std::int64_t>(network_protocol::unixgram))
		{
			return network_protocol::empty;
		}
		return static_cast<network_protocol>(value);
	}

	auto to_int(network_protocol proto) -> std::int64_t
	{
		return static_cast<std::int64_t>(proto);
	}

	auto is_tcp_family(network_protocol proto) -> bool
	{
		return proto == network_protocol::tcp || proto == network_protocol::tcp4 ||
			   proto == network_protocol::tcp6;
	}

	auto is_udp_family(network_protocol proto) -> bool
	{
		return proto == network_protocol::udp || proto == network_protocol::udp4 ||
			   proto == network_protocol::udp6;
	}

	auto is_unix_family(network_protocol proto) -> bool
	{
		return proto == network_protocol::unix_stream || proto == network_protocol::unixgram;
	}

	auto is_ip_family(network_protocol proto) -> bool
	{
		return proto == network_protocol::ip || proto == network_protocol::ip4 ||
			   proto == network_protocol::ip6;
	}

	auto is_datagram(network_protocol proto) -> bool
	{
		return is_udp_family(proto) || proto == network_protocol::unixgram;
	}

	auto split_host_port(std::string_view address) -> Result<host_port>
	{
		using error_codes::socket::invalid_address;

		if (address.empty())
		{
			return error<host_port>(invalid_address, "missing address", "network_protocol");
		}

		if (address.front() == '[')
		{
			const auto close = address.find(']');
			if (close == std::string_view::npos)
			{
				return error<host_port>(invalid_address, "missing ']' in address",
										"network_protocol", std::string(address));
			}
			if (close + 1 >= address.size() || address[close + 1] != ':')
			{
				return error<host_port>(invalid_address, "missing port in address",
										"network_protocol", std::string(address));
			}
			host_port parts{std::string(address.substr(1, close - 1)),
							std::string(address.substr(close + 2))};
			if (parts.port.empty())
			{
				return error<host_port>(invalid_address, "missing port in address",
										"network_protocol", std::string(address));
			}
			return ok(std::move(parts));
		}

		const auto colon = address.rfind(':');
		if (colon == std::string_view::npos)
		{
			return error<host_port>(invalid_address, "missing port in address",
									"network_protocol", std::string(address));
		}
		if (address.find(':') != colon)
		{
			return error<host_port>(invalid_address, "too many colons in address",
									"network_protocol", std::string(address));
		}

		host_port parts{std::string(address.substr(0, colon)),
						std::string(address.substr(colon + 1))};
		if (parts.port.empty())
		{
			return error<host_port>(invalid_address, "missing port in address",
									"network_protocol", std::string(address));
		}
		return ok(std::move(parts));
	}

	auto join_host_port(std::string_view host, std::string_view port) -> std::string
	{
		if (host.find(':') != std::string_view::npos)
		{
			return "[" + std::string(host) + "]:" + std::string(port);
		}
		return std::string(host) + ":" + std::string(port);
	}

} // namespace netkit::protocol
