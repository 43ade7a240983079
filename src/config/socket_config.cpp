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

#include "netkit/config/socket_config.h"

#include <algorithm>
#include <cctype>

#include "netkit/detail/resolver.h"

namespace netkit::config
{
	namespace
	{
		using protocol::network_protocol;

		constexpr const char* kSource = "socket_config";

		auto trim_quotes(std::string_view text) -> std::string_view
		{
			auto is_noise = [](char c) {
				return std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\'';
			};
			while (!text.empty() && is_noise(text.front())) text.remove_prefix(1);
			while (!text.empty() && is_noise(text.back())) text.remove_suffix(1);
			return text;
		}

		/*!
		 * \brief Checks shared by client and server: the network value and
		 *        its address.
		 */
		auto validate_endpoint(network_protocol network, const std::string& address) -> VoidResult
		{
			using namespace error_codes::socket;

			if (protocol::is_tcp_family(network))
			{
				if (address.empty())
				{
					return error_void(invalid_address, "missing address", kSource);
				}
				auto resolved = detail::resolve<asio::ip::tcp>(network, address, true);
				if (resolved.is_err())
				{
					return error_void(resolved.error().code, resolved.error().message, kSource,
									  resolved.error().details);
				}
				return ok();
			}

			if (protocol::is_udp_family(network))
			{
				if (address.empty())
				{
					return error_void(invalid_address, "missing address", kSource);
				}
				auto resolved = detail::resolve<asio::ip::udp>(network, address, true);
				if (resolved.is_err())
				{
					return error_void(resolved.error().code, resolved.error().message, kSource,
									  resolved.error().details);
				}
				return ok();
			}

			if (protocol::is_unix_family(network))
			{
#if defined(_WIN32)
				return error_void(invalid_protocol, "unix sockets are not available on this platform",
								  kSource, protocol::to_string(network));
#else
				return detail::check_unix_path(address);
#endif
			}

			return error_void(invalid_protocol, "invalid network protocol", kSource,
							  protocol::to_string(network));
		}

		auto tls_base(const std::optional<tls_config>& instance_default) -> std::optional<tls_config>
		{
			if (instance_default)
			{
				return instance_default;
			}
			return tls_config::global_default();
		}
	} // namespace

	auto file_mode::parse(std::string_view text) -> Result<file_mode>
	{
		using error_codes::common_errors::invalid_argument;

		auto cleaned = trim_quotes(text);
		if (cleaned.empty())
		{
			return error<file_mode>(invalid_argument, "empty file mode", kSource);
		}

		if (cleaned.size() == 9 && std::all_of(cleaned.begin(), cleaned.end(), [](char c) {
				return c == 'r' || c == 'w' || c == 'x' || c == '-';
			}))
		{
			static constexpr char kLetters[] = "rwxrwxrwx";
			std::uint32_t bits = 0;
			for (std::size_t i = 0; i < 9; ++i)
			{
				if (cleaned[i] == kLetters[i])
				{
					bits |= 1u << (8 - i);
				}
				else if (cleaned[i] != '-')
				{
					return error<file_mode>(invalid_argument, "invalid symbolic file mode", kSource,
											std::string(text));
				}
			}
			return ok(file_mode(bits));
		}

		if (cleaned.size() > 2 && cleaned[0] == '0' && (cleaned[1] == 'o' || cleaned[1] == 'O'))
		{
			cleaned.remove_prefix(2);
		}
		if (cleaned.empty() || cleaned.size() > 5)
		{
			return error<file_mode>(invalid_argument, "invalid octal file mode", kSource,
									std::string(text));
		}

		std::uint32_t bits = 0;
		for (char c : cleaned)
		{
			if (c < '0' || c > '7')
			{
				return error<file_mode>(invalid_argument, "invalid octal file mode", kSource,
										std::string(text));
			}
			bits = bits * 8 + static_cast<std::uint32_t>(c - '0');
		}
		if (bits > 07777)
		{
			return error<file_mode>(invalid_argument, "file mode out of range", kSource,
									std::string(text));
		}
		return ok(file_mode(bits));
	}

	auto file_mode::to_string() const -> std::string
	{
		std::string out(4, '0');
		std::uint32_t value = bits_;
		for (int i = 3; i >= 0; --i)
		{
			out[static_cast<std::size_t>(i)] = static_cast<char>('0' + (value & 07));
			value >>= 3;
		}
		return out;
	}

	auto file_mode::symbolic() const -> std::string
	{
		static constexpr char kLetters[] = "rwxrwxrwx";
		std::string out(9, '-');
		for (std::size_t i = 0; i < 9; ++i)
		{
			if (bits_ & (1u << (8 - i)))
			{
				out[i] = kLetters[i];
			}
		}
		return out;
	}

	auto client_config::validate() const -> VoidResult
	{
		auto endpoint = validate_endpoint(network, address);
		if (endpoint.is_err())
		{
			return endpoint;
		}

		if (tls.enabled)
		{
			if (!protocol::is_tcp_family(network))
			{
				return error_void(error_codes::socket::invalid_tls_config,
								  "TLS is only supported over TCP", kSource,
								  protocol::to_string(network));
			}
			if (tls.server_name.empty())
			{
				return error_void(error_codes::socket::invalid_tls_config,
								  "TLS requires a server name", kSource);
			}
		}

		return ok();
	}

	auto client_config::default_tls(const tls_config* defaults) -> void
	{
		if (defaults == nullptr)
		{
			default_tls_.reset();
			return;
		}
		default_tls_ = *defaults;
	}

	auto client_config::get_tls() const -> client_tls
	{
		if (!tls.enabled)
		{
			return client_tls{};
		}

		auto base = tls_base(default_tls_);
		return client_tls{true, tls.config.new_from(base ? &*base : nullptr), tls.server_name};
	}

	auto server_config::validate() const -> VoidResult
	{
		auto endpoint = validate_endpoint(network, address);
		if (endpoint.is_err())
		{
			return endpoint;
		}

		if (tls.enabled)
		{
			if (!protocol::is_tcp_family(network))
			{
				return error_void(error_codes::socket::invalid_tls_config,
								  "TLS is only supported over TCP", kSource,
								  protocol::to_string(network));
			}

			auto effective = get_tls();
			if (!effective.config || !effective.config->has_certificates())
			{
				return error_void(error_codes::socket::invalid_tls_config,
								  "TLS requires a certificate pair", kSource);
			}
		}

		if (group_perm > max_gid || group_perm < -1)
		{
			return error_void(error_codes::socket::invalid_group, "invalid unix group id", kSource,
							  std::to_string(group_perm));
		}

		return ok();
	}

	auto server_config::default_tls(const tls_config* defaults) -> void
	{
		if (defaults == nullptr)
		{
			default_tls_.reset();
			return;
		}
		default_tls_ = *defaults;
	}

	auto server_config::get_tls() const -> server_tls
	{
		if (!tls.enabled)
		{
			return server_tls{};
		}

		auto base = tls_base(default_tls_);
		return server_tls{true, tls.config.new_from(base ? &*base : nullptr)};
	}

} // namespace netkit::config
