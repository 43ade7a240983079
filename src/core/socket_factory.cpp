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

#include "netkit/core/socket_factory.h"

#include "netkit/core/tcp_client.h"
#include "netkit/core/tcp_server.h"
#include "netkit/core/udp_client.h"
#include "netkit/core/udp_server.h"
#include "netkit/core/unix_client.h"
#include "netkit/core/unix_server.h"
#include "netkit/core/unixgram_client.h"
#include "netkit/core/unixgram_server.h"
#include "netkit/integration/logger_integration.h"

namespace netkit::core
{
	namespace
	{
		using server_ptr = std::shared_ptr<interfaces::i_socket_server>;
		using client_ptr = std::shared_ptr<interfaces::i_socket_client>;

		template<typename Server>
		auto as_server(Result<std::shared_ptr<Server>> created) -> Result<server_ptr>
		{
			if (created.is_err())
			{
				return forward_error<server_ptr>(created);
			}
			return ok(server_ptr(std::move(created.value())));
		}

		template<typename Client>
		auto as_client(Result<std::shared_ptr<Client>> created) -> Result<client_ptr>
		{
			if (created.is_err())
			{
				return forward_error<client_ptr>(created);
			}
			return ok(client_ptr(std::move(created.value())));
		}

		auto unsupported(protocol::network_protocol network, const char* role) -> error_info
		{
			return error_info(error_codes::socket::invalid_protocol,
							  std::string("no socket ") + role + " for this network",
							  "socket_factory", protocol::to_string(network));
		}
	} // namespace

	auto make_server(const config::server_config& cfg, handler_t handler, update_conn_t update_conn)
		-> Result<server_ptr>
	{
		if (auto valid = cfg.validate(); valid.is_err())
		{
			NETKIT_LOG_DEBUG("[socket_factory] invalid server config: " + to_string(valid.error()));
			return forward_error<server_ptr>(valid);
		}

		using protocol::network_protocol;
		switch (cfg.network)
		{
		case network_protocol::tcp:
		case network_protocol::tcp4:
		case network_protocol::tcp6:
			return as_server(tcp_server::create(cfg, std::move(handler), std::move(update_conn)));
		case network_protocol::udp:
		case network_protocol::udp4:
		case network_protocol::udp6:
			return as_server(udp_server::create(cfg, std::move(handler), std::move(update_conn)));
#if defined(ASIO_HAS_LOCAL_SOCKETS)
		case network_protocol::unix_stream:
			return as_server(unix_server::create(cfg, std::move(handler), std::move(update_conn)));
		case network_protocol::unixgram:
			return as_server(
				unixgram_server::create(cfg, std::move(handler), std::move(update_conn)));
#endif
		default:
			return Result<server_ptr>(unsupported(cfg.network, "server"));
		}
	}

	auto make_client(const config::client_config& cfg) -> Result<client_ptr>
	{
		if (auto valid = cfg.validate(); valid.is_err())
		{
			NETKIT_LOG_DEBUG("[socket_factory] invalid client config: " + to_string(valid.error()));
			return forward_error<client_ptr>(valid);
		}

		using protocol::network_protocol;
		Result<client_ptr> created = unsupported(cfg.network, "client");
		switch (cfg.network)
		{
		case network_protocol::tcp:
		case network_protocol::tcp4:
		case network_protocol::tcp6:
			created = as_client(tcp_client::create(cfg.address, cfg.network));
			break;
		case network_protocol::udp:
		case network_protocol::udp4:
		case network_protocol::udp6:
			created = as_client(udp_client::create(cfg.address, cfg.network));
			break;
#if defined(ASIO_HAS_LOCAL_SOCKETS)
		case network_protocol::unix_stream:
			created = as_client(unix_client::create(cfg.address));
			break;
		case network_protocol::unixgram:
			created = as_client(unixgram_client::create(cfg.address));
			break;
#endif
		default:
			break;
		}

		if (created.is_err())
		{
			return created;
		}

		auto tls = cfg.get_tls();
		if (tls.enabled)
		{
			if (!tls.config)
			{
				return error<client_ptr>(error_codes::socket::invalid_tls_config,
										 "TLS enabled without configuration", "socket_factory");
			}
			auto applied = created.value()->set_tls(true, *tls.config, tls.server_name);
			if (applied.is_err())
			{
				return forward_error<client_ptr>(applied);
			}
		}

		return created;
	}

} // namespace netkit::core
