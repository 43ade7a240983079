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

#include "netkit/core/udp_server.h"

#include "netkit/detail/resolver.h"
#include "netkit/integration/logger_integration.h"

namespace netkit::core
{
	udp_server::udp_server(config::server_config cfg, handler_t handler, update_conn_t update_conn)
		: socket_server_base<udp_server>("udp_server", std::move(cfg), std::move(handler),
										 std::move(update_conn))
	{
	}

	udp_server::~udp_server()
	{
		do_release();
	}

	auto udp_server::create(const config::server_config& cfg,
							handler_t handler,
							update_conn_t update_conn) -> Result<std::shared_ptr<udp_server>>
	{
		using result_type = std::shared_ptr<udp_server>;

		if (!handler)
		{
			return error<result_type>(error_codes::socket::invalid_handler,
									  "missing datagram handler", "udp_server");
		}
		if (cfg.address.empty())
		{
			return error<result_type>(error_codes::socket::invalid_address,
									  "missing listen address", "udp_server");
		}
		if (!protocol::is_udp_family(cfg.network))
		{
			return error<result_type>(error_codes::socket::invalid_protocol,
									  "udp_server needs a udp network", "udp_server",
									  protocol::to_string(cfg.network));
		}
		if (cfg.tls.enabled)
		{
			return error<result_type>(error_codes::socket::invalid_tls_config,
									  "TLS is not available on udp", "udp_server");
		}

		return ok(std::shared_ptr<udp_server>(
			new udp_server(cfg, std::move(handler), std::move(update_conn))));
	}

	auto udp_server::do_bind() -> Result<std::string>
	{
		const auto& cfg = settings();

		auto endpoints = detail::resolve<asio::ip::udp>(cfg.network, cfg.address, true);
		if (endpoints.is_err())
		{
			return forward_error<std::string>(endpoints);
		}

		asio::error_code ec;
		for (const auto& endpoint : endpoints.value())
		{
			socket_.emplace(io_);

			socket_->open(endpoint.protocol(), ec);
			if (!ec)
			{
				socket_->set_option(asio::socket_base::reuse_address(true), ec);
			}
			if (!ec)
			{
				socket_->bind(endpoint, ec);
			}
			if (!ec)
			{
				return ok(detail::local_endpoint_string(*socket_));
			}

			NETKIT_LOG_DEBUG("[udp_server] cannot bind " + detail::format_endpoint(endpoint) +
							 ": " + ec.message());
			do_release();
		}

		return error<std::string>(error_codes::socket::bind_failed, "cannot bind " + cfg.address,
								  "udp_server", ec.message());
	}

	auto udp_server::do_serve(const utils::cancel_context& ctx) -> VoidResult
	{
		return receive_loop(*socket_, ctx);
	}

	auto udp_server::do_release() -> void
	{
		if (socket_)
		{
			asio::error_code ignored;
			socket_->close(ignored);
		}
	}

} // namespace netkit::core
