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

#include "netkit/core/unix_server.h"

#if defined(ASIO_HAS_LOCAL_SOCKETS)

#include "netkit/detail/resolver.h"
#include "netkit/detail/stream_session.h"
#include "netkit/detail/unix_socket_file.h"

namespace netkit::core
{
	unix_server::unix_server(config::server_config cfg, handler_t handler, update_conn_t update_conn)
		: socket_server_base<unix_server>("unix_server", std::move(cfg), std::move(handler),
										  std::move(update_conn))
	{
	}

	unix_server::~unix_server()
	{
		do_release();
	}

	auto unix_server::create(const config::server_config& cfg,
							 handler_t handler,
							 update_conn_t update_conn) -> Result<std::shared_ptr<unix_server>>
	{
		using result_type = std::shared_ptr<unix_server>;

		if (!handler)
		{
			return error<result_type>(error_codes::socket::invalid_handler,
									  "missing connection handler", "unix_server");
		}
		if (cfg.address.empty())
		{
			return error<result_type>(error_codes::socket::invalid_address,
									  "missing socket path", "unix_server");
		}
		if (cfg.network != protocol::network_protocol::unix_stream)
		{
			return error<result_type>(error_codes::socket::invalid_protocol,
									  "unix_server needs the unix network", "unix_server",
									  protocol::to_string(cfg.network));
		}
		if (cfg.tls.enabled)
		{
			return error<result_type>(error_codes::socket::invalid_tls_config,
									  "TLS is not available on unix sockets", "unix_server");
		}
		if (cfg.group_perm < -1 || cfg.group_perm > config::max_gid)
		{
			return error<result_type>(error_codes::socket::invalid_group, "invalid unix group",
									  "unix_server", std::to_string(cfg.group_perm));
		}

		return ok(std::shared_ptr<unix_server>(
			new unix_server(cfg, std::move(handler), std::move(update_conn))));
	}

	auto unix_server::do_bind() -> Result<std::string>
	{
		const auto& cfg = settings();

		if (auto checked = detail::check_unix_path(cfg.address); checked.is_err())
		{
			return forward_error<std::string>(checked);
		}
		if (auto prepared = detail::prepare_socket_path(cfg.address); prepared.is_err())
		{
			return forward_error<std::string>(prepared);
		}

		asio::error_code ec;
		acceptor_.emplace(io_);
		acceptor_->open(asio::local::stream_protocol(), ec);
		if (!ec)
		{
			acceptor_->bind(asio::local::stream_protocol::endpoint(cfg.address), ec);
		}
		if (ec)
		{
			do_release();
			return error<std::string>(error_codes::socket::bind_failed, "cannot bind " + cfg.address,
									  "unix_server", ec.message());
		}
		owns_file_ = true;

		acceptor_->listen(asio::socket_base::max_listen_connections, ec);
		if (ec)
		{
			do_release();
			return error<std::string>(error_codes::socket::bind_failed,
									  "cannot listen on " + cfg.address, "unix_server",
									  ec.message());
		}

		auto permissions = detail::apply_socket_permissions(cfg.address, cfg.perm_file, cfg.group_perm);
		if (permissions.is_err())
		{
			do_release();
			return forward_error<std::string>(permissions);
		}

		return ok(cfg.address);
	}

	auto unix_server::do_serve(const utils::cancel_context& ctx) -> VoidResult
	{
		using socket_type = asio::local::stream_protocol::socket;

		const auto idle = settings().con_idle_timeout;
		const auto poll = defaults_.io_poll_interval;

		return accept_loop(
			*acceptor_, ctx,
			[this, idle, poll](std::unique_ptr<asio::io_context> io, socket_type peer,
							   utils::cancel_context conn_ctx)
			{
				auto stream = std::make_unique<socket_type>(std::move(peer));
				return std::make_shared<detail::stream_session<socket_type>>(
					std::move(io), std::move(stream), std::move(conn_ctx), idle, poll, notifier());
			});
	}

	auto unix_server::do_release() -> void
	{
		if (acceptor_)
		{
			asio::error_code ignored;
			acceptor_->close(ignored);
			acceptor_.reset();
		}
		if (owns_file_)
		{
			owns_file_ = false;
			detail::remove_socket_file(settings().address);
		}
	}

} // namespace netkit::core

#endif
