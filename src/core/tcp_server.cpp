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

#include "netkit/core/tcp_server.h"

#include "netkit/detail/resolver.h"
#include "netkit/detail/stream_session.h"
#include "netkit/integration/logger_integration.h"

namespace netkit::core
{
	namespace
	{
		using tls_stream = asio::ssl::stream<asio::ip::tcp::socket>;
	}

	tcp_server::tcp_server(config::server_config cfg, handler_t handler, update_conn_t update_conn)
		: socket_server_base<tcp_server>("tcp_server", std::move(cfg), std::move(handler),
										 std::move(update_conn))
	{
	}

	tcp_server::~tcp_server()
	{
		do_release();
	}

	auto tcp_server::create(const config::server_config& cfg,
							handler_t handler,
							update_conn_t update_conn) -> Result<std::shared_ptr<tcp_server>>
	{
		using result_type = std::shared_ptr<tcp_server>;

		if (!handler)
		{
			return error<result_type>(error_codes::socket::invalid_handler,
									  "missing connection handler", "tcp_server");
		}
		if (cfg.address.empty())
		{
			return error<result_type>(error_codes::socket::invalid_address,
									  "missing listen address", "tcp_server");
		}
		if (!protocol::is_tcp_family(cfg.network))
		{
			return error<result_type>(error_codes::socket::invalid_protocol,
									  "tcp_server needs a tcp network", "tcp_server",
									  protocol::to_string(cfg.network));
		}

		auto server = std::shared_ptr<tcp_server>(
			new tcp_server(cfg, std::move(handler), std::move(update_conn)));

		auto tls = cfg.get_tls();
		if (tls.enabled)
		{
			if (!tls.config)
			{
				return error<result_type>(error_codes::socket::invalid_tls_config,
										  "TLS enabled without configuration", "tcp_server");
			}
			auto applied = server->set_tls(true, *tls.config);
			if (applied.is_err())
			{
				return forward_error<result_type>(applied);
			}
		}

		return ok(std::move(server));
	}

	auto tcp_server::set_tls(bool enable, const config::tls_config& tls) -> VoidResult
	{
		if (started())
		{
			return error_void(error_codes::socket::server_already_running,
							  "TLS cannot change once the server listened", "tcp_server");
		}

		if (!enable)
		{
			std::lock_guard<std::mutex> lock(tls_mutex_);
			ssl_context_.reset();
			return ok();
		}

		auto context = tls.make_server_context();
		if (context.is_err())
		{
			return forward_error<std::monostate>(context);
		}

		std::lock_guard<std::mutex> lock(tls_mutex_);
		ssl_context_ = context.value();
		handshake_timeout_ms_ = tls.handshake_timeout_ms;
		return ok();
	}

	auto tcp_server::tls_enabled() const -> bool
	{
		std::lock_guard<std::mutex> lock(tls_mutex_);
		return ssl_context_ != nullptr;
	}

	auto tcp_server::handshake_timeout_ms() const -> std::size_t
	{
		std::lock_guard<std::mutex> lock(tls_mutex_);
		return handshake_timeout_ms_;
	}

	auto tcp_server::do_bind() -> Result<std::string>
	{
		const auto& cfg = settings();

		auto endpoints = detail::resolve<asio::ip::tcp>(cfg.network, cfg.address, true);
		if (endpoints.is_err())
		{
			return forward_error<std::string>(endpoints);
		}

		asio::error_code ec;
		for (const auto& endpoint : endpoints.value())
		{
			acceptor_.emplace(io_);

			acceptor_->open(endpoint.protocol(), ec);
			if (!ec)
			{
				acceptor_->set_option(asio::socket_base::reuse_address(true), ec);
			}
			if (!ec)
			{
				acceptor_->bind(endpoint, ec);
			}
			if (!ec)
			{
				acceptor_->listen(asio::socket_base::max_listen_connections, ec);
			}
			if (!ec)
			{
				return ok(detail::local_endpoint_string(*acceptor_));
			}

			NETKIT_LOG_DEBUG("[tcp_server] cannot bind " + detail::format_endpoint(endpoint) +
							 ": " + ec.message());
			do_release();
		}

		return error<std::string>(error_codes::socket::bind_failed, "cannot bind " + cfg.address,
								  "tcp_server", ec.message());
	}

	auto tcp_server::do_serve(const utils::cancel_context& ctx) -> VoidResult
	{
		std::shared_ptr<asio::ssl::context> ssl_context;
		{
			std::lock_guard<std::mutex> lock(tls_mutex_);
			ssl_context = ssl_context_;
		}

		const auto idle = settings().con_idle_timeout;
		const auto poll = defaults_.io_poll_interval;

		if (ssl_context)
		{
			return accept_loop(
				*acceptor_, ctx,
				[this, ssl_context, idle, poll](std::unique_ptr<asio::io_context> io,
												asio::ip::tcp::socket peer,
												utils::cancel_context conn_ctx)
				{
					auto stream = std::make_unique<tls_stream>(std::move(peer), *ssl_context);
					return std::make_shared<detail::stream_session<tls_stream>>(
						std::move(io), std::move(stream), std::move(conn_ctx), idle, poll,
						notifier());
				});
		}

		return accept_loop(
			*acceptor_, ctx,
			[this, idle, poll](std::unique_ptr<asio::io_context> io, asio::ip::tcp::socket peer,
							   utils::cancel_context conn_ctx)
			{
				auto stream = std::make_unique<asio::ip::tcp::socket>(std::move(peer));
				return std::make_shared<detail::stream_session<asio::ip::tcp::socket>>(
					std::move(io), std::move(stream), std::move(conn_ctx), idle, poll, notifier());
			});
	}

	auto tcp_server::do_release() -> void
	{
		if (acceptor_)
		{
			asio::error_code ignored;
			acceptor_->close(ignored);
			acceptor_.reset();
		}
	}

} // namespace netkit::core
