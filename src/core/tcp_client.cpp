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

#include "netkit/core/tcp_client.h"

#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include "netkit/detail/resolver.h"
#include "netkit/integration/logger_integration.h"

namespace netkit::core
{
	namespace
	{
		constexpr const char* kSource = "tcp_client";

		auto is_ip_literal(const std::string& name) -> bool
		{
			asio::error_code ec;
			asio::ip::make_address(name, ec);
			return !ec;
		}
	} // namespace

	tcp_client::tcp_client(std::string address, protocol::network_protocol network)
		: socket_client_base<tcp_client>(kSource, network, std::move(address))
	{
	}

	tcp_client::~tcp_client()
	{
		auto closed = close();
		(void)closed;
		do_close();
	}

	auto tcp_client::create(const std::string& address, protocol::network_protocol network)
		-> Result<std::shared_ptr<tcp_client>>
	{
		using result_type = std::shared_ptr<tcp_client>;

		if (address.empty())
		{
			return error<result_type>(error_codes::socket::invalid_address,
									  "missing server address", kSource);
		}
		if (!protocol::is_tcp_family(network))
		{
			return error<result_type>(error_codes::socket::invalid_protocol,
									  "tcp_client needs a tcp network", kSource,
									  protocol::to_string(network));
		}

		auto resolved = detail::resolve<asio::ip::tcp>(network, address, false);
		if (resolved.is_err())
		{
			return forward_error<result_type>(resolved);
		}

		return ok(std::shared_ptr<tcp_client>(new tcp_client(address, network)));
	}

	auto tcp_client::set_tls(bool enable, const config::tls_config& tls,
							 const std::string& server_name) -> VoidResult
	{
		if (is_connected())
		{
			return error_void(error_codes::socket::invalid_instance,
							  "TLS cannot change while connected", kSource);
		}

		if (!enable)
		{
			tls_enabled_ = false;
			tls_.reset();
			server_name_.clear();
			ssl_context_.reset();
			return ok();
		}

		if (server_name.empty())
		{
			return error_void(error_codes::socket::invalid_tls_config,
							  "TLS needs the server name to verify", kSource);
		}

		auto context = tls.make_client_context();
		if (context.is_err())
		{
			return forward_error<std::monostate>(context);
		}

		tls_enabled_ = true;
		tls_ = tls;
		server_name_ = server_name;
		ssl_context_ = context.value();
		return ok();
	}

	auto tcp_client::do_connect(asio::io_context& io, const utils::cancel_context& ctx)
		-> VoidResult
	{
		auto endpoints = detail::resolve<asio::ip::tcp>(network(), address(), false);
		if (endpoints.is_err())
		{
			return forward_error<std::monostate>(endpoints);
		}

		socket_.emplace(io);

		auto done = detail::run_blocking(
			io,
			[this, &endpoints](detail::op_completion completion)
			{ asio::async_connect(*socket_, endpoints.value(), completion); },
			[&ctx] { return ctx.is_done(); },
			[this]
			{
				asio::error_code ignored;
				socket_->close(ignored);
			},
			defaults_.io_poll_interval);

		if (done.aborted)
		{
			auto reason = ctx.reason();
			return error_void(error_codes::socket::connection_failed,
							  "connect to " + address() + " aborted", kSource,
							  reason.is_err() ? reason.error().message : std::string());
		}
		if (done.ec)
		{
			return error_void(error_codes::socket::connection_failed,
							  "cannot connect to " + address(), kSource, done.ec.message());
		}

		if (tls_enabled_)
		{
			return handshake(ctx, io);
		}
		return ok();
	}

	auto tcp_client::handshake(const utils::cancel_context& ctx, asio::io_context& io)
		-> VoidResult
	{
		tls_stream_.emplace(std::move(*socket_), *ssl_context_);
		socket_.reset();

		SSL* ssl = tls_stream_->native_handle();
		if (is_ip_literal(server_name_))
		{
			if (tls_->verify_mode != config::certificate_verification::none &&
				X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), server_name_.c_str()) != 1)
			{
				return error_void(error_codes::socket::tls_handshake_failed,
								  "cannot set peer address check", kSource, server_name_);
			}
		}
		else
		{
			if (SSL_set_tlsext_host_name(ssl, server_name_.c_str()) != 1)
			{
				return error_void(error_codes::socket::tls_handshake_failed,
								  "cannot set server name indication", kSource, server_name_);
			}
			if (tls_->verify_mode != config::certificate_verification::none &&
				SSL_set1_host(ssl, server_name_.c_str()) != 1)
			{
				return error_void(error_codes::socket::tls_handshake_failed,
								  "cannot set peer host name check", kSource, server_name_);
			}
		}

		const auto deadline = std::chrono::steady_clock::now() +
							  std::chrono::milliseconds(tls_->handshake_timeout_ms);

		auto done = detail::run_blocking(
			io,
			[this](detail::op_completion completion)
			{ tls_stream_->async_handshake(asio::ssl::stream_base::client, completion); },
			[&ctx, deadline] { return ctx.is_done() || std::chrono::steady_clock::now() >= deadline; },
			[this]
			{
				asio::error_code ignored;
				tls_stream_->lowest_layer().close(ignored);
			},
			defaults_.io_poll_interval);

		if (done.ec || done.aborted)
		{
			const auto reason = done.ec ? done.ec.message() : std::string("handshake timed out");
			NETKIT_LOG_WARN("[tcp_client] TLS handshake with " + address() + " failed: " + reason);
			return error_void(error_codes::socket::tls_handshake_failed, "TLS handshake failed",
							  kSource, reason);
		}
		return ok();
	}

	auto tcp_client::start_read(std::span<std::uint8_t> buffer, detail::op_completion completion)
		-> void
	{
		auto target = asio::buffer(buffer.data(), buffer.size());
		if (tls_stream_)
		{
			tls_stream_->async_read_some(target, std::move(completion));
		}
		else
		{
			socket_->async_read_some(target, std::move(completion));
		}
	}

	auto tcp_client::start_write(std::span<const std::uint8_t> data,
								 detail::op_completion completion) -> void
	{
		auto source = asio::buffer(data.data(), data.size());
		if (tls_stream_)
		{
			asio::async_write(*tls_stream_, source, std::move(completion));
		}
		else
		{
			asio::async_write(*socket_, source, std::move(completion));
		}
	}

	auto tcp_client::cancel_io() -> void
	{
		asio::error_code ignored;
		lowest_layer().cancel(ignored);
	}

	auto tcp_client::close_write() -> void
	{
		// A TLS stream cannot be half closed without ending the session.
		if (socket_)
		{
			asio::error_code ignored;
			socket_->shutdown(asio::socket_base::shutdown_send, ignored);
		}
	}

	auto tcp_client::do_close() -> void
	{
		asio::error_code ignored;
		if (tls_stream_)
		{
			tls_stream_->lowest_layer().shutdown(asio::socket_base::shutdown_both, ignored);
			tls_stream_->lowest_layer().close(ignored);
			tls_stream_.reset();
		}
		if (socket_)
		{
			socket_->shutdown(asio::socket_base::shutdown_both, ignored);
			socket_->close(ignored);
			socket_.reset();
		}
	}

	auto tcp_client::lowest_layer() -> asio::ip::tcp::socket&
	{
		return tls_stream_ ? tls_stream_->next_layer() : *socket_;
	}

	auto tcp_client::lowest_layer() const -> const asio::ip::tcp::socket&
	{
		return tls_stream_ ? tls_stream_->next_layer() : *socket_;
	}

	auto tcp_client::local_endpoint() const -> std::string
	{
		if (!tls_stream_ && !socket_)
		{
			return std::string();
		}
		return detail::local_endpoint_string(lowest_layer());
	}

	auto tcp_client::remote_endpoint() const -> std::string
	{
		if (!tls_stream_ && !socket_)
		{
			return std::string();
		}
		return detail::remote_endpoint_string(lowest_layer());
	}

} // namespace netkit::core
