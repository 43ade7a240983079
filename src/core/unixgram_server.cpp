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

#include "netkit/core/unixgram_server.h"

#if defined(ASIO_HAS_LOCAL_SOCKETS)

#include "netkit/detail/resolver.h"
#include "netkit/detail/unix_socket_file.h"

namespace netkit::core
{
	unixgram_server::unixgram_server(config::server_config cfg,
									 handler_t handler,
									 update_conn_t update_conn)
		: socket_server_base<unixgram_server>("unixgram_server", std::move(cfg),
											  std::move(handler), std::move(update_conn))
	{
	}

	unixgram_server::~unixgram_server()
	{
		do_release();
	}

	auto unixgram_server::create(const config::server_config& cfg,
								 handler_t handler,
								 update_conn_t update_conn)
		-> Result<std::shared_ptr<unixgram_server>>
	{
		using result_type = std::shared_ptr<unixgram_server>;

		if (!handler)
		{
			return error<result_type>(error_codes::socket::invalid_handler,
									  "missing datagram handler", "unixgram_server");
		}
		if (cfg.address.empty())
		{
			return error<result_type>(error_codes::socket::invalid_address,
									  "missing socket path", "unixgram_server");
		}
		if (cfg.network != protocol::network_protocol::unixgram)
		{
			return error<result_type>(error_codes::socket::invalid_protocol,
									  "unixgram_server needs the unixgram network",
									  "unixgram_server", protocol::to_string(cfg.network));
		}
		if (cfg.tls.enabled)
		{
			return error<result_type>(error_codes::socket::invalid_tls_config,
									  "TLS is not available on unix sockets", "unixgram_server");
		}
		if (cfg.group_perm < -1 || cfg.group_perm > config::max_gid)
		{
			return error<result_type>(error_codes::socket::invalid_group, "invalid unix group",
									  "unixgram_server", std::to_string(cfg.group_perm));
		}

		return ok(std::shared_ptr<unixgram_server>(
			new unixgram_server(cfg, std::move(handler), std::move(update_conn))));
	}

	auto unixgram_server::do_bind() -> Result<std::string>
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
		socket_.emplace(io_);
		socket_->open(asio::local::datagram_protocol(), ec);
		if (!ec)
		{
			socket_->bind(asio::local::datagram_protocol::endpoint(cfg.address), ec);
		}
		if (ec)
		{
			do_release();
			return error<std::string>(error_codes::socket::bind_failed, "cannot bind " + cfg.address,
									  "unixgram_server", ec.message());
		}
		owns_file_ = true;

		auto permissions = detail::apply_socket_permissions(cfg.address, cfg.perm_file, cfg.group_perm);
		if (permissions.is_err())
		{
			do_release();
			return forward_error<std::string>(permissions);
		}

		return ok(cfg.address);
	}

	auto unixgram_server::do_serve(const utils::cancel_context& ctx) -> VoidResult
	{
		return receive_loop(*socket_, ctx);
	}

	auto unixgram_server::do_release() -> void
	{
		if (socket_)
		{
			asio::error_code ignored;
			socket_->close(ignored);
		}
		if (owns_file_)
		{
			owns_file_ = false;
			detail::remove_socket_file(settings().address);
		}
	}

} // namespace netkit::core

#endif
