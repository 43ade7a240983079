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

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <asio.hpp>
#include <asio/ssl.hpp>

#include "netkit/config/socket_config.h"
#include "netkit/config/tls_config.h"
#include "netkit/core/socket_server_base.h"
#include "netkit/core/socket_types.h"
#include "netkit/types/result.h"
#include "netkit/utils/cancel_context.h"

namespace netkit::core
{
	/*!
	 * \class tcp_server
	 * \brief Stream server over tcp, tcp4 or tcp6, optionally with TLS.
	 *
	 * Each accepted connection gets its own thread and io_context; the
	 * handler runs there, after the TLS handshake when TLS is on.
	 *
	 * ### Usage Example
	 * \code
	 * config::server_config cfg;
	 * cfg.network = protocol::network_protocol::tcp;
	 * cfg.address = "127.0.0.1:9000";
	 *
	 * auto server = tcp_server::create(cfg, [](socket_context& conn) {
	 *     std::array<std::uint8_t, 512> buf{};
	 *     while (auto n = conn.read(buf)) {
	 *         conn.write(std::span(buf.data(), n.value()));
	 *     }
	 * }).value();
	 * server->listen(utils::cancel_context::background());
	 * \endcode
	 */
	class tcp_server : public socket_server_base<tcp_server>
	{
	public:
		/*!
		 * \brief Creates a server that is not listening yet.
		 *
		 * ### Error Conditions
		 * - invalid_handler when \p handler is empty
		 * - invalid_address when the address is empty
		 * - invalid_protocol when the network is not of the tcp family
		 * - invalid_tls_config when TLS is enabled without usable certificates
		 */
		static auto create(const config::server_config& cfg,
						   handler_t handler,
						   update_conn_t update_conn = nullptr)
			-> Result<std::shared_ptr<tcp_server>>;

		~tcp_server() override;

		auto set_tls(bool enable, const config::tls_config& tls) -> VoidResult override;

	private:
		friend class socket_server_base<tcp_server>;

		tcp_server(config::server_config cfg, handler_t handler, update_conn_t update_conn);

		auto do_bind() -> Result<std::string>;
		auto do_serve(const utils::cancel_context& ctx) -> VoidResult;
		auto do_release() -> void;

		[[nodiscard]] auto tls_enabled() const -> bool;
		[[nodiscard]] auto handshake_timeout_ms() const -> std::size_t;

		std::optional<asio::ip::tcp::acceptor> acceptor_;

		mutable std::mutex tls_mutex_;
		std::shared_ptr<asio::ssl::context> ssl_context_;
		std::size_t handshake_timeout_ms_ = 10000;
	};

} // namespace netkit::core
