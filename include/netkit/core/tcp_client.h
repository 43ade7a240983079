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

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include <asio.hpp>
#include <asio/ssl.hpp>

#include "netkit/config/tls_config.h"
#include "netkit/core/socket_client_base.h"
#include "netkit/detail/blocking_op.h"
#include "netkit/protocol/network_protocol.h"
#include "netkit/types/result.h"
#include "netkit/utils/cancel_context.h"

namespace netkit::core
{
	/*!
	 * \class tcp_client
	 * \brief Stream client over tcp, tcp4 or tcp6, optionally with TLS.
	 *
	 * With TLS the server certificate is checked against \c server_name
	 * (host name or IP literal) unless the configuration disables
	 * verification. A failed handshake fails connect(); there is no
	 * plaintext fallback.
	 */
	class tcp_client : public socket_client_base<tcp_client>
	{
	public:
		static constexpr bool datagram = false;

		/*!
		 * \brief Creates an unconnected client for "host:port".
		 *
		 * ### Error Conditions
		 * - invalid_address when \p address is empty
		 * - invalid_protocol when \p network is not of the tcp family
		 * - address_resolution_failed when \p address does not resolve
		 */
		static auto create(const std::string& address,
						   protocol::network_protocol network = protocol::network_protocol::tcp)
			-> Result<std::shared_ptr<tcp_client>>;

		~tcp_client() override;

		auto set_tls(bool enable, const config::tls_config& tls, const std::string& server_name)
			-> VoidResult override;

	private:
		friend class socket_client_base<tcp_client>;

		tcp_client(std::string address, protocol::network_protocol network);

		auto do_connect(asio::io_context& io, const utils::cancel_context& ctx) -> VoidResult;
		auto handshake(const utils::cancel_context& ctx, asio::io_context& io) -> VoidResult;

		auto start_read(std::span<std::uint8_t> buffer, detail::op_completion completion) -> void;
		auto start_write(std::span<const std::uint8_t> data, detail::op_completion completion)
			-> void;
		auto cancel_io() -> void;
		auto close_write() -> void;
		auto do_close() -> void;

		[[nodiscard]] auto local_endpoint() const -> std::string;
		[[nodiscard]] auto remote_endpoint() const -> std::string;

		[[nodiscard]] auto lowest_layer() -> asio::ip::tcp::socket&;
		[[nodiscard]] auto lowest_layer() const -> const asio::ip::tcp::socket&;

		std::optional<asio::ip::tcp::socket> socket_;
		std::optional<asio::ssl::stream<asio::ip::tcp::socket>> tls_stream_;

		bool tls_enabled_ = false;
		std::optional<config::tls_config> tls_;
		std::string server_name_;
		std::shared_ptr<asio::ssl::context> ssl_context_;
	};

} // namespace netkit::core
