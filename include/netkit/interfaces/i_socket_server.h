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

#include <chrono>
#include <cstdint>
#include <string>

#include "netkit/config/tls_config.h"
#include "netkit/core/socket_types.h"
#include "netkit/types/result.h"
#include "netkit/utils/cancel_context.h"

namespace netkit::interfaces
{

	/*!
	 * \interface i_socket_server
	 * \brief Protocol independent view of a running socket server.
	 *
	 * ### Lifecycle
	 * created (not running, gone) -> listen() (running) -> shutdown() /
	 * close() / context cancellation (draining) -> gone. A server that has
	 * listened once cannot listen again; create a new instance instead.
	 *
	 * ### Thread Safety
	 * All methods are thread-safe. Callback registration may race with
	 * serving; the latest registration wins.
	 *
	 * \see core::tcp_server
	 * \see core::udp_server
	 * \see core::unix_server
	 * \see core::unixgram_server
	 */
	class i_socket_server
	{
	public:
		virtual ~i_socket_server() = default;

		virtual auto register_error_callback(core::error_callback_t callback) -> void = 0;
		virtual auto register_info_callback(core::info_callback_t callback) -> void = 0;
		virtual auto register_server_info_callback(core::server_info_callback_t callback)
			-> void = 0;

		/*!
		 * \brief Enables or disables TLS before listen().
		 * \return invalid_tls_config when enabling without certificates or
		 *         on a transport that does not support TLS.
		 */
		virtual auto set_tls(bool enable, const config::tls_config& tls) -> VoidResult = 0;

		/*!
		 * \brief Binds and serves until \p ctx is done or the server is
		 *        stopped.
		 *
		 * ### Error Conditions
		 * - server_already_running while another listen() is active
		 * - invalid_instance when the server already terminated
		 * - bind_failed when the address cannot be bound
		 */
		virtual auto listen(const utils::cancel_context& ctx) -> VoidResult = 0;

		/*!
		 * \brief Stops accepting and waits for open connections to finish.
		 * \return shutdown_timeout when \p ctx ends (or one second passes)
		 *         before the drain completes. Handlers keep running.
		 */
		virtual auto shutdown(const utils::cancel_context& ctx) -> VoidResult = 0;

		//! \brief Stops accepting and aborts open connections. Idempotent.
		virtual auto close() -> VoidResult = 0;

		[[nodiscard]] virtual auto is_running() const -> bool = 0;
		[[nodiscard]] virtual auto is_gone() const -> bool = 0;
		[[nodiscard]] virtual auto open_connections() const -> std::int64_t = 0;

		//! \brief Address actually bound (resolves ":0"), empty when not listening.
		[[nodiscard]] virtual auto local_address() const -> std::string = 0;

		[[nodiscard]] virtual auto listener() const -> core::listener_info = 0;

		//! \brief Blocks until a started listen() returns. False on timeout.
		virtual auto wait_for_stop(std::chrono::milliseconds timeout) const -> bool = 0;
	};

} // namespace netkit::interfaces
