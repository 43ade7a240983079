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

/**
 * @file socket_types.h
 * @brief Connection states, connection context and callback signatures
 *        shared by every server and client.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "netkit/io/io_interfaces.h"
#include "netkit/types/result.h"
#include "netkit/utils/cancel_context.h"

namespace netkit::core
{
	/*!
	 * \enum conn_state
	 * \brief Steps of a connection life, reported through info_callback_t.
	 */
	enum class conn_state : std::uint8_t
	{
		dial,
		new_connection,
		read,
		close_read,
		handler,
		write,
		close_write,
		close,
	};

	auto to_string(conn_state state) -> std::string;

	/*!
	 * \class socket_context
	 * \brief What a handler sees of one connection (or one datagram).
	 *
	 * Reads consume the request, writes produce the response. For datagram
	 * servers the reader yields the received datagram once and each write
	 * sends one datagram back to the sender.
	 *
	 * The context is only valid during the handler call.
	 */
	class socket_context : public io::reader, public io::writer
	{
	public:
		~socket_context() override = default;

		//! \brief Closes the connection. Idempotent.
		virtual auto close() -> VoidResult = 0;

		[[nodiscard]] virtual auto is_connected() const -> bool = 0;
		[[nodiscard]] virtual auto local_address() const -> std::string = 0;
		[[nodiscard]] virtual auto remote_address() const -> std::string = 0;

		/*!
		 * \brief Cancellation state of this connection.
		 *
		 * Done when the connection closed, when the server stops hard or
		 * when the listen context is cancelled.
		 */
		[[nodiscard]] virtual auto context() const -> const utils::cancel_context& = 0;
	};

	//! \brief Errors raised while serving; one call may carry several.
	using error_callback_t = std::function<void(const std::vector<error_info>&)>;

	//! \brief Connection state transitions: (local, remote, state).
	using info_callback_t =
		std::function<void(const std::string&, const std::string&, conn_state)>;

	//! \brief Server lifecycle messages.
	using server_info_callback_t = std::function<void(const std::string&)>;

	//! \brief User logic, run once per connection or datagram.
	using handler_t = std::function<void(socket_context&)>;

	//! \brief Socket option hook, called with the native handle of each new
	//!        stream connection before the handler runs.
	using update_conn_t = std::function<void(int native_handle)>;

	//! \brief Client-side response consumer used by once().
	using response_t = std::function<void(io::reader&)>;

	/*!
	 * \struct listener_info
	 * \brief Description of what a server listens on.
	 */
	struct listener_info
	{
		std::string network;
		std::string address;
		bool tls = false;
	};

} // namespace netkit::core
