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
#include <span>
#include <string>

#include "netkit/config/tls_config.h"
#include "netkit/core/socket_types.h"
#include "netkit/io/io_interfaces.h"
#include "netkit/types/result.h"
#include "netkit/utils/cancel_context.h"

namespace netkit::interfaces
{

	/*!
	 * \interface i_socket_client
	 * \brief Protocol independent socket client.
	 *
	 * read() and write() require a prior successful connect(); otherwise
	 * they return not_connected. Concurrent read() (or concurrent write())
	 * calls on one client must be serialized by the caller.
	 */
	class i_socket_client : public io::reader, public io::writer
	{
	public:
		~i_socket_client() override = default;

		/*!
		 * \brief Configures TLS for the next connect().
		 * \return invalid_tls_config when the transport has no TLS support
		 *         or \p server_name is empty.
		 */
		virtual auto set_tls(bool enable, const config::tls_config& tls,
							 const std::string& server_name) -> VoidResult = 0;

		virtual auto register_error_callback(core::error_callback_t callback) -> void = 0;
		virtual auto register_info_callback(core::info_callback_t callback) -> void = 0;

		//! \brief Dials the server (and negotiates TLS), bounded by \p ctx.
		virtual auto connect(const utils::cancel_context& ctx) -> VoidResult = 0;

		[[nodiscard]] virtual auto is_connected() const -> bool = 0;

		//! \brief Closes the connection. Idempotent.
		virtual auto close() -> VoidResult = 0;

		/*!
		 * \brief Connects if needed, sends \p request, hands the reply to
		 *        \p response (when set), then closes.
		 */
		virtual auto once(const utils::cancel_context& ctx,
						  std::span<const std::uint8_t> request,
						  const core::response_t& response) -> VoidResult = 0;
	};

} // namespace netkit::interfaces
