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

#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>

#include "netkit/config/socket_config.h"
#include "netkit/core/socket_server_base.h"
#include "netkit/core/socket_types.h"
#include "netkit/types/result.h"
#include "netkit/utils/cancel_context.h"

namespace netkit::core
{
	/*!
	 * \class udp_server
	 * \brief Datagram server over udp, udp4 or udp6.
	 *
	 * The handler runs once per received datagram with a context whose
	 * reader yields the datagram and whose writer answers the sender.
	 * open_connections() stays at zero: nothing outlives a datagram.
	 */
	class udp_server : public socket_server_base<udp_server>
	{
	public:
		/*!
		 * \brief Creates a server that is not listening yet.
		 *
		 * ### Error Conditions
		 * - invalid_handler, invalid_address, invalid_protocol
		 * - invalid_tls_config when the configuration enables TLS
		 */
		static auto create(const config::server_config& cfg,
						   handler_t handler,
						   update_conn_t update_conn = nullptr)
			-> Result<std::shared_ptr<udp_server>>;

		~udp_server() override;

	private:
		friend class socket_server_base<udp_server>;

		udp_server(config::server_config cfg, handler_t handler, update_conn_t update_conn);

		auto do_bind() -> Result<std::string>;
		auto do_serve(const utils::cancel_context& ctx) -> VoidResult;
		auto do_release() -> void;

		std::optional<asio::ip::udp::socket> socket_;
	};

} // namespace netkit::core
