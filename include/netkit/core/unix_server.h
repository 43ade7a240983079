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

#if defined(ASIO_HAS_LOCAL_SOCKETS)

namespace netkit::core
{
	/*!
	 * \class unix_server
	 * \brief Stream server over a unix domain socket file.
	 *
	 * A stale socket file at the address is removed before binding. After
	 * binding, perm_file and group_perm of the configuration are applied to
	 * the socket file; the file is removed when the server stops.
	 */
	class unix_server : public socket_server_base<unix_server>
	{
	public:
		/*!
		 * \brief Creates a server that is not listening yet.
		 *
		 * ### Error Conditions
		 * - invalid_handler, invalid_address, invalid_protocol
		 * - invalid_group when group_perm is outside -1..max_gid
		 * - invalid_tls_config when the configuration enables TLS
		 */
		static auto create(const config::server_config& cfg,
						   handler_t handler,
						   update_conn_t update_conn = nullptr)
			-> Result<std::shared_ptr<unix_server>>;

		~unix_server() override;

	private:
		friend class socket_server_base<unix_server>;

		unix_server(config::server_config cfg, handler_t handler, update_conn_t update_conn);

		auto do_bind() -> Result<std::string>;
		auto do_serve(const utils::cancel_context& ctx) -> VoidResult;
		auto do_release() -> void;

		std::optional<asio::local::stream_protocol::acceptor> acceptor_;
		bool owns_file_ = false;
	};

} // namespace netkit::core

#endif
