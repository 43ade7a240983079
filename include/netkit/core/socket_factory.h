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
 * @file socket_factory.h
 * @brief Protocol dispatch from a validated configuration to a concrete
 *        server or client.
 */

#pragma once

#include <memory>

#include "netkit/config/socket_config.h"
#include "netkit/core/socket_types.h"
#include "netkit/interfaces/i_socket_client.h"
#include "netkit/interfaces/i_socket_server.h"
#include "netkit/types/result.h"

namespace netkit::core
{
	/*!
	 * \brief Validates \p cfg and builds the matching server.
	 *
	 * tcp family -> tcp_server, udp family -> udp_server, unix ->
	 * unix_server, unixgram -> unixgram_server. Validation errors are
	 * returned as is, so no server is built from an invalid configuration.
	 */
	auto make_server(const config::server_config& cfg,
					 handler_t handler,
					 update_conn_t update_conn = nullptr)
		-> Result<std::shared_ptr<interfaces::i_socket_server>>;

	//! \brief Validates \p cfg and builds the matching client, TLS applied.
	auto make_client(const config::client_config& cfg)
		-> Result<std::shared_ptr<interfaces::i_socket_client>>;

} // namespace netkit::core
