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

#include "netkit/core/socket_client_base.h"
#include "netkit/detail/blocking_op.h"
#include "netkit/protocol/network_protocol.h"
#include "netkit/types/result.h"
#include "netkit/utils/cancel_context.h"

namespace netkit::core
{
	/*!
	 * \class udp_client
	 * \brief Connected datagram client over udp, udp4 or udp6.
	 *
	 * connect() only fixes the peer; nothing is exchanged. Each write() is
	 * one datagram and each read() returns one datagram. A lost datagram is
	 * not an error: once() with a response callback simply sees the end of
	 * the stream when its context ends.
	 */
	class udp_client : public socket_client_base<udp_client>
	{
	public:
		static constexpr bool datagram = true;

		static auto create(const std::string& address,
						   protocol::network_protocol network = protocol::network_protocol::udp)
			-> Result<std::shared_ptr<udp_client>>;

		~udp_client() override;

	private:
		friend class socket_client_base<udp_client>;

		udp_client(std::string address, protocol::network_protocol network);

		auto do_connect(asio::io_context& io, const utils::cancel_context& ctx) -> VoidResult;
		auto start_read(std::span<std::uint8_t> buffer, detail::op_completion completion) -> void;
		auto start_write(std::span<const std::uint8_t> data, detail::op_completion completion)
			-> void;
		auto cancel_io() -> void;
		auto close_write() -> void {}
		auto do_close() -> void;

		[[nodiscard]] auto local_endpoint() const -> std::string;
		[[nodiscard]] auto remote_endpoint() const -> std::string;

		std::optional<asio::ip::udp::socket> socket_;
	};

} // namespace netkit::core
