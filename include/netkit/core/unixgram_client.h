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
#include "netkit/types/result.h"
#include "netkit/utils/cancel_context.h"

#if defined(ASIO_HAS_LOCAL_SOCKETS)

namespace netkit::core
{
	/*!
	 * \class unixgram_client
	 * \brief Connected datagram client over a unix domain socket path.
	 *
	 * The client socket is unnamed, so servers cannot reply to it; once()
	 * is the usual fire-and-forget entry point.
	 */
	class unixgram_client : public socket_client_base<unixgram_client>
	{
	public:
		static constexpr bool datagram = true;

		static auto create(const std::string& path) -> Result<std::shared_ptr<unixgram_client>>;

		~unixgram_client() override;

	private:
		friend class socket_client_base<unixgram_client>;

		explicit unixgram_client(std::string path);

		auto do_connect(asio::io_context& io, const utils::cancel_context& ctx) -> VoidResult;
		auto start_read(std::span<std::uint8_t> buffer, detail::op_completion completion) -> void;
		auto start_write(std::span<const std::uint8_t> data, detail::op_completion completion)
			-> void;
		auto cancel_io() -> void;
		auto close_write() -> void {}
		auto do_close() -> void;

		[[nodiscard]] auto local_endpoint() const -> std::string;
		[[nodiscard]] auto remote_endpoint() const -> std::string;

		std::optional<asio::local::datagram_protocol::socket> socket_;
	};

} // namespace netkit::core

#endif
