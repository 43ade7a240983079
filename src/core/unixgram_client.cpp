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

#include "netkit/core/unixgram_client.h"

#if defined(ASIO_HAS_LOCAL_SOCKETS)

#include "netkit/detail/resolver.h"

namespace netkit::core
{
	namespace
	{
		constexpr const char* kSource = "unixgram_client";
	}

	unixgram_client::unixgram_client(std::string path)
		: socket_client_base<unixgram_client>(kSource, protocol::network_protocol::unixgram,
											  std::move(path))
	{
	}

	unixgram_client::~unixgram_client()
	{
		auto closed = close();
		(void)closed;
		do_close();
	}

	auto unixgram_client::create(const std::string& path)
		-> Result<std::shared_ptr<unixgram_client>>
	{
		if (auto checked = detail::check_unix_path(path); checked.is_err())
		{
			return forward_error<std::shared_ptr<unixgram_client>>(checked);
		}
		return ok(std::shared_ptr<unixgram_client>(new unixgram_client(path)));
	}

	auto unixgram_client::do_connect(asio::io_context& io, const utils::cancel_context& ctx)
		-> VoidResult
	{
		if (auto reason = ctx.reason(); reason.is_err())
		{
			return error_void(error_codes::socket::connection_failed,
							  "connect to " + address() + " aborted", kSource,
							  reason.error().message);
		}

		asio::error_code ec;
		socket_.emplace(io);
		socket_->open(asio::local::datagram_protocol(), ec);
		if (!ec)
		{
			socket_->connect(asio::local::datagram_protocol::endpoint(address()), ec);
		}
		if (ec)
		{
			return error_void(error_codes::socket::connection_failed,
							  "cannot connect to " + address(), kSource, ec.message());
		}
		return ok();
	}

	auto unixgram_client::start_read(std::span<std::uint8_t> buffer,
									 detail::op_completion completion) -> void
	{
		socket_->async_receive(asio::buffer(buffer.data(), buffer.size()), std::move(completion));
	}

	auto unixgram_client::start_write(std::span<const std::uint8_t> data,
									  detail::op_completion completion) -> void
	{
		socket_->async_send(asio::buffer(data.data(), data.size()), std::move(completion));
	}

	auto unixgram_client::cancel_io() -> void
	{
		asio::error_code ignored;
		socket_->cancel(ignored);
	}

	auto unixgram_client::do_close() -> void
	{
		if (socket_)
		{
			asio::error_code ignored;
			socket_->close(ignored);
			socket_.reset();
		}
	}

	auto unixgram_client::local_endpoint() const -> std::string
	{
		return socket_ ? detail::local_endpoint_string(*socket_) : std::string();
	}

	auto unixgram_client::remote_endpoint() const -> std::string
	{
		return socket_ ? detail::remote_endpoint_string(*socket_) : std::string();
	}

} // namespace netkit::core

#endif
