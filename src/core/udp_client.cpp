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

#include "netkit/core/udp_client.h"

#include "netkit/detail/resolver.h"

namespace netkit::core
{
	namespace
	{
		constexpr const char* kSource = "udp_client";
	}

	udp_client::udp_client(std::string address, protocol::network_protocol network)
		: socket_client_base<udp_client>(kSource, network, std::move(address))
	{
	}

	udp_client::~udp_client()
	{
		auto closed = close();
		(void)closed;
		do_close();
	}

	auto udp_client::create(const std::string& address, protocol::network_protocol network)
		-> Result<std::shared_ptr<udp_client>>
	{
		using result_type = std::shared_ptr<udp_client>;

		if (address.empty())
		{
			return error<result_type>(error_codes::socket::invalid_address,
									  "missing server address", kSource);
		}
		if (!protocol::is_udp_family(network))
		{
			return error<result_type>(error_codes::socket::invalid_protocol,
									  "udp_client needs a udp network", kSource,
									  protocol::to_string(network));
		}

		auto resolved = detail::resolve<asio::ip::udp>(network, address, false);
		if (resolved.is_err())
		{
			return forward_error<result_type>(resolved);
		}

		return ok(std::shared_ptr<udp_client>(new udp_client(address, network)));
	}

	auto udp_client::do_connect(asio::io_context& io, const utils::cancel_context& ctx)
		-> VoidResult
	{
		if (auto reason = ctx.reason(); reason.is_err())
		{
			return error_void(error_codes::socket::connection_failed,
							  "connect to " + address() + " aborted", kSource,
							  reason.error().message);
		}

		auto endpoints = detail::resolve<asio::ip::udp>(network(), address(), false);
		if (endpoints.is_err())
		{
			return forward_error<std::monostate>(endpoints);
		}

		asio::error_code ec;
		for (const auto& endpoint : endpoints.value())
		{
			socket_.emplace(io);
			socket_->open(endpoint.protocol(), ec);
			if (!ec)
			{
				socket_->connect(endpoint, ec);
			}
			if (!ec)
			{
				return ok();
			}
			do_close();
		}

		return error_void(error_codes::socket::connection_failed,
						  "cannot connect to " + address(), kSource, ec.message());
	}

	auto udp_client::start_read(std::span<std::uint8_t> buffer, detail::op_completion completion)
		-> void
	{
		socket_->async_receive(asio::buffer(buffer.data(), buffer.size()), std::move(completion));
	}

	auto udp_client::start_write(std::span<const std::uint8_t> data,
								 detail::op_completion completion) -> void
	{
		socket_->async_send(asio::buffer(data.data(), data.size()), std::move(completion));
	}

	auto udp_client::cancel_io() -> void
	{
		asio::error_code ignored;
		socket_->cancel(ignored);
	}

	auto udp_client::do_close() -> void
	{
		if (socket_)
		{
			asio::error_code ignored;
			socket_->close(ignored);
			socket_.reset();
		}
	}

	auto udp_client::local_endpoint() const -> std::string
	{
		return socket_ ? detail::local_endpoint_string(*socket_) : std::string();
	}

	auto udp_client::remote_endpoint() const -> std::string
	{
		return socket_ ? detail::remote_endpoint_string(*socket_) : std::string();
	}

} // namespace netkit::core
