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
 * @file datagram_context.h
 * @brief Handler view of one received datagram
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include "netkit/core/socket_types.h"
#include "netkit/types/result.h"
#include "netkit/utils/cancel_context.h"

namespace netkit::detail
{
	//! \brief Receive buffer size for datagram servers, large enough for any UDP payload.
	inline constexpr std::size_t max_datagram_size = 64 * 1024;

	/*!
	 * \class datagram_context
	 * \brief Reader over the received payload, writer sending replies to
	 *        the sender.
	 *
	 * The payload can be consumed in several reads; afterwards read()
	 * reports end_of_file. Each write() is one datagram.
	 */
	class datagram_context : public core::socket_context
	{
	public:
		using reply_t = std::function<Result<std::size_t>(std::span<const std::uint8_t>)>;
		using notify_t = std::function<void(const std::string&, const std::string&, core::conn_state)>;

		datagram_context(std::vector<std::uint8_t> payload,
						 std::string local,
						 std::string remote,
						 reply_t reply,
						 const utils::cancel_context& ctx,
						 notify_t notify)
			: payload_(std::move(payload))
			, local_(std::move(local))
			, remote_(std::move(remote))
			, reply_(std::move(reply))
			, ctx_(utils::cancel_context::with_cancel(ctx))
			, notify_(std::move(notify))
		{
		}

		auto read(std::span<std::uint8_t> buffer) -> Result<std::size_t> override
		{
			if (closed_.load() || offset_ >= payload_.size())
			{
				return error<std::size_t>(error_codes::io::end_of_file, "end of datagram",
										  "datagram_context");
			}

			const auto count = std::min(buffer.size(), payload_.size() - offset_);
			std::copy_n(payload_.begin() + static_cast<std::ptrdiff_t>(offset_), count,
						buffer.begin());
			offset_ += count;

			notify(core::conn_state::read);
			return ok(count);
		}

		auto write(std::span<const std::uint8_t> data) -> Result<std::size_t> override
		{
			if (closed_.load())
			{
				return error<std::size_t>(error_codes::socket::connection_closed,
										  "datagram context closed", "datagram_context");
			}
			if (remote_.empty() || !reply_)
			{
				return error<std::size_t>(error_codes::socket::send_failed,
										  "sender has no address to reply to",
										  "datagram_context");
			}

			auto sent = reply_(data);
			if (sent.is_ok())
			{
				notify(core::conn_state::write);
			}
			return sent;
		}

		auto close() -> VoidResult override
		{
			if (!closed_.exchange(true))
			{
				ctx_.cancel();
				notify(core::conn_state::close);
			}
			return ok();
		}

		[[nodiscard]] auto is_connected() const -> bool override { return !closed_.load(); }
		[[nodiscard]] auto local_address() const -> std::string override { return local_; }
		[[nodiscard]] auto remote_address() const -> std::string override { return remote_; }

		[[nodiscard]] auto context() const -> const utils::cancel_context& override
		{
			return ctx_;
		}

	private:
		auto notify(core::conn_state state) -> void
		{
			if (notify_)
			{
				notify_(local_, remote_, state);
			}
		}

		std::vector<std::uint8_t> payload_;
		std::size_t offset_ = 0;
		std::string local_;
		std::string remote_;
		reply_t reply_;
		utils::cancel_context ctx_;
		notify_t notify_;
		std::atomic<bool> closed_{false};
	};

} // namespace netkit::detail
