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
 * @file blocking_op.h
 * @brief Runs one asio asynchronous operation to completion on the calling
 *        thread while watching an abort condition.
 *
 * Every blocking netkit call (accept, connect, handshake, read, write,
 * receive) goes through run_blocking(): the operation is started on an
 * io_context owned by the caller, the context is driven in short slices,
 * and between slices the abort predicate is checked. When it fires, the
 * abort action (cancel or close of the socket) makes the pending
 * operation complete with operation_aborted.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

#include <asio.hpp>
#include <asio/ssl.hpp>

namespace netkit::detail
{
	struct op_result
	{
		asio::error_code ec;
		std::size_t bytes = 0;
		bool aborted = false;
	};

	struct op_state
	{
		std::atomic<bool> done{false};
		asio::error_code ec;
		std::size_t bytes = 0;
	};

	/*!
	 * \class op_completion
	 * \brief Completion handler accepted by every asio initiating function
	 *        netkit uses.
	 */
	class op_completion
	{
	public:
		explicit op_completion(std::shared_ptr<op_state> state) : state_(std::move(state)) {}

		void operator()(const asio::error_code& ec) const
		{
			finish(ec, 0);
		}

		void operator()(const asio::error_code& ec, std::size_t bytes) const
		{
			finish(ec, bytes);
		}

		template<typename Endpoint>
		void operator()(const asio::error_code& ec, const Endpoint&) const
		{
			finish(ec, 0);
		}

	private:
		void finish(const asio::error_code& ec, std::size_t bytes) const
		{
			state_->ec = ec;
			state_->bytes = bytes;
			state_->done.store(true, std::memory_order_release);
		}

		std::shared_ptr<op_state> state_;
	};

	/*!
	 * \brief Starts an operation and drives \p io until it completes.
	 *
	 * \param start        callable receiving the op_completion to hand to
	 *                     the asio initiating function
	 * \param should_abort polled between slices
	 * \param abort        invoked at most once, must make the operation
	 *                     complete
	 * \param slice        maximum time spent inside io_context::run_for
	 */
	template<typename Start, typename ShouldAbort, typename Abort>
	auto run_blocking(asio::io_context& io, Start&& start, ShouldAbort&& should_abort,
					  Abort&& abort, std::chrono::milliseconds slice) -> op_result
	{
		auto state = std::make_shared<op_state>();
		start(op_completion(state));

		op_result result;
		while (!state->done.load(std::memory_order_acquire))
		{
			if (io.stopped())
			{
				io.restart();
			}
			io.run_for(slice);

			if (state->done.load(std::memory_order_acquire))
			{
				break;
			}
			if (!result.aborted && should_abort())
			{
				result.aborted = true;
				abort();
			}
		}

		result.ec = state->ec;
		result.bytes = state->bytes;
		return result;
	}

	//! \brief Errors meaning "the peer or we closed the stream".
	inline auto is_disconnect(const asio::error_code& ec) -> bool
	{
		return ec == asio::error::eof || ec == asio::error::connection_reset ||
			   ec == asio::error::broken_pipe || ec == asio::error::not_connected ||
			   ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor ||
			   ec == asio::ssl::error::stream_truncated;
	}

} // namespace netkit::detail
