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
 * @file stream_session.h
 * @brief Server side connection context over a stream socket
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <type_traits>

#include <asio.hpp>
#include <asio/ssl.hpp>

#include "netkit/core/socket_types.h"
#include "netkit/detail/blocking_op.h"
#include "netkit/detail/resolver.h"
#include "netkit/types/result.h"
#include "netkit/utils/cancel_context.h"

namespace netkit::detail
{
	template<typename Stream>
	struct is_ssl_stream : std::false_type
	{
	};

	template<typename Next>
	struct is_ssl_stream<asio::ssl::stream<Next>> : std::true_type
	{
	};

	/*!
	 * \class stream_session
	 * \brief One accepted connection, driven by the thread that runs the
	 *        handler.
	 *
	 * \tparam Stream asio::ip::tcp::socket, asio::ssl::stream over it, or
	 *         asio::local::stream_protocol::socket.
	 *
	 * Every blocking call is aborted when the connection context is done
	 * (server stop, listen context cancelled) or when the connection stays
	 * idle longer than the idle timeout.
	 */
	template<typename Stream>
	class stream_session : public core::socket_context
	{
	public:
		using notify_t = std::function<void(const std::string&, const std::string&, core::conn_state)>;

		stream_session(std::unique_ptr<asio::io_context> io,
					   std::unique_ptr<Stream> stream,
					   utils::cancel_context ctx,
					   std::chrono::milliseconds idle_timeout,
					   std::chrono::milliseconds poll_interval,
					   notify_t notify)
			: io_(std::move(io))
			, stream_(std::move(stream))
			, ctx_(utils::cancel_context::with_cancel(ctx))
			, idle_timeout_(idle_timeout)
			, poll_interval_(poll_interval)
			, notify_(std::move(notify))
			, local_(local_endpoint_string(stream_->lowest_layer()))
			, remote_(remote_endpoint_string(stream_->lowest_layer()))
		{
			touch();
		}

		~stream_session() override
		{
			if (!closed_.exchange(true))
			{
				release();
			}
		}

		stream_session(const stream_session&) = delete;
		stream_session& operator=(const stream_session&) = delete;

		/*!
		 * \brief Runs the TLS server handshake when Stream is an SSL stream.
		 * \return tls_handshake_failed on failure or when \p timeout elapses.
		 */
		auto start(std::chrono::milliseconds timeout) -> VoidResult
		{
			if constexpr (is_ssl_stream<Stream>::value)
			{
				const auto deadline = std::chrono::steady_clock::now() + timeout;
				auto done = run_blocking(
					*io_,
					[this](op_completion completion)
					{ stream_->async_handshake(asio::ssl::stream_base::server, completion); },
					[this, deadline]
					{ return ctx_.is_done() || std::chrono::steady_clock::now() >= deadline; },
					[this] { abort_io(); }, poll_interval_);

				if (done.ec || done.aborted)
				{
					return error_void(error_codes::socket::tls_handshake_failed,
									  "TLS handshake failed", "stream_session",
									  remote_ + ": " +
										  (done.ec ? done.ec.message() : std::string("timeout")));
				}
				touch();
			}
			else
			{
				(void)timeout;
			}
			return ok();
		}

		auto read(std::span<std::uint8_t> buffer) -> Result<std::size_t> override
		{
			if (closed_.load())
			{
				return error<std::size_t>(error_codes::io::end_of_file, "connection closed",
										  "stream_session");
			}
			if (buffer.empty())
			{
				return ok(std::size_t{0});
			}

			auto done = run_blocking(
				*io_,
				[this, buffer](op_completion completion)
				{ stream_->async_read_some(asio::buffer(buffer.data(), buffer.size()), completion); },
				[this] { return must_abort(); }, [this] { abort_io(); }, poll_interval_);

			if (done.bytes > 0)
			{
				touch();
				notify(core::conn_state::read);
				return ok(done.bytes);
			}
			if (done.aborted)
			{
				return aborted_error<std::size_t>();
			}
			if (done.ec && !is_disconnect(done.ec))
			{
				return error<std::size_t>(error_codes::socket::receive_failed, "read failed",
										  "stream_session", done.ec.message());
			}

			notify(core::conn_state::close_read);
			return error<std::size_t>(error_codes::io::end_of_file, "end of stream",
									  "stream_session");
		}

		auto write(std::span<const std::uint8_t> data) -> Result<std::size_t> override
		{
			if (closed_.load())
			{
				return error<std::size_t>(error_codes::socket::connection_closed,
										  "connection closed", "stream_session");
			}

			auto done = run_blocking(
				*io_,
				[this, data](op_completion completion)
				{ asio::async_write(*stream_, asio::buffer(data.data(), data.size()), completion); },
				[this] { return must_abort(); }, [this] { abort_io(); }, poll_interval_);

			if (done.aborted && done.bytes < data.size())
			{
				return aborted_error<std::size_t>();
			}
			if (done.ec)
			{
				return error<std::size_t>(error_codes::socket::send_failed, "write failed",
										  "stream_session", done.ec.message());
			}

			touch();
			notify(core::conn_state::write);
			return ok(done.bytes);
		}

		auto close() -> VoidResult override
		{
			if (closed_.exchange(true))
			{
				return ok();
			}

			release();
			notify(core::conn_state::close);
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
		auto touch() -> void
		{
			last_activity_.store(std::chrono::steady_clock::now().time_since_epoch().count());
		}

		[[nodiscard]] auto idle_expired() const -> bool
		{
			if (idle_timeout_ < std::chrono::seconds(1))
			{
				return false;
			}
			const auto last = std::chrono::steady_clock::time_point(
				std::chrono::steady_clock::duration(last_activity_.load()));
			return std::chrono::steady_clock::now() - last > idle_timeout_;
		}

		[[nodiscard]] auto must_abort() const -> bool
		{
			return ctx_.is_done() || idle_expired();
		}

		template<typename T>
		auto aborted_error() -> Result<T>
		{
			if (idle_expired())
			{
				return error<T>(error_codes::socket::idle_timeout, "connection idle for too long",
								"stream_session", remote_);
			}
			auto reason = ctx_.reason();
			if (reason.is_err())
			{
				return forward_error<T>(reason);
			}
			return error<T>(error_codes::common_errors::cancelled, "operation aborted",
							"stream_session");
		}

		auto abort_io() -> void
		{
			asio::error_code ignored;
			stream_->lowest_layer().cancel(ignored);
		}

		auto release() -> void
		{
			ctx_.cancel();

			asio::error_code ignored;
			auto& socket = stream_->lowest_layer();
			socket.shutdown(asio::socket_base::shutdown_both, ignored);
			socket.close(ignored);
		}

		auto notify(core::conn_state state) -> void
		{
			if (notify_)
			{
				notify_(local_, remote_, state);
			}
		}

		std::unique_ptr<asio::io_context> io_;
		std::unique_ptr<Stream> stream_;
		utils::cancel_context ctx_;
		std::chrono::milliseconds idle_timeout_;
		std::chrono::milliseconds poll_interval_;
		notify_t notify_;

		std::string local_;
		std::string remote_;

		std::atomic<bool> closed_{false};
		std::atomic<std::chrono::steady_clock::rep> last_activity_{0};
	};

} // namespace netkit::detail
