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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <asio.hpp>

#include "netkit/config/netkit_config.h"
#include "netkit/config/tls_config.h"
#include "netkit/core/socket_types.h"
#include "netkit/detail/blocking_op.h"
#include "netkit/integration/logger_integration.h"
#include "netkit/interfaces/i_socket_client.h"
#include "netkit/io/io_interfaces.h"
#include "netkit/protocol/network_protocol.h"
#include "netkit/types/result.h"
#include "netkit/utils/callback_manager.h"
#include "netkit/utils/cancel_context.h"

namespace netkit::core
{
	/*!
	 * \class socket_client_base
	 * \brief CRTP base class for socket clients: connection state, blocking
	 *        read/write over a private io_context, once() and callbacks.
	 *
	 * \tparam Derived The concrete client (CRTP pattern)
	 *
	 * ### CRTP Pattern
	 * Derived classes must implement:
	 * - `auto do_connect(asio::io_context& io, const utils::cancel_context& ctx) -> VoidResult`
	 * - `auto start_read(std::span<std::uint8_t>, detail::op_completion) -> void`
	 * - `auto start_write(std::span<const std::uint8_t>, detail::op_completion) -> void`
	 * - `auto cancel_io() -> void`
	 * - `auto close_write() -> void` (half close, no-op where meaningless)
	 * - `auto do_close() -> void` (closes and destroys the sockets built on io)
	 * - `auto local_endpoint() const -> std::string`, `auto remote_endpoint() const -> std::string`
	 * - `static constexpr bool datagram`
	 *
	 * ### Thread Safety
	 * connect() and close() are serialized. One read() and one write() may
	 * run concurrently with each other and with close(), which aborts them.
	 */
	template<typename Derived>
	class socket_client_base : public interfaces::i_socket_client
	{
	public:
		socket_client_base(const socket_client_base&) = delete;
		socket_client_base& operator=(const socket_client_base&) = delete;

		~socket_client_base() override = default;

		auto set_tls(bool enable, const config::tls_config& tls, const std::string& server_name)
			-> VoidResult override
		{
			(void)tls;
			(void)server_name;
			if (enable)
			{
				return error_void(error_codes::socket::invalid_tls_config,
								  "TLS is not available on " + protocol::to_string(network_),
								  client_name_);
			}
			return ok();
		}

		auto register_error_callback(error_callback_t callback) -> void override
		{
			callbacks_.template set<0>(std::move(callback));
		}

		auto register_info_callback(info_callback_t callback) -> void override
		{
			callbacks_.template set<1>(std::move(callback));
		}

		auto connect(const utils::cancel_context& ctx) -> VoidResult override
		{
			std::lock_guard<std::mutex> lock(connection_mutex_);
			if (connected_.load())
			{
				return ok();
			}

			report_info("", address_, conn_state::dial);

			auto io = std::make_unique<asio::io_context>();
			auto connected = derived().do_connect(*io, ctx);
			if (connected.is_err())
			{
				derived().do_close();
				report_error(connected.error());
				return connected;
			}

			io_ = std::move(io);
			closing_.store(false);
			connected_.store(true);

			NETKIT_LOG_DEBUG("[" + client_name_ + "] connected to " + address_);
			report_info(derived().local_endpoint(), derived().remote_endpoint(),
						conn_state::new_connection);
			return ok();
		}

		[[nodiscard]] auto is_connected() const -> bool override { return connected_.load(); }

		auto read(std::span<std::uint8_t> buffer) -> Result<std::size_t> override
		{
			return bounded_read(buffer, nullptr);
		}

		auto write(std::span<const std::uint8_t> data) -> Result<std::size_t> override
		{
			op_guard guard(active_ops_);
			if (!connected_.load() || closing_.load())
			{
				return not_connected<std::size_t>();
			}

			auto done = detail::run_blocking(
				*io_,
				[this, data](detail::op_completion completion)
				{ derived().start_write(data, std::move(completion)); },
				[this] { return closing_.load(); }, [this] { derived().cancel_io(); },
				defaults_.io_poll_interval);

			if (done.ec || (done.aborted && done.bytes < data.size()))
			{
				auto failed = error<std::size_t>(
					error_codes::socket::send_failed, "write failed", client_name_,
					done.ec ? done.ec.message() : std::string("connection closing"));
				report_error(failed.error());
				return failed;
			}

			report_info(derived().local_endpoint(), derived().remote_endpoint(), conn_state::write);
			return ok(done.bytes);
		}

		auto close() -> VoidResult override
		{
			std::lock_guard<std::mutex> lock(connection_mutex_);
			if (!connected_.exchange(false))
			{
				return ok();
			}

			closing_.store(true);
			while (active_ops_.load() > 0)
			{
				std::this_thread::sleep_for(defaults_.io_poll_interval);
			}

			const auto local = derived().local_endpoint();
			const auto remote = derived().remote_endpoint();
			derived().do_close();
			io_.reset();

			NETKIT_LOG_DEBUG("[" + client_name_ + "] closed connection to " + address_);
			report_info(local, remote, conn_state::close);
			return ok();
		}

		auto once(const utils::cancel_context& ctx,
				  std::span<const std::uint8_t> request,
				  const response_t& response) -> VoidResult override
		{
			if (!connected_.load())
			{
				auto connected = connect(ctx);
				if (connected.is_err())
				{
					return connected;
				}
			}

			auto written = write(request);
			if (written.is_err())
			{
				auto closed = close();
				(void)closed;
				return forward_error<std::monostate>(written);
			}

			if (response)
			{
				if constexpr (!Derived::datagram)
				{
					derived().close_write();
					report_info(derived().local_endpoint(), derived().remote_endpoint(),
								conn_state::close_write);
				}

				response_reader reader(*this, ctx);
				try
				{
					response(reader);
				}
				catch (const std::exception& e)
				{
					NETKIT_LOG_ERROR("[" + client_name_ + "] response callback threw: " + e.what());
					report_error(error_info(error_codes::common_errors::internal_error,
											"response callback threw an exception", client_name_,
											e.what()));
				}
				catch (...)
				{
					NETKIT_LOG_ERROR("[" + client_name_ +
									 "] response callback threw a non-standard exception");
					report_error(error_info(error_codes::common_errors::internal_error,
											"response callback threw an exception", client_name_));
				}
			}

			return close();
		}

		//! \brief Address given at creation.
		[[nodiscard]] auto address() const -> const std::string& { return address_; }

	protected:
		socket_client_base(std::string client_name, protocol::network_protocol network,
						   std::string address)
			: client_name_(std::move(client_name))
			, network_(network)
			, address_(std::move(address))
		{
		}

		Derived& derived() noexcept { return static_cast<Derived&>(*this); }

		const Derived& derived() const noexcept { return static_cast<const Derived&>(*this); }

		[[nodiscard]] auto network() const -> protocol::network_protocol { return network_; }

		[[nodiscard]] auto client_name() const -> const std::string& { return client_name_; }

		const config::socket_defaults defaults_ = active_socket_defaults();

	private:
		//! \brief Counts a read or write in flight so close() can wait for it.
		class op_guard
		{
		public:
			explicit op_guard(std::atomic<int>& counter) : counter_(counter) { counter_.fetch_add(1); }
			~op_guard() { counter_.fetch_sub(1); }

			op_guard(const op_guard&) = delete;
			op_guard& operator=(const op_guard&) = delete;

		private:
			std::atomic<int>& counter_;
		};

		//! \brief Reader handed to once() response callbacks, bounded by the once() context.
		class response_reader : public io::reader
		{
		public:
			response_reader(socket_client_base& client, const utils::cancel_context& ctx)
				: client_(client), ctx_(ctx)
			{
			}

			auto read(std::span<std::uint8_t> buffer) -> Result<std::size_t> override
			{
				return client_.bounded_read(buffer, &ctx_);
			}

		private:
			socket_client_base& client_;
			const utils::cancel_context& ctx_;
		};

		template<typename T>
		auto not_connected() const -> Result<T>
		{
			return error<T>(error_codes::socket::not_connected, "client is not connected",
							client_name_);
		}

		/*!
		 * \brief read() with an optional context bound.
		 *
		 * When \p ctx ends, datagram clients report end_of_file (no reply is
		 * a normal outcome) and stream clients report the context reason.
		 */
		auto bounded_read(std::span<std::uint8_t> buffer, const utils::cancel_context* ctx)
			-> Result<std::size_t>
		{
			op_guard guard(active_ops_);
			if (!connected_.load() || closing_.load())
			{
				return not_connected<std::size_t>();
			}
			if (buffer.empty())
			{
				return ok(std::size_t{0});
			}

			auto done = detail::run_blocking(
				*io_,
				[this, buffer](detail::op_completion completion)
				{ derived().start_read(buffer, std::move(completion)); },
				[this, ctx] { return closing_.load() || (ctx != nullptr && ctx->is_done()); },
				[this] { derived().cancel_io(); }, defaults_.io_poll_interval);

			if (done.bytes > 0)
			{
				report_info(derived().local_endpoint(), derived().remote_endpoint(),
							conn_state::read);
				return ok(done.bytes);
			}

			if (done.aborted && ctx != nullptr && ctx->is_done() && !closing_.load())
			{
				if constexpr (Derived::datagram)
				{
					return error<std::size_t>(error_codes::io::end_of_file, "no more datagrams",
											  client_name_);
				}
				return forward_error<std::size_t>(ctx->reason());
			}

			if (done.aborted || !done.ec || detail::is_disconnect(done.ec))
			{
				report_info(derived().local_endpoint(), derived().remote_endpoint(),
							conn_state::close_read);
				return error<std::size_t>(error_codes::io::end_of_file, "end of stream",
										  client_name_);
			}

			auto failed = error<std::size_t>(error_codes::socket::receive_failed, "read failed",
											 client_name_, done.ec.message());
			report_error(failed.error());
			return failed;
		}

		auto report_error(const error_info& err) -> void
		{
			NETKIT_LOG_DEBUG("[" + client_name_ + "] " + to_string(err));

			auto callback = callbacks_.template get<0>();
			if (!callback)
			{
				return;
			}
			try
			{
				callback(std::vector<error_info>{err});
			}
			catch (const std::exception& e)
			{
				NETKIT_LOG_ERROR("[" + client_name_ + "] error callback threw: " + e.what());
			}
			catch (...)
			{
				NETKIT_LOG_ERROR("[" + client_name_ + "] error callback threw a non-standard exception");
			}
		}

		auto report_info(const std::string& local, const std::string& remote, conn_state state)
			-> void
		{
			auto callback = callbacks_.template get<1>();
			if (!callback)
			{
				return;
			}
			try
			{
				callback(local, remote, state);
			}
			catch (const std::exception& e)
			{
				NETKIT_LOG_ERROR("[" + client_name_ + "] info callback threw: " + e.what());
				report_error(error_info(error_codes::common_errors::internal_error,
										"info callback threw an exception", client_name_, e.what()));
			}
			catch (...)
			{
				NETKIT_LOG_ERROR("[" + client_name_ + "] info callback threw a non-standard exception");
				report_error(error_info(error_codes::common_errors::internal_error,
										"info callback threw an exception", client_name_));
			}
		}

		std::string client_name_;
		protocol::network_protocol network_;
		std::string address_;

		utils::callback_manager<error_callback_t, info_callback_t> callbacks_;

		std::mutex connection_mutex_;
		std::atomic<bool> connected_{false};
		std::atomic<bool> closing_{false};
		std::atomic<int> active_ops_{0};
		std::unique_ptr<asio::io_context> io_;
	};

} // namespace netkit::core
