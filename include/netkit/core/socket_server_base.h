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

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <asio.hpp>

#include "netkit/config/netkit_config.h"
#include "netkit/config/socket_config.h"
#include "netkit/core/socket_types.h"
#include "netkit/detail/blocking_op.h"
#include "netkit/detail/datagram_context.h"
#include "netkit/detail/resolver.h"
#include "netkit/integration/logger_integration.h"
#include "netkit/interfaces/i_socket_server.h"
#include "netkit/types/result.h"
#include "netkit/utils/callback_manager.h"
#include "netkit/utils/cancel_context.h"
#include "netkit/utils/task_group.h"

namespace netkit::core
{
	/*!
	 * \class socket_server_base
	 * \brief CRTP base class carrying the lifecycle shared by every socket
	 *        server.
	 *
	 * \tparam Derived The concrete server (CRTP pattern)
	 *
	 * ### Lifecycle
	 * listen() binds through the derived class, serves until the listen
	 * context is done or shutdown()/close() asks for a stop, drains the
	 * running handlers and releases the listener. An instance serves once.
	 *
	 * ### CRTP Pattern
	 * Derived classes must implement:
	 * - `auto do_bind() -> Result<std::string>` (returns the bound address)
	 * - `auto do_serve(const utils::cancel_context& ctx) -> VoidResult`
	 * - `auto do_release() -> void`
	 *
	 * and build their sockets on io_, which the base drives while serving.
	 *
	 * ### Thread Safety
	 * All public methods are thread-safe. User callbacks are invoked from
	 * the listen thread and from connection threads; exceptions they throw
	 * are logged and reported to the error callback.
	 */
	template<typename Derived>
	class socket_server_base : public interfaces::i_socket_server,
							   public std::enable_shared_from_this<Derived>
	{
	public:
		socket_server_base(const socket_server_base&) = delete;
		socket_server_base& operator=(const socket_server_base&) = delete;
		socket_server_base(socket_server_base&&) = delete;
		socket_server_base& operator=(socket_server_base&&) = delete;

		~socket_server_base() override = default;

		auto register_error_callback(error_callback_t callback) -> void override
		{
			callbacks_.template set<to_index(callback_index::error)>(std::move(callback));
		}

		auto register_info_callback(info_callback_t callback) -> void override
		{
			callbacks_.template set<to_index(callback_index::info)>(std::move(callback));
		}

		auto register_server_info_callback(server_info_callback_t callback) -> void override
		{
			callbacks_.template set<to_index(callback_index::server_info)>(std::move(callback));
		}

		//! \brief Replaces the socket option hook run on each accepted connection.
		auto register_update_conn(update_conn_t callback) -> void
		{
			callbacks_.template set<to_index(callback_index::update_conn)>(std::move(callback));
		}

		//! \brief Only TCP servers carry TLS; enabling it elsewhere fails.
		auto set_tls(bool enable, const config::tls_config& tls) -> VoidResult override
		{
			(void)tls;
			if (enable)
			{
				return error_void(error_codes::socket::invalid_tls_config,
								  "TLS is not available on " + network_name(), server_name_);
			}
			return ok();
		}

		auto listen(const utils::cancel_context& ctx) -> VoidResult override
		{
			bool expected = false;
			if (!listening_.compare_exchange_strong(expected, true))
			{
				return error_void(error_codes::socket::server_already_running,
								  "server is already listening", server_name_);
			}
			if (used_.load())
			{
				finish_listen();
				return error_void(error_codes::socket::invalid_instance,
								  "server already stopped, create a new instance", server_name_);
			}

			auto bound = derived().do_bind();
			if (bound.is_err())
			{
				NETKIT_LOG_ERROR("[" + server_name_ + "] " + to_string(bound.error()));
				finish_listen();
				return forward_error<std::monostate>(bound);
			}

			used_.store(true);
			auto serve_ctx = utils::cancel_context::with_cancel(ctx);
			{
				std::lock_guard<std::mutex> lock(state_mutex_);
				serve_ctx_ = serve_ctx;
				local_address_ = bound.value();
			}
			if (hard_stop_.load())
			{
				serve_ctx.cancel();
			}

			gone_.store(false);
			running_.store(true);

			report_server_info("listening on " + network_name() + " " + bound.value());
			NETKIT_LOG_INFO("[" + server_name_ + "] listening on " + bound.value());

			auto served = derived().do_serve(serve_ctx);

			running_.store(false);

			if (ctx.is_done() || hard_stop_.load())
			{
				serve_ctx.cancel();
			}
			drain(serve_ctx);
			derived().do_release();

			{
				std::lock_guard<std::mutex> lock(state_mutex_);
				local_address_.clear();
			}
			gone_.store(true);

			report_server_info("stopped listening on " + network_name() + " " + bound.value());
			NETKIT_LOG_INFO("[" + server_name_ + "] stopped");

			finish_listen();

			if (served.is_err())
			{
				report_error({served.error()});
			}
			return served;
		}

		auto shutdown(const utils::cancel_context& ctx) -> VoidResult override
		{
			// Never listened: nothing to stop, the instance stays usable.
			if (!started())
			{
				return ok();
			}

			if (!running_.load() && open_.load() == 0)
			{
				stop_requested_.store(true);
				gone_.store(true);
				return ok();
			}

			stop_requested_.store(true);
			gone_.store(true);

			auto bounded = utils::cancel_context::with_timeout(ctx, defaults_.shutdown_max_wait);
			while (running_.load() || open_.load() > 0)
			{
				if (bounded.wait_for(defaults_.shutdown_poll_interval))
				{
					NETKIT_LOG_WARN("[" + server_name_ + "] shutdown timed out with " +
									std::to_string(open_.load()) + " open connection(s)");
					return error_void(error_codes::socket::shutdown_timeout,
									  "timeout on stopping socket", server_name_);
				}
			}
			return ok();
		}

		auto close() -> VoidResult override
		{
			if (!used_.load() && !listening_.load())
			{
				return ok();
			}

			hard_stop_.store(true);
			stop_requested_.store(true);
			gone_.store(true);

			{
				std::lock_guard<std::mutex> lock(state_mutex_);
				serve_ctx_.cancel();
			}

			const auto deadline = std::chrono::steady_clock::now() + defaults_.shutdown_max_wait;
			while (running_.load() && std::chrono::steady_clock::now() < deadline)
			{
				std::this_thread::sleep_for(defaults_.shutdown_poll_interval);
			}
			return ok();
		}

		[[nodiscard]] auto is_running() const -> bool override { return running_.load(); }

		[[nodiscard]] auto is_gone() const -> bool override { return gone_.load(); }

		[[nodiscard]] auto open_connections() const -> std::int64_t override
		{
			return open_.load();
		}

		[[nodiscard]] auto local_address() const -> std::string override
		{
			std::lock_guard<std::mutex> lock(state_mutex_);
			return local_address_;
		}

		[[nodiscard]] auto listener() const -> listener_info override
		{
			return listener_info{network_name(), config_.address, derived().tls_enabled()};
		}

		auto wait_for_stop(std::chrono::milliseconds timeout) const -> bool override
		{
			std::unique_lock<std::mutex> lock(stop_mutex_);
			return stop_cv_.wait_for(lock, timeout, [this] { return !listening_.load(); });
		}

	protected:
		socket_server_base(std::string server_name,
						   config::server_config config,
						   handler_t handler,
						   update_conn_t update_conn)
			: server_name_(std::move(server_name))
			, config_(std::move(config))
			, handler_(std::move(handler))
		{
			callbacks_.template set<to_index(callback_index::update_conn)>(std::move(update_conn));
		}

		Derived& derived() noexcept { return static_cast<Derived&>(*this); }

		const Derived& derived() const noexcept { return static_cast<const Derived&>(*this); }

		[[nodiscard]] auto settings() const -> const config::server_config& { return config_; }

		[[nodiscard]] auto server_name() const -> const std::string& { return server_name_; }

		[[nodiscard]] auto network_name() const -> std::string
		{
			return protocol::to_string(config_.network);
		}

		//! \brief Overridden (hidden) by servers that speak TLS.
		[[nodiscard]] auto tls_enabled() const -> bool { return false; }

		[[nodiscard]] auto handshake_timeout_ms() const -> std::size_t { return 0; }

		//! \brief True once listen() was entered.
		[[nodiscard]] auto started() const -> bool { return used_.load() || listening_.load(); }

		[[nodiscard]] auto should_stop(const utils::cancel_context& ctx) const -> bool
		{
			return stop_requested_.load() || ctx.is_done();
		}

		/*!
		 * \brief Accepts connections until a stop is requested.
		 *
		 * \param make_session builds the connection context from a fresh
		 *        io_context, the accepted socket and the connection
		 *        cancellation context. It returns a shared_ptr to a
		 *        detail::stream_session.
		 */
		template<typename Acceptor, typename MakeSession>
		auto accept_loop(Acceptor& acceptor, const utils::cancel_context& ctx,
						 MakeSession&& make_session) -> VoidResult
		{
			using socket_type = typename Acceptor::protocol_type::socket;

			while (!should_stop(ctx))
			{
				auto conn_io = std::make_unique<asio::io_context>();
				socket_type peer(*conn_io);

				auto accepted = detail::run_blocking(
					io_,
					[&acceptor, &peer](detail::op_completion completion)
					{ acceptor.async_accept(peer, completion); },
					[this, &ctx] { return should_stop(ctx); },
					[&acceptor]
					{
						asio::error_code ignored;
						acceptor.cancel(ignored);
					},
					defaults_.io_poll_interval);

				if (accepted.aborted || accepted.ec == asio::error::operation_aborted)
				{
					break;
				}
				if (accepted.ec)
				{
					if (accepted.ec == asio::error::bad_descriptor)
					{
						return error_void(error_codes::socket::connection_failed,
										  "listener closed unexpectedly", server_name_,
										  accepted.ec.message());
					}
					report_error({error_info(error_codes::socket::connection_failed,
											 "accept failed", server_name_,
											 accepted.ec.message())});
					continue;
				}

				open_.fetch_add(1);

				const auto local = detail::local_endpoint_string(peer);
				const auto remote = detail::remote_endpoint_string(peer);
				report_info(local, remote, conn_state::new_connection);

				if (auto update = callbacks_.template get<to_index(callback_index::update_conn)>())
				{
					guarded("update_conn", [&update, &peer] { update(peer.native_handle()); });
				}

				auto session = make_session(std::move(conn_io), std::move(peer),
											utils::cancel_context::with_cancel(ctx));

				std::shared_ptr<socket_server_base> self = this->shared_from_this();
				auto spawned = tasks_.spawn([self, session] { self->serve_connection(*session); });
				if (spawned.is_err())
				{
					auto closed = session->close();
					(void)closed;
					open_.fetch_sub(1);
					report_error({spawned.error()});
				}
			}

			return ok();
		}

		/*!
		 * \brief Receives datagrams until a stop is requested and runs the
		 *        handler once per datagram.
		 */
		template<typename Socket>
		auto receive_loop(Socket& socket, const utils::cancel_context& ctx) -> VoidResult
		{
			using endpoint_type = typename Socket::endpoint_type;

			std::vector<std::uint8_t> buffer(std::max(defaults_.buffer_size, detail::max_datagram_size));
			const auto local = detail::local_endpoint_string(socket);

			while (!should_stop(ctx))
			{
				endpoint_type sender;
				auto received = detail::run_blocking(
					io_,
					[&socket, &buffer, &sender](detail::op_completion completion)
					{ socket.async_receive_from(asio::buffer(buffer), sender, completion); },
					[this, &ctx] { return should_stop(ctx); },
					[&socket]
					{
						asio::error_code ignored;
						socket.cancel(ignored);
					},
					defaults_.io_poll_interval);

				if (received.aborted || received.ec == asio::error::operation_aborted)
				{
					break;
				}
				if (received.ec)
				{
					if (received.ec == asio::error::bad_descriptor)
					{
						return error_void(error_codes::socket::receive_failed,
										  "socket closed unexpectedly", server_name_,
										  received.ec.message());
					}
					report_error({error_info(error_codes::socket::receive_failed,
											 "receive failed", server_name_,
											 received.ec.message())});
					continue;
				}

				std::vector<std::uint8_t> payload(
					buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(received.bytes));
				const auto remote = detail::format_endpoint(sender);

				auto reply = [this, &socket, sender](std::span<const std::uint8_t> data)
				{ return send_datagram(socket, sender, data); };

				auto context = std::make_shared<detail::datagram_context>(
					std::move(payload), local, remote, std::move(reply), ctx, notifier());

				std::shared_ptr<socket_server_base> self = this->shared_from_this();
				auto spawned = tasks_.spawn([self, context] { self->serve_datagram(*context); });
				if (spawned.is_err())
				{
					report_error({spawned.error()});
				}
			}

			return ok();
		}

		//! \brief Connection state notifier handed to connection contexts.
		auto notifier() -> std::function<void(const std::string&, const std::string&, conn_state)>
		{
			return [this](const std::string& local, const std::string& remote, conn_state state)
			{ report_info(local, remote, state); };
		}

		auto report_error(const std::vector<error_info>& errors) -> void
		{
			for (const auto& err : errors)
			{
				NETKIT_LOG_DEBUG("[" + server_name_ + "] " + to_string(err));
			}

			auto callback = callbacks_.template get<to_index(callback_index::error)>();
			if (!callback)
			{
				return;
			}
			try
			{
				callback(errors);
			}
			catch (const std::exception& e)
			{
				NETKIT_LOG_ERROR("[" + server_name_ + "] error callback threw: " +
								 std::string(e.what()));
			}
			catch (...)
			{
				NETKIT_LOG_ERROR("[" + server_name_ + "] error callback threw a non-standard exception");
			}
		}

		auto report_info(const std::string& local, const std::string& remote, conn_state state)
			-> void
		{
			if (auto callback = callbacks_.template get<to_index(callback_index::info)>())
			{
				guarded("info callback",
						[&callback, &local, &remote, state] { callback(local, remote, state); });
			}
		}

		auto report_server_info(const std::string& message) -> void
		{
			if (auto callback = callbacks_.template get<to_index(callback_index::server_info)>())
			{
				guarded("server info callback", [&callback, &message] { callback(message); });
			}
		}

		asio::io_context io_;
		const config::socket_defaults defaults_ = active_socket_defaults();

	private:
		enum class callback_index : std::size_t
		{
			error = 0,
			info = 1,
			server_info = 2,
			update_conn = 3,
		};

		static constexpr auto to_index(callback_index index) -> std::size_t
		{
			return static_cast<std::size_t>(index);
		}

		//! \brief Runs user code; exceptions are logged and reported.
		template<typename Fn>
		auto guarded(const char* what, Fn&& fn) -> void
		{
			try
			{
				fn();
			}
			catch (const std::exception& e)
			{
				NETKIT_LOG_ERROR("[" + server_name_ + "] " + what + " threw: " + e.what());
				report_error({error_info(error_codes::common_errors::internal_error,
										 std::string(what) + " threw an exception", server_name_,
										 e.what())});
			}
			catch (...)
			{
				NETKIT_LOG_ERROR("[" + server_name_ + "] " + what +
								 " threw a non-standard exception");
				report_error({error_info(error_codes::common_errors::internal_error,
										 std::string(what) + " threw an exception", server_name_)});
			}
		}

		template<typename Session>
		auto serve_connection(Session& session) -> void
		{
			const auto timeout = std::chrono::milliseconds(derived().handshake_timeout_ms());
			auto ready = session.start(timeout);
			if (ready.is_err())
			{
				report_error({ready.error()});
			}
			else
			{
				report_info(session.local_address(), session.remote_address(), conn_state::handler);
				guarded("handler", [this, &session] { handler_(session); });
			}

			auto closed = session.close();
			if (closed.is_err())
			{
				report_error({closed.error()});
			}
			open_.fetch_sub(1);
		}

		auto serve_datagram(detail::datagram_context& context) -> void
		{
			report_info(context.local_address(), context.remote_address(), conn_state::handler);
			guarded("handler", [this, &context] { handler_(context); });

			auto closed = context.close();
			if (closed.is_err())
			{
				report_error({closed.error()});
			}
		}

		/*!
		 * \brief Sends one reply datagram from a handler thread.
		 *
		 * The send runs on io_, which the listen thread drives, so it never
		 * races with the pending receive.
		 */
		template<typename Socket, typename Endpoint>
		auto send_datagram(Socket& socket, const Endpoint& to, std::span<const std::uint8_t> data)
			-> Result<std::size_t>
		{
			auto promise = std::make_shared<std::promise<detail::op_result>>();
			auto future = promise->get_future();
			auto payload = std::make_shared<std::vector<std::uint8_t>>(data.begin(), data.end());

			asio::post(io_,
					   [&socket, to, payload, promise]
					   {
						   socket.async_send_to(
							   asio::buffer(*payload), to,
							   [payload, promise](const asio::error_code& ec, std::size_t bytes)
							   { promise->set_value(detail::op_result{ec, bytes, false}); });
					   });

			if (future.wait_for(defaults_.shutdown_max_wait) != std::future_status::ready)
			{
				return error<std::size_t>(error_codes::socket::send_failed, "reply timed out",
										  server_name_, detail::format_endpoint(to));
			}

			try
			{
				auto sent = future.get();
				if (sent.ec)
				{
					return error<std::size_t>(error_codes::socket::send_failed, "reply failed",
											  server_name_, sent.ec.message());
				}
				return ok(sent.bytes);
			}
			catch (const std::future_error& e)
			{
				return error<std::size_t>(error_codes::socket::send_failed, "reply abandoned",
										  server_name_, e.what());
			}
		}

		/*!
		 * \brief Waits for running handlers, driving io_ so their replies go
		 *        out. After shutdown_max_wait the connections are cancelled
		 *        and waited for once more.
		 */
		auto drain(const utils::cancel_context& serve_ctx) -> void
		{
			auto wait_round = [this]
			{
				const auto deadline =
					std::chrono::steady_clock::now() + defaults_.shutdown_max_wait;
				while (tasks_.active() > 0 && std::chrono::steady_clock::now() < deadline)
				{
					if (io_.stopped())
					{
						io_.restart();
					}
					if (io_.run_for(defaults_.io_poll_interval) == 0)
					{
						std::this_thread::sleep_for(defaults_.io_poll_interval);
					}
				}
				return tasks_.active() == 0;
			};

			if (wait_round())
			{
				return;
			}

			serve_ctx.cancel();
			if (!wait_round())
			{
				NETKIT_LOG_WARN("[" + server_name_ + "] " + std::to_string(tasks_.active()) +
								" handler(s) still running after stop");
			}
		}

		auto finish_listen() -> void
		{
			{
				std::lock_guard<std::mutex> lock(stop_mutex_);
				listening_.store(false);
			}
			stop_cv_.notify_all();
		}

		std::string server_name_;
		config::server_config config_;
		handler_t handler_;

		utils::callback_manager<error_callback_t, info_callback_t, server_info_callback_t, update_conn_t>
			callbacks_;

		std::atomic<bool> listening_{false};
		std::atomic<bool> used_{false};
		std::atomic<bool> running_{false};
		std::atomic<bool> gone_{true};
		std::atomic<bool> stop_requested_{false};
		std::atomic<bool> hard_stop_{false};
		std::atomic<std::int64_t> open_{0};

		mutable std::mutex state_mutex_;
		utils::cancel_context serve_ctx_;
		std::string local_address_;

		mutable std::mutex stop_mutex_;
		mutable std::condition_variable stop_cv_;

		utils::task_group tasks_;
	};

} // namespace netkit::core
