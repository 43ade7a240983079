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

#include "netkit/netkit.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace netkit
{
	namespace
	{
		/*!
		 * \brief Process state touched by initialize() and shutdown().
		 *
		 * The tunables are read by every server and client constructor, so
		 * they sit behind a mutex instead of being published once.
		 */
		struct process_state
		{
			std::mutex mutex;
			std::atomic<bool> initialized{false};
			config::socket_defaults sockets;
		};

		auto state() -> process_state&
		{
			static process_state instance;
			return instance;
		}
	} // namespace

	auto initialize() -> VoidResult
	{
		return initialize(config::netkit_config::production());
	}

	auto initialize(const config::netkit_config& config) -> VoidResult
	{
		auto& current = state();
		std::lock_guard<std::mutex> lock(current.mutex);

		if (current.initialized.load())
		{
			NETKIT_LOG_WARN("[netkit] initialize called twice");
			return error_void(error_codes::common_errors::already_exists,
							  "netkit already initialized", "netkit");
		}

		integration::logger_integration_manager::instance().set_logger(
			std::make_shared<integration::basic_logger>(config.logger.min_level));
		current.sockets = config.sockets;
		current.initialized.store(true);

		NETKIT_LOG_INFO("[netkit] initialized, buffer size " +
						std::to_string(config.sockets.buffer_size) + ", shutdown bound " +
						std::to_string(config.sockets.shutdown_max_wait.count()) + "ms");
		return ok();
	}

	auto shutdown() -> VoidResult
	{
		auto& current = state();
		std::lock_guard<std::mutex> lock(current.mutex);

		if (!current.initialized.load())
		{
			return error_void(error_codes::common_errors::not_initialized,
							  "netkit not initialized", "netkit");
		}

		NETKIT_LOG_INFO("[netkit] shutting down");
		integration::logger_integration_manager::instance().get_logger()->flush();

		current.sockets = config::socket_defaults{};
		current.initialized.store(false);
		return ok();
	}

	auto is_initialized() -> bool
	{
		return state().initialized.load();
	}

	auto active_socket_defaults() -> config::socket_defaults
	{
		auto& current = state();
		std::lock_guard<std::mutex> lock(current.mutex);
		return current.sockets;
	}

} // namespace netkit
