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

#include "netkit/utils/task_group.h"

#include <condition_variable>
#include <mutex>
#include <system_error>
#include <thread>

#include "netkit/integration/logger_integration.h"

namespace netkit::utils
{
	struct task_group::shared_state
	{
		std::mutex mutex;
		std::condition_variable condition;
		std::size_t active = 0;
	};

	task_group::task_group() : state_(std::make_shared<shared_state>()) {}

	task_group::~task_group() = default;

	auto task_group::spawn(std::function<void()> task) -> VoidResult
	{
		{
			std::lock_guard<std::mutex> lock(state_->mutex);
			++state_->active;
		}

		try
		{
			std::thread([state = state_, task = std::move(task)]() {
				try
				{
					task();
				}
				catch (const std::exception& e)
				{
					NETKIT_LOG_ERROR("[task_group] task terminated by exception: " +
									 std::string(e.what()));
				}

				std::lock_guard<std::mutex> lock(state->mutex);
				--state->active;
				state->condition.notify_all();
			}).detach();
		}
		catch (const std::system_error& e)
		{
			std::lock_guard<std::mutex> lock(state_->mutex);
			--state_->active;
			state_->condition.notify_all();
			return error_void(error_codes::common_errors::internal_error,
							  "cannot start worker thread", "task_group", e.what());
		}

		return ok();
	}

	auto task_group::active() const -> std::size_t
	{
		std::lock_guard<std::mutex> lock(state_->mutex);
		return state_->active;
	}

	auto task_group::wait_for(std::chrono::steady_clock::duration timeout) -> bool
	{
		std::unique_lock<std::mutex> lock(state_->mutex);
		return state_->condition.wait_for(lock, timeout, [this] { return state_->active == 0; });
	}

	auto task_group::wait() -> void
	{
		std::unique_lock<std::mutex> lock(state_->mutex);
		state_->condition.wait(lock, [this] { return state_->active == 0; });
	}

} // namespace netkit::utils
