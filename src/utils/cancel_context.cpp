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

#include "netkit/utils/cancel_context.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace netkit::utils
{
	namespace
	{
		// Parent cancellation is not pushed to children; waiters re-check the
		// chain at this interval.
		constexpr auto kWaitSlice = std::chrono::milliseconds(10);
	}

	struct cancel_context::state
	{
		std::shared_ptr<state> parent;
		std::optional<clock::time_point> deadline;
		std::atomic<bool> cancelled{false};
		std::mutex mutex;
		std::condition_variable cv;

		auto done(clock::time_point now) const -> bool
		{
			for (const state* node = this; node != nullptr; node = node->parent.get())
			{
				if (node->cancelled.load(std::memory_order_acquire))
				{
					return true;
				}
				if (node->deadline && now >= *node->deadline)
				{
					return true;
				}
			}
			return false;
		}
	};

	auto cancel_context::with_cancel(const cancel_context& parent) -> cancel_context
	{
		auto st = std::make_shared<state>();
		st->parent = parent.state_;
		return cancel_context(std::move(st));
	}

	auto cancel_context::with_timeout(const cancel_context& parent, clock::duration timeout)
		-> cancel_context
	{
		return with_deadline(parent, clock::now() + timeout);
	}

	auto cancel_context::with_deadline(const cancel_context& parent, clock::time_point deadline)
		-> cancel_context
	{
		auto st = std::make_shared<state>();
		st->parent = parent.state_;
		st->deadline = deadline;
		return cancel_context(std::move(st));
	}

	auto cancel_context::cancel() const -> void
	{
		if (!state_)
		{
			return;
		}
		{
			std::lock_guard<std::mutex> lock(state_->mutex);
			state_->cancelled.store(true, std::memory_order_release);
		}
		state_->cv.notify_all();
	}

	auto cancel_context::is_done() const -> bool
	{
		return state_ && state_->done(clock::now());
	}

	auto cancel_context::reason() const -> VoidResult
	{
		const auto now = clock::now();
		for (const state* node = state_.get(); node != nullptr; node = node->parent.get())
		{
			if (node->cancelled.load(std::memory_order_acquire))
			{
				return error_void(error_codes::common_errors::cancelled,
								  "context canceled", "cancel_context");
			}
			if (node->deadline && now >= *node->deadline)
			{
				return error_void(error_codes::common_errors::timeout,
								  "context deadline exceeded", "cancel_context");
			}
		}
		return ok();
	}

	auto cancel_context::deadline() const -> std::optional<clock::time_point>
	{
		std::optional<clock::time_point> earliest;
		for (const state* node = state_.get(); node != nullptr; node = node->parent.get())
		{
			if (node->deadline && (!earliest || *node->deadline < *earliest))
			{
				earliest = node->deadline;
			}
		}
		return earliest;
	}

	auto cancel_context::remaining() const -> std::optional<clock::duration>
	{
		auto dl = deadline();
		if (!dl)
		{
			return std::nullopt;
		}
		return std::max(clock::duration::zero(), *dl - clock::now());
	}

	auto cancel_context::wait_for(clock::duration timeout) const -> bool
	{
		const auto until = clock::now() + timeout;
		if (!state_)
		{
			std::this_thread::sleep_until(until);
			return false;
		}

		std::unique_lock<std::mutex> lock(state_->mutex);
		for (;;)
		{
			const auto now = clock::now();
			if (state_->done(now))
			{
				return true;
			}
			if (now >= until)
			{
				return false;
			}

			auto wake = std::min(until, now + kWaitSlice);
			if (state_->deadline)
			{
				wake = std::min(wake, *state_->deadline);
			}
			state_->cv.wait_until(lock, wake);
		}
	}

} // namespace netkit::utils
