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
 * @file task_group.h
 * @brief Counted set of detached worker threads
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

#include "netkit/types/result.h"

namespace netkit::utils
{
	/*!
	 * \class task_group
	 * \brief Runs each task on its own thread and tracks how many are alive.
	 *
	 * Servers hand one task per accepted connection or received datagram to
	 * the group, then wait for it to drain on stop. Threads are detached;
	 * the bookkeeping state is shared with them so the group may be
	 * destroyed while tasks still run.
	 */
	class task_group
	{
	public:
		task_group();
		~task_group();

		task_group(const task_group&) = delete;
		task_group& operator=(const task_group&) = delete;

		/*!
		 * \brief Starts \p task on a new thread.
		 * \return internal_error when the thread cannot be created; the task
		 *         is not run in that case.
		 */
		auto spawn(std::function<void()> task) -> VoidResult;

		[[nodiscard]] auto active() const -> std::size_t;

		//! \brief Waits until no task is running. Returns false on timeout.
		auto wait_for(std::chrono::steady_clock::duration timeout) -> bool;

		auto wait() -> void;

	private:
		struct shared_state;
		std::shared_ptr<shared_state> state_;
	};

} // namespace netkit::utils
