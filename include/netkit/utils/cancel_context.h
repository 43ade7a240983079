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
 * @file cancel_context.h
 * @brief Cancellation token with optional deadline, threaded through every
 *        blocking netkit call (listen, connect, shutdown, once).
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "netkit/types/result.h"

namespace netkit::utils
{
	/*!
	 * \class cancel_context
	 * \brief Copyable handle to a shared cancellation state.
	 *
	 * A default-constructed context is never done. Derived contexts observe
	 * their parent: cancelling a parent (or reaching its deadline) makes every
	 * descendant done, never the other way round.
	 *
	 * ### Thread Safety
	 * All members are safe to call concurrently from any thread.
	 */
	class cancel_context
	{
	public:
		using clock = std::chrono::steady_clock;

		cancel_context() = default;

		static auto background() -> cancel_context { return cancel_context(); }
		static auto with_cancel(const cancel_context& parent) -> cancel_context;
		static auto with_timeout(const cancel_context& parent, clock::duration timeout)
			-> cancel_context;
		static auto with_deadline(const cancel_context& parent, clock::time_point deadline)
			-> cancel_context;

		//! \brief Marks this context (and its descendants) done. No-op on background.
		auto cancel() const -> void;

		[[nodiscard]] auto is_done() const -> bool;

		/*!
		 * \brief Why the context is done.
		 * \return ok() while not done, otherwise an error with code
		 *         common_errors::cancelled or common_errors::timeout.
		 */
		[[nodiscard]] auto reason() const -> VoidResult;

		//! \brief Earliest deadline along the parent chain.
		[[nodiscard]] auto deadline() const -> std::optional<clock::time_point>;

		//! \brief Time left before the earliest deadline, nullopt when unbounded.
		[[nodiscard]] auto remaining() const -> std::optional<clock::duration>;

		/*!
		 * \brief Blocks up to \p timeout for the context to become done.
		 * \return true when done.
		 */
		auto wait_for(clock::duration timeout) const -> bool;

	private:
		struct state;

		explicit cancel_context(std::shared_ptr<state> st) : state_(std::move(st)) {}

		std::shared_ptr<state> state_;
	};

} // namespace netkit::utils
