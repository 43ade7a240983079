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
 * @file bandwidth_limiter.h
 * @brief Transfer rate smoothing driven by progress_file callbacks
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "netkit/io/progress_file.h"

namespace netkit::io
{
	/*!
	 * \class bandwidth_limiter
	 * \brief Slows the calling thread when the observed rate exceeds a limit.
	 *
	 * The limiter remembers the instant of the previous increment only. Each
	 * increment estimates the rate from the bytes just moved and the time
	 * since that instant; when the estimate is above the limit the caller
	 * sleeps for (rate / limit) seconds, at most one second. Bursts below the
	 * average rate pass untouched.
	 *
	 * - first increment, or first one after reset(): no sleep
	 * - less than 1ms since the previous increment: no sleep
	 * - less than 100ms: no sleep and the previous instant is kept, so
	 *   small transfers accumulate into a measurable sample
	 *
	 * A limit of zero disables throttling.
	 *
	 * ### Thread Safety
	 * increment() and reset() may be called from several threads; the last
	 * instant is a single atomic value.
	 *
	 * ### Usage Example
	 * \code
	 * bandwidth_limiter limiter(1024 * 1024);
	 * auto opened = progress_file::open("payload.bin");
	 * auto& file = opened.value();
	 * limiter.register_increment(*file, nullptr);
	 * limiter.register_reset(*file, nullptr);
	 * file->write_to(socket);
	 * \endcode
	 */
	class bandwidth_limiter
	{
	public:
		using clock = std::chrono::steady_clock;

		//! \brief Longest sleep of a single increment().
		static constexpr std::chrono::nanoseconds max_sleep = std::chrono::seconds(1);

		//! \brief \p bytes_per_second of zero means unlimited.
		explicit bandwidth_limiter(std::uint64_t bytes_per_second);

		bandwidth_limiter(const bandwidth_limiter&) = delete;
		bandwidth_limiter& operator=(const bandwidth_limiter&) = delete;

		[[nodiscard]] auto limit() const -> std::uint64_t { return limit_; }

		//! \brief Accounts \p size transferred bytes, sleeping if needed.
		auto increment(std::int64_t size) -> void;

		//! \brief Forgets the previous instant.
		auto reset() -> void;

		/*!
		 * \brief Installs increment() as \p file's increment callback.
		 *
		 * \p next (may be empty) runs after the limiter. The limiter must
		 * outlive \p file.
		 */
		auto register_increment(progress_file& file, increment_callback_t next) -> void;

		//! \brief Installs reset() as \p file's reset callback, then \p next.
		auto register_reset(progress_file& file, reset_callback_t next) -> void;

	private:
		//! \brief Sleep for \p rate against the limit, capped at max_sleep.
		[[nodiscard]] auto sleep_for_rate(double rate) const -> std::chrono::nanoseconds;

		const std::uint64_t limit_;

		// steady_clock ticks of the previous increment, 0 when none.
		std::atomic<std::int64_t> last_{0};
	};

} // namespace netkit::io
