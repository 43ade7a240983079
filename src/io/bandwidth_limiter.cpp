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

#include "netkit/io/bandwidth_limiter.h"

#include <algorithm>
#include <thread>

namespace netkit::io
{
	namespace
	{
		constexpr auto noise_threshold = std::chrono::milliseconds(1);
		constexpr auto sample_threshold = std::chrono::milliseconds(100);

		auto now_ticks() -> std::int64_t
		{
			const auto ticks = bandwidth_limiter::clock::now().time_since_epoch().count();
			// 0 is reserved for "no previous increment".
			return ticks == 0 ? 1 : static_cast<std::int64_t>(ticks);
		}
	} // namespace

	bandwidth_limiter::bandwidth_limiter(std::uint64_t bytes_per_second)
		: limit_(bytes_per_second)
	{
	}

	auto bandwidth_limiter::increment(std::int64_t size) -> void
	{
		const auto now = now_ticks();
		const auto last = last_.load();

		if (last == 0)
		{
			last_.store(now);
			return;
		}

		const auto elapsed = clock::duration(now - last);
		if (elapsed < noise_threshold)
		{
			last_.store(now);
			return;
		}
		if (elapsed < sample_threshold)
		{
			return;
		}

		if (limit_ > 0 && size > 0)
		{
			const double seconds = std::chrono::duration<double>(elapsed).count();
			const double rate = static_cast<double>(size) / seconds;
			if (rate > static_cast<double>(limit_))
			{
				std::this_thread::sleep_for(sleep_for_rate(rate));
			}
		}

		last_.store(now_ticks());
	}

	auto bandwidth_limiter::reset() -> void
	{
		last_.store(0);
	}

	auto bandwidth_limiter::sleep_for_rate(double rate) const -> std::chrono::nanoseconds
	{
		const double ratio = rate / static_cast<double>(limit_);
		const double capped = std::min(ratio, 1.0);
		return std::chrono::duration_cast<std::chrono::nanoseconds>(
			std::chrono::duration<double>(capped));
	}

	auto bandwidth_limiter::register_increment(progress_file& file, increment_callback_t next)
		-> void
	{
		file.register_increment(
			[this, next = std::move(next)](std::int64_t size)
			{
				increment(size);
				if (next)
				{
					next(size);
				}
			});
	}

	auto bandwidth_limiter::register_reset(progress_file& file, reset_callback_t next) -> void
	{
		file.register_reset(
			[this, next = std::move(next)](std::int64_t size, std::int64_t current)
			{
				reset();
				if (next)
				{
					next(size, current);
				}
			});
	}

} // namespace netkit::io
