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

#include <cstddef>
#include <functional>
#include <mutex>
#include <tuple>
#include <utility>

namespace netkit::utils
{
	/*!
	 * \class callback_manager
	 * \brief Fixed set of callback slots guarded by one mutex.
	 *
	 * Slots are addressed by position. Readers receive a copy, so a
	 * callback runs without the lock held and may replace any slot,
	 * including its own, while it runs.
	 *
	 * \code
	 * callback_manager<std::function<void(int)>, std::function<void()>> slots;
	 * slots.set<0>([](int n) { consume(n); });
	 * slots.invoke<0>(42);
	 * \endcode
	 */
	template<typename... Slots>
	class callback_manager
	{
		using storage_t = std::tuple<Slots...>;

	public:
		template<std::size_t Index>
		using slot_t = std::tuple_element_t<Index, storage_t>;

		callback_manager() = default;

		callback_manager(const callback_manager&) = delete;
		callback_manager& operator=(const callback_manager&) = delete;

		template<std::size_t Index>
		auto set(slot_t<Index> callback) -> void
		{
			std::scoped_lock lock(mutex_);
			std::get<Index>(slots_) = std::move(callback);
		}

		//! \brief Copy of slot \p Index, empty when nothing is registered.
		template<std::size_t Index>
		[[nodiscard]] auto get() const -> slot_t<Index>
		{
			std::scoped_lock lock(mutex_);
			return std::get<Index>(slots_);
		}

		//! \brief Calls slot \p Index when set; returns whether it was.
		template<std::size_t Index, typename... Args>
		auto invoke(Args&&... args) const -> bool
		{
			if (auto callback = get<Index>())
			{
				callback(std::forward<Args>(args)...);
				return true;
			}
			return false;
		}

		//! \brief Replaces every slot with those of \p source.
		auto assign_from(const callback_manager& source) -> void
		{
			if (&source == this)
			{
				return;
			}
			std::scoped_lock lock(mutex_, source.mutex_);
			slots_ = source.slots_;
		}

		auto clear() -> void
		{
			std::scoped_lock lock(mutex_);
			slots_ = storage_t{};
		}

	private:
		mutable std::mutex mutex_;
		storage_t slots_;
	};

} // namespace netkit::utils
