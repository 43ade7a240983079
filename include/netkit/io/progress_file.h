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
 * @file progress_file.h
 * @brief File handle that reports every transfer through callbacks
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "netkit/io/io_interfaces.h"
#include "netkit/types/result.h"
#include "netkit/utils/callback_manager.h"

namespace netkit::io
{
	//! \brief Copy buffer used by read_from() and write_to() unless changed.
	inline constexpr std::size_t default_buffer_size = 32 * 1024;

	//! \brief Buffer sizes below this fall back to default_buffer_size.
	inline constexpr std::int32_t min_buffer_size = 1024;

	//! \brief Bytes moved by the call that triggered it.
	using increment_callback_t = std::function<void(std::int64_t size)>;

	//! \brief (expected total size, current position).
	using reset_callback_t = std::function<void(std::int64_t size, std::int64_t current)>;

	using eof_callback_t = std::function<void()>;

	enum class seek_origin
	{
		begin,
		current,
		end,
	};

	struct file_info
	{
		std::string path;
		std::int64_t size = 0;
		std::uint32_t mode = 0;
		bool is_regular = false;
		std::chrono::system_clock::time_point modified;
	};

	/*!
	 * \class progress_file
	 * \brief Instrumented file.
	 *
	 * - read/write family: the increment callback receives the byte count
	 *   of every successful transfer.
	 * - reaching end of file on read: the EOF callback fires.
	 * - seek, truncate and reset(max): the reset callback receives
	 *   (max, current position), with the file size substituted for a
	 *   zero max.
	 *
	 * Callbacks may be registered from any thread at any time; an empty
	 * callback disables the notification.
	 *
	 * ### Thread Safety
	 * Callback registration is thread-safe. I/O calls on one instance must
	 * be serialized by the caller.
	 */
	class progress_file : public reader, public writer
	{
	public:
		using pointer = std::unique_ptr<progress_file>;

		//! \brief Opens an existing file read-only.
		static auto open(const std::string& path) -> Result<pointer>;

		//! \brief Creates or truncates \p path for reading and writing.
		static auto create(const std::string& path) -> Result<pointer>;

		//! \brief open(2) with explicit \p flags (O_*) and \p mode.
		static auto make(const std::string& path, int flags, std::uint32_t mode) -> Result<pointer>;

		/*!
		 * \brief New file in the system temporary directory, removed on
		 *        close().
		 *
		 * The last '*' of \p pattern is replaced by a random string; without
		 * '*' the random string is appended.
		 */
		static auto temp(const std::string& pattern) -> Result<pointer>;

		//! \brief Like temp() but in \p base_path, and kept on close().
		static auto unique(const std::string& base_path, const std::string& pattern)
			-> Result<pointer>;

		~progress_file() override;

		progress_file(const progress_file&) = delete;
		progress_file& operator=(const progress_file&) = delete;

		auto read(std::span<std::uint8_t> buffer) -> Result<std::size_t> override;
		auto read_at(std::span<std::uint8_t> buffer, std::int64_t offset) -> Result<std::size_t>;
		auto read_byte() -> Result<std::uint8_t>;

		//! \brief Copies \p source until its end into this file.
		auto read_from(reader& source) -> Result<std::int64_t>;

		auto write(std::span<const std::uint8_t> data) -> Result<std::size_t> override;
		auto write_at(std::span<const std::uint8_t> data, std::int64_t offset)
			-> Result<std::size_t>;
		auto write_string(std::string_view text) -> Result<std::size_t>;
		auto write_byte(std::uint8_t value) -> VoidResult;

		//! \brief Copies the rest of this file into \p target.
		auto write_to(writer& target) -> Result<std::int64_t>;

		auto seek(std::int64_t offset, seek_origin origin) -> Result<std::int64_t>;
		auto truncate(std::int64_t size) -> VoidResult;
		auto sync() -> VoidResult;

		auto close() -> VoidResult;

		//! \brief Closes then removes the file.
		auto close_delete() -> VoidResult;

		[[nodiscard]] auto path() const -> const std::string& { return path_; }
		[[nodiscard]] auto is_temp() const -> bool { return temp_; }

		auto stat() const -> Result<file_info>;

		//! \brief Bytes between the start of the file and the cursor.
		auto size_bof() const -> Result<std::int64_t>;

		//! \brief Bytes between the cursor and the end of the file.
		auto size_eof() const -> Result<std::int64_t>;

		auto register_increment(increment_callback_t callback) -> void;
		auto register_reset(reset_callback_t callback) -> void;
		auto register_eof(eof_callback_t callback) -> void;

		auto set_buffer_size(std::int32_t size) -> void;
		[[nodiscard]] auto buffer_size() const -> std::size_t;

		//! \brief Copies the three callbacks of this file onto \p other.
		auto set_register_progress(progress_file& other) const -> void;

		//! \brief Fires the reset callback with (\p max or file size, position).
		auto reset(std::int64_t max) -> void;

	private:
		progress_file(int fd, std::string path, bool temp);

		auto ensure_open() const -> VoidResult;
		auto position() const -> Result<std::int64_t>;
		auto notify_increment(std::int64_t size) -> void;
		auto notify_eof() -> void;

		int fd_;
		std::string path_;
		bool temp_;
		std::atomic<std::int32_t> buffer_size_{0};

		utils::callback_manager<increment_callback_t, reset_callback_t, eof_callback_t> callbacks_;
	};

} // namespace netkit::io
