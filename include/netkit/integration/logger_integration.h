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

/**
 * @file logger_integration.h
 * @brief Logging hook shared by every netkit server and client
 *
 * Sockets log through the NETKIT_LOG_* macros. The macros check the
 * active sink's level before building the message, then hand a
 * log_record to it. Without an installed sink records go to a console
 * basic_logger.
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace netkit::integration
{
	enum class log_level : int
	{
		trace = 0,
		debug = 1,
		info = 2,
		warn = 3,
		error = 4,
		fatal = 5
	};

	//! \brief Fixed-width upper case name, e.g. "WARN ".
	auto to_string(log_level level) -> const char*;

	/*!
	 * \struct log_record
	 * \brief One log line with its origin.
	 *
	 * \c file holds the base name of the source file only.
	 */
	struct log_record
	{
		log_level level = log_level::info;
		std::string message;
		std::string_view file;
		int line = 0;
		std::string_view function;
		std::chrono::system_clock::time_point time;
	};

	/*!
	 * \class logger_interface
	 * \brief Sink for netkit log records.
	 *
	 * write() may be called from any thread, including handler threads.
	 */
	class logger_interface
	{
	public:
		virtual ~logger_interface() = default;

		virtual auto write(const log_record& record) -> void = 0;

		[[nodiscard]] virtual auto is_level_enabled(log_level level) const -> bool = 0;

		virtual auto flush() -> void = 0;
	};

	/*!
	 * \class basic_logger
	 * \brief Console sink: "time LEVEL [netkit] message (file:line)".
	 *
	 * Records at error and above go to stderr, the rest to stdout.
	 */
	class basic_logger : public logger_interface
	{
	public:
		explicit basic_logger(log_level min_level = log_level::info);

		auto write(const log_record& record) -> void override;
		[[nodiscard]] auto is_level_enabled(log_level level) const -> bool override;
		auto flush() -> void override;

		auto set_min_level(log_level level) -> void;
		[[nodiscard]] auto min_level() const -> log_level;

		//! \brief The line write() prints for \p record, without newline.
		[[nodiscard]] static auto format(const log_record& record) -> std::string;

	private:
		std::mutex output_mutex_;
		std::atomic<int> min_level_;
	};

	/*!
	 * \class logger_integration_manager
	 * \brief Process-wide holder of the active sink.
	 *
	 * set_logger(nullptr) restores the console sink.
	 */
	class logger_integration_manager
	{
	public:
		static auto instance() -> logger_integration_manager&;

		auto set_logger(std::shared_ptr<logger_interface> logger) -> void;

		[[nodiscard]] auto get_logger() -> std::shared_ptr<logger_interface>;

		[[nodiscard]] auto is_enabled(log_level level) -> bool;

		auto log(log_level level, std::string message, std::string_view file, int line,
				 std::string_view function) -> void;

	private:
		logger_integration_manager();

		std::mutex mutex_;
		std::shared_ptr<logger_interface> logger_;
	};

} // namespace netkit::integration

#define NETKIT_LOG_AT(lvl, msg)                                                             \
	do                                                                                      \
	{                                                                                       \
		auto& netkit_log_manager_ = ::netkit::integration::logger_integration_manager::instance(); \
		if (netkit_log_manager_.is_enabled(lvl))                                            \
		{                                                                                   \
			netkit_log_manager_.log(lvl, msg, __FILE__, __LINE__, __func__);                \
		}                                                                                   \
	} while (false)

#define NETKIT_LOG_TRACE(msg) NETKIT_LOG_AT(::netkit::integration::log_level::trace, msg)
#define NETKIT_LOG_DEBUG(msg) NETKIT_LOG_AT(::netkit::integration::log_level::debug, msg)
#define NETKIT_LOG_INFO(msg) NETKIT_LOG_AT(::netkit::integration::log_level::info, msg)
#define NETKIT_LOG_WARN(msg) NETKIT_LOG_AT(::netkit::integration::log_level::warn, msg)
#define NETKIT_LOG_ERROR(msg) NETKIT_LOG_AT(::netkit::integration::log_level::error, msg)
#define NETKIT_LOG_FATAL(msg) NETKIT_LOG_AT(::netkit::integration::log_level::fatal, msg)
