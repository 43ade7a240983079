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

#include "netkit/integration/logger_integration.h"

#include <cstdio>
#include <ctime>

namespace netkit::integration
{
	namespace
	{
		auto base_name(std::string_view path) -> std::string_view
		{
			const auto slash = path.find_last_of("/\\");
			return slash == std::string_view::npos ? path : path.substr(slash + 1);
		}

		auto format_time(std::chrono::system_clock::time_point time) -> std::string
		{
			const auto seconds = std::chrono::system_clock::to_time_t(time);
			const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
									time.time_since_epoch())
									.count() %
								1000;

			std::tm local{};
#if defined(_WIN32)
			localtime_s(&local, &seconds);
#else
			localtime_r(&seconds, &local);
#endif

			char buffer[32];
			const auto n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
			char stamp[40];
			std::snprintf(stamp, sizeof(stamp), "%.*s.%03d", static_cast<int>(n), buffer,
						  static_cast<int>(millis));
			return stamp;
		}
	} // namespace

	auto to_string(log_level level) -> const char*
	{
		switch (level)
		{
		case log_level::trace:
			return "TRACE";
		case log_level::debug:
			return "DEBUG";
		case log_level::info:
			return "INFO ";
		case log_level::warn:
			return "WARN ";
		case log_level::error:
			return "ERROR";
		case log_level::fatal:
			return "FATAL";
		}
		return "?????";
	}

	// ========================================================================
	// basic_logger
	// ========================================================================

	basic_logger::basic_logger(log_level min_level) : min_level_(static_cast<int>(min_level)) {}

	auto basic_logger::format(const log_record& record) -> std::string
	{
		std::string line = format_time(record.time);
		line += ' ';
		line += to_string(record.level);
		line += " [netkit] ";
		line += record.message;
		if (!record.file.empty())
		{
			line += " (";
			line += record.file;
			line += ':';
			line += std::to_string(record.line);
			line += ')';
		}
		return line;
	}

	auto basic_logger::write(const log_record& record) -> void
	{
		if (!is_level_enabled(record.level))
		{
			return;
		}

		auto line = format(record);
		line += '\n';

		std::FILE* target = record.level >= log_level::error ? stderr : stdout;
		std::lock_guard<std::mutex> lock(output_mutex_);
		std::fwrite(line.data(), 1, line.size(), target);
		if (target == stderr || record.level >= log_level::warn)
		{
			std::fflush(target);
		}
	}

	auto basic_logger::is_level_enabled(log_level level) const -> bool
	{
		return static_cast<int>(level) >= min_level_.load();
	}

	auto basic_logger::flush() -> void
	{
		std::lock_guard<std::mutex> lock(output_mutex_);
		std::fflush(stdout);
		std::fflush(stderr);
	}

	auto basic_logger::set_min_level(log_level level) -> void
	{
		min_level_.store(static_cast<int>(level));
	}

	auto basic_logger::min_level() const -> log_level
	{
		return static_cast<log_level>(min_level_.load());
	}

	// ========================================================================
	// logger_integration_manager
	// ========================================================================

	auto logger_integration_manager::instance() -> logger_integration_manager&
	{
		// Never destroyed: handler threads may still log during static teardown.
		static auto* manager = new logger_integration_manager();
		return *manager;
	}

	logger_integration_manager::logger_integration_manager()
		: logger_(std::make_shared<basic_logger>())
	{
	}

	auto logger_integration_manager::set_logger(std::shared_ptr<logger_interface> logger) -> void
	{
		std::lock_guard<std::mutex> lock(mutex_);
		logger_ = logger ? std::move(logger) : std::make_shared<basic_logger>();
	}

	auto logger_integration_manager::get_logger() -> std::shared_ptr<logger_interface>
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return logger_;
	}

	auto logger_integration_manager::is_enabled(log_level level) -> bool
	{
		return get_logger()->is_level_enabled(level);
	}

	auto logger_integration_manager::log(log_level level, std::string message,
										 std::string_view file, int line,
										 std::string_view function) -> void
	{
		log_record record;
		record.level = level;
		record.message = std::move(message);
		record.file = base_name(file);
		record.line = line;
		record.function = function;
		record.time = std::chrono::system_clock::now();

		get_logger()->write(record);
	}

} // namespace netkit::integration
