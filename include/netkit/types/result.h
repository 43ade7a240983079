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
 * @file result.h
 * @brief Result<T> error handling types for netkit
 *
 * Every fallible netkit operation returns a Result<T> (or VoidResult)
 * carrying either the value or an error_info with a numeric code from
 * netkit::error_codes.
 *
 * @code
 * #include <netkit/types/result.h>
 *
 * auto bind() -> netkit::VoidResult {
 *     return netkit::error_void(netkit::error_codes::socket::bind_failed,
 *                               "address in use", "tcp_server");
 * }
 * @endcode
 */

#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace netkit {

	/*!
	 * \struct error_info
	 * \brief Error payload of a failed Result.
	 *
	 * \c details keeps the lower level error text (resolver message,
	 * errno string, OpenSSL reason) when the code alone is not enough.
	 */
	struct error_info {
		int code;
		std::string message;
		std::string source;
		std::string details;

		error_info(int c, std::string msg, std::string src = "", std::string det = "")
			: code(c), message(std::move(msg)), source(std::move(src)), details(std::move(det)) {}
	};

	template<typename T>
	class Result {
	public:
		Result(const T& val) : data_(val) {}
		Result(T&& val) : data_(std::move(val)) {}
		Result(const error_info& err) : data_(err) {}
		Result(error_info&& err) : data_(std::move(err)) {}

		bool is_ok() const { return std::holds_alternative<T>(data_); }
		bool is_err() const { return !is_ok(); }

		const T& value() const& { return std::get<T>(data_); }
		T& value() & { return std::get<T>(data_); }
		T&& value() && { return std::get<T>(std::move(data_)); }

		const error_info& error() const { return std::get<error_info>(data_); }

		operator bool() const { return is_ok(); }

	private:
		std::variant<T, error_info> data_;
	};

	using VoidResult = Result<std::monostate>;

	namespace error_codes {
		namespace common_errors {
			constexpr int success = 0;
			constexpr int invalid_argument = -1;
			constexpr int not_found = -2;
			constexpr int permission_denied = -3;
			constexpr int timeout = -4;
			constexpr int cancelled = -5;
			constexpr int not_initialized = -6;
			constexpr int already_exists = -7;
			constexpr int io_error = -9;
			constexpr int internal_error = -99;
		}

		namespace socket {
			constexpr int invalid_protocol = -700;
			constexpr int invalid_tls_config = -701;
			constexpr int invalid_group = -702;
			constexpr int invalid_address = -703;
			constexpr int address_resolution_failed = -704;
			constexpr int invalid_handler = -705;
			constexpr int shutdown_timeout = -706;
			constexpr int invalid_instance = -707;
			constexpr int not_connected = -708;

			constexpr int connection_failed = -720;
			constexpr int connection_closed = -721;
			constexpr int tls_handshake_failed = -722;
			constexpr int idle_timeout = -723;
			constexpr int send_failed = -724;
			constexpr int receive_failed = -725;

			constexpr int server_already_running = -740;
			constexpr int bind_failed = -741;
			constexpr int permission_failed = -742;
		}

		namespace io {
			constexpr int end_of_file = -800;
			constexpr int file_closed = -801;
			constexpr int open_failed = -802;
			constexpr int io_failed = -803;
			constexpr int invalid_whence = -804;
			constexpr int not_regular_file = -805;
		}
	}

	template<typename T>
	inline Result<std::decay_t<T>> ok(T&& value) {
		return Result<std::decay_t<T>>(std::forward<T>(value));
	}

	inline VoidResult ok() {
		return VoidResult(std::monostate{});
	}

	template<typename T>
	inline Result<T> error(int code, const std::string& message,
	                      const std::string& source = "netkit",
	                      const std::string& details = "") {
		return Result<T>(error_info(code, message, source, details));
	}

	inline VoidResult error_void(int code, const std::string& message,
	                            const std::string& source = "netkit",
	                            const std::string& details = "") {
		return VoidResult(error_info(code, message, source, details));
	}

	//! \brief Same error, different payload type.
	template<typename T, typename U>
	inline Result<T> forward_error(const Result<U>& failed) {
		return Result<T>(failed.error());
	}

	//! \brief "source: message (details)" for logs and tests.
	inline std::string to_string(const error_info& err) {
		std::string out = err.source.empty() ? err.message : err.source + ": " + err.message;
		if (!err.details.empty()) {
			out += " (" + err.details + ")";
		}
		return out;
	}

} // namespace netkit
