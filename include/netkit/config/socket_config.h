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
 * @file socket_config.h
 * @brief Declarative client and server socket configuration
 *
 * A configuration is a plain value: build it from literals or from a
 * deserialized document, call validate(), then hand it to
 * core::make_server() / core::make_client().
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "netkit/config/tls_config.h"
#include "netkit/protocol/network_protocol.h"
#include "netkit/types/result.h"

namespace netkit::config
{
	//! \brief Highest group id accepted for unix socket ownership.
	inline constexpr std::int32_t max_gid = 32767;

	/*!
	 * \class file_mode
	 * \brief Unix permission bits of a socket file.
	 */
	class file_mode
	{
	public:
		constexpr file_mode() = default;
		constexpr explicit file_mode(std::uint32_t bits) : bits_(bits & 07777) {}

		/*!
		 * \brief Parses "0660", "660", "0o660" or "rw-rw----".
		 *
		 * Surrounding whitespace and quotes are ignored.
		 * \return invalid_argument for anything else.
		 */
		static auto parse(std::string_view text) -> Result<file_mode>;

		[[nodiscard]] constexpr auto bits() const -> std::uint32_t { return bits_; }
		[[nodiscard]] constexpr auto is_set() const -> bool { return bits_ != 0; }

		//! \brief Four digit octal form, e.g. "0660".
		[[nodiscard]] auto to_string() const -> std::string;

		//! \brief "rwxrwxrwx" form of the permission bits.
		[[nodiscard]] auto symbolic() const -> std::string;

		constexpr auto operator==(const file_mode&) const -> bool = default;

	private:
		std::uint32_t bits_ = 0;
	};

	/*!
	 * \struct tls_settings
	 * \brief TLS block shared by client and server configurations.
	 *
	 * \c server_name is only meaningful for clients.
	 */
	struct tls_settings
	{
		bool enabled = false;
		tls_config config;
		std::string server_name;
	};

	/*!
	 * \struct client_tls
	 * \brief Effective client TLS: merged configuration plus peer name.
	 */
	struct client_tls
	{
		bool enabled = false;
		std::optional<tls_config> config;
		std::string server_name;
	};

	struct server_tls
	{
		bool enabled = false;
		std::optional<tls_config> config;
	};

	/*!
	 * \struct client_config
	 * \brief Where and how a client connects.
	 *
	 * ### Validation
	 * - tcp and udp families: the address must resolve.
	 * - unix families: refused on platforms without unix sockets.
	 * - TLS: tcp family only, with a non-empty server name.
	 * - any other network: invalid_protocol.
	 */
	struct client_config
	{
		protocol::network_protocol network = protocol::network_protocol::empty;
		std::string address;
		tls_settings tls;

		[[nodiscard]] auto validate() const -> VoidResult;

		//! \brief Base configuration merged under tls.config; nullptr clears it.
		auto default_tls(const tls_config* defaults) -> void;

		//! \brief {false, nullopt, ""} when TLS is disabled.
		[[nodiscard]] auto get_tls() const -> client_tls;

	private:
		std::optional<tls_config> default_tls_;
	};

	/*!
	 * \struct server_config
	 * \brief What a server binds and how it treats connections.
	 *
	 * perm_file and group_perm only apply to unix socket files;
	 * group_perm -1 keeps the process group. con_idle_timeout below one
	 * second disables idle closing.
	 */
	struct server_config
	{
		protocol::network_protocol network = protocol::network_protocol::empty;
		std::string address;
		tls_settings tls;

		file_mode perm_file;
		std::int32_t group_perm = -1;
		std::chrono::milliseconds con_idle_timeout{0};

		[[nodiscard]] auto validate() const -> VoidResult;

		auto default_tls(const tls_config* defaults) -> void;

		[[nodiscard]] auto get_tls() const -> server_tls;

	private:
		std::optional<tls_config> default_tls_;
	};

} // namespace netkit::config
