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
 * @file tls_config.h
 * @brief Certificate material and protocol settings for TLS over TCP
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "netkit/types/result.h"

namespace asio::ssl
{
	class context;
}

namespace netkit::config
{
	/*!
	 * \enum tls_version
	 * \brief TLS protocol versions
	 */
	enum class tls_version : std::uint8_t {
		tls_1_0 = 10,  /*!< TLS 1.0 (deprecated, insecure) */
		tls_1_1 = 11,  /*!< TLS 1.1 (deprecated, insecure) */
		tls_1_2 = 12,  /*!< TLS 1.2 */
		tls_1_3 = 13   /*!< TLS 1.3 */
	};

	/*!
	 * \enum certificate_verification
	 * \brief Certificate verification modes
	 *
	 * Clients verify the server whenever the mode is not none. Servers only
	 * ask for a client certificate with verify_fail_if_no_peer_cert.
	 */
	enum class certificate_verification : std::uint8_t {
		none = 0,
		verify_peer = 1,
		verify_fail_if_no_peer_cert = 2
	};

	/*!
	 * \struct certificate_pair
	 * \brief One certificate chain with its private key, as PEM text or as
	 *        paths to PEM files.
	 */
	struct certificate_pair {
		std::string certificate;
		std::string private_key;
		bool from_file = false;

		static auto from_pem(std::string certificate_pem, std::string key_pem)
			-> certificate_pair {
			return certificate_pair{std::move(certificate_pem), std::move(key_pem), false};
		}

		static auto from_files(std::string certificate_file, std::string key_file)
			-> certificate_pair {
			return certificate_pair{std::move(certificate_file), std::move(key_file), true};
		}
	};

	/*!
	 * \struct tls_config
	 * \brief TLS settings consumed by TCP servers and clients.
	 *
	 * A server needs at least one certificate pair. A client needs trust
	 * anchors (root_ca_pem, ca_file or ca_path) unless verification is off;
	 * without any, the system default paths are used.
	 *
	 * ### Example Usage
	 * \code
	 * auto tls = tls_config::secure_defaults();
	 * tls.certificates.push_back(certificate_pair::from_files("srv.crt", "srv.key"));
	 * auto ctx = tls.make_server_context();
	 * \endcode
	 */
	struct tls_config {
		tls_version min_version = tls_version::tls_1_2;
		tls_version max_version = tls_version::tls_1_3;

		certificate_verification verify_mode = certificate_verification::verify_peer;

		std::vector<certificate_pair> certificates;

		/// Trust anchors given as PEM text
		std::vector<std::string> root_ca_pem;

		/// Path to CA certificate file (PEM format)
		std::optional<std::string> ca_file;

		/// Path to directory containing CA certificates
		std::optional<std::string> ca_path;

		/// Cipher suite list for TLS 1.2 and below (OpenSSL format)
		std::optional<std::string> cipher_list;

		/// Password for encrypted private keys
		std::optional<std::string> private_key_password;

		/// Timeout for TLS handshake in milliseconds
		std::size_t handshake_timeout_ms = 10000;

		[[nodiscard]] auto has_certificates() const -> bool;

		/*!
		 * \brief Structural checks only: version range and non-empty
		 *        certificate entries. No file is opened.
		 */
		[[nodiscard]] auto is_valid() const -> bool;

		/*!
		 * \brief Merges this configuration over \p defaults.
		 *
		 * Own certificates win when present, trust anchors are the union,
		 * optional settings fall back to the default. A null \p defaults
		 * returns a copy of this configuration.
		 */
		[[nodiscard]] auto new_from(const tls_config* defaults) const -> tls_config;

		/*!
		 * \brief Builds a server context.
		 * \return invalid_tls_config without certificates or when OpenSSL
		 *         rejects the material.
		 */
		[[nodiscard]] auto make_server_context() const
			-> Result<std::shared_ptr<asio::ssl::context>>;

		//! \brief Builds a client context; peer name checks are per connection.
		[[nodiscard]] auto make_client_context() const
			-> Result<std::shared_ptr<asio::ssl::context>>;

		/*!
		 * \brief Creates a configuration with verification disabled
		 *
		 * WARNING: only for development and tests.
		 */
		[[nodiscard]] static auto insecure_for_testing() -> tls_config {
			tls_config config;
			config.verify_mode = certificate_verification::none;
			return config;
		}

		[[nodiscard]] static auto secure_defaults() -> tls_config {
			tls_config config;
			config.min_version = tls_version::tls_1_3;
			config.verify_mode = certificate_verification::verify_peer;
			return config;
		}

		[[nodiscard]] static auto legacy_compatible() -> tls_config {
			tls_config config;
			config.min_version = tls_version::tls_1_2;
			config.verify_mode = certificate_verification::verify_peer;
			return config;
		}

		//! \brief Installs (or clears with nullopt) the process-wide default.
		static auto set_global_default(std::optional<tls_config> config) -> void;

		[[nodiscard]] static auto global_default() -> std::optional<tls_config>;
	};

	inline constexpr std::string_view default_tls_cipher_list =
		"ECDHE-ECDSA-AES256-GCM-SHA384:"
		"ECDHE-RSA-AES256-GCM-SHA384:"
		"ECDHE-ECDSA-AES128-GCM-SHA256:"
		"ECDHE-RSA-AES128-GCM-SHA256:"
		"ECDHE-RSA-CHACHA20-POLY1305";

} // namespace netkit::config
