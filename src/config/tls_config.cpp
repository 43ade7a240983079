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

#include "netkit/config/tls_config.h"

#include <mutex>

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <openssl/ssl.h>

#include "netkit/integration/logger_integration.h"

namespace netkit::config
{
	namespace
	{
		using error_codes::socket::invalid_tls_config;

		std::mutex g_default_mutex;
		std::optional<tls_config> g_default;

		auto to_openssl_version(tls_version version) -> int
		{
			switch (version)
			{
			case tls_version::tls_1_0: return TLS1_VERSION;
			case tls_version::tls_1_1: return TLS1_1_VERSION;
			case tls_version::tls_1_2: return TLS1_2_VERSION;
			case tls_version::tls_1_3: return TLS1_3_VERSION;
			}
			return TLS1_2_VERSION;
		}

		auto tls_error(const std::string& message, const asio::error_code& ec = {})
			-> Result<std::shared_ptr<asio::ssl::context>>
		{
			NETKIT_LOG_ERROR("[tls_config] " + message + (ec ? ": " + ec.message() : ""));
			return error<std::shared_ptr<asio::ssl::context>>(
				invalid_tls_config, message, "tls_config", ec ? ec.message() : "");
		}

		/*!
		 * \brief Settings shared by both roles: protocol range, ciphers and
		 *        key password.
		 */
		auto apply_common(asio::ssl::context& ctx, const tls_config& config) -> bool
		{
			ctx.set_options(asio::ssl::context::default_workarounds |
							asio::ssl::context::no_sslv2 |
							asio::ssl::context::no_sslv3 |
							asio::ssl::context::single_dh_use);

			SSL_CTX* native_ctx = ctx.native_handle();
			if (SSL_CTX_set_min_proto_version(native_ctx, to_openssl_version(config.min_version)) != 1 ||
				SSL_CTX_set_max_proto_version(native_ctx, to_openssl_version(config.max_version)) != 1)
			{
				return false;
			}

			const std::string ciphers = config.cipher_list.value_or(std::string(default_tls_cipher_list));
			if (SSL_CTX_set_cipher_list(native_ctx, ciphers.c_str()) != 1)
			{
				return false;
			}

			if (config.private_key_password)
			{
				ctx.set_password_callback(
					[password = *config.private_key_password](
						std::size_t, asio::ssl::context::password_purpose) { return password; });
			}
			return true;
		}

		auto load_pairs(asio::ssl::context& ctx, const std::vector<certificate_pair>& pairs)
			-> asio::error_code
		{
			asio::error_code ec;
			for (const auto& pair : pairs)
			{
				if (pair.from_file)
				{
					ctx.use_certificate_chain_file(pair.certificate, ec);
					if (!ec) ctx.use_private_key_file(pair.private_key, asio::ssl::context::pem, ec);
				}
				else
				{
					ctx.use_certificate_chain(asio::buffer(pair.certificate), ec);
					if (!ec) ctx.use_private_key(asio::buffer(pair.private_key), asio::ssl::context::pem, ec);
				}
				if (ec) return ec;
			}
			return ec;
		}

		auto load_trust(asio::ssl::context& ctx, const tls_config& config, bool use_system_paths)
			-> asio::error_code
		{
			asio::error_code ec;
			for (const auto& pem : config.root_ca_pem)
			{
				ctx.add_certificate_authority(asio::buffer(pem), ec);
				if (ec) return ec;
			}
			if (config.ca_file)
			{
				ctx.load_verify_file(*config.ca_file, ec);
				if (ec) return ec;
			}
			if (config.ca_path)
			{
				ctx.add_verify_path(*config.ca_path, ec);
				if (ec) return ec;
			}
			if (use_system_paths && config.root_ca_pem.empty() && !config.ca_file && !config.ca_path)
			{
				ctx.set_default_verify_paths(ec);
			}
			return ec;
		}
	} // namespace

	auto tls_config::has_certificates() const -> bool
	{
		return !certificates.empty();
	}

	auto tls_config::is_valid() const -> bool
	{
		if (static_cast<int>(min_version) > static_cast<int>(max_version))
		{
			return false;
		}
		for (const auto& pair : certificates)
		{
			if (pair.certificate.empty() || pair.private_key.empty())
			{
				return false;
			}
		}
		return true;
	}

	auto tls_config::new_from(const tls_config* defaults) const -> tls_config
	{
		tls_config merged = *this;
		if (defaults == nullptr)
		{
			return merged;
		}

		if (merged.certificates.empty())
		{
			merged.certificates = defaults->certificates;
		}

		std::vector<std::string> roots = defaults->root_ca_pem;
		for (const auto& pem : root_ca_pem)
		{
			roots.push_back(pem);
		}
		merged.root_ca_pem = std::move(roots);

		if (!merged.ca_file) merged.ca_file = defaults->ca_file;
		if (!merged.ca_path) merged.ca_path = defaults->ca_path;
		if (!merged.cipher_list) merged.cipher_list = defaults->cipher_list;
		if (!merged.private_key_password) merged.private_key_password = defaults->private_key_password;

		return merged;
	}

	auto tls_config::make_server_context() const -> Result<std::shared_ptr<asio::ssl::context>>
	{
		if (!has_certificates())
		{
			return tls_error("server TLS requires at least one certificate pair");
		}
		if (!is_valid())
		{
			return tls_error("inconsistent TLS configuration");
		}

		try
		{
			auto ctx = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_server);
			if (!apply_common(*ctx, *this))
			{
				return tls_error("unsupported TLS version range or cipher list");
			}

			asio::error_code ec = load_pairs(*ctx, certificates);
			if (ec)
			{
				return tls_error("cannot load server certificate pair", ec);
			}

			if (verify_mode == certificate_verification::verify_fail_if_no_peer_cert)
			{
				ec = load_trust(*ctx, *this, false);
				if (!ec)
				{
					ctx->set_verify_mode(asio::ssl::verify_peer | asio::ssl::verify_fail_if_no_peer_cert, ec);
				}
			}
			else
			{
				ctx->set_verify_mode(asio::ssl::verify_none, ec);
			}
			if (ec)
			{
				return tls_error("cannot configure client certificate verification", ec);
			}

			return ok(std::move(ctx));
		}
		catch (const std::exception& e)
		{
			return tls_error(std::string("cannot create server TLS context: ") + e.what());
		}
	}

	auto tls_config::make_client_context() const -> Result<std::shared_ptr<asio::ssl::context>>
	{
		if (!is_valid())
		{
			return tls_error("inconsistent TLS configuration");
		}

		try
		{
			auto ctx = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
			if (!apply_common(*ctx, *this))
			{
				return tls_error("unsupported TLS version range or cipher list");
			}

			asio::error_code ec = load_pairs(*ctx, certificates);
			if (ec)
			{
				return tls_error("cannot load client certificate pair", ec);
			}

			if (verify_mode == certificate_verification::none)
			{
				ctx->set_verify_mode(asio::ssl::verify_none, ec);
			}
			else
			{
				ec = load_trust(*ctx, *this, true);
				if (!ec)
				{
					ctx->set_verify_mode(asio::ssl::verify_peer, ec);
				}
			}
			if (ec)
			{
				return tls_error("cannot configure server certificate verification", ec);
			}

			return ok(std::move(ctx));
		}
		catch (const std::exception& e)
		{
			return tls_error(std::string("cannot create client TLS context: ") + e.what());
		}
	}

	auto tls_config::set_global_default(std::optional<tls_config> config) -> void
	{
		std::lock_guard<std::mutex> lock(g_default_mutex);
		g_default = std::move(config);
	}

	auto tls_config::global_default() -> std::optional<tls_config>
	{
		std::lock_guard<std::mutex> lock(g_default_mutex);
		return g_default;
	}

} // namespace netkit::config
