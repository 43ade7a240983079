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
#include <gtest/gtest.h>

#include <asio.hpp>
#include <asio/ssl.hpp>

#include "../helpers/test_certificates.h"

namespace cfg = netkit::config;
namespace codes = netkit::error_codes;
using netkit::testing::test_certificate_generator;

/**
 * @file tls_config_test.cpp
 * @brief Unit tests for TLS presets, merging and context construction
 */

// ============================================================================
// Structure Tests
// ============================================================================

class TlsConfigTest : public ::testing::Test
{
protected:
	static auto with_certificate() -> cfg::tls_config
	{
		const auto& pair = test_certificate_generator::shared();
		cfg::tls_config tls;
		tls.certificates.push_back(
			cfg::certificate_pair::from_pem(pair.certificate_pem, pair.private_key_pem));
		return tls;
	}
};

TEST_F(TlsConfigTest, Presets)
{
	EXPECT_EQ(cfg::tls_config::secure_defaults().min_version, cfg::tls_version::tls_1_3);
	EXPECT_EQ(cfg::tls_config::legacy_compatible().min_version, cfg::tls_version::tls_1_2);
	EXPECT_EQ(cfg::tls_config::insecure_for_testing().verify_mode,
			  cfg::certificate_verification::none);
}

TEST_F(TlsConfigTest, ValidityChecks)
{
	cfg::tls_config tls;
	EXPECT_TRUE(tls.is_valid());
	EXPECT_FALSE(tls.has_certificates());

	tls.min_version = cfg::tls_version::tls_1_3;
	tls.max_version = cfg::tls_version::tls_1_2;
	EXPECT_FALSE(tls.is_valid());

	cfg::tls_config incomplete;
	incomplete.certificates.push_back(cfg::certificate_pair::from_files("server.crt", ""));
	EXPECT_FALSE(incomplete.is_valid());
}

TEST_F(TlsConfigTest, NewFromKeepsOwnCertificates)
{
	cfg::tls_config defaults = with_certificate();
	defaults.ca_file = "/etc/ssl/ca.pem";

	cfg::tls_config own;
	own.certificates.push_back(cfg::certificate_pair::from_files("own.crt", "own.key"));

	auto merged = own.new_from(&defaults);
	ASSERT_EQ(merged.certificates.size(), 1u);
	EXPECT_EQ(merged.certificates[0].certificate, "own.crt");
	EXPECT_EQ(merged.ca_file, defaults.ca_file);
}

TEST_F(TlsConfigTest, NewFromBorrowsMissingCertificates)
{
	cfg::tls_config defaults = with_certificate();
	cfg::tls_config own;
	own.ca_path = "/etc/ssl/certs";

	auto merged = own.new_from(&defaults);
	EXPECT_TRUE(merged.has_certificates());
	EXPECT_EQ(merged.ca_path, own.ca_path);

	auto copy = own.new_from(nullptr);
	EXPECT_FALSE(copy.has_certificates());
}

// ============================================================================
// Context Construction Tests
// ============================================================================

TEST_F(TlsConfigTest, ServerContextNeedsCertificates)
{
	cfg::tls_config tls;

	auto context = tls.make_server_context();
	ASSERT_TRUE(context.is_err());
	EXPECT_EQ(context.error().code, codes::socket::invalid_tls_config);
}

TEST_F(TlsConfigTest, ServerContextFromPem)
{
	auto context = with_certificate().make_server_context();

	ASSERT_TRUE(context.is_ok());
	EXPECT_NE(context.value(), nullptr);
}

TEST_F(TlsConfigTest, ServerContextRejectsBadPem)
{
	cfg::tls_config tls;
	tls.certificates.push_back(cfg::certificate_pair::from_pem("not a certificate", "not a key"));

	auto context = tls.make_server_context();
	ASSERT_TRUE(context.is_err());
	EXPECT_EQ(context.error().code, codes::socket::invalid_tls_config);
}

TEST_F(TlsConfigTest, ServerContextRejectsMissingFiles)
{
	cfg::tls_config tls;
	tls.certificates.push_back(cfg::certificate_pair::from_files("/nonexistent/netkit.crt",
																 "/nonexistent/netkit.key"));

	EXPECT_TRUE(tls.make_server_context().is_err());
}

TEST_F(TlsConfigTest, ClientContextWithRootPem)
{
	cfg::tls_config tls;
	tls.root_ca_pem.push_back(test_certificate_generator::shared().certificate_pem);

	auto context = tls.make_client_context();
	ASSERT_TRUE(context.is_ok());
}

TEST_F(TlsConfigTest, ClientContextWithoutVerification)
{
	auto context = cfg::tls_config::insecure_for_testing().make_client_context();

	EXPECT_TRUE(context.is_ok());
}

// ============================================================================
// Global Default Tests
// ============================================================================

TEST_F(TlsConfigTest, GlobalDefaultCanBeClearedAgain)
{
	EXPECT_FALSE(cfg::tls_config::global_default().has_value());

	cfg::tls_config::set_global_default(cfg::tls_config::secure_defaults());
	ASSERT_TRUE(cfg::tls_config::global_default().has_value());
	EXPECT_EQ(cfg::tls_config::global_default()->min_version, cfg::tls_version::tls_1_3);

	cfg::tls_config::set_global_default(std::nullopt);
	EXPECT_FALSE(cfg::tls_config::global_default().has_value());
}
