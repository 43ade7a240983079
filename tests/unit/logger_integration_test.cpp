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
#include "netkit/netkit.h"
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace integration = netkit::integration;
using integration::log_level;

/**
 * @file logger_integration_test.cpp
 * @brief Unit tests for the logger hook and process-wide initialization
 */

namespace
{
	class capture_logger : public integration::logger_interface
	{
	public:
		explicit capture_logger(log_level min_level = log_level::trace) : min_level_(min_level) {}

		void write(const integration::log_record& record) override
		{
			std::lock_guard<std::mutex> lock(mutex_);
			records_.push_back(record);
		}

		bool is_level_enabled(log_level level) const override { return level >= min_level_; }

		void flush() override {}

		auto records() -> std::vector<integration::log_record>
		{
			std::lock_guard<std::mutex> lock(mutex_);
			return records_;
		}

	private:
		log_level min_level_;
		std::mutex mutex_;
		std::vector<integration::log_record> records_;
	};
} // namespace

// ============================================================================
// Logger Tests
// ============================================================================

class LoggerIntegrationTest : public ::testing::Test
{
protected:
	void TearDown() override
	{
		integration::logger_integration_manager::instance().set_logger(
			std::make_shared<integration::basic_logger>(log_level::warn));
	}
};

TEST_F(LoggerIntegrationTest, MacrosReachInstalledLogger)
{
	auto logger = std::make_shared<capture_logger>();
	integration::logger_integration_manager::instance().set_logger(logger);

	NETKIT_LOG_INFO("listening");
	NETKIT_LOG_ERROR("bind failed");

	auto records = logger->records();
	ASSERT_EQ(records.size(), 2u);
	EXPECT_EQ(records[0].level, log_level::info);
	EXPECT_EQ(records[0].message, "listening");
	EXPECT_EQ(records[0].file, "logger_integration_test.cpp");
	EXPECT_GT(records[0].line, 0);
	EXPECT_EQ(records[1].level, log_level::error);
}

TEST_F(LoggerIntegrationTest, DisabledLevelSkipsMessageBuilding)
{
	auto logger = std::make_shared<capture_logger>(log_level::warn);
	integration::logger_integration_manager::instance().set_logger(logger);

	int built = 0;
	auto message = [&built] {
		++built;
		return std::string("expensive");
	};

	NETKIT_LOG_DEBUG(message());
	NETKIT_LOG_WARN(message());

	EXPECT_EQ(built, 1);
	ASSERT_EQ(logger->records().size(), 1u);
	EXPECT_EQ(logger->records()[0].level, log_level::warn);
}

TEST_F(LoggerIntegrationTest, NullLoggerFallsBackToConsole)
{
	auto& manager = integration::logger_integration_manager::instance();
	manager.set_logger(nullptr);

	EXPECT_NE(manager.get_logger(), nullptr);
}

TEST_F(LoggerIntegrationTest, BasicLoggerLevelFilter)
{
	integration::basic_logger logger(log_level::warn);

	EXPECT_FALSE(logger.is_level_enabled(log_level::info));
	EXPECT_TRUE(logger.is_level_enabled(log_level::error));

	logger.set_min_level(log_level::trace);
	EXPECT_EQ(logger.min_level(), log_level::trace);
	EXPECT_TRUE(logger.is_level_enabled(log_level::debug));
}

TEST_F(LoggerIntegrationTest, BasicLoggerFormat)
{
	integration::log_record record;
	record.level = log_level::warn;
	record.message = "drain timed out";
	record.file = "tcp_server.cpp";
	record.line = 42;
	record.time = std::chrono::system_clock::now();

	auto line = integration::basic_logger::format(record);

	EXPECT_NE(line.find("WARN  [netkit] drain timed out (tcp_server.cpp:42)"), std::string::npos);
	EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST_F(LoggerIntegrationTest, LevelNames)
{
	EXPECT_STREQ(integration::to_string(log_level::debug), "DEBUG");
	EXPECT_STREQ(integration::to_string(log_level::fatal), "FATAL");
}

// ============================================================================
// Initialization Tests
// ============================================================================

class NetkitInitTest : public ::testing::Test
{
protected:
	void TearDown() override
	{
		if (netkit::is_initialized())
		{
			auto stopped = netkit::shutdown();
			EXPECT_TRUE(stopped.is_ok());
		}
		integration::logger_integration_manager::instance().set_logger(
			std::make_shared<integration::basic_logger>(log_level::warn));
	}
};

TEST_F(NetkitInitTest, InitializeAppliesSocketDefaults)
{
	auto config = netkit::config::netkit_config::testing();
	config.sockets.buffer_size = 4096;

	ASSERT_TRUE(netkit::initialize(config).is_ok());
	EXPECT_TRUE(netkit::is_initialized());
	EXPECT_EQ(netkit::active_socket_defaults().buffer_size, 4096u);

	ASSERT_TRUE(netkit::shutdown().is_ok());
	EXPECT_FALSE(netkit::is_initialized());
	EXPECT_EQ(netkit::active_socket_defaults().buffer_size,
			  netkit::config::socket_defaults{}.buffer_size);
}

TEST_F(NetkitInitTest, DoubleInitializeFails)
{
	ASSERT_TRUE(netkit::initialize(netkit::config::netkit_config::testing()).is_ok());

	auto again = netkit::initialize();
	ASSERT_TRUE(again.is_err());
	EXPECT_EQ(again.error().code, netkit::error_codes::common_errors::already_exists);
}

TEST_F(NetkitInitTest, ShutdownWithoutInitializeFails)
{
	auto stopped = netkit::shutdown();

	ASSERT_TRUE(stopped.is_err());
	EXPECT_EQ(stopped.error().code, netkit::error_codes::common_errors::not_initialized);
}
