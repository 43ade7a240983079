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

#include "netkit/io/progress_file.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/resource.h>

namespace io = netkit::io;
namespace codes = netkit::error_codes;

/**
 * @file progress_file_test.cpp
 * @brief Unit tests for instrumented file I/O and its callbacks
 *
 * Tests validate:
 * - increment callbacks sum to the transferred size
 * - the EOF callback fires when reading reaches the end
 * - seek, truncate and reset report (size, position) to the reset callback
 * - temporary files disappear on close
 */

namespace
{
	auto bytes(const std::string& text) -> std::vector<std::uint8_t>
	{
		return std::vector<std::uint8_t>(text.begin(), text.end());
	}

	//! \brief Caps the process file size so a write stops midway with EFBIG.
	class file_size_limit
	{
	public:
		explicit file_size_limit(rlim_t bytes)
		{
			previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);
			::getrlimit(RLIMIT_FSIZE, &previous_);
			rlimit capped = previous_;
			capped.rlim_cur = bytes;
			::setrlimit(RLIMIT_FSIZE, &capped);
		}

		~file_size_limit()
		{
			::setrlimit(RLIMIT_FSIZE, &previous_);
			std::signal(SIGXFSZ, previous_handler_);
		}

	private:
		rlimit previous_{};
		void (*previous_handler_)(int) = SIG_DFL;
	};

	//! \brief In-memory reader producing \p data in chunks of \p chunk.
	class memory_reader : public io::reader
	{
	public:
		memory_reader(std::vector<std::uint8_t> data, std::size_t chunk)
			: data_(std::move(data)), chunk_(chunk)
		{
		}

		auto read(std::span<std::uint8_t> buffer) -> netkit::Result<std::size_t> override
		{
			if (offset_ >= data_.size())
			{
				return netkit::error<std::size_t>(codes::io::end_of_file, "end of data");
			}
			const auto count = std::min({buffer.size(), chunk_, data_.size() - offset_});
			std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), count,
						buffer.begin());
			offset_ += count;
			return netkit::ok(count);
		}

	private:
		std::vector<std::uint8_t> data_;
		std::size_t chunk_;
		std::size_t offset_ = 0;
	};

	class memory_writer : public io::writer
	{
	public:
		auto write(std::span<const std::uint8_t> data) -> netkit::Result<std::size_t> override
		{
			out.insert(out.end(), data.begin(), data.end());
			return netkit::ok(data.size());
		}

		std::vector<std::uint8_t> out;
	};
} // namespace

// ============================================================================
// Fixture
// ============================================================================

class ProgressFileTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		auto file = io::progress_file::temp("netkit-progress-*.dat");
		ASSERT_TRUE(file.is_ok()) << netkit::to_string(file.error());
		file_ = std::move(file.value());
	}

	auto fill(const std::string& text) -> void
	{
		ASSERT_TRUE(file_->write_string(text).is_ok());
		ASSERT_TRUE(file_->seek(0, io::seek_origin::begin).is_ok());
	}

	io::progress_file::pointer file_;
};

// ============================================================================
// Creation Tests
// ============================================================================

TEST_F(ProgressFileTest, TempFileLivesInTempDirectory)
{
	EXPECT_TRUE(file_->is_temp());
	EXPECT_TRUE(std::filesystem::exists(file_->path()));

	const auto name = std::filesystem::path(file_->path()).filename().string();
	EXPECT_EQ(name.rfind("netkit-progress-", 0), 0u);
	EXPECT_EQ(name.substr(name.size() - 4), ".dat");
}

TEST_F(ProgressFileTest, TempFileRemovedOnClose)
{
	const auto path = file_->path();

	ASSERT_TRUE(file_->close().is_ok());

	EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ProgressFileTest, SecondCloseReportsClosed)
{
	ASSERT_TRUE(file_->close().is_ok());

	auto again = file_->close();
	ASSERT_TRUE(again.is_err());
	EXPECT_EQ(again.error().code, codes::io::file_closed);

	auto read = file_->read_byte();
	ASSERT_TRUE(read.is_err());
	EXPECT_EQ(read.error().code, codes::io::file_closed);
}

TEST_F(ProgressFileTest, PatternWithSeparatorIsRejected)
{
	auto bad = io::progress_file::temp("sub/dir-*");

	ASSERT_TRUE(bad.is_err());
	EXPECT_EQ(bad.error().code, codes::common_errors::invalid_argument);
}

TEST_F(ProgressFileTest, OpenMissingFileFails)
{
	auto missing = io::progress_file::open("/nonexistent/netkit/file.bin");

	ASSERT_TRUE(missing.is_err());
	EXPECT_EQ(missing.error().code, codes::io::open_failed);
}

TEST_F(ProgressFileTest, UniqueFileIsKeptOnClose)
{
	const auto dir = std::filesystem::temp_directory_path().string();
	auto file = io::progress_file::unique(dir, "netkit-unique-*.txt");
	ASSERT_TRUE(file.is_ok());

	const auto path = file.value()->path();
	EXPECT_FALSE(file.value()->is_temp());
	ASSERT_TRUE(file.value()->close().is_ok());
	EXPECT_TRUE(std::filesystem::exists(path));

	auto reopened = io::progress_file::make(path, O_RDWR, 0);
	ASSERT_TRUE(reopened.is_ok());
	EXPECT_TRUE(reopened.value()->close_delete().is_ok());
	EXPECT_FALSE(std::filesystem::exists(path));
}

// ============================================================================
// Callback Tests
// ============================================================================

TEST_F(ProgressFileTest, IncrementsSumToFileSize)
{
	const std::string content(10000, 'a');
	fill(content);

	std::int64_t total = 0;
	int eof_calls = 0;
	file_->register_increment([&total](std::int64_t size) { total += size; });
	file_->register_eof([&eof_calls] { ++eof_calls; });

	memory_writer sink;
	file_->set_buffer_size(1024);
	auto copied = file_->write_to(sink);

	ASSERT_TRUE(copied.is_ok());
	EXPECT_EQ(copied.value(), 10000);
	EXPECT_EQ(total, 10000);
	EXPECT_EQ(eof_calls, 1);
	EXPECT_EQ(sink.out.size(), content.size());
}

TEST_F(ProgressFileTest, ReadReportsEndOfFile)
{
	fill("xy");

	std::vector<std::uint8_t> buffer(8);
	auto first = file_->read(buffer);
	ASSERT_TRUE(first.is_ok());
	EXPECT_EQ(first.value(), 2u);

	auto second = file_->read(buffer);
	ASSERT_TRUE(second.is_err());
	EXPECT_TRUE(io::is_eof(second));
}

TEST_F(ProgressFileTest, ReadFromCountsWrites)
{
	std::int64_t total = 0;
	bool eof = false;
	file_->register_increment([&total](std::int64_t size) { total += size; });
	file_->register_eof([&eof] { eof = true; });

	memory_reader source(bytes(std::string(5000, 'z')), 700);
	auto copied = file_->read_from(source);

	ASSERT_TRUE(copied.is_ok());
	EXPECT_EQ(copied.value(), 5000);
	EXPECT_EQ(total, 5000);
	EXPECT_TRUE(eof);

	auto info = file_->stat();
	ASSERT_TRUE(info.is_ok());
	EXPECT_EQ(info.value().size, 5000);
	EXPECT_TRUE(info.value().is_regular);
}

TEST_F(ProgressFileTest, SeekReportsSizeAndPosition)
{
	fill("0123456789");

	std::int64_t size = -1;
	std::int64_t current = -1;
	file_->register_reset([&](std::int64_t s, std::int64_t c) {
		size = s;
		current = c;
	});

	auto pos = file_->seek(4, io::seek_origin::begin);
	ASSERT_TRUE(pos.is_ok());
	EXPECT_EQ(pos.value(), 4);
	EXPECT_EQ(size, 10);
	EXPECT_EQ(current, 4);

	pos = file_->seek(-2, io::seek_origin::end);
	ASSERT_TRUE(pos.is_ok());
	EXPECT_EQ(pos.value(), 8);
	EXPECT_EQ(current, 8);
}

TEST_F(ProgressFileTest, TruncateReportsNewSize)
{
	fill("0123456789");

	std::int64_t size = -1;
	file_->register_reset([&size](std::int64_t s, std::int64_t) { size = s; });

	ASSERT_TRUE(file_->truncate(3).is_ok());

	EXPECT_EQ(size, 3);
	EXPECT_EQ(file_->stat().value().size, 3);
}

TEST_F(ProgressFileTest, ResetWithExplicitMax)
{
	fill("abc");

	std::int64_t size = -1;
	file_->register_reset([&size](std::int64_t s, std::int64_t) { size = s; });

	file_->reset(1000);
	EXPECT_EQ(size, 1000);

	file_->reset(0);
	EXPECT_EQ(size, 3);
}

TEST_F(ProgressFileTest, RemainingSizes)
{
	fill("0123456789");
	ASSERT_TRUE(file_->seek(3, io::seek_origin::begin).is_ok());

	EXPECT_EQ(file_->size_bof().value(), 3);
	EXPECT_EQ(file_->size_eof().value(), 7);
}

TEST_F(ProgressFileTest, PositionalIo)
{
	ASSERT_TRUE(file_->write_at(bytes("hello"), 0).is_ok());
	ASSERT_TRUE(file_->write_at(bytes("J"), 0).is_ok());

	std::vector<std::uint8_t> buffer(5);
	auto n = file_->read_at(buffer, 0);
	ASSERT_TRUE(n.is_ok());
	EXPECT_EQ(std::string(buffer.begin(), buffer.end()), "Jello");

	auto beyond = file_->read_at(buffer, 100);
	EXPECT_TRUE(io::is_eof(beyond));
}

TEST_F(ProgressFileTest, FailedWritesReportBytesAlreadyWritten)
{
	std::int64_t total = 0;
	file_->register_increment([&total](std::int64_t size) { total += size; });
	const std::vector<std::uint8_t> payload(8192, 0x41);

	{
		file_size_limit limit(4096);

		auto positional = file_->write_at(payload, 0);
		ASSERT_TRUE(positional.is_err());
		EXPECT_EQ(total, 4096);

		ASSERT_TRUE(file_->seek(0, io::seek_origin::begin).is_ok());
		auto sequential = file_->write(payload);
		ASSERT_TRUE(sequential.is_err());
		EXPECT_EQ(total, 8192);
	}
}

TEST_F(ProgressFileTest, ByteHelpers)
{
	ASSERT_TRUE(file_->write_byte('k').is_ok());
	ASSERT_TRUE(file_->seek(0, io::seek_origin::begin).is_ok());

	auto value = file_->read_byte();
	ASSERT_TRUE(value.is_ok());
	EXPECT_EQ(value.value(), 'k');
}

TEST_F(ProgressFileTest, BufferSizeFallsBackBelowMinimum)
{
	file_->set_buffer_size(10);
	EXPECT_EQ(file_->buffer_size(), io::default_buffer_size);

	file_->set_buffer_size(4096);
	EXPECT_EQ(file_->buffer_size(), 4096u);
}

TEST_F(ProgressFileTest, SetRegisterProgressCopiesCallbacks)
{
	std::int64_t total = 0;
	file_->register_increment([&total](std::int64_t size) { total += size; });

	auto other = io::progress_file::temp("netkit-progress-copy-*");
	ASSERT_TRUE(other.is_ok());
	file_->set_register_progress(*other.value());

	ASSERT_TRUE(other.value()->write_string("copied").is_ok());
	EXPECT_EQ(total, 6);
}
