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

#include <cerrno>
#include <filesystem>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "netkit/integration/logger_integration.h"

namespace netkit::io
{
	namespace
	{
		using error_codes::io::end_of_file;
		using error_codes::io::file_closed;
		using error_codes::io::invalid_whence;
		using error_codes::io::io_failed;
		using error_codes::io::open_failed;

		constexpr const char* kSource = "progress_file";

		auto errno_text(int err) -> std::string
		{
			return std::system_category().message(err);
		}

		template<typename T>
		auto io_error(const std::string& what) -> Result<T>
		{
			const int err = errno;
			return error<T>(io_failed, what, kSource, errno_text(err));
		}

		auto io_error_void(const std::string& what) -> VoidResult
		{
			const int err = errno;
			return error_void(io_failed, what, kSource, errno_text(err));
		}

		auto open_fd(const std::string& path, int flags, std::uint32_t mode) -> Result<int>
		{
			int fd = -1;
			do
			{
				fd = ::open(path.c_str(), flags | O_CLOEXEC, static_cast<mode_t>(mode));
			} while (fd < 0 && errno == EINTR);

			if (fd < 0)
			{
				const int err = errno;
				return error<int>(open_failed, "cannot open " + path, kSource, errno_text(err));
			}
			return ok(fd);
		}

		/*!
		 * \brief mkstemps over "<dir>/<prefix>XXXXXX<suffix>" where prefix
		 *        and suffix surround the last '*' of \p pattern.
		 */
		auto create_unique(const std::string& dir, const std::string& pattern)
			-> Result<std::pair<int, std::string>>
		{
			using result_type = std::pair<int, std::string>;

			if (pattern.find('/') != std::string::npos)
			{
				return error<result_type>(error_codes::common_errors::invalid_argument,
										  "pattern contains path separator", kSource, pattern);
			}

			std::string prefix = pattern;
			std::string suffix;
			if (auto star = pattern.rfind('*'); star != std::string::npos)
			{
				prefix = pattern.substr(0, star);
				suffix = pattern.substr(star + 1);
			}

			std::string base = dir.empty() ? std::string(".") : dir;
			if (base.back() != '/')
			{
				base.push_back('/');
			}

			std::string name = base + prefix + "XXXXXX" + suffix;
			std::vector<char> buffer(name.begin(), name.end());
			buffer.push_back('\0');

			const int fd = ::mkstemps(buffer.data(), static_cast<int>(suffix.size()));
			if (fd < 0)
			{
				const int err = errno;
				return error<result_type>(open_failed, "cannot create file in " + base, kSource,
										  errno_text(err));
			}
			::fcntl(fd, F_SETFD, FD_CLOEXEC);
			return ok(result_type{fd, std::string(buffer.data())});
		}
	} // namespace

	progress_file::progress_file(int fd, std::string path, bool temp)
		: fd_(fd), path_(std::move(path)), temp_(temp)
	{
	}

	progress_file::~progress_file()
	{
		if (fd_ >= 0)
		{
			auto closed = close();
			if (closed.is_err())
			{
				NETKIT_LOG_WARN("[progress_file] " + to_string(closed.error()));
			}
		}
	}

	auto progress_file::open(const std::string& path) -> Result<pointer>
	{
		auto fd = open_fd(path, O_RDONLY, 0);
		if (fd.is_err())
		{
			return forward_error<pointer>(fd);
		}
		return ok(pointer(new progress_file(fd.value(), path, false)));
	}

	auto progress_file::create(const std::string& path) -> Result<pointer>
	{
		return make(path, O_RDWR | O_CREAT | O_TRUNC, 0666);
	}

	auto progress_file::make(const std::string& path, int flags, std::uint32_t mode)
		-> Result<pointer>
	{
		auto fd = open_fd(path, flags, mode);
		if (fd.is_err())
		{
			return forward_error<pointer>(fd);
		}
		return ok(pointer(new progress_file(fd.value(), path, false)));
	}

	auto progress_file::temp(const std::string& pattern) -> Result<pointer>
	{
		std::error_code ec;
		auto dir = std::filesystem::temp_directory_path(ec);
		if (ec)
		{
			return error<pointer>(open_failed, "no temporary directory", kSource, ec.message());
		}

		auto created = create_unique(dir.string(), pattern);
		if (created.is_err())
		{
			return forward_error<pointer>(created);
		}
		return ok(pointer(new progress_file(created.value().first, created.value().second, true)));
	}

	auto progress_file::unique(const std::string& base_path, const std::string& pattern)
		-> Result<pointer>
	{
		auto created = create_unique(base_path, pattern);
		if (created.is_err())
		{
			return forward_error<pointer>(created);
		}
		return ok(pointer(new progress_file(created.value().first, created.value().second, false)));
	}

	auto progress_file::ensure_open() const -> VoidResult
	{
		if (fd_ < 0)
		{
			return error_void(file_closed, "file already closed", kSource, path_);
		}
		return ok();
	}

	auto progress_file::read(std::span<std::uint8_t> buffer) -> Result<std::size_t>
	{
		if (auto opened = ensure_open(); opened.is_err())
		{
			return forward_error<std::size_t>(opened);
		}
		if (buffer.empty())
		{
			return ok(std::size_t{0});
		}

		ssize_t n = 0;
		do
		{
			n = ::read(fd_, buffer.data(), buffer.size());
		} while (n < 0 && errno == EINTR);

		if (n < 0)
		{
			return io_error<std::size_t>("read failed");
		}
		if (n == 0)
		{
			notify_eof();
			return error<std::size_t>(end_of_file, "end of file", kSource, path_);
		}

		notify_increment(n);
		return ok(static_cast<std::size_t>(n));
	}

	auto progress_file::read_at(std::span<std::uint8_t> buffer, std::int64_t offset)
		-> Result<std::size_t>
	{
		if (auto opened = ensure_open(); opened.is_err())
		{
			return forward_error<std::size_t>(opened);
		}

		ssize_t n = 0;
		do
		{
			n = ::pread(fd_, buffer.data(), buffer.size(), static_cast<off_t>(offset));
		} while (n < 0 && errno == EINTR);

		if (n < 0)
		{
			return io_error<std::size_t>("read failed");
		}
		if (n == 0 && !buffer.empty())
		{
			notify_eof();
			return error<std::size_t>(end_of_file, "end of file", kSource, path_);
		}

		notify_increment(n);
		return ok(static_cast<std::size_t>(n));
	}

	auto progress_file::read_byte() -> Result<std::uint8_t>
	{
		std::uint8_t value = 0;
		auto n = read(std::span<std::uint8_t>(&value, 1));
		if (n.is_err())
		{
			return forward_error<std::uint8_t>(n);
		}
		return ok(value);
	}

	auto progress_file::read_from(reader& source) -> Result<std::int64_t>
	{
		if (auto opened = ensure_open(); opened.is_err())
		{
			return forward_error<std::int64_t>(opened);
		}

		std::vector<std::uint8_t> buffer(buffer_size());
		std::int64_t total = 0;

		for (;;)
		{
			auto n = source.read(buffer);
			if (n.is_err())
			{
				if (is_eof(n))
				{
					notify_eof();
					return ok(total);
				}
				return forward_error<std::int64_t>(n);
			}

			auto written = write(std::span<const std::uint8_t>(buffer.data(), n.value()));
			if (written.is_err())
			{
				return forward_error<std::int64_t>(written);
			}
			total += static_cast<std::int64_t>(written.value());
		}
	}

	auto progress_file::write(std::span<const std::uint8_t> data) -> Result<std::size_t>
	{
		if (auto opened = ensure_open(); opened.is_err())
		{
			return forward_error<std::size_t>(opened);
		}

		std::size_t done = 0;
		while (done < data.size())
		{
			const ssize_t n = ::write(fd_, data.data() + done, data.size() - done);
			if (n < 0)
			{
				if (errno == EINTR)
				{
					continue;
				}
				if (done > 0)
				{
					notify_increment(static_cast<std::int64_t>(done));
				}
				return io_error<std::size_t>("write failed");
			}
			done += static_cast<std::size_t>(n);
		}

		notify_increment(static_cast<std::int64_t>(done));
		return ok(done);
	}

	auto progress_file::write_at(std::span<const std::uint8_t> data, std::int64_t offset)
		-> Result<std::size_t>
	{
		if (auto opened = ensure_open(); opened.is_err())
		{
			return forward_error<std::size_t>(opened);
		}

		std::size_t done = 0;
		while (done < data.size())
		{
			const ssize_t n = ::pwrite(fd_, data.data() + done, data.size() - done,
									   static_cast<off_t>(offset) + static_cast<off_t>(done));
			if (n < 0)
			{
				if (errno == EINTR)
				{
					continue;
				}
				if (done > 0)
				{
					notify_increment(static_cast<std::int64_t>(done));
				}
				return io_error<std::size_t>("write failed");
			}
			done += static_cast<std::size_t>(n);
		}

		notify_increment(static_cast<std::int64_t>(done));
		return ok(done);
	}

	auto progress_file::write_string(std::string_view text) -> Result<std::size_t>
	{
		return write(std::span<const std::uint8_t>(
			reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
	}

	auto progress_file::write_byte(std::uint8_t value) -> VoidResult
	{
		auto n = write(std::span<const std::uint8_t>(&value, 1));
		if (n.is_err())
		{
			return forward_error<std::monostate>(n);
		}
		return ok();
	}

	auto progress_file::write_to(writer& target) -> Result<std::int64_t>
	{
		std::vector<std::uint8_t> buffer(buffer_size());
		std::int64_t total = 0;

		for (;;)
		{
			auto n = read(buffer);
			if (n.is_err())
			{
				if (is_eof(n))
				{
					return ok(total);
				}
				return forward_error<std::int64_t>(n);
			}

			auto written = target.write(std::span<const std::uint8_t>(buffer.data(), n.value()));
			if (written.is_err())
			{
				return forward_error<std::int64_t>(written);
			}
			total += static_cast<std::int64_t>(written.value());
		}
	}

	auto progress_file::seek(std::int64_t offset, seek_origin origin) -> Result<std::int64_t>
	{
		if (auto opened = ensure_open(); opened.is_err())
		{
			return forward_error<std::int64_t>(opened);
		}

		int whence = SEEK_SET;
		switch (origin)
		{
		case seek_origin::begin: whence = SEEK_SET; break;
		case seek_origin::current: whence = SEEK_CUR; break;
		case seek_origin::end: whence = SEEK_END; break;
		default:
			return error<std::int64_t>(invalid_whence, "invalid seek origin", kSource);
		}

		const off_t pos = ::lseek(fd_, static_cast<off_t>(offset), whence);
		if (pos < 0)
		{
			return io_error<std::int64_t>("seek failed");
		}

		reset(0);
		return ok(static_cast<std::int64_t>(pos));
	}

	auto progress_file::truncate(std::int64_t size) -> VoidResult
	{
		if (auto opened = ensure_open(); opened.is_err())
		{
			return opened;
		}

		int rc = 0;
		do
		{
			rc = ::ftruncate(fd_, static_cast<off_t>(size));
		} while (rc < 0 && errno == EINTR);

		if (rc < 0)
		{
			return io_error_void("truncate failed");
		}

		reset(size);
		return ok();
	}

	auto progress_file::sync() -> VoidResult
	{
		if (auto opened = ensure_open(); opened.is_err())
		{
			return opened;
		}
		if (::fsync(fd_) < 0)
		{
			return io_error_void("sync failed");
		}
		return ok();
	}

	auto progress_file::close() -> VoidResult
	{
		if (fd_ < 0)
		{
			return error_void(file_closed, "file already closed", kSource, path_);
		}

		const int fd = fd_;
		fd_ = -1;

		if (::close(fd) < 0)
		{
			auto failed = io_error_void("close failed");
			if (temp_)
			{
				::unlink(path_.c_str());
			}
			return failed;
		}

		if (temp_ && ::unlink(path_.c_str()) < 0 && errno != ENOENT)
		{
			return io_error_void("cannot remove temporary file");
		}
		return ok();
	}

	auto progress_file::close_delete() -> VoidResult
	{
		if (fd_ >= 0)
		{
			auto closed = close();
			if (closed.is_err())
			{
				return closed;
			}
		}

		if (::unlink(path_.c_str()) < 0 && errno != ENOENT)
		{
			return io_error_void("cannot remove file");
		}
		return ok();
	}

	auto progress_file::stat() const -> Result<file_info>
	{
		if (auto opened = ensure_open(); opened.is_err())
		{
			return forward_error<file_info>(opened);
		}

		struct ::stat st {};
		if (::fstat(fd_, &st) < 0)
		{
			return io_error<file_info>("stat failed");
		}

		file_info info;
		info.path = path_;
		info.size = static_cast<std::int64_t>(st.st_size);
		info.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
		info.is_regular = S_ISREG(st.st_mode);
		info.modified = std::chrono::system_clock::from_time_t(st.st_mtime);
		return ok(std::move(info));
	}

	auto progress_file::position() const -> Result<std::int64_t>
	{
		if (auto opened = ensure_open(); opened.is_err())
		{
			return forward_error<std::int64_t>(opened);
		}

		const off_t pos = ::lseek(fd_, 0, SEEK_CUR);
		if (pos < 0)
		{
			return io_error<std::int64_t>("cannot read file position");
		}
		return ok(static_cast<std::int64_t>(pos));
	}

	auto progress_file::size_bof() const -> Result<std::int64_t>
	{
		return position();
	}

	auto progress_file::size_eof() const -> Result<std::int64_t>
	{
		auto pos = position();
		if (pos.is_err())
		{
			return pos;
		}
		auto info = stat();
		if (info.is_err())
		{
			return forward_error<std::int64_t>(info);
		}
		const auto remaining = info.value().size - pos.value();
		return ok(remaining > 0 ? remaining : std::int64_t{0});
	}

	auto progress_file::register_increment(increment_callback_t callback) -> void
	{
		callbacks_.set<0>(std::move(callback));
	}

	auto progress_file::register_reset(reset_callback_t callback) -> void
	{
		callbacks_.set<1>(std::move(callback));
	}

	auto progress_file::register_eof(eof_callback_t callback) -> void
	{
		callbacks_.set<2>(std::move(callback));
	}

	auto progress_file::set_buffer_size(std::int32_t size) -> void
	{
		buffer_size_.store(size < min_buffer_size ? 0 : size);
	}

	auto progress_file::buffer_size() const -> std::size_t
	{
		const auto size = buffer_size_.load();
		return size < min_buffer_size ? default_buffer_size : static_cast<std::size_t>(size);
	}

	auto progress_file::set_register_progress(progress_file& other) const -> void
	{
		other.callbacks_.assign_from(callbacks_);
	}

	auto progress_file::reset(std::int64_t max) -> void
	{
		auto callback = callbacks_.get<1>();
		if (!callback)
		{
			return;
		}

		std::int64_t size = max;
		if (size == 0)
		{
			auto info = stat();
			size = info.is_ok() ? info.value().size : 0;
		}

		auto pos = position();
		callback(size, pos.is_ok() ? pos.value() : 0);
	}

	auto progress_file::notify_increment(std::int64_t size) -> void
	{
		callbacks_.invoke<0>(size);
	}

	auto progress_file::notify_eof() -> void
	{
		callbacks_.invoke<2>();
	}

} // namespace netkit::io
