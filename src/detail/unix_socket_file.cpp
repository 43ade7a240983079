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

#include "netkit/detail/unix_socket_file.h"

#include <cerrno>
#include <filesystem>
#include <system_error>

#include <sys/stat.h>
#include <unistd.h>

#include "netkit/integration/logger_integration.h"

namespace netkit::detail
{
	namespace
	{
		constexpr const char* kSource = "unix_socket_file";
	}

	auto prepare_socket_path(const std::string& path) -> VoidResult
	{
		std::error_code ec;
		const auto status = std::filesystem::symlink_status(path, ec);
		if (ec || !std::filesystem::exists(status))
		{
			return ok();
		}

		if (!std::filesystem::is_socket(status))
		{
			return error_void(error_codes::socket::bind_failed,
							  "path exists and is not a socket", kSource, path);
		}

		if (!std::filesystem::remove(path, ec) && ec)
		{
			return error_void(error_codes::socket::bind_failed, "cannot remove stale socket file",
							  kSource, ec.message());
		}
		NETKIT_LOG_DEBUG("[unix_socket_file] removed stale socket " + path);
		return ok();
	}

	auto apply_socket_permissions(const std::string& path, const config::file_mode& mode,
								  std::int32_t group) -> VoidResult
	{
		if (mode.is_set() && ::chmod(path.c_str(), static_cast<mode_t>(mode.bits())) != 0)
		{
			const int err = errno;
			return error_void(error_codes::socket::permission_failed,
							  "cannot set socket file mode " + mode.to_string(), kSource,
							  std::system_category().message(err));
		}

		if (group >= 0 &&
			::chown(path.c_str(), static_cast<uid_t>(-1), static_cast<gid_t>(group)) != 0)
		{
			const int err = errno;
			return error_void(error_codes::socket::permission_failed,
							  "cannot set socket file group " + std::to_string(group), kSource,
							  std::system_category().message(err));
		}

		return ok();
	}

	auto remove_socket_file(const std::string& path) -> void
	{
		std::error_code ec;
		const auto status = std::filesystem::symlink_status(path, ec);
		if (ec || !std::filesystem::is_socket(status))
		{
			return;
		}
		if (!std::filesystem::remove(path, ec) && ec)
		{
			NETKIT_LOG_WARN("[unix_socket_file] cannot remove " + path + ": " + ec.message());
		}
	}

} // namespace netkit::detail
