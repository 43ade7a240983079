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
 * @file unix_socket_file.h
 * @brief Filesystem side of unix domain socket servers
 */

#pragma once

#include <cstdint>
#include <string>

#include "netkit/config/socket_config.h"
#include "netkit/types/result.h"

namespace netkit::detail
{
	/*!
	 * \brief Makes \p path bindable: removes a stale socket file.
	 * \return bind_failed when \p path exists and is not a socket.
	 */
	auto prepare_socket_path(const std::string& path) -> VoidResult;

	/*!
	 * \brief Applies \p mode (when set) and \p group (when not -1) to the
	 *        bound socket file.
	 * \return permission_failed with the errno text in details.
	 */
	auto apply_socket_permissions(const std::string& path, const config::file_mode& mode,
								  std::int32_t group) -> VoidResult;

	//! \brief Removes the socket file if it is still a socket.
	auto remove_socket_file(const std::string& path) -> void;

} // namespace netkit::detail
