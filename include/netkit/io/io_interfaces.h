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
 * @file io_interfaces.h
 * @brief Byte stream interfaces shared by files and socket connections
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "netkit/types/result.h"

namespace netkit::io
{
	/*!
	 * \interface reader
	 * \brief Source of bytes.
	 *
	 * read() returns the number of bytes stored in \p buffer (at least one
	 * when \p buffer is not empty). End of stream is reported as an error
	 * with code error_codes::io::end_of_file and carries no bytes.
	 */
	class reader
	{
	public:
		virtual ~reader() = default;

		virtual auto read(std::span<std::uint8_t> buffer) -> Result<std::size_t> = 0;
	};

	/*!
	 * \interface writer
	 * \brief Sink of bytes. A successful write() consumed all of \p data.
	 */
	class writer
	{
	public:
		virtual ~writer() = default;

		virtual auto write(std::span<const std::uint8_t> data) -> Result<std::size_t> = 0;
	};

	//! \brief True when \p result failed with end_of_file.
	template<typename T>
	inline auto is_eof(const Result<T>& result) -> bool
	{
		return result.is_err() && result.error().code == error_codes::io::end_of_file;
	}

} // namespace netkit::io
