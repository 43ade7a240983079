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
 * @file netkit.h
 * @brief Umbrella header and process-wide initialization
 *
 * Servers and clients work without initialize(); it only installs the
 * configured logger and socket tunables.
 */

#pragma once

#include "netkit/config/netkit_config.h"
#include "netkit/config/socket_config.h"
#include "netkit/config/tls_config.h"
#include "netkit/core/socket_factory.h"
#include "netkit/integration/logger_integration.h"
#include "netkit/io/bandwidth_limiter.h"
#include "netkit/io/progress_file.h"
#include "netkit/protocol/network_protocol.h"
#include "netkit/types/result.h"
#include "netkit/utils/cancel_context.h"

namespace netkit
{
	//! \brief initialize() with netkit_config::production().
	auto initialize() -> VoidResult;

	/*!
	 * \brief Installs a console logger at the configured level and the
	 *        socket tunables for servers and clients created afterwards.
	 * \return already_exists when called twice without shutdown().
	 */
	auto initialize(const config::netkit_config& config) -> VoidResult;

	//! \brief Flushes the logger and restores default tunables.
	auto shutdown() -> VoidResult;

	[[nodiscard]] auto is_initialized() -> bool;

} // namespace netkit
