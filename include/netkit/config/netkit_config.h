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
 * @file netkit_config.h
 * @brief Process-wide configuration applied by netkit::initialize()
 */

#pragma once

#include <chrono>
#include <cstddef>

#include "netkit/integration/logger_integration.h"

namespace netkit::config {

/**
 * @struct logger_config
 * @brief Configuration for the built-in console logger
 */
struct logger_config {
    /// Minimum log level to record
    integration::log_level min_level = integration::log_level::info;
};

/**
 * @struct socket_defaults
 * @brief Tunables shared by every server and client
 */
struct socket_defaults {
    /// Read buffer used by datagram servers and copy loops
    std::size_t buffer_size = 32 * 1024;

    /// Slice handed to io_context::run_for while waiting on a blocking call.
    /// Bounds how quickly cancellation and idle timeouts are noticed.
    std::chrono::milliseconds io_poll_interval{5};

    /// Interval at which Shutdown re-checks the drain condition
    std::chrono::milliseconds shutdown_poll_interval{3};

    /// Upper bound for a single Shutdown drain, whatever the caller context
    std::chrono::milliseconds shutdown_max_wait{1000};
};

/**
 * @struct netkit_config
 * @brief Complete configuration for netkit
 */
struct netkit_config {
    logger_config logger;
    socket_defaults sockets;

    static netkit_config development() {
        netkit_config cfg;
        cfg.logger.min_level = integration::log_level::debug;
        return cfg;
    }

    static netkit_config production() {
        netkit_config cfg;
        cfg.logger.min_level = integration::log_level::info;
        return cfg;
    }

    /**
     * @brief Create testing configuration
     * @return Quiet logger and a short drain bound
     */
    static netkit_config testing() {
        netkit_config cfg;
        cfg.logger.min_level = integration::log_level::warn;
        cfg.sockets.io_poll_interval = std::chrono::milliseconds(2);
        return cfg;
    }
};

} // namespace netkit::config

namespace netkit {

/*!
 * \brief Socket tunables currently in effect.
 *
 * Returns the defaults of config::socket_defaults until initialize() is
 * called with something else.
 */
auto active_socket_defaults() -> config::socket_defaults;

} // namespace netkit
