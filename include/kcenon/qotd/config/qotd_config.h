/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2024, 🍀☀🌕🌥 🌊
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
 * @file qotd_config.h
 * @brief Option structures for qotd servers and clients
 *
 * Options are plain values. A host validates a snapshot when it is
 * constructed or reconfigured; invalid values throw std::invalid_argument.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "kcenon/qotd/codec/quote_codec.h"
#include "kcenon/qotd/integration/logger_integration.h"

namespace kcenon::qotd::config {

/// Well-known QOTD port (RFC 865)
constexpr std::uint16_t default_port = 17;

constexpr std::size_t default_maximum_quote_length = 512;
constexpr std::size_t maximum_quote_length_limit = 65535;
constexpr std::size_t default_maximum_pooled_buffers = 16;

constexpr std::chrono::milliseconds default_request_timeout{5000};

/// Bounded wait for in-flight requests before a rebind or a dispose
constexpr std::chrono::milliseconds quiesce_timeout{5000};

/// Socket buffer headroom for TCP and UDP headers
constexpr std::size_t stream_header_overhead = 60;
constexpr std::size_t datagram_header_overhead = 8;

/**
 * @enum server_mode
 * @brief Transports a server listens on
 */
enum class server_mode {
    stream,
    datagram,
    both
};

/**
 * @enum client_mode
 * @brief Transport a client requests over
 */
enum class client_mode {
    stream,
    datagram
};

auto to_string(server_mode mode) -> std::string_view;
auto to_string(client_mode mode) -> std::string_view;

/// Accepts "tcp"/"stream", "udp"/"datagram" and "both" (case-insensitive)
auto parse_server_mode(std::string_view name) -> std::optional<server_mode>;
auto parse_client_mode(std::string_view name) -> std::optional<client_mode>;

/**
 * @struct host_options
 * @brief Settings shared by servers and clients
 */
struct host_options {
    /// Size of every pooled buffer in bytes, 1..65535
    std::size_t maximum_quote_length = default_maximum_quote_length;

    /// Buffers kept for reuse; 0 disables pooling
    std::size_t maximum_pooled_buffers = default_maximum_pooled_buffers;

    codec::text_encoding encoding = codec::text_encoding::ascii;
};

/**
 * @struct server_options
 * @brief Listener configuration for qotd_server
 */
struct server_options : host_options {
    server_mode mode = server_mode::both;

    /// Port shared by both transports unless overridden below
    std::uint16_t port = default_port;

    std::optional<std::uint16_t> datagram_port;
    std::optional<std::uint16_t> stream_port;

    /// Bind [::] accepting IPv4-mapped peers instead of 0.0.0.0
    bool dual_stack = true;

    auto effective_datagram_port() const -> std::uint16_t {
        return datagram_port.value_or(port);
    }

    auto effective_stream_port() const -> std::uint16_t {
        return stream_port.value_or(port);
    }

    auto datagram_enabled() const -> bool {
        return mode == server_mode::datagram || mode == server_mode::both;
    }

    auto stream_enabled() const -> bool {
        return mode == server_mode::stream || mode == server_mode::both;
    }
};

/**
 * @struct client_options
 * @brief Target and request settings for qotd_client
 */
struct client_options : host_options {
    client_mode mode = client_mode::stream;

    /// IPv4 or IPv6 literal of the server
    std::string host = "127.0.0.1";

    std::uint16_t port = default_port;

    /// Used when a request passes a zero timeout; negative waits forever
    std::chrono::milliseconds default_timeout = default_request_timeout;
};

/**
 * @brief Validators; each throws std::invalid_argument naming the bad field
 */
void validate(const host_options& options);
void validate(const server_options& options);
void validate(const client_options& options);

/**
 * @struct logger_config
 * @brief Configuration for the default console logger
 */
struct logger_config {
    /// Minimum log level to record
    integration::log_level min_level = integration::log_level::info;
};

/**
 * @struct qotd_config
 * @brief Process-wide settings applied once at startup
 */
struct qotd_config {
    logger_config logger;

    static qotd_config development() {
        qotd_config cfg;
        cfg.logger.min_level = integration::log_level::debug;
        return cfg;
    }

    static qotd_config production() {
        qotd_config cfg;
        cfg.logger.min_level = integration::log_level::info;
        return cfg;
    }

    static qotd_config testing() {
        qotd_config cfg;
        cfg.logger.min_level = integration::log_level::warn;
        return cfg;
    }
};

/**
 * @brief Installs a basic_logger honouring @p config.min_level
 */
void apply_logger_config(const logger_config& config);

} // namespace kcenon::qotd::config
