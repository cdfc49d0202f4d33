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
 * @file qotd_config.cpp
 * @brief Option validation and name parsing
 */

#include "kcenon/qotd/config/qotd_config.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace kcenon::qotd::config {

namespace {

std::string lower(std::string_view name) {
    std::string result(name);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

auto to_string(server_mode mode) -> std::string_view {
    switch (mode) {
        case server_mode::stream: return "stream";
        case server_mode::datagram: return "datagram";
        case server_mode::both: return "both";
    }
    return "unknown";
}

auto to_string(client_mode mode) -> std::string_view {
    switch (mode) {
        case client_mode::stream: return "stream";
        case client_mode::datagram: return "datagram";
    }
    return "unknown";
}

auto parse_server_mode(std::string_view name) -> std::optional<server_mode> {
    const auto key = lower(name);
    if (key == "both") {
        return server_mode::both;
    }
    if (auto mode = parse_client_mode(key)) {
        return *mode == client_mode::stream ? server_mode::stream : server_mode::datagram;
    }
    return std::nullopt;
}

auto parse_client_mode(std::string_view name) -> std::optional<client_mode> {
    const auto key = lower(name);
    if (key == "tcp" || key == "stream") {
        return client_mode::stream;
    }
    if (key == "udp" || key == "datagram") {
        return client_mode::datagram;
    }
    return std::nullopt;
}

void validate(const host_options& options) {
    if (options.maximum_quote_length == 0 ||
        options.maximum_quote_length > maximum_quote_length_limit) {
        throw std::invalid_argument(
            "qotd: maximum_quote_length must be between 1 and 65535");
    }
}

void validate(const server_options& options) {
    validate(static_cast<const host_options&>(options));

    switch (options.mode) {
        case server_mode::stream:
        case server_mode::datagram:
        case server_mode::both:
            break;
        default:
            throw std::invalid_argument("qotd_server: unknown server mode");
    }
    // port 0 binds an ephemeral port
}

void validate(const client_options& options) {
    validate(static_cast<const host_options&>(options));

    switch (options.mode) {
        case client_mode::stream:
        case client_mode::datagram:
            break;
        default:
            throw std::invalid_argument("qotd_client: unknown client mode");
    }

    if (options.host.empty()) {
        throw std::invalid_argument("qotd_client: host cannot be empty");
    }

    if (options.port == 0) {
        throw std::invalid_argument("qotd_client: port must be between 1 and 65535");
    }
}

void apply_logger_config(const logger_config& config) {
    integration::logger_integration_manager::instance().set_logger(
        std::make_shared<integration::basic_logger>(config.min_level));
}

} // namespace kcenon::qotd::config
