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
 * @file qotd_server_demo.cpp
 * @brief Quote of the Day server serving a rotating daily quote
 *
 * This example shows:
 * 1. Creating a daily quote provider from a quote pool
 * 2. Starting a server in stream, datagram or dual mode
 * 3. Observing diagnostics raised by the server
 * 4. Graceful shutdown on Ctrl+C
 *
 * Usage: qotd_server_demo [port] [tcp|udp|both]
 */

#include <kcenon/qotd/qotd_system.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::qotd;

// Shared flag for graceful shutdown
std::atomic<bool> should_stop{false};

void signal_handler(int)
{
    should_stop.store(true);
}

int main(int argc, char* argv[])
{
    config::server_options options;
    options.port = 1717;

    if (argc > 1)
    {
        const int port = std::atoi(argv[1]);
        if (port < 0 || port > 65535)
        {
            std::cerr << "Invalid port: " << argv[1] << "\n";
            return 1;
        }
        options.port = static_cast<uint16_t>(port);
    }
    if (argc > 2)
    {
        auto mode = config::parse_server_mode(argv[2]);
        if (!mode)
        {
            std::cerr << "Unknown mode '" << argv[2] << "', expected tcp, udp or both\n";
            return 1;
        }
        options.mode = *mode;
    }

    config::apply_logger_config(config::qotd_config::development().logger);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto provider = std::make_shared<provider::daily_quote_provider>(std::vector<std::string>{
        "The only way to do great work is to love what you do.",
        "Simplicity is prerequisite for reliability.",
        "Premature optimization is the root of all evil.",
        "Make it work, make it right, make it fast.",
        "Talk is cheap. Show me the code."
    });

    std::shared_ptr<core::qotd_server> server;
    try
    {
        server = std::make_shared<core::qotd_server>(provider, options, "QotdDemoServer");
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "[Server] Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    server->set_diagnostic_callback(
        [](const core::diagnostic& d)
        {
            std::cerr << "[Server] " << core::to_string(d.kind) << ": " << d.message << "\n";
        });

    std::cout << "[Server] Starting QOTD server (" << config::to_string(options.mode) << ")...\n";

    auto result = server->start_server();
    if (result.is_err())
    {
        std::cerr << "[Server] Failed to start: " << result.error().message << "\n";
        return 1;
    }

    if (server->has_stream_listener())
    {
        std::cout << "[Server] TCP on port " << server->stream_port() << "\n";
    }
    if (server->has_datagram_socket())
    {
        std::cout << "[Server] UDP on port " << server->datagram_port() << "\n";
    }
    std::cout << "[Server] Press Ctrl+C to stop.\n";

    while (!should_stop.load())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "[Server] Stopping...\n";
    auto stop_result = server->stop_server();
    if (stop_result.is_err())
    {
        std::cerr << "[Server] Stop error: " << stop_result.error().message << "\n";
        return 1;
    }
    std::cout << "[Server] Stopped.\n";

    return 0;
}
