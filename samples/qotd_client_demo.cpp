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
 * @file qotd_client_demo.cpp
 * @brief Interactive Quote of the Day client
 *
 * Press Enter to request a quote, type "q" to quit.
 *
 * Usage: qotd_client_demo [host] [port] [tcp|udp]
 */

#include <kcenon/qotd/qotd_system.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace kcenon::qotd;

int main(int argc, char* argv[])
{
    config::client_options options;
    options.port = 1717;

    if (argc > 1)
    {
        options.host = argv[1];
    }
    if (argc > 2)
    {
        const int port = std::atoi(argv[2]);
        if (port <= 0 || port > 65535)
        {
            std::cerr << "Invalid port: " << argv[2] << "\n";
            return 1;
        }
        options.port = static_cast<uint16_t>(port);
    }
    if (argc > 3)
    {
        auto mode = config::parse_client_mode(argv[3]);
        if (!mode)
        {
            std::cerr << "Unknown mode '" << argv[3] << "', expected tcp or udp\n";
            return 1;
        }
        options.mode = *mode;
    }

    config::apply_logger_config(config::qotd_config::production().logger);

    std::unique_ptr<core::qotd_client> client;
    try
    {
        client = std::make_unique<core::qotd_client>(options, "QotdDemoClient");
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "[Client] Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    std::cout << "[Client] Target " << options.host << ":" << options.port << " over "
              << config::to_string(options.mode) << "\n";
    std::cout << "[Client] Press Enter for a quote, 'q' to quit.\n";

    std::string line;
    while (std::getline(std::cin, line) && line != "q")
    {
        const auto started = std::chrono::steady_clock::now();
        auto result = client->request_quote();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (result.is_ok())
        {
            std::cout << "[Client] " << result.value() << " (" << elapsed.count() << " ms)\n";
        }
        else
        {
            std::cerr << "[Client] Request failed: " << result.error().message
                      << " (code " << result.error().code << ")\n";
        }
    }

    client->stop_client();
    std::cout << "[Client] Done.\n";
    return 0;
}
