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
 * @file logger_integration.cpp
 * @brief Console logger and the logger manager
 */

#include "kcenon/qotd/integration/logger_integration.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <mutex>

namespace kcenon::qotd::integration {

namespace {

const char* level_name(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info:  return "INFO ";
        case log_level::warn:  return "WARN ";
        case log_level::error: return "ERROR";
    }
    return "?????";
}

// "2024-03-14 08:15:02.417"
std::string format_timestamp(std::chrono::system_clock::time_point now) {
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

    char stamp[40];
    std::snprintf(stamp, sizeof(stamp), "%s.%03d", date, static_cast<int>(millis));
    return stamp;
}

} // namespace

//============================================================================
// basic_logger
//============================================================================

class basic_logger::impl {
public:
    explicit impl(log_level min_level) : min_level_(min_level) {}

    bool is_level_enabled(log_level level) const {
        return level >= min_level_;
    }

    void log(log_level level, const std::string& message,
             const char* file, int line, const char* function) {
        if (!is_level_enabled(level)) return;

        std::string record = "[" + format_timestamp(std::chrono::system_clock::now()) + "] ["
            + level_name(level) + "] [qotd_system] " + message;
        if (level <= log_level::debug && file != nullptr) {
            record += " (" + std::string(file) + ":" + std::to_string(line)
                + " in " + (function ? function : "?") + ")";
        }
        record += '\n';

        std::lock_guard<std::mutex> lock(mutex_);
        auto* stream = (level == log_level::error) ? stderr : stdout;
        std::fputs(record.c_str(), stream);
        std::fflush(stream);
    }

private:
    const log_level min_level_;
    std::mutex mutex_;
};

basic_logger::basic_logger(log_level min_level)
    : pimpl_(std::make_unique<impl>(min_level)) {}

basic_logger::~basic_logger() = default;

void basic_logger::log(log_level level, const std::string& message,
                       const char* file, int line, const char* function) {
    pimpl_->log(level, message, file, line, function);
}

bool basic_logger::is_level_enabled(log_level level) const {
    return pimpl_->is_level_enabled(level);
}

//============================================================================
// logger_integration_manager
//============================================================================

class logger_integration_manager::impl {
public:
    impl() : logger_(std::make_shared<basic_logger>()) {}

    void set_logger(std::shared_ptr<logger_interface> logger) {
        std::lock_guard<std::mutex> lock(mutex_);
        logger_ = logger ? std::move(logger) : std::make_shared<basic_logger>();
    }

    std::shared_ptr<logger_interface> get_logger() {
        std::lock_guard<std::mutex> lock(mutex_);
        return logger_;
    }

private:
    std::mutex mutex_;
    std::shared_ptr<logger_interface> logger_;
};

logger_integration_manager& logger_integration_manager::instance() {
    static logger_integration_manager instance;
    return instance;
}

logger_integration_manager::logger_integration_manager()
    : pimpl_(std::make_unique<impl>()) {}

logger_integration_manager::~logger_integration_manager() = default;

void logger_integration_manager::set_logger(std::shared_ptr<logger_interface> logger) {
    pimpl_->set_logger(std::move(logger));
}

std::shared_ptr<logger_interface> logger_integration_manager::get_logger() {
    return pimpl_->get_logger();
}

bool logger_integration_manager::is_level_enabled(log_level level) {
    return pimpl_->get_logger()->is_level_enabled(level);
}

void logger_integration_manager::log(log_level level, const std::string& message,
                                     const char* file, int line, const char* function) {
    auto logger = pimpl_->get_logger();

    // Log statements sit inside I/O completion handlers.
    try {
        logger->log(level, message, file, line, function);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[qotd_system] logger failure: %s\n", e.what());
    }
}

} // namespace kcenon::qotd::integration
