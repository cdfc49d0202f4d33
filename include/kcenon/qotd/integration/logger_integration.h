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

#pragma once

/**
 * @file logger_integration.h
 * @brief Logging hooks for qotd_system
 *
 * Engine code logs through the QOTD_LOG_* macros. They forward to the
 * logger held by logger_integration_manager, which is a console
 * basic_logger unless the application installs its own.
 */

#include <memory>
#include <string>

namespace kcenon::qotd::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level : int {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

/**
 * @class logger_interface
 * @brief Sink for engine log records
 *
 * Implementations may be called concurrently from every host's I/O thread.
 */
class logger_interface {
public:
    virtual ~logger_interface() = default;

    /**
     * @brief Write one record
     * @param level Severity of the record
     * @param message Formatted message, already prefixed with the host id
     * @param file Source file of the log statement
     * @param line Line of the log statement
     * @param function Function containing the log statement
     */
    virtual void log(log_level level, const std::string& message,
                     const char* file, int line, const char* function) = 0;

    virtual bool is_level_enabled(log_level level) const = 0;
};

/**
 * @class basic_logger
 * @brief Timestamped console logger
 *
 * Records at error level go to stderr, the rest to stdout. Source
 * locations are appended at debug level and below.
 */
class basic_logger : public logger_interface {
public:
    explicit basic_logger(log_level min_level = log_level::info);

    ~basic_logger() override;

    void log(log_level level, const std::string& message,
             const char* file, int line, const char* function) override;

    bool is_level_enabled(log_level level) const override;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @class logger_integration_manager
 * @brief Process-wide holder of the active logger
 */
class logger_integration_manager {
public:
    static logger_integration_manager& instance();

    /**
     * @brief Replace the active logger
     * @param logger Logger to use; nullptr restores a default basic_logger
     */
    void set_logger(std::shared_ptr<logger_interface> logger);

    std::shared_ptr<logger_interface> get_logger();

    bool is_level_enabled(log_level level);

    /**
     * @brief Forward a record to the active logger
     *
     * Exceptions thrown by the logger are reported on stderr and not
     * propagated.
     */
    void log(log_level level, const std::string& message,
             const char* file, int line, const char* function);

private:
    logger_integration_manager();
    ~logger_integration_manager();

    class impl;
    std::unique_ptr<impl> pimpl_;
};

} // namespace kcenon::qotd::integration

#define QOTD_LOG_AT(level, msg)                                                       \
    do {                                                                              \
        auto& qotd_log_manager_ =                                                     \
            ::kcenon::qotd::integration::logger_integration_manager::instance();      \
        if (qotd_log_manager_.is_level_enabled(level)) {                              \
            qotd_log_manager_.log(level, (msg), __FILE__, __LINE__, __func__);        \
        }                                                                             \
    } while (false)

#define QOTD_LOG_TRACE(msg) QOTD_LOG_AT(::kcenon::qotd::integration::log_level::trace, msg)
#define QOTD_LOG_DEBUG(msg) QOTD_LOG_AT(::kcenon::qotd::integration::log_level::debug, msg)
#define QOTD_LOG_INFO(msg) QOTD_LOG_AT(::kcenon::qotd::integration::log_level::info, msg)
#define QOTD_LOG_WARN(msg) QOTD_LOG_AT(::kcenon::qotd::integration::log_level::warn, msg)
#define QOTD_LOG_ERROR(msg) QOTD_LOG_AT(::kcenon::qotd::integration::log_level::error, msg)
