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
 * @file result_types.h
 * @brief Result<T> and error code definitions for qotd_system
 *
 * Operations that can fail at runtime (binding listeners, requesting a
 * quote) report failure through Result<T> / VoidResult instead of throwing.
 * Configuration errors are the exception: they throw std::invalid_argument
 * at the call that introduced them.
 */

#include <string>
#include <utility>
#include <variant>

namespace kcenon::qotd {

	struct error_info {
		int code;
		std::string message;
		std::string source;
		std::string details;

		error_info(int c, std::string msg, std::string src = "", std::string det = "")
			: code(c), message(std::move(msg)), source(std::move(src)), details(std::move(det)) {}
	};

	template<typename T>
	class Result {
	public:
		Result(T&& val) : data_(std::forward<T>(val)) {}
		Result(const T& val) : data_(val) {}
		Result(const error_info& err) : data_(err) {}

		bool is_ok() const { return std::holds_alternative<T>(data_); }
		bool is_err() const { return !is_ok(); }

		const T& value() const { return std::get<T>(data_); }
		T& value() { return std::get<T>(data_); }

		const error_info& error() const { return std::get<error_info>(data_); }

		explicit operator bool() const { return is_ok(); }

	private:
		std::variant<T, error_info> data_;
	};

	using VoidResult = Result<std::monostate>;

	namespace error_codes {
		namespace qotd_system {
			constexpr int connection_failed = -600;
			constexpr int connection_refused = -601;
			constexpr int send_failed = -640;
			constexpr int receive_failed = -641;
			constexpr int invalid_response = -642;
			constexpr int operation_cancelled = -650;
			constexpr int disposed = -651;
			constexpr int transport_error = -652;
			constexpr int server_not_started = -660;
			constexpr int server_already_running = -661;
			constexpr int bind_failed = -662;
			constexpr int provider_failed = -670;
		}
		namespace common_errors {
			constexpr int success = 0;
			constexpr int invalid_argument = -1;
			constexpr int not_found = -2;
			constexpr int permission_denied = -3;
			constexpr int timeout = -4;
			constexpr int cancelled = -5;
			constexpr int not_initialized = -6;
			constexpr int already_exists = -7;
			constexpr int io_error = -9;
			constexpr int network_error = -10;
			constexpr int internal_error = -99;
		}
	}

	template<typename T>
	inline Result<T> ok(T&& value) {
		return Result<T>(std::forward<T>(value));
	}

	inline VoidResult ok() {
		return VoidResult(std::monostate{});
	}

	template<typename T>
	inline Result<T> error(int code, const std::string& message,
	                      const std::string& source = "qotd_system",
	                      const std::string& details = "") {
		return Result<T>(error_info(code, message, source, details));
	}

	inline VoidResult error_void(int code, const std::string& message,
	                            const std::string& source = "qotd_system",
	                            const std::string& details = "") {
		return VoidResult(error_info(code, message, source, details));
	}

} // namespace kcenon::qotd
