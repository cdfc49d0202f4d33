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

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

#include "kcenon/qotd/config/qotd_config.h"
#include "kcenon/qotd/core/host_base.h"
#include "kcenon/qotd/integration/io_context_runner.h"
#include "kcenon/qotd/utils/inflight_counter.h"
#include "kcenon/qotd/utils/result_types.h"

namespace kcenon::qotd::core
{
	/*!
	 * \class qotd_client
	 * \brief Requests quotes from an RFC 865 server.
	 *
	 * Every request opens its own socket, so requests are independent and
	 * may run concurrently. A request ends with exactly one of:
	 * - the decoded quote,
	 * - invalid_response for an empty or undecodable reply,
	 * - operation_cancelled when the timeout elapses or the caller's token fires,
	 * - disposed when the client is stopped before or during the request,
	 * - connection_failed when the server cannot be reached.
	 *
	 * ### Thread Safety
	 * - All public methods are thread-safe.
	 * - request_quote() blocks and must not be called from a response handler.
	 * - Response handlers run on the client's I/O thread.
	 *
	 * ### Timeouts
	 * A zero timeout selects client_options::default_timeout; a negative
	 * timeout waits without limit.
	 */
	class qotd_client
	{
	public:
		using response_handler = std::function<void(Result<std::string>)>;

		/*!
		 * \throws std::invalid_argument if \p options is invalid or its host
		 *         is not an IPv4/IPv6 literal
		 */
		explicit qotd_client(const config::client_options& options = {},
							 const std::string& client_id = "qotd_client");

		/*!
		 * \brief Equivalent to stop_client().
		 */
		~qotd_client() noexcept;

		qotd_client(const qotd_client&) = delete;
		qotd_client& operator=(const qotd_client&) = delete;

		/*!
		 * \brief Requests one quote and waits for the outcome.
		 */
		auto request_quote(std::chrono::milliseconds timeout = std::chrono::milliseconds{ 0 },
						   std::stop_token token = {}) -> Result<std::string>;

		/*!
		 * \brief Starts a request; \p handler receives the outcome exactly once.
		 *
		 * When the client is already stopping, \p handler is invoked before
		 * this call returns with a disposed error.
		 */
		auto async_request_quote(std::chrono::milliseconds timeout,
								 std::stop_token token,
								 response_handler handler) -> void;

		/*!
		 * \brief Replaces the option snapshot for requests started afterwards.
		 * \throws std::invalid_argument if \p options is invalid
		 */
		auto apply_options(const config::client_options& options) -> void;

		auto options() const -> config::client_options;

		/*!
		 * \brief Waits up to 5 s for in-flight requests, then aborts the rest
		 * and stops the I/O thread. Idempotent.
		 */
		auto stop_client() -> void;

		auto is_disposed() const -> bool { return host_.is_disposed(); }

		auto in_flight() const -> std::size_t { return inflight_.count(); }

		auto set_diagnostic_callback(diagnostic_callback callback) -> void;

		auto host() -> host_base& { return host_; }

	private:
		struct request_state;

		enum class cancel_reason
		{
			none,
			cancelled,
			timed_out,
			disposed
		};

		auto start_request(std::shared_ptr<request_state> state) -> void;
		auto start_stream(std::shared_ptr<request_state> state) -> void;
		auto start_datagram(std::shared_ptr<request_state> state) -> void;
		auto do_receive_datagram(std::shared_ptr<request_state> state) -> void;

		auto force_close(std::shared_ptr<request_state> state, cancel_reason reason) -> void;
		auto fail(std::shared_ptr<request_state> state, const std::error_code& ec,
				  const std::string& stage) -> void;
		auto complete_with_bytes(std::shared_ptr<request_state> state, std::size_t length) -> void;
		auto finish(std::shared_ptr<request_state> state, Result<std::string> result) -> void;

	private:
		host_base host_;
		integration::io_context_runner runner_;
		utils::inflight_counter inflight_;

		mutable std::mutex options_mutex_;
		config::client_options options_;
		asio::ip::address target_address_;

		std::mutex stop_mutex_;
	};

} // namespace kcenon::qotd::core
