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

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "kcenon/qotd/config/qotd_config.h"
#include "kcenon/qotd/core/host_base.h"
#include "kcenon/qotd/integration/io_context_runner.h"
#include "kcenon/qotd/provider/quote_provider.h"
#include "kcenon/qotd/utils/inflight_counter.h"
#include "kcenon/qotd/utils/result_types.h"

namespace kcenon::qotd::core
{
	enum class server_state
	{
		idle,      ///< constructed, nothing bound
		listening, ///< listeners bound per mode
		draining,  ///< stop_server() waiting for in-flight requests
		disposed   ///< terminal
	};

	auto to_string(server_state state) -> std::string_view;

	/*!
	 * \class qotd_server
	 * \brief RFC 865 server answering over TCP, UDP or both.
	 *
	 * Each accepted connection or received datagram becomes one exchange:
	 * the provider is asked for a quote, the quote is encoded into a pooled
	 * buffer and written back, then the buffer returns to the pool and a
	 * connection is closed. The accept and receive loops re-arm as soon as
	 * an exchange is dispatched, so exchanges overlap freely.
	 *
	 * ### Thread Safety
	 * - start_server(), apply_options() and stop_server() are serialized by
	 *   an instance mutex and may be called from any thread except the
	 *   server's own I/O thread.
	 * - Observers (server_state, ports, in_flight) are safe from any thread.
	 *
	 * ### Lifecycle
	 * idle -> listening -> draining -> disposed. stop_server() is terminal;
	 * a disposed server cannot be restarted.
	 *
	 * ### Usage Example
	 * \code
	 * auto provider = std::make_shared<provider::fixed_quote_provider>("Hello");
	 * auto server = std::make_shared<qotd_server>(provider, config::server_options{});
	 * auto result = server->start_server();
	 * if (result.is_err()) {
	 *     std::cerr << result.error().message << "\n";
	 * }
	 * // ...
	 * server->stop_server();
	 * \endcode
	 *
	 * \note Instances must be owned by std::shared_ptr; completion handlers
	 * keep the server alive through shared_from_this().
	 */
	class qotd_server : public std::enable_shared_from_this<qotd_server>
	{
	public:
		/*!
		 * \throws std::invalid_argument if \p provider is null or \p options is invalid
		 */
		qotd_server(std::shared_ptr<provider::quote_provider> provider,
					const config::server_options& options = {},
					const std::string& server_id = "qotd_server");

		~qotd_server() noexcept;

		qotd_server(const qotd_server&) = delete;
		qotd_server& operator=(const qotd_server&) = delete;

		/*!
		 * \brief Binds the listeners the current mode enables.
		 * \return bind_failed if a listener could not be bound,
		 *         server_already_running or disposed on a wrong state.
		 */
		auto start_server() -> VoidResult;

		/*!
		 * \brief Replaces the option snapshot.
		 *
		 * Before start_server() the options are only stored. While listening,
		 * waits up to 5 s for in-flight exchanges, then closes and rebinds the
		 * datagram socket and the stream listener per the new mode.
		 * Encoding and maximum quote length take effect at the next encode,
		 * so an exchange still waiting on its provider replies with the new
		 * values.
		 *
		 * \throws std::invalid_argument if \p options is invalid
		 */
		auto apply_options(const config::server_options& options) -> VoidResult;

		/*!
		 * \brief Stops accepting, drains in-flight exchanges (5 s bound),
		 * fires the disposal signal and closes every socket. Idempotent.
		 */
		auto stop_server() -> VoidResult;

		auto state() const -> server_state { return state_.load(); }

		auto is_running() const -> bool { return state() == server_state::listening; }

		auto options() const -> config::server_options;

		auto has_stream_listener() const -> bool { return stream_port_.load() != 0; }

		auto has_datagram_socket() const -> bool { return datagram_port_.load() != 0; }

		/*!
		 * \brief Port the stream listener is bound to, 0 when there is none.
		 */
		auto stream_port() const -> uint16_t { return stream_port_.load(); }

		/*!
		 * \brief Port the datagram socket is bound to, 0 when there is none.
		 */
		auto datagram_port() const -> uint16_t { return datagram_port_.load(); }

		auto in_flight() const -> std::size_t { return inflight_.count(); }

		auto set_diagnostic_callback(diagnostic_callback callback) -> void;

		auto host() -> host_base& { return host_; }

	private:
		struct datagram_listener;
		struct stream_exchange;
		struct datagram_exchange;

		auto rebind(const config::server_options& options) -> VoidResult;
		auto bind_datagram(const config::server_options& options) -> VoidResult;
		auto bind_stream(const config::server_options& options) -> VoidResult;
		auto close_listeners() -> void;

		auto do_accept(std::shared_ptr<asio::ip::tcp::acceptor> acceptor) -> void;
		auto on_accept(std::shared_ptr<asio::ip::tcp::acceptor> acceptor,
					   std::error_code ec,
					   asio::ip::tcp::socket socket) -> void;

		auto do_receive(std::shared_ptr<datagram_listener> listener) -> void;
		auto on_receive(std::shared_ptr<datagram_listener> listener, std::error_code ec) -> void;

		/*!
		 * \brief Asks the provider for a quote and hands the text to
		 * \p respond on the I/O thread.
		 */
		auto query_provider(const asio::ip::address& remote,
							std::function<void(const std::string&)> respond) -> void;

		auto send_stream_reply(std::shared_ptr<stream_exchange> exchange, const std::string& text)
			-> void;
		auto send_datagram_reply(std::shared_ptr<datagram_exchange> exchange,
								 const std::string& text) -> void;

		auto is_shutdown_race(const std::error_code& ec) const -> bool;

	private:
		std::shared_ptr<provider::quote_provider> provider_;
		host_base host_;
		integration::io_context_runner runner_;
		utils::inflight_counter inflight_;

		mutable std::mutex config_mutex_;
		config::server_options options_;

		std::atomic<server_state> state_{ server_state::idle };

		// Touched only on the I/O thread
		std::shared_ptr<asio::ip::tcp::acceptor> acceptor_;
		std::shared_ptr<datagram_listener> datagram_;

		std::atomic<uint16_t> stream_port_{ 0 };
		std::atomic<uint16_t> datagram_port_{ 0 };
	};

} // namespace kcenon::qotd::core
