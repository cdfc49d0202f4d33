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

#include "kcenon/qotd/core/qotd_client.h"

#include "kcenon/qotd/integration/logger_integration.h"

#include <exception>
#include <future>
#include <optional>
#include <stdexcept>
#include <vector>

namespace kcenon::qotd::core
{

	using tcp = asio::ip::tcp;
	using udp = asio::ip::udp;

	namespace
	{
		auto parse_target(const config::client_options& options) -> asio::ip::address
		{
			config::validate(options);

			std::error_code ec;
			auto address = asio::ip::make_address(options.host, ec);
			if (ec)
			{
				throw std::invalid_argument("qotd_client: host must be an IPv4 or IPv6 address, got '" +
											options.host + "'");
			}
			return address;
		}
	} // namespace

	struct qotd_client::request_state
	{
		explicit request_state(asio::io_context& io) : timer(io), stream(io), datagram(io) {}

		config::client_mode mode = config::client_mode::stream;
		codec::text_encoding encoding = codec::text_encoding::ascii;
		asio::ip::address address;
		uint16_t port = 0;
		std::chrono::milliseconds timeout{ 0 };

		utils::inflight_counter::ticket ticket;
		response_handler handler;

		asio::steady_timer timer;
		tcp::socket stream;
		udp::socket datagram;
		udp::endpoint sender;
		std::vector<uint8_t> buffer;

		// Only touched on the I/O thread
		cancel_reason reason = cancel_reason::none;
		bool completed = false;

		std::optional<std::stop_callback<std::function<void()>>> caller_stop;
		std::optional<std::stop_callback<std::function<void()>>> disposal_stop;

		auto target_text() const -> std::string
		{
			return address.to_string() + ":" + std::to_string(port);
		}
	};

	qotd_client::qotd_client(const config::client_options& options, const std::string& client_id)
		: host_(client_id, options)
		, runner_(client_id)
		, options_(options)
		, target_address_(parse_target(options))
	{
		runner_.start();
	}

	qotd_client::~qotd_client() noexcept
	{
		try
		{
			stop_client();
		}
		catch (const std::exception& e)
		{
			QOTD_LOG_ERROR("[" + host_.host_id() + "] stop in destructor failed: " +
						   std::string(e.what()));
		}
	}

	auto qotd_client::request_quote(std::chrono::milliseconds timeout, std::stop_token token)
		-> Result<std::string>
	{
		if (runner_.running_in_this_thread())
		{
			return error<std::string>(error_codes::common_errors::invalid_argument,
									  "request_quote cannot block the client's I/O thread",
									  "qotd_client::request_quote");
		}

		auto promise = std::make_shared<std::promise<Result<std::string>>>();
		auto outcome = promise->get_future();

		async_request_quote(timeout, std::move(token),
							[promise](Result<std::string> result)
							{ promise->set_value(std::move(result)); });

		return outcome.get();
	}

	auto qotd_client::async_request_quote(std::chrono::milliseconds timeout,
										  std::stop_token token,
										  response_handler handler) -> void
	{
		config::client_options snapshot;
		asio::ip::address address;
		{
			std::lock_guard<std::mutex> lock(options_mutex_);
			snapshot = options_;
			address = target_address_;
		}

		auto ticket = inflight_.try_enter();
		if (!ticket || host_.is_disposed())
		{
			handler(error<std::string>(error_codes::qotd_system::disposed, "Client has been stopped",
									   "qotd_client::async_request_quote",
									   "Client ID: " + host_.host_id()));
			return;
		}

		if (timeout.count() == 0)
		{
			timeout = snapshot.default_timeout;
		}

		auto state = std::make_shared<request_state>(runner_.context());
		state->mode = snapshot.mode;
		state->address = address;
		state->port = snapshot.port;
		state->timeout = timeout;
		state->encoding = snapshot.encoding;
		state->ticket = std::move(ticket);
		state->handler = std::move(handler);

		std::weak_ptr<request_state> weak = state;
		state->caller_stop.emplace(
			token, std::function<void()>(
					   [this, weak]()
					   {
						   runner_.post(
							   [this, weak]()
							   {
								   if (auto locked = weak.lock())
								   {
									   force_close(locked, cancel_reason::cancelled);
								   }
							   });
					   }));
		state->disposal_stop.emplace(
			host_.disposal_token(), std::function<void()>(
										[this, weak]()
										{
											runner_.post(
												[this, weak]()
												{
													if (auto locked = weak.lock())
													{
														force_close(locked, cancel_reason::disposed);
													}
												});
										}));

		runner_.post([this, state]() { start_request(state); });
	}

	auto qotd_client::apply_options(const config::client_options& options) -> void
	{
		auto address = parse_target(options);

		std::lock_guard<std::mutex> lock(options_mutex_);
		host_.apply_options(options);
		options_ = options;
		target_address_ = address;

		QOTD_LOG_DEBUG("[" + host_.host_id() + "] Options applied, mode=" +
					   std::string(config::to_string(options.mode)) + ", target=" +
					   options.host + ":" + std::to_string(options.port));
	}

	auto qotd_client::options() const -> config::client_options
	{
		std::lock_guard<std::mutex> lock(options_mutex_);
		return options_;
	}

	auto qotd_client::stop_client() -> void
	{
		std::lock_guard<std::mutex> lock(stop_mutex_);
		if (host_.is_disposed())
		{
			return;
		}

		inflight_.begin_drain();
		if (!inflight_.wait_for_idle(config::quiesce_timeout))
		{
			QOTD_LOG_WARN("[" + host_.host_id() + "] " + std::to_string(inflight_.count()) +
						  " requests still in flight after 5s, aborting them");
		}

		host_.dispose();
		runner_.stop();
		QOTD_LOG_DEBUG("[" + host_.host_id() + "] Stopped");
	}

	auto qotd_client::set_diagnostic_callback(diagnostic_callback callback) -> void
	{
		host_.set_diagnostic_callback(std::move(callback));
	}

	auto qotd_client::start_request(std::shared_ptr<request_state> state) -> void
	{
		if (state->reason != cancel_reason::none)
		{
			fail(state, asio::error::operation_aborted, "start");
			return;
		}

		if (state->timeout.count() > 0)
		{
			state->timer.expires_after(state->timeout);
			state->timer.async_wait(
				[this, state](std::error_code ec)
				{
					if (!ec)
					{
						force_close(state, cancel_reason::timed_out);
					}
				});
		}

		state->buffer = host_.rent_buffer();

		if (state->mode == config::client_mode::stream)
		{
			start_stream(state);
		}
		else
		{
			start_datagram(state);
		}
	}

	auto qotd_client::start_stream(std::shared_ptr<request_state> state) -> void
	{
		const tcp::endpoint endpoint(state->address, state->port);
		std::error_code ec;

		state->stream.open(endpoint.protocol(), ec);
		if (ec)
		{
			fail(state, ec, "open");
			return;
		}

		const auto receive_size =
			static_cast<int>(state->buffer.size() + config::stream_header_overhead);
		state->stream.set_option(asio::socket_base::receive_buffer_size(receive_size), ec);
		state->stream.set_option(
			asio::socket_base::send_buffer_size(static_cast<int>(config::stream_header_overhead)), ec);
		if (ec)
		{
			QOTD_LOG_DEBUG("[" + host_.host_id() + "] Socket buffer sizing ignored: " + ec.message());
		}

		state->stream.async_connect(
			endpoint,
			[this, state](std::error_code ec)
			{
				if (ec)
				{
					fail(state, ec, "connect");
					return;
				}

				asio::async_read(state->stream, asio::buffer(state->buffer),
								 [this, state](std::error_code ec, std::size_t length)
								 {
									 // EOF is how the server ends a reply
									 if (ec && ec != asio::error::eof)
									 {
										 fail(state, ec, "read");
										 return;
									 }
									 complete_with_bytes(state, length);
								 });
			});
	}

	auto qotd_client::start_datagram(std::shared_ptr<request_state> state) -> void
	{
		const udp::endpoint endpoint(state->address, state->port);
		std::error_code ec;

		state->datagram.open(endpoint.protocol(), ec);
		if (!ec)
		{
			state->datagram.bind(udp::endpoint(endpoint.protocol(), 0), ec);
		}
		if (ec)
		{
			fail(state, ec, "open");
			return;
		}

		std::error_code sizing_ec;
		state->datagram.set_option(
			asio::socket_base::send_buffer_size(static_cast<int>(config::datagram_header_overhead)),
			sizing_ec);
		state->datagram.set_option(
			asio::socket_base::receive_buffer_size(
				static_cast<int>(state->buffer.size() + config::datagram_header_overhead)),
			sizing_ec);

		state->datagram.async_send_to(
			asio::const_buffer(), endpoint,
			[this, state](std::error_code ec, std::size_t)
			{
				if (ec)
				{
					fail(state, ec, "send");
					return;
				}
				do_receive_datagram(state);
			});
	}

	auto qotd_client::do_receive_datagram(std::shared_ptr<request_state> state) -> void
	{
		state->datagram.async_receive_from(
			asio::buffer(state->buffer), state->sender,
			[this, state](std::error_code ec, std::size_t length)
			{
				if (ec == asio::error::message_size)
				{
					ec.clear();
				}
				if (ec)
				{
					fail(state, ec, "receive");
					return;
				}

				const udp::endpoint expected(state->address, state->port);
				if (state->sender != expected)
				{
					QOTD_LOG_DEBUG("[" + host_.host_id() + "] Ignoring datagram from " +
								   state->sender.address().to_string() + ":" +
								   std::to_string(state->sender.port()));
					do_receive_datagram(state);
					return;
				}

				complete_with_bytes(state, length);
			});
	}

	auto qotd_client::force_close(std::shared_ptr<request_state> state, cancel_reason reason) -> void
	{
		if (state->completed)
		{
			return;
		}
		if (state->reason == cancel_reason::none)
		{
			state->reason = reason;
		}

		std::error_code ignored;
		state->stream.close(ignored);
		state->datagram.close(ignored);
		state->timer.cancel();
	}

	auto qotd_client::fail(std::shared_ptr<request_state> state,
						   const std::error_code& ec,
						   const std::string& stage) -> void
	{
		if (state->completed)
		{
			return;
		}

		switch (state->reason)
		{
		case cancel_reason::cancelled:
			finish(state, error<std::string>(error_codes::qotd_system::operation_cancelled,
											 "Quote request was cancelled",
											 "qotd_client::request_quote", state->target_text()));
			return;
		case cancel_reason::timed_out:
			finish(state, error<std::string>(error_codes::qotd_system::operation_cancelled,
											 "Quote request timed out after " +
												 std::to_string(state->timeout.count()) + " ms",
											 "qotd_client::request_quote", state->target_text()));
			return;
		case cancel_reason::disposed:
			finish(state, error<std::string>(error_codes::qotd_system::disposed,
											 "Client was stopped during the request",
											 "qotd_client::request_quote", state->target_text()));
			return;
		case cancel_reason::none:
			break;
		}

		host_.report(diagnostic_kind::transport_error,
					 stage + " " + state->target_text() + " failed: " + ec.message());

		const auto code = (stage == "read" || stage == "receive")
							  ? error_codes::qotd_system::transport_error
							  : error_codes::qotd_system::connection_failed;
		finish(state, error<std::string>(code, "Failed to " + stage + ": " + ec.message(),
										 "qotd_client::request_quote", state->target_text()));
	}

	auto qotd_client::complete_with_bytes(std::shared_ptr<request_state> state, std::size_t length)
		-> void
	{
		if (state->completed)
		{
			return;
		}

		if (length == 0)
		{
			finish(state, error<std::string>(error_codes::qotd_system::invalid_response,
											 "Server sent an empty response",
											 "qotd_client::request_quote", state->target_text()));
			return;
		}

		auto text = host_.decode_quote(std::span<const uint8_t>(state->buffer.data(), length),
										 state->encoding);
		if (!text || text->empty())
		{
			finish(state, error<std::string>(error_codes::qotd_system::invalid_response,
											 "Invalid quote received",
											 "qotd_client::request_quote", state->target_text()));
			return;
		}

		finish(state, Result<std::string>(std::move(*text)));
	}

	auto qotd_client::finish(std::shared_ptr<request_state> state, Result<std::string> result) -> void
	{
		if (state->completed)
		{
			return;
		}
		state->completed = true;

		std::error_code ignored;
		state->timer.cancel();
		state->stream.close(ignored);
		state->datagram.close(ignored);
		state->caller_stop.reset();
		state->disposal_stop.reset();

		if (!state->buffer.empty())
		{
			host_.return_buffer(std::move(state->buffer));
			state->buffer.clear();
		}

		auto handler = std::move(state->handler);
		state->handler = nullptr;
		if (handler)
		{
			try
			{
				handler(std::move(result));
			}
			catch (const std::exception& e)
			{
				QOTD_LOG_ERROR("[" + host_.host_id() + "] response handler threw: " +
							   std::string(e.what()));
			}
		}

		state->ticket.release();
	}

} // namespace kcenon::qotd::core
