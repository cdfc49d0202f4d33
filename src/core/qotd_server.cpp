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

#include "kcenon/qotd/core/qotd_server.h"

#include "kcenon/qotd/integration/logger_integration.h"

#include <array>
#include <exception>
#include <stdexcept>
#include <system_error>

namespace kcenon::qotd::core
{

	using tcp = asio::ip::tcp;
	using udp = asio::ip::udp;

	namespace
	{
		auto unmapped(const asio::ip::address& address) -> asio::ip::address
		{
			if (address.is_v6() && address.to_v6().is_v4_mapped())
			{
				return asio::ip::make_address_v4(asio::ip::v4_mapped, address.to_v6());
			}
			return address;
		}

		auto validated(const std::shared_ptr<provider::quote_provider>& provider)
			-> std::shared_ptr<provider::quote_provider>
		{
			if (!provider)
			{
				throw std::invalid_argument("qotd_server: quote provider cannot be null");
			}
			return provider;
		}

		auto validated(const config::server_options& options) -> const config::server_options&
		{
			config::validate(options);
			return options;
		}

		auto is_address_family_error(const std::error_code& ec) -> bool
		{
			return ec == asio::error::address_family_not_supported ||
				   ec == std::errc::address_not_available;
		}
	} // namespace

	struct qotd_server::datagram_listener
	{
		explicit datagram_listener(asio::io_context& io) : socket(io) {}

		udp::socket socket;
		udp::endpoint sender;
		// Request payloads carry no meaning; the scratch only has to exist.
		std::array<uint8_t, 64> scratch{};
	};

	struct qotd_server::stream_exchange
	{
		stream_exchange(utils::inflight_counter::ticket t, tcp::socket s)
			: ticket(std::move(t)), socket(std::move(s))
		{
		}

		utils::inflight_counter::ticket ticket;
		tcp::socket socket;
	};

	struct qotd_server::datagram_exchange
	{
		utils::inflight_counter::ticket ticket;
		std::shared_ptr<datagram_listener> listener;
		udp::endpoint sender;
	};

	auto to_string(server_state state) -> std::string_view
	{
		switch (state)
		{
		case server_state::idle:
			return "idle";
		case server_state::listening:
			return "listening";
		case server_state::draining:
			return "draining";
		case server_state::disposed:
			return "disposed";
		}
		return "unknown";
	}

	qotd_server::qotd_server(std::shared_ptr<provider::quote_provider> provider,
							 const config::server_options& options,
							 const std::string& server_id)
		: provider_(validated(provider))
		, host_(server_id, validated(options))
		, runner_(server_id)
		, options_(options)
	{
	}

	qotd_server::~qotd_server() noexcept
	{
		try
		{
			(void)stop_server();
		}
		catch (const std::exception& e)
		{
			QOTD_LOG_ERROR("[" + host_.host_id() + "] stop in destructor failed: " +
						   std::string(e.what()));
		}
	}

	auto qotd_server::start_server() -> VoidResult
	{
		std::lock_guard<std::mutex> lock(config_mutex_);

		const auto current = state_.load();
		if (current == server_state::listening)
		{
			return error_void(error_codes::qotd_system::server_already_running,
							  "Server is already running", "qotd_server::start_server",
							  "Server ID: " + host_.host_id());
		}
		if (current != server_state::idle)
		{
			return error_void(error_codes::qotd_system::disposed, "Server has been stopped",
							  "qotd_server::start_server", "Server ID: " + host_.host_id());
		}

		runner_.start();

		auto result = rebind(options_);
		if (result.is_err())
		{
			runner_.run_and_wait([this]() { close_listeners(); });
			runner_.stop();
			return result;
		}

		state_.store(server_state::listening);
		QOTD_LOG_INFO("[" + host_.host_id() + "] Listening, mode=" +
					  std::string(config::to_string(options_.mode)) +
					  ", stream_port=" + std::to_string(stream_port_.load()) +
					  ", datagram_port=" + std::to_string(datagram_port_.load()));
		return ok();
	}

	auto qotd_server::apply_options(const config::server_options& options) -> VoidResult
	{
		config::validate(options);

		std::lock_guard<std::mutex> lock(config_mutex_);

		const auto current = state_.load();
		if (current == server_state::draining || current == server_state::disposed)
		{
			return error_void(error_codes::qotd_system::disposed, "Server has been stopped",
							  "qotd_server::apply_options", "Server ID: " + host_.host_id());
		}

		host_.apply_options(options);
		options_ = options;

		if (current != server_state::listening)
		{
			return ok();
		}

		if (!inflight_.wait_for_idle(config::quiesce_timeout))
		{
			QOTD_LOG_WARN("[" + host_.host_id() + "] " + std::to_string(inflight_.count()) +
						  " requests still in flight, rebinding anyway");
		}

		auto result = rebind(options_);
		QOTD_LOG_INFO("[" + host_.host_id() + "] Reconfigured, mode=" +
					  std::string(config::to_string(options_.mode)));
		return result;
	}

	auto qotd_server::stop_server() -> VoidResult
	{
		std::lock_guard<std::mutex> lock(config_mutex_);

		const auto previous = state_.load();
		if (previous == server_state::disposed)
		{
			return ok();
		}

		state_.store(server_state::draining);
		inflight_.begin_drain();

		if (!inflight_.wait_for_idle(config::quiesce_timeout))
		{
			QOTD_LOG_WARN("[" + host_.host_id() + "] " + std::to_string(inflight_.count()) +
						  " requests still in flight after 5s, disposing anyway");
		}

		host_.dispose();

		runner_.run_and_wait([this]() { close_listeners(); });
		runner_.stop();

		state_.store(server_state::disposed);
		if (previous == server_state::listening)
		{
			QOTD_LOG_INFO("[" + host_.host_id() + "] Stopped");
		}
		return ok();
	}

	auto qotd_server::options() const -> config::server_options
	{
		std::lock_guard<std::mutex> lock(config_mutex_);
		return options_;
	}

	auto qotd_server::set_diagnostic_callback(diagnostic_callback callback) -> void
	{
		host_.set_diagnostic_callback(std::move(callback));
	}

	auto qotd_server::rebind(const config::server_options& options) -> VoidResult
	{
		VoidResult result = ok();
		runner_.run_and_wait(
			[this, &options, &result]()
			{
				auto datagram_result = bind_datagram(options);
				auto stream_result = bind_stream(options);
				if (datagram_result.is_err())
				{
					result = datagram_result;
				}
				else if (stream_result.is_err())
				{
					result = stream_result;
				}
			});
		return result;
	}

	auto qotd_server::bind_datagram(const config::server_options& options) -> VoidResult
	{
		if (datagram_)
		{
			std::error_code ec;
			datagram_->socket.close(ec);
			datagram_.reset();
			datagram_port_.store(0);
		}

		if (!options.datagram_enabled())
		{
			return ok();
		}

		const auto port = options.effective_datagram_port();
		auto listener = std::make_shared<datagram_listener>(runner_.context());
		std::error_code ec;

		if (options.dual_stack)
		{
			listener->socket.open(udp::v6(), ec);
			if (!ec)
			{
				listener->socket.set_option(asio::ip::v6_only(false), ec);
			}
			if (!ec)
			{
				listener->socket.bind(udp::endpoint(udp::v6(), port), ec);
			}
			if (ec && is_address_family_error(ec))
			{
				QOTD_LOG_WARN("[" + host_.host_id() + "] IPv6 unavailable (" + ec.message() +
							  "), binding datagram socket to IPv4");
				std::error_code ignored;
				listener->socket.close(ignored);
				ec.clear();
				listener->socket.open(udp::v4(), ec);
				if (!ec)
				{
					listener->socket.bind(udp::endpoint(udp::v4(), port), ec);
				}
			}
		}
		else
		{
			listener->socket.open(udp::v4(), ec);
			if (!ec)
			{
				listener->socket.bind(udp::endpoint(udp::v4(), port), ec);
			}
		}

		if (ec)
		{
			std::error_code ignored;
			listener->socket.close(ignored);
			QOTD_LOG_ERROR("[" + host_.host_id() + "] Failed to bind datagram port " +
						   std::to_string(port) + ": " + ec.message());
			return error_void(error_codes::qotd_system::bind_failed,
							  "Failed to bind datagram socket: " + ec.message(),
							  "qotd_server::bind_datagram", "Port: " + std::to_string(port));
		}

		datagram_ = listener;
		datagram_port_.store(listener->socket.local_endpoint(ec).port());
		do_receive(listener);
		return ok();
	}

	auto qotd_server::bind_stream(const config::server_options& options) -> VoidResult
	{
		if (acceptor_)
		{
			std::error_code ec;
			acceptor_->cancel(ec);
			acceptor_->close(ec);
			acceptor_.reset();
			stream_port_.store(0);
		}

		if (!options.stream_enabled())
		{
			return ok();
		}

		const auto port = options.effective_stream_port();
		auto acceptor = std::make_shared<tcp::acceptor>(runner_.context());

		auto open_and_bind = [&acceptor, port](const tcp& protocol, bool dual) -> std::error_code
		{
			std::error_code ec;
			acceptor->open(protocol, ec);
			if (ec)
			{
				return ec;
			}
			acceptor->set_option(asio::socket_base::reuse_address(true), ec);
			if (!ec && dual)
			{
				acceptor->set_option(asio::ip::v6_only(false), ec);
			}
			if (!ec)
			{
				acceptor->bind(tcp::endpoint(protocol, port), ec);
			}
			if (!ec)
			{
				acceptor->listen(asio::socket_base::max_listen_connections, ec);
			}
			return ec;
		};

		std::error_code ec;
		if (options.dual_stack)
		{
			ec = open_and_bind(tcp::v6(), true);
			if (ec && is_address_family_error(ec))
			{
				QOTD_LOG_WARN("[" + host_.host_id() + "] IPv6 unavailable (" + ec.message() +
							  "), binding stream listener to IPv4");
				std::error_code ignored;
				acceptor->close(ignored);
				ec = open_and_bind(tcp::v4(), false);
			}
		}
		else
		{
			ec = open_and_bind(tcp::v4(), false);
		}

		if (ec)
		{
			std::error_code ignored;
			acceptor->close(ignored);
			QOTD_LOG_ERROR("[" + host_.host_id() + "] Failed to bind stream port " +
						   std::to_string(port) + ": " + ec.message());
			return error_void(error_codes::qotd_system::bind_failed,
							  "Failed to bind stream listener: " + ec.message(),
							  "qotd_server::bind_stream", "Port: " + std::to_string(port));
		}

		acceptor_ = acceptor;
		stream_port_.store(acceptor->local_endpoint(ec).port());
		do_accept(acceptor);
		return ok();
	}

	auto qotd_server::close_listeners() -> void
	{
		std::error_code ec;
		if (acceptor_)
		{
			acceptor_->cancel(ec);
			acceptor_->close(ec);
			acceptor_.reset();
		}
		if (datagram_)
		{
			datagram_->socket.close(ec);
			datagram_.reset();
		}
		stream_port_.store(0);
		datagram_port_.store(0);
	}

	auto qotd_server::do_accept(std::shared_ptr<tcp::acceptor> acceptor) -> void
	{
		auto self = shared_from_this();
		acceptor->async_accept(
			[this, self, acceptor](std::error_code ec, tcp::socket socket)
			{ on_accept(acceptor, ec, std::move(socket)); });
	}

	auto qotd_server::on_accept(std::shared_ptr<tcp::acceptor> acceptor,
								std::error_code ec,
								tcp::socket socket) -> void
	{
		if (ec)
		{
			if (is_shutdown_race(ec) || !acceptor->is_open())
			{
				QOTD_LOG_TRACE("[" + host_.host_id() + "] Accept loop ended: " + ec.message());
				return;
			}
			if (ec == asio::error::connection_aborted)
			{
				QOTD_LOG_DEBUG("[" + host_.host_id() + "] Peer aborted before accept");
			}
			else
			{
				host_.report(diagnostic_kind::transport_error, "accept failed: " + ec.message());
			}
		}
		else
		{
			auto ticket = inflight_.try_enter();
			std::error_code endpoint_ec;
			const auto remote = socket.remote_endpoint(endpoint_ec);

			if (!ticket)
			{
				QOTD_LOG_TRACE("[" + host_.host_id() + "] Draining, dropping connection");
			}
			else if (endpoint_ec)
			{
				QOTD_LOG_DEBUG("[" + host_.host_id() + "] Peer left before dispatch: " +
							   endpoint_ec.message());
			}
			else
			{
				QOTD_LOG_TRACE("[" + host_.host_id() + "] Stream request from " +
							   remote.address().to_string());
				auto exchange = std::make_shared<stream_exchange>(std::move(ticket), std::move(socket));
				auto self = shared_from_this();
				query_provider(unmapped(remote.address()),
							   [this, self, exchange](const std::string& text)
							   { send_stream_reply(exchange, text); });
			}
		}

		if (!inflight_.is_draining() && acceptor == acceptor_)
		{
			do_accept(acceptor);
		}
	}

	auto qotd_server::do_receive(std::shared_ptr<datagram_listener> listener) -> void
	{
		auto self = shared_from_this();
		listener->socket.async_receive_from(
			asio::buffer(listener->scratch), listener->sender,
			[this, self, listener](std::error_code ec, std::size_t)
			{ on_receive(listener, ec); });
	}

	auto qotd_server::on_receive(std::shared_ptr<datagram_listener> listener, std::error_code ec)
		-> void
	{
		// An oversized request is still a request.
		if (ec == asio::error::message_size)
		{
			ec.clear();
		}

		if (ec)
		{
			if (is_shutdown_race(ec) || !listener->socket.is_open())
			{
				QOTD_LOG_TRACE("[" + host_.host_id() + "] Receive loop ended: " + ec.message());
				return;
			}
			host_.report(diagnostic_kind::transport_error, "receive failed: " + ec.message());
		}
		else
		{
			auto ticket = inflight_.try_enter();
			if (!ticket)
			{
				QOTD_LOG_TRACE("[" + host_.host_id() + "] Draining, dropping datagram");
			}
			else
			{
				auto exchange = std::make_shared<datagram_exchange>(
					datagram_exchange{ std::move(ticket), listener, listener->sender });
				QOTD_LOG_TRACE("[" + host_.host_id() + "] Datagram request from " +
							   exchange->sender.address().to_string());
				auto self = shared_from_this();
				query_provider(unmapped(exchange->sender.address()),
							   [this, self, exchange](const std::string& text)
							   { send_datagram_reply(exchange, text); });
			}
		}

		if (!inflight_.is_draining() && listener == datagram_)
		{
			do_receive(listener);
		}
	}

	auto qotd_server::query_provider(const asio::ip::address& remote,
									 std::function<void(const std::string&)> respond) -> void
	{
		auto self = shared_from_this();
		auto answered = std::make_shared<std::atomic<bool>>(false);

		provider::quote_handler handler =
			[this, self, answered, respond](Result<std::string> result)
		{
			if (answered->exchange(true))
			{
				return;
			}

			auto complete = [this, self, respond, result = std::move(result)]()
			{
				if (result.is_err())
				{
					if (host_.is_disposed())
					{
						QOTD_LOG_TRACE("[" + host_.host_id() + "] Provider gave up on shutdown: " +
									   result.error().message);
						return;
					}
					host_.report(diagnostic_kind::provider_failure,
								 "quote provider failed: " + result.error().message);
					return;
				}
				respond(result.value());
			};

			if (runner_.running_in_this_thread())
			{
				complete();
			}
			else if (runner_.is_running())
			{
				runner_.post(std::move(complete));
			}
		};

		try
		{
			provider_->get_quote(remote, host_.disposal_token(), std::move(handler));
		}
		catch (const std::exception& e)
		{
			if (!answered->exchange(true))
			{
				host_.report(diagnostic_kind::provider_failure,
							 "quote provider threw: " + std::string(e.what()));
			}
		}
	}

	auto qotd_server::send_stream_reply(std::shared_ptr<stream_exchange> exchange,
										const std::string& text) -> void
	{
		if (host_.is_disposed())
		{
			return;
		}

		auto encoded = host_.encode_quote(text);
		if (!encoded)
		{
			return;
		}

		auto payload = std::make_shared<encoded_quote>(std::move(*encoded));
		auto self = shared_from_this();
		asio::async_write(
			exchange->socket, asio::buffer(payload->buffer.data(), payload->size),
			[this, self, exchange, payload](std::error_code ec, std::size_t)
			{
				host_.return_buffer(std::move(payload->buffer));

				if (ec && !is_shutdown_race(ec))
				{
					host_.report(diagnostic_kind::transport_error,
								 "stream write failed: " + ec.message());
				}

				std::error_code ignored;
				exchange->socket.shutdown(tcp::socket::shutdown_both, ignored);
				exchange->socket.close(ignored);
			});
	}

	auto qotd_server::send_datagram_reply(std::shared_ptr<datagram_exchange> exchange,
										  const std::string& text) -> void
	{
		if (host_.is_disposed())
		{
			return;
		}

		auto encoded = host_.encode_quote(text);
		if (!encoded)
		{
			return;
		}

		auto payload = std::make_shared<encoded_quote>(std::move(*encoded));
		auto self = shared_from_this();
		exchange->listener->socket.async_send_to(
			asio::buffer(payload->buffer.data(), payload->size), exchange->sender,
			[this, self, exchange, payload](std::error_code ec, std::size_t)
			{
				host_.return_buffer(std::move(payload->buffer));

				if (ec && !is_shutdown_race(ec))
				{
					host_.report(diagnostic_kind::transport_error,
								 "datagram send failed: " + ec.message());
				}
			});
	}

	auto qotd_server::is_shutdown_race(const std::error_code& ec) const -> bool
	{
		return ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor;
	}

} // namespace kcenon::qotd::core
