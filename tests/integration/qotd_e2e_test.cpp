/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, 🍀☀🌕🌥 🌊
All rights reserved.
*****************************************************************************/

#include "kcenon/qotd/core/qotd_client.h"
#include "kcenon/qotd/core/qotd_server.h"
#include "kcenon/qotd/provider/daily_quote_provider.h"
#include "kcenon/qotd/provider/quote_provider.h"
#include "../helpers/qotd_test_helpers.h"
#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::qotd;
using namespace kcenon::qotd::core;
using namespace kcenon::qotd::testing;
using namespace std::chrono_literals;

/**
 * @file qotd_e2e_test.cpp
 * @brief End-to-end tests for qotd_client against qotd_server
 *
 * Tests validate:
 * - Stream and datagram exchanges, including a slow provider
 * - Timeouts and caller cancellation surface as operation_cancelled
 * - Reconfiguration while a stream request is in flight
 * - Truncation, unrepresentable quotes and alternate encodings
 * - Connection failures and client disposal
 */

class QotdEndToEndTest : public ::testing::Test
{
protected:
	void TearDown() override
	{
		client_.reset();
		if (server_)
		{
			EXPECT_TRUE(server_->stop_server().is_ok());
		}
	}

	auto start_server(std::shared_ptr<provider::quote_provider> provider,
					  config::server_options options = {}) -> void
	{
		options.port = 0;
		server_ = std::make_shared<qotd_server>(std::move(provider), options, "e2e_server");
		auto result = server_->start_server();
		ASSERT_TRUE(result.is_ok()) << result.error().message;
	}

	auto connect_client(config::client_mode mode, config::client_options options = {}) -> void
	{
		options.mode = mode;
		options.port = mode == config::client_mode::stream ? server_->stream_port()
														   : server_->datagram_port();
		options.default_timeout = 2s;
		client_ = std::make_unique<qotd_client>(options, "e2e_client");
	}

	std::shared_ptr<qotd_server> server_;
	std::unique_ptr<qotd_client> client_;
};

// ============================================================================
// Basic exchanges
// ============================================================================

TEST_F(QotdEndToEndTest, StreamRequestReturnsFixedQuote)
{
	start_server(std::make_shared<provider::fixed_quote_provider>("Test Quote"));
	connect_client(config::client_mode::stream);

	auto result = client_->request_quote();

	ASSERT_TRUE(result.is_ok()) << result.error().message;
	EXPECT_EQ(result.value(), "Test Quote");
}

TEST_F(QotdEndToEndTest, DatagramRequestWaitsForSlowProvider)
{
	auto provider = std::make_shared<delayed_quote_provider>("Delayed quote", 100ms);
	config::server_options options;
	options.mode = config::server_mode::datagram;
	start_server(provider, options);
	connect_client(config::client_mode::datagram);

	auto result = client_->request_quote(2s);

	ASSERT_TRUE(result.is_ok()) << result.error().message;
	EXPECT_EQ(result.value(), "Delayed quote");
	EXPECT_EQ(provider->calls(), 1);
}

TEST_F(QotdEndToEndTest, RepeatedRequestsReuseClient)
{
	start_server(std::make_shared<provider::daily_quote_provider>(
		std::vector<std::string>{ "Daily wisdom" }));
	connect_client(config::client_mode::stream);

	for (int i = 0; i < 5; ++i)
	{
		auto result = client_->request_quote();
		ASSERT_TRUE(result.is_ok()) << "attempt " << i << ": " << result.error().message;
		EXPECT_EQ(result.value(), "Daily wisdom");
	}
	EXPECT_EQ(client_->in_flight(), 0);
}

TEST_F(QotdEndToEndTest, ConcurrentRequestsAllComplete)
{
	start_server(std::make_shared<delayed_quote_provider>("Together", 50ms));
	connect_client(config::client_mode::stream);

	constexpr int request_count = 8;
	std::vector<std::promise<Result<std::string>>> replies(request_count);
	for (auto& reply : replies)
	{
		client_->async_request_quote(2s, {}, [&reply](Result<std::string> result)
									 { reply.set_value(std::move(result)); });
	}

	for (auto& reply : replies)
	{
		auto result = reply.get_future().get();
		ASSERT_TRUE(result.is_ok()) << result.error().message;
		EXPECT_EQ(result.value(), "Together");
	}
}

// ============================================================================
// Timeouts and cancellation
// ============================================================================

TEST_F(QotdEndToEndTest, ShortTimeoutCancelsQuickly)
{
	start_server(std::make_shared<delayed_quote_provider>("Too late", 1s));
	connect_client(config::client_mode::stream);

	const auto started = std::chrono::steady_clock::now();
	auto result = client_->request_quote(1ms);
	const auto elapsed = std::chrono::steady_clock::now() - started;

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::qotd_system::operation_cancelled);
	EXPECT_LT(elapsed, 500ms);
}

TEST_F(QotdEndToEndTest, DatagramTimeoutWhenServerNeverAnswers)
{
	config::server_options options;
	options.mode = config::server_mode::datagram;
	start_server(std::make_shared<failing_quote_provider>(), options);
	connect_client(config::client_mode::datagram);

	auto result = client_->request_quote(100ms);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::qotd_system::operation_cancelled);
	EXPECT_NE(result.error().message.find("timed out"), std::string::npos);
}

TEST_F(QotdEndToEndTest, CallerTokenCancelsPendingRequest)
{
	auto provider = std::make_shared<gated_quote_provider>();
	start_server(provider);
	connect_client(config::client_mode::stream);

	std::stop_source source;
	std::promise<Result<std::string>> reply;
	client_->async_request_quote(-1ms, source.get_token(), [&reply](Result<std::string> result)
								 { reply.set_value(std::move(result)); });
	ASSERT_TRUE(provider->wait_for_pending(1));

	source.request_stop();
	auto result = reply.get_future().get();

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::qotd_system::operation_cancelled);

	provider->release_all("Unread");
}

TEST_F(QotdEndToEndTest, AlreadyCancelledTokenFailsImmediately)
{
	start_server(std::make_shared<provider::fixed_quote_provider>("Never asked"));
	connect_client(config::client_mode::stream);

	std::stop_source source;
	source.request_stop();
	auto result = client_->request_quote(0ms, source.get_token());

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::qotd_system::operation_cancelled);
}

// ============================================================================
// Reconfiguration mid-flight
// ============================================================================

TEST_F(QotdEndToEndTest, StreamRequestInFlightSurvivesSwitchToDatagram)
{
	auto provider = std::make_shared<gated_quote_provider>();
	config::server_options options;
	options.mode = config::server_mode::stream;
	start_server(provider, options);
	connect_client(config::client_mode::stream);

	std::promise<Result<std::string>> reply;
	client_->async_request_quote(3s, {}, [&reply](Result<std::string> result)
								 { reply.set_value(std::move(result)); });
	ASSERT_TRUE(provider->wait_for_pending(1));

	config::server_options datagram_only;
	datagram_only.mode = config::server_mode::datagram;
	datagram_only.port = 0;
	auto reconfigured = std::async(std::launch::async,
								   [this, datagram_only] { return server_->apply_options(datagram_only); });

	// The rebind waits for the in-flight request before tearing the listener down
	std::this_thread::sleep_for(50ms);
	EXPECT_TRUE(server_->has_stream_listener());
	EXPECT_EQ(provider->release_all("Before teardown"), 1);

	auto result = reply.get_future().get();
	ASSERT_TRUE(result.is_ok()) << result.error().message;
	EXPECT_EQ(result.value(), "Before teardown");

	ASSERT_TRUE(reconfigured.get().is_ok());
	EXPECT_FALSE(server_->has_stream_listener());
	ASSERT_TRUE(server_->has_datagram_socket());

	config::client_options datagram_client;
	datagram_client.mode = config::client_mode::datagram;
	datagram_client.port = server_->datagram_port();
	client_->apply_options(datagram_client);

	std::promise<Result<std::string>> second;
	client_->async_request_quote(2s, {}, [&second](Result<std::string> r)
								 { second.set_value(std::move(r)); });
	ASSERT_TRUE(provider->wait_for_pending(1));
	provider->release_all("After rebind");

	auto after = second.get_future().get();
	ASSERT_TRUE(after.is_ok()) << after.error().message;
	EXPECT_EQ(after.value(), "After rebind");
}

TEST_F(QotdEndToEndTest, InFlightRequestKeepsEncodingItStartedWith)
{
	auto provider = std::make_shared<gated_quote_provider>();
	config::server_options options;
	options.mode = config::server_mode::stream;
	options.encoding = codec::text_encoding::latin1;
	start_server(provider, options);

	config::client_options latin1_client;
	latin1_client.encoding = codec::text_encoding::latin1;
	connect_client(config::client_mode::stream, latin1_client);

	std::promise<Result<std::string>> reply;
	client_->async_request_quote(3s, {}, [&reply](Result<std::string> result)
								 { reply.set_value(std::move(result)); });
	ASSERT_TRUE(provider->wait_for_pending(1));

	auto ascii_client = client_->options();
	ascii_client.encoding = codec::text_encoding::ascii;
	client_->apply_options(ascii_client);

	provider->release_all("Caf\xC3\xA9");
	auto result = reply.get_future().get();
	ASSERT_TRUE(result.is_ok()) << result.error().message;
	EXPECT_EQ(result.value(), "Caf\xC3\xA9");

	// The next request decodes as ASCII and rejects the Latin-1 byte
	std::promise<Result<std::string>> next;
	client_->async_request_quote(3s, {}, [&next](Result<std::string> r)
								 { next.set_value(std::move(r)); });
	ASSERT_TRUE(provider->wait_for_pending(1));
	provider->release_all("Caf\xC3\xA9");

	auto rejected = next.get_future().get();
	ASSERT_TRUE(rejected.is_err());
	EXPECT_EQ(rejected.error().code, error_codes::qotd_system::invalid_response);
}

TEST_F(QotdEndToEndTest, WaitingExchangeRepliesWithReconfiguredLength)
{
	auto provider = std::make_shared<gated_quote_provider>();
	config::server_options options;
	options.mode = config::server_mode::stream;
	start_server(provider, options);
	connect_client(config::client_mode::stream);

	std::promise<Result<std::string>> reply;
	client_->async_request_quote(3s, {}, [&reply](Result<std::string> result)
								 { reply.set_value(std::move(result)); });
	ASSERT_TRUE(provider->wait_for_pending(1));

	auto shorter = options;
	shorter.maximum_quote_length = 5;
	auto reconfigured = std::async(std::launch::async,
								   [this, shorter] { return server_->apply_options(shorter); });

	std::this_thread::sleep_for(50ms);
	EXPECT_EQ(provider->release_all("A quote that keeps going"), 1);

	auto result = reply.get_future().get();
	ASSERT_TRUE(result.is_ok()) << result.error().message;
	EXPECT_EQ(result.value(), "A quo");
	ASSERT_TRUE(reconfigured.get().is_ok());
}

// ============================================================================
// Encoding and length limits
// ============================================================================

TEST_F(QotdEndToEndTest, LongQuoteIsTruncatedToLimit)
{
	config::server_options options;
	options.maximum_quote_length = 10;
	start_server(std::make_shared<provider::fixed_quote_provider>("A quote that keeps going"), options);

	std::atomic<int> truncations{ 0 };
	server_->set_diagnostic_callback(
		[&truncations](const diagnostic& d)
		{
			if (d.kind == diagnostic_kind::quote_truncated)
			{
				truncations++;
			}
		});
	connect_client(config::client_mode::stream);

	auto result = client_->request_quote();

	ASSERT_TRUE(result.is_ok()) << result.error().message;
	EXPECT_EQ(result.value(), "A quote th");
	EXPECT_EQ(truncations.load(), 1);
}

TEST_F(QotdEndToEndTest, UnrepresentableQuoteClosesWithoutReply)
{
	start_server(std::make_shared<provider::fixed_quote_provider>("Caf\xC3\xA9 society"));
	connect_client(config::client_mode::stream);

	auto result = client_->request_quote();

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::qotd_system::invalid_response);
}

TEST_F(QotdEndToEndTest, Latin1QuoteRoundTripsThroughBothHosts)
{
	config::server_options options;
	options.encoding = codec::text_encoding::latin1;
	start_server(std::make_shared<provider::fixed_quote_provider>("Caf\xC3\xA9 society"), options);

	config::client_options client_options;
	client_options.encoding = codec::text_encoding::latin1;
	connect_client(config::client_mode::datagram, client_options);

	auto result = client_->request_quote();

	ASSERT_TRUE(result.is_ok()) << result.error().message;
	EXPECT_EQ(result.value(), "Caf\xC3\xA9 society");
}

TEST_F(QotdEndToEndTest, AsciiClientRejectsUtf8Reply)
{
	config::server_options options;
	options.encoding = codec::text_encoding::utf8;
	start_server(std::make_shared<provider::fixed_quote_provider>("\xE2\x98\x80 sunny"), options);
	connect_client(config::client_mode::stream);

	auto result = client_->request_quote();

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::qotd_system::invalid_response);
}

// ============================================================================
// Transport failures and disposal
// ============================================================================

TEST(QotdClientFailureTest, ConnectionRefusedIsConnectionFailed)
{
	config::client_options options;
	options.port = find_available_port(25000);
	qotd_client client(options);

	auto result = client.request_quote(2s);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::qotd_system::connection_failed);
}

TEST(QotdClientFailureTest, RequestAfterStopIsDisposed)
{
	qotd_client client;
	client.stop_client();
	client.stop_client();

	auto result = client.request_quote();

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::qotd_system::disposed);
	EXPECT_TRUE(client.is_disposed());
}

TEST(QotdClientFailureTest, InvalidHostThrows)
{
	config::client_options options;
	options.host = "not an address";
	EXPECT_THROW(qotd_client{ options }, std::invalid_argument);
}

TEST_F(QotdEndToEndTest, StopClientWaitsForInFlightRequest)
{
	start_server(std::make_shared<delayed_quote_provider>("Finished first", 200ms));
	connect_client(config::client_mode::stream);

	std::promise<Result<std::string>> reply;
	client_->async_request_quote(2s, {}, [&reply](Result<std::string> result)
								 { reply.set_value(std::move(result)); });
	client_->stop_client();

	auto future = reply.get_future();
	ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
	auto result = future.get();
	ASSERT_TRUE(result.is_ok()) << result.error().message;
	EXPECT_EQ(result.value(), "Finished first");
}

TEST(QotdDatagramClientTest, IgnoresRepliesFromOtherEndpoints)
{
	asio::io_context io;
	asio::ip::udp::socket target(io, asio::ip::udp::endpoint(asio::ip::udp::v4(), 0));
	asio::ip::udp::socket decoy(io, asio::ip::udp::endpoint(asio::ip::udp::v4(), 0));

	config::client_options options;
	options.mode = config::client_mode::datagram;
	options.port = target.local_endpoint().port();
	qotd_client client(options);

	std::promise<Result<std::string>> reply;
	client.async_request_quote(2s, {}, [&reply](Result<std::string> result)
							   { reply.set_value(std::move(result)); });

	std::array<uint8_t, 16> request{};
	asio::ip::udp::endpoint requester;
	target.receive_from(asio::buffer(request), requester);

	const std::string fake = "Decoy";
	decoy.send_to(asio::buffer(fake), requester);
	std::this_thread::sleep_for(20ms);

	const std::string genuine = "Genuine";
	target.send_to(asio::buffer(genuine), requester);

	auto result = reply.get_future().get();
	ASSERT_TRUE(result.is_ok()) << result.error().message;
	EXPECT_EQ(result.value(), "Genuine");
}
