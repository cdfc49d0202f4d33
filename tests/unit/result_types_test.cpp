/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, 🍀☀🌕🌥 🌊
All rights reserved.
*****************************************************************************/

#include "kcenon/qotd/utils/result_types.h"
#include <gtest/gtest.h>

#include <set>
#include <string>

namespace qotd = kcenon::qotd;

/**
 * @file result_types_test.cpp
 * @brief Unit tests for Result<T>, helper functions and error codes
 *
 * Tests validate:
 * - Result<T> ok/error creation and inspection
 * - VoidResult ok/error creation
 * - Default error source
 * - qotd_system error codes are distinct
 */

// ============================================================================
// Result<T> OK State Tests
// ============================================================================

TEST(ResultOkTest, OkStringResult)
{
	std::string value = "hello";
	auto result = qotd::ok(std::move(value));
	EXPECT_TRUE(result.is_ok());
	EXPECT_FALSE(result.is_err());
	EXPECT_EQ(result.value(), "hello");
}

TEST(ResultOkTest, VoidResultOk)
{
	auto result = qotd::ok();
	EXPECT_TRUE(result.is_ok());
	EXPECT_TRUE(static_cast<bool>(result));
}

// ============================================================================
// Result<T> Error State Tests
// ============================================================================

TEST(ResultErrorTest, ErrorCarriesAllFields)
{
	auto result = qotd::error<std::string>(qotd::error_codes::qotd_system::invalid_response,
										   "Invalid quote received", "qotd_client",
										   "127.0.0.1:17");
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, qotd::error_codes::qotd_system::invalid_response);
	EXPECT_EQ(result.error().message, "Invalid quote received");
	EXPECT_EQ(result.error().source, "qotd_client");
	EXPECT_EQ(result.error().details, "127.0.0.1:17");
}

TEST(ResultErrorTest, DefaultSourceIsQotdSystem)
{
	auto result = qotd::error_void(qotd::error_codes::qotd_system::bind_failed, "bind");
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().source, "qotd_system");
	EXPECT_FALSE(static_cast<bool>(result));
}

// ============================================================================
// Error Code Tests
// ============================================================================

TEST(ErrorCodeTest, QotdCodesAreDistinctAndNegative)
{
	namespace codes = qotd::error_codes::qotd_system;
	const std::set<int> values{ codes::connection_failed, codes::connection_refused,
								codes::send_failed,       codes::receive_failed,
								codes::invalid_response,  codes::operation_cancelled,
								codes::disposed,          codes::transport_error,
								codes::server_not_started, codes::server_already_running,
								codes::bind_failed,       codes::provider_failed };

	EXPECT_EQ(values.size(), 12);
	EXPECT_LT(*values.rbegin(), 0);
}
