/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, 🍀☀🌕🌥 🌊
All rights reserved.
*****************************************************************************/

#include "kcenon/qotd/provider/daily_quote_provider.h"
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kcenon::qotd;
using namespace kcenon::qotd::provider;
using namespace std::chrono;

/**
 * @file daily_quote_provider_test.cpp
 * @brief Unit tests for daily_quote_provider
 *
 * Tests validate:
 * - Pool validation
 * - The quote is stable within a day and changes across the rollover
 * - A new quote never repeats the previous one
 * - Rollover time and UTC offset handling
 */

namespace
{
	// A clock the tests move by hand
	struct manual_clock
	{
		std::shared_ptr<system_clock::time_point> now =
			std::make_shared<system_clock::time_point>(sys_days{ year{ 2024 } / 3 / 14 });

		auto function() const -> daily_quote_provider::clock_function
		{
			auto shared = now;
			return [shared]() { return *shared; };
		}

		auto set(sys_days day, seconds time_of_day) -> void { *now = day + time_of_day; }
	};

	const sys_days day_one{ year{ 2024 } / 3 / 14 };
	const sys_days day_two = day_one + days{ 1 };
} // namespace

TEST(DailyQuoteProviderTest, RejectsEmptyPool)
{
	EXPECT_THROW(daily_quote_provider({}), std::invalid_argument);
}

TEST(DailyQuoteProviderTest, RejectsEmptyQuote)
{
	EXPECT_THROW(daily_quote_provider({ "one", "" }), std::invalid_argument);
}

TEST(DailyQuoteProviderTest, InvalidRolloverFallsBackToMidnight)
{
	daily_quote_provider late({ "a" }, hours{ 25 });
	daily_quote_provider negative({ "a" }, seconds{ -1 });

	EXPECT_EQ(late.rollover(), seconds{ 0 });
	EXPECT_EQ(negative.rollover(), seconds{ 0 });
}

TEST(DailyQuoteProviderTest, SingleQuotePoolAlwaysReturnsIt)
{
	manual_clock clock;
	daily_quote_provider provider({ "only" }, seconds{ 0 }, minutes{ 0 }, clock.function(), 7u);

	EXPECT_EQ(provider.get_quote(), "only");
	clock.set(day_two, hours{ 12 });
	EXPECT_EQ(provider.get_quote(), "only");
}

TEST(DailyQuoteProviderTest, QuoteIsStableWithinADay)
{
	manual_clock clock;
	clock.set(day_one, hours{ 8 });
	daily_quote_provider provider({ "a", "b", "c", "d" }, seconds{ 0 }, minutes{ 0 },
								  clock.function(), 42u);

	const auto first = provider.get_quote();
	clock.set(day_one, hours{ 20 });
	EXPECT_EQ(provider.get_quote(), first);
}

TEST(DailyQuoteProviderTest, QuoteChangesAcrossDayBorder)
{
	manual_clock clock;
	clock.set(day_one, hours{ 23 } + minutes{ 59 } + seconds{ 59 });
	daily_quote_provider provider({ "a", "b" }, seconds{ 0 }, minutes{ 0 }, clock.function(), 1u);

	const auto before = provider.get_quote();
	clock.set(day_two, seconds{ 0 });
	const auto after = provider.get_quote();

	EXPECT_NE(before, after);
}

TEST(DailyQuoteProviderTest, NewQuoteNeverRepeatsPrevious)
{
	manual_clock clock;
	daily_quote_provider provider({ "a", "b", "c" }, seconds{ 0 }, minutes{ 0 }, clock.function(),
								  3u);

	auto previous = provider.get_quote();
	for (int day = 1; day <= 50; ++day)
	{
		clock.set(day_one + days{ day }, hours{ 1 });
		auto current = provider.get_quote();
		EXPECT_NE(current, previous) << "day " << day;
		previous = current;
	}
}

TEST(DailyQuoteProviderTest, DuplicateTextsNeverRepeatTheSameQuote)
{
	manual_clock clock;
	daily_quote_provider provider({ "a", "a", "b" }, seconds{ 0 }, minutes{ 0 }, clock.function(),
								  21u);

	auto previous = provider.get_quote();
	for (int day = 1; day <= 30; ++day)
	{
		clock.set(day_one + days{ day }, hours{ 1 });
		auto current = provider.get_quote();
		EXPECT_NE(current, previous) << "day " << day;
		previous = current;
	}
}

TEST(DailyQuoteProviderTest, IdenticalPoolKeepsAnswering)
{
	manual_clock clock;
	daily_quote_provider provider({ "same", "same" }, seconds{ 0 }, minutes{ 0 }, clock.function(),
								  4u);

	EXPECT_EQ(provider.get_quote(), "same");
	clock.set(day_two, hours{ 1 });
	EXPECT_EQ(provider.get_quote(), "same");
}

TEST(DailyQuoteProviderTest, WaitsForRolloverTimeBeforeChanging)
{
	manual_clock clock;
	clock.set(day_one, hours{ 10 });
	daily_quote_provider provider({ "a", "b" }, hours{ 6 }, minutes{ 0 }, clock.function(), 5u);

	const auto first = provider.get_quote();

	clock.set(day_two, hours{ 5 });
	EXPECT_EQ(provider.get_quote(), first);

	clock.set(day_two, hours{ 6 });
	EXPECT_NE(provider.get_quote(), first);
}

TEST(DailyQuoteProviderTest, QuotePickedBeforeRolloverIsReplacedAtRollover)
{
	manual_clock clock;
	clock.set(day_one, hours{ 2 });
	daily_quote_provider provider({ "a", "b" }, hours{ 6 }, minutes{ 0 }, clock.function(), 9u);

	const auto early = provider.get_quote();

	clock.set(day_one, hours{ 7 });
	EXPECT_NE(provider.get_quote(), early);
}

TEST(DailyQuoteProviderTest, UtcOffsetShiftsTheDayBorder)
{
	manual_clock clock;
	// 22:00 UTC is already 00:00 the next day at UTC+2
	clock.set(day_one, hours{ 21 });
	daily_quote_provider provider({ "a", "b" }, seconds{ 0 }, minutes{ 120 }, clock.function(), 11u);

	const auto first = provider.get_quote();
	clock.set(day_one, hours{ 22 });
	EXPECT_NE(provider.get_quote(), first);
}

TEST(DailyQuoteProviderTest, AnswersThroughProviderInterfaceInline)
{
	daily_quote_provider provider({ "inline" });
	bool called = false;

	provider.get_quote(asio::ip::make_address("127.0.0.1"), std::stop_token{},
					   [&called](Result<std::string> result)
					   {
						   called = true;
						   ASSERT_TRUE(result.is_ok());
						   EXPECT_EQ(result.value(), "inline");
					   });

	EXPECT_TRUE(called);
}

TEST(DailyQuoteProviderTest, CancelledTokenYieldsError)
{
	daily_quote_provider provider({ "never" });
	std::stop_source source;
	source.request_stop();

	bool failed = false;
	provider.get_quote(asio::ip::make_address("127.0.0.1"), source.get_token(),
					   [&failed](Result<std::string> result) { failed = result.is_err(); });

	EXPECT_TRUE(failed);
}
