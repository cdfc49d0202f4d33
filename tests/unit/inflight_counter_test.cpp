/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, 🍀☀🌕🌥 🌊
All rights reserved.
*****************************************************************************/

#include "kcenon/qotd/utils/inflight_counter.h"
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

using namespace kcenon::qotd::utils;
using namespace std::chrono_literals;

/**
 * @file inflight_counter_test.cpp
 * @brief Unit tests for inflight_counter
 *
 * Tests validate:
 * - Tickets count while alive and release on destruction
 * - Draining refuses new tickets without touching existing ones
 * - wait_for_idle() wakes when the last ticket goes away and honours its timeout
 */

TEST(InflightCounterTest, TicketCountsWhileAlive)
{
	inflight_counter counter;
	{
		auto ticket = counter.try_enter();
		ASSERT_TRUE(ticket);
		EXPECT_EQ(counter.count(), 1);
	}
	EXPECT_EQ(counter.count(), 0);
}

TEST(InflightCounterTest, MovedTicketReleasesOnce)
{
	inflight_counter counter;
	auto first = counter.try_enter();
	auto second = std::move(first);

	EXPECT_FALSE(first.valid());
	EXPECT_EQ(counter.count(), 1);

	second.release();
	second.release();
	EXPECT_EQ(counter.count(), 0);
}

TEST(InflightCounterTest, DrainingRefusesNewTickets)
{
	inflight_counter counter;
	auto existing = counter.try_enter();

	counter.begin_drain();
	auto refused = counter.try_enter();

	EXPECT_TRUE(counter.is_draining());
	EXPECT_FALSE(refused);
	EXPECT_TRUE(existing);
	EXPECT_EQ(counter.count(), 1);
}

TEST(InflightCounterTest, WaitForIdleReturnsImmediatelyWhenIdle)
{
	inflight_counter counter;
	EXPECT_TRUE(counter.wait_for_idle(0ms));
}

TEST(InflightCounterTest, WaitForIdleTimesOutWithPendingTicket)
{
	inflight_counter counter;
	auto ticket = counter.try_enter();

	const auto started = std::chrono::steady_clock::now();
	EXPECT_FALSE(counter.wait_for_idle(50ms));
	EXPECT_GE(std::chrono::steady_clock::now() - started, 50ms);
}

TEST(InflightCounterTest, WaitForIdleWakesWhenLastTicketLeaves)
{
	inflight_counter counter;
	auto ticket = counter.try_enter();

	auto releaser = std::async(std::launch::async,
							   [&ticket]()
							   {
								   std::this_thread::sleep_for(20ms);
								   ticket.release();
							   });

	EXPECT_TRUE(counter.wait_for_idle(5s));
	releaser.get();
}
