/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, 🍀☀🌕🌥 🌊
All rights reserved.
*****************************************************************************/

#include "kcenon/qotd/utils/buffer_pool.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace kcenon::qotd::utils;

/**
 * @file buffer_pool_test.cpp
 * @brief Unit tests for buffer_pool
 *
 * Tests validate:
 * - Rented buffers have the configured length
 * - LIFO reuse of returned buffers
 * - Pool size limit enforcement (excess buffers discarded)
 * - Length change clears the pool and rejects stale buffers
 * - Concurrent rent/return never allocates more buffers than renters
 */

// ============================================================================
// Rent Tests
// ============================================================================

class BufferPoolRentTest : public ::testing::Test
{
protected:
	std::unique_ptr<buffer_pool> pool_;

	void SetUp() override { pool_ = std::make_unique<buffer_pool>(512, 4); }
};

TEST_F(BufferPoolRentTest, StartsEmpty)
{
	auto [available, total] = pool_->get_stats();
	EXPECT_EQ(available, 0);
	EXPECT_EQ(total, 0);
}

TEST_F(BufferPoolRentTest, RentedBufferHasConfiguredLength)
{
	auto buffer = pool_->rent();
	EXPECT_EQ(buffer.size(), 512);
	EXPECT_EQ(pool_->get_stats().second, 1);
}

TEST_F(BufferPoolRentTest, ReturnedBufferIsReused)
{
	auto buffer = pool_->rent();
	const auto* storage = buffer.data();
	pool_->give_back(std::move(buffer));

	EXPECT_EQ(pool_->get_stats().first, 1);

	auto again = pool_->rent();
	EXPECT_EQ(again.data(), storage);
	EXPECT_EQ(pool_->get_stats().second, 1);
}

TEST_F(BufferPoolRentTest, MostRecentlyReturnedComesBackFirst)
{
	auto first = pool_->rent();
	auto second = pool_->rent();
	const auto* second_storage = second.data();

	pool_->give_back(std::move(first));
	pool_->give_back(std::move(second));

	auto next = pool_->rent();
	EXPECT_EQ(next.data(), second_storage);
}

// ============================================================================
// Limit Tests
// ============================================================================

TEST(BufferPoolLimitTest, DiscardsBuffersBeyondMaxPooled)
{
	buffer_pool pool(64, 2);

	std::vector<std::vector<uint8_t>> rented;
	for (int i = 0; i < 5; ++i)
	{
		rented.push_back(pool.rent());
	}
	for (auto& buffer : rented)
	{
		pool.give_back(std::move(buffer));
	}

	EXPECT_EQ(pool.get_stats().first, 2);
}

TEST(BufferPoolLimitTest, ZeroMaxPooledDisablesReuse)
{
	buffer_pool pool(64, 0);

	pool.give_back(pool.rent());
	pool.give_back(pool.rent());

	auto [available, total] = pool.get_stats();
	EXPECT_EQ(available, 0);
	EXPECT_EQ(total, 2);
}

TEST(BufferPoolLimitTest, LoweringMaxPooledTrimsIdleBuffers)
{
	buffer_pool pool(64, 4);
	auto a = pool.rent();
	auto b = pool.rent();
	auto c = pool.rent();
	pool.give_back(std::move(a));
	pool.give_back(std::move(b));
	pool.give_back(std::move(c));

	pool.set_max_pooled(1);

	EXPECT_EQ(pool.get_stats().first, 1);
}

// ============================================================================
// Length Change Tests
// ============================================================================

TEST(BufferPoolLengthTest, LengthChangeClearsPool)
{
	buffer_pool pool(128, 4);
	pool.give_back(pool.rent());
	ASSERT_EQ(pool.get_stats().first, 1);

	pool.set_buffer_length(256);

	EXPECT_EQ(pool.get_stats().first, 0);
	EXPECT_EQ(pool.rent().size(), 256);
}

TEST(BufferPoolLengthTest, StaleBufferIsNeverReissued)
{
	buffer_pool pool(128, 4);
	auto stale = pool.rent();

	pool.set_buffer_length(32);
	pool.give_back(std::move(stale));

	EXPECT_EQ(pool.get_stats().first, 0);
	EXPECT_EQ(pool.rent().size(), 32);
}

TEST(BufferPoolLengthTest, SameLengthKeepsPool)
{
	buffer_pool pool(128, 4);
	pool.give_back(pool.rent());

	pool.set_buffer_length(128);

	EXPECT_EQ(pool.get_stats().first, 1);
}

TEST(BufferPoolLengthTest, ClearDropsIdleBuffers)
{
	buffer_pool pool(16, 4);
	pool.give_back(pool.rent());

	pool.clear();

	EXPECT_EQ(pool.get_stats().first, 0);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST(BufferPoolConcurrencyTest, AllocationsBoundedByConcurrentRenters)
{
	constexpr int renters = 4;
	constexpr int cycles = 500;
	buffer_pool pool(256, renters);

	std::vector<std::thread> threads;
	for (int t = 0; t < renters; ++t)
	{
		threads.emplace_back(
			[&pool]()
			{
				for (int i = 0; i < cycles; ++i)
				{
					auto buffer = pool.rent();
					buffer[0] = static_cast<uint8_t>(i);
					pool.give_back(std::move(buffer));
				}
			});
	}
	for (auto& thread : threads)
	{
		thread.join();
	}

	auto [available, total] = pool.get_stats();
	EXPECT_LE(total, static_cast<size_t>(renters));
	EXPECT_EQ(available, total);
}
