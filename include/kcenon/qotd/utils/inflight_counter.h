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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace kcenon::qotd::utils
{

	/*!
	 * \class inflight_counter
	 * \brief Counts requests in progress and lets a stopper wait for them.
	 *
	 * A request enters with try_enter() before its first suspension point
	 * and leaves when the returned ticket is destroyed. Once begin_drain()
	 * has been called, try_enter() hands out empty tickets; because the
	 * draining flag is checked after the increment, a request racing with
	 * the drain either is counted by wait_for_idle() or sees the flag.
	 *
	 * ### Thread Safety
	 * All methods are thread-safe.
	 *
	 * ### Usage Example
	 * \code
	 * auto ticket = counter.try_enter();
	 * if (!ticket) {
	 *     return; // host is shutting down
	 * }
	 * // ... handle the request; ticket released on scope exit ...
	 * \endcode
	 */
	class inflight_counter
	{
	public:
		/*!
		 * \class ticket
		 * \brief Move-only proof of membership in the in-flight set.
		 */
		class ticket
		{
		public:
			ticket() = default;

			~ticket() { release(); }

			ticket(const ticket&) = delete;
			ticket& operator=(const ticket&) = delete;

			ticket(ticket&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }

			ticket& operator=(ticket&& other) noexcept
			{
				if (this != &other)
				{
					release();
					owner_ = other.owner_;
					other.owner_ = nullptr;
				}
				return *this;
			}

			[[nodiscard]] auto valid() const -> bool { return owner_ != nullptr; }

			explicit operator bool() const { return valid(); }

			auto release() -> void
			{
				if (owner_)
				{
					owner_->leave();
					owner_ = nullptr;
				}
			}

		private:
			friend class inflight_counter;

			explicit ticket(inflight_counter* owner) : owner_(owner) {}

			inflight_counter* owner_ = nullptr;
		};

		inflight_counter() = default;

		inflight_counter(const inflight_counter&) = delete;
		inflight_counter& operator=(const inflight_counter&) = delete;

		/*!
		 * \brief Registers a new request.
		 * \return A valid ticket, or an empty one when draining has begun.
		 */
		[[nodiscard]] auto try_enter() -> ticket
		{
			count_.fetch_add(1, std::memory_order_acq_rel);
			if (draining_.load(std::memory_order_acquire))
			{
				leave();
				return ticket{};
			}
			return ticket{ this };
		}

		/*!
		 * \brief Stops admitting new requests. Idempotent.
		 */
		auto begin_drain() -> void { draining_.store(true, std::memory_order_release); }

		[[nodiscard]] auto is_draining() const -> bool
		{
			return draining_.load(std::memory_order_acquire);
		}

		[[nodiscard]] auto count() const -> std::size_t
		{
			return count_.load(std::memory_order_acquire);
		}

		/*!
		 * \brief Blocks until no request is in flight or \p timeout elapses.
		 * \return true if the counter reached zero.
		 */
		auto wait_for_idle(std::chrono::milliseconds timeout) -> bool
		{
			std::unique_lock<std::mutex> lock(mutex_);
			return idle_.wait_for(lock, timeout, [this] { return count() == 0; });
		}

	private:
		auto leave() -> void
		{
			if (count_.fetch_sub(1, std::memory_order_acq_rel) == 1)
			{
				std::lock_guard<std::mutex> lock(mutex_);
				idle_.notify_all();
			}
		}

		std::atomic<std::size_t> count_{ 0 };
		std::atomic<bool> draining_{ false };
		std::mutex mutex_;
		std::condition_variable idle_;
	};

} // namespace kcenon::qotd::utils
