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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace kcenon::qotd::utils
{

	/*!
	 * \class buffer_pool
	 * \brief Bounded LIFO pool of fixed-length byte buffers
	 *
	 * Every buffer handed out by rent() is exactly buffer_length() bytes
	 * long. Changing the length empties the pool, and a buffer given back
	 * with a stale length is dropped, so a buffer sized for an old bound is
	 * never issued again.
	 *
	 * ### Thread Safety
	 * - All public methods are thread-safe
	 * - rent() and give_back() serialize on one pool-wide mutex and are O(1)
	 *
	 * ### Usage Example
	 * \code
	 * buffer_pool pool(512, 16);
	 *
	 * auto buffer = pool.rent();          // 512 bytes
	 * // fill and send buffer...
	 * pool.give_back(std::move(buffer));  // reused by the next rent()
	 * \endcode
	 */
	class buffer_pool
	{
	public:
		/*!
		 * \brief Constructs a buffer pool
		 * \param buffer_length Length of every buffer in bytes
		 * \param max_pooled Maximum number of idle buffers kept for reuse
		 */
		explicit buffer_pool(size_t buffer_length, size_t max_pooled);

		~buffer_pool() noexcept;

		buffer_pool(const buffer_pool&) = delete;
		buffer_pool& operator=(const buffer_pool&) = delete;

		/*!
		 * \brief Pops the most recently returned buffer, or allocates a new one
		 */
		auto rent() -> std::vector<uint8_t>;

		/*!
		 * \brief Returns a buffer for reuse
		 *
		 * The buffer is discarded when the pool already holds max_pooled()
		 * buffers or when its length differs from buffer_length().
		 */
		auto give_back(std::vector<uint8_t>&& buffer) -> void;

		auto buffer_length() const -> size_t;

		/*!
		 * \brief Changes the length of future buffers and empties the pool
		 */
		auto set_buffer_length(size_t length) -> void;

		auto max_pooled() const -> size_t;

		/*!
		 * \brief Changes the reuse bound, discarding idle buffers above it
		 */
		auto set_max_pooled(size_t max_pooled) -> void;

		/*!
		 * \brief Gets current pool statistics
		 * \return Pair of (available buffers, buffers allocated so far)
		 */
		auto get_stats() const -> std::pair<size_t, size_t>;

		/*!
		 * \brief Releases all idle buffers
		 */
		auto clear() -> void;

	private:
		class impl;
		std::unique_ptr<impl> pimpl_;
	};

} // namespace kcenon::qotd::utils
