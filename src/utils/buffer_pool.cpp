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

#include "kcenon/qotd/utils/buffer_pool.h"
#include "kcenon/qotd/integration/logger_integration.h"

#include <mutex>
#include <string>

namespace kcenon::qotd::utils
{

	class buffer_pool::impl
	{
	public:
		impl(size_t buffer_length, size_t max_pooled)
			: buffer_length_(buffer_length), max_pooled_(max_pooled), total_allocated_(0)
		{
			available_buffers_.reserve(max_pooled);
			QOTD_LOG_DEBUG("[buffer_pool] Created with buffer_length=" +
						   std::to_string(buffer_length) +
						   ", max_pooled=" + std::to_string(max_pooled));
		}

		auto rent() -> std::vector<uint8_t>
		{
			std::lock_guard<std::mutex> lock(mutex_);

			if (!available_buffers_.empty())
			{
				auto buffer = std::move(available_buffers_.back());
				available_buffers_.pop_back();
				QOTD_LOG_TRACE("[buffer_pool] Reused buffer, available=" +
							   std::to_string(available_buffers_.size()));
				return buffer;
			}

			++total_allocated_;
			QOTD_LOG_TRACE("[buffer_pool] Allocated buffer, length=" +
						   std::to_string(buffer_length_) +
						   ", total_allocated=" + std::to_string(total_allocated_));
			return std::vector<uint8_t>(buffer_length_);
		}

		auto give_back(std::vector<uint8_t>&& buffer) -> void
		{
			std::lock_guard<std::mutex> lock(mutex_);

			if (buffer.size() != buffer_length_)
			{
				QOTD_LOG_TRACE("[buffer_pool] Dropping buffer of stale length " +
							   std::to_string(buffer.size()));
				return;
			}

			if (available_buffers_.size() >= max_pooled_)
			{
				return;
			}

			available_buffers_.push_back(std::move(buffer));
		}

		auto buffer_length() const -> size_t
		{
			std::lock_guard<std::mutex> lock(mutex_);
			return buffer_length_;
		}

		auto set_buffer_length(size_t length) -> void
		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (length == buffer_length_)
			{
				return;
			}
			buffer_length_ = length;
			available_buffers_.clear();
			QOTD_LOG_DEBUG("[buffer_pool] Buffer length changed to " + std::to_string(length));
		}

		auto max_pooled() const -> size_t
		{
			std::lock_guard<std::mutex> lock(mutex_);
			return max_pooled_;
		}

		auto set_max_pooled(size_t max_pooled) -> void
		{
			std::lock_guard<std::mutex> lock(mutex_);
			max_pooled_ = max_pooled;
			if (available_buffers_.size() > max_pooled_)
			{
				available_buffers_.resize(max_pooled_);
			}
		}

		auto get_stats() const -> std::pair<size_t, size_t>
		{
			std::lock_guard<std::mutex> lock(mutex_);
			return { available_buffers_.size(), total_allocated_ };
		}

		auto clear() -> void
		{
			std::lock_guard<std::mutex> lock(mutex_);
			available_buffers_.clear();
		}

	private:
		size_t buffer_length_;
		size_t max_pooled_;
		size_t total_allocated_;

		mutable std::mutex mutex_;
		std::vector<std::vector<uint8_t>> available_buffers_;
	};

	buffer_pool::buffer_pool(size_t buffer_length, size_t max_pooled)
		: pimpl_(std::make_unique<impl>(buffer_length, max_pooled))
	{
	}

	buffer_pool::~buffer_pool() noexcept = default;

	auto buffer_pool::rent() -> std::vector<uint8_t> { return pimpl_->rent(); }

	auto buffer_pool::give_back(std::vector<uint8_t>&& buffer) -> void
	{
		pimpl_->give_back(std::move(buffer));
	}

	auto buffer_pool::buffer_length() const -> size_t { return pimpl_->buffer_length(); }

	auto buffer_pool::set_buffer_length(size_t length) -> void
	{
		pimpl_->set_buffer_length(length);
	}

	auto buffer_pool::max_pooled() const -> size_t { return pimpl_->max_pooled(); }

	auto buffer_pool::set_max_pooled(size_t max_pooled) -> void
	{
		pimpl_->set_max_pooled(max_pooled);
	}

	auto buffer_pool::get_stats() const -> std::pair<size_t, size_t>
	{
		return pimpl_->get_stats();
	}

	auto buffer_pool::clear() -> void { pimpl_->clear(); }

} // namespace kcenon::qotd::utils
