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

#include "kcenon/qotd/integration/io_context_runner.h"

#include "kcenon/qotd/integration/logger_integration.h"

#include <chrono>
#include <exception>

namespace kcenon::qotd::integration
{
	io_context_runner::io_context_runner(std::string name)
		: name_(std::move(name))
		, io_context_(std::make_shared<asio::io_context>())
	{
	}

	io_context_runner::~io_context_runner()
	{
		if (running_in_this_thread())
		{
			// The last owner went away inside a completion handler; the worker
			// cannot join itself, so a helper thread finishes the shutdown.
			work_guard_.reset();
			io_context_->stop();
			std::thread([pool = std::move(io_thread_pool_)]() mutable
						{
							if (pool)
							{
								pool->stop(true);
							}
						})
				.detach();
			return;
		}

		stop();
		if (io_thread_pool_)
		{
			io_thread_pool_->stop(true);
		}
	}

	auto io_context_runner::start() -> void
	{
		std::lock_guard<std::mutex> lock(lifecycle_mutex_);
		if (running_.load())
		{
			return;
		}

		if (io_context_->stopped())
		{
			io_context_->restart();
		}

		if (!io_thread_pool_)
		{
			io_thread_pool_ = std::make_unique<basic_thread_pool>(1);
		}

		work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
			asio::make_work_guard(*io_context_));

		// The task keeps its own reference so the context outlives a runner
		// destroyed while run() is still unwinding.
		auto io_context_copy = io_context_;
		auto name = name_;
		auto* thread_id = &io_thread_id_;
		io_run_future_ = io_thread_pool_->submit(
			[io_context_copy, name, thread_id]()
			{
				thread_id->store(std::this_thread::get_id());
				QOTD_LOG_DEBUG("[" + name + "] io_context->run() starting in worker thread");
				try
				{
					io_context_copy->run();
				}
				catch (const std::exception& e)
				{
					QOTD_LOG_ERROR("[" + name + "] io_context exception: " + std::string(e.what()));
				}
				QOTD_LOG_DEBUG("[" + name + "] io_context worker thread exiting");
			});

		running_.store(true);
	}

	auto io_context_runner::stop() -> void
	{
		std::lock_guard<std::mutex> lock(lifecycle_mutex_);
		if (!running_.exchange(false))
		{
			return;
		}

		work_guard_.reset();

		if (running_in_this_thread())
		{
			QOTD_LOG_WARN("[" + name_ + "] stop requested from the I/O thread; not waiting");
			return;
		}

		if (!io_run_future_.valid())
		{
			return;
		}

		auto wait_result = io_run_future_.wait_for(std::chrono::seconds(5));
		if (wait_result == std::future_status::timeout)
		{
			QOTD_LOG_WARN("[" + name_ + "] handlers still pending after 5s, stopping io_context");
			io_context_->stop();
			io_run_future_.wait_for(std::chrono::seconds(5));
		}

		try
		{
			if (io_run_future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
			{
				io_run_future_.get();
			}
		}
		catch (const std::exception& e)
		{
			QOTD_LOG_ERROR("[" + name_ + "] io worker failed: " + std::string(e.what()));
		}
	}

	auto io_context_runner::running_in_this_thread() const -> bool
	{
		return io_thread_id_.load() == std::this_thread::get_id();
	}

	auto io_context_runner::post(std::function<void()> fn) -> void
	{
		asio::post(*io_context_, std::move(fn));
	}

	auto io_context_runner::run_and_wait(std::function<void()> fn) -> void
	{
		if (!running_.load() || running_in_this_thread())
		{
			fn();
			return;
		}

		auto promise = std::make_shared<std::promise<void>>();
		auto done = promise->get_future();
		asio::post(*io_context_,
				   [fn = std::move(fn), promise]()
				   {
					   try
					   {
						   fn();
						   promise->set_value();
					   }
					   catch (...)
					   {
						   promise->set_exception(std::current_exception());
					   }
				   });
		done.get();
	}

} // namespace kcenon::qotd::integration
