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

/**
 * @file io_context_runner.h
 * @brief Runs one asio::io_context on a dedicated worker thread
 */

#include <asio.hpp>

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "kcenon/qotd/integration/thread_integration.h"

namespace kcenon::qotd::integration
{
	/*!
	 * \class io_context_runner
	 * \brief Owns an io_context and the single worker thread that runs it.
	 *
	 * Every socket of a host is created on this context, so all completion
	 * handlers of that host execute on one thread. Work coming from other
	 * threads enters through post() or run_and_wait().
	 *
	 * ### Thread Safety
	 * - start(), stop() and run_and_wait() may be called from any thread.
	 * - stop() called from the I/O thread itself only releases the work guard
	 *   and does not wait.
	 */
	class io_context_runner
	{
	public:
		explicit io_context_runner(std::string name);

		~io_context_runner();

		io_context_runner(const io_context_runner&) = delete;
		io_context_runner& operator=(const io_context_runner&) = delete;

		/*!
		 * \brief Starts the worker thread. Calling it again while running is a no-op.
		 */
		auto start() -> void;

		/*!
		 * \brief Lets the context drain its outstanding handlers and joins the
		 * worker, forcing io_context::stop() if it has not finished within 5 s.
		 */
		auto stop() -> void;

		auto context() -> asio::io_context& { return *io_context_; }

		auto is_running() const -> bool { return running_.load(); }

		/*!
		 * \brief True when the caller is the worker thread running the context.
		 */
		auto running_in_this_thread() const -> bool;

		/*!
		 * \brief Queues \p fn for execution on the I/O thread.
		 */
		auto post(std::function<void()> fn) -> void;

		/*!
		 * \brief Executes \p fn on the I/O thread and waits for it to finish.
		 *
		 * Runs \p fn inline when already on the I/O thread or when the runner
		 * is not running. Exceptions thrown by \p fn are rethrown to the caller.
		 */
		auto run_and_wait(std::function<void()> fn) -> void;

	private:
		std::string name_;
		std::shared_ptr<asio::io_context> io_context_;
		std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
		std::unique_ptr<basic_thread_pool> io_thread_pool_;
		std::future<void> io_run_future_;
		std::atomic<bool> running_{false};
		std::atomic<std::thread::id> io_thread_id_{};
		std::mutex lifecycle_mutex_;
	};

} // namespace kcenon::qotd::integration
