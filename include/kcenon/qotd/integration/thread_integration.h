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
 * @file thread_integration.h
 * @brief Worker pool that hosts each io_context run loop
 */

#include <cstddef>
#include <functional>
#include <future>
#include <memory>

namespace kcenon::qotd::integration {

/**
 * @class basic_thread_pool
 * @brief Fixed set of worker threads draining a FIFO task queue
 *
 * ### Thread Safety
 * submit() and is_running() are thread-safe. stop() joins every worker and
 * must not be called from one of the pool's own workers.
 */
class basic_thread_pool {
public:
    /**
     * @param num_threads Number of workers (0 = hardware concurrency)
     */
    explicit basic_thread_pool(std::size_t num_threads = 0);

    /**
     * @brief Runs the queued tasks and joins the workers
     */
    ~basic_thread_pool();

    basic_thread_pool(const basic_thread_pool&) = delete;
    basic_thread_pool& operator=(const basic_thread_pool&) = delete;

    /**
     * @brief Queue a task
     * @return Future that completes with the task, carrying its exception if
     *         it threw; it holds std::runtime_error if the pool is stopped
     */
    std::future<void> submit(std::function<void()> task);

    bool is_running() const;

    /**
     * @brief Stop accepting tasks and join the workers
     * @param wait_for_tasks Run already queued tasks first; otherwise drop them
     */
    void stop(bool wait_for_tasks = true);

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

} // namespace kcenon::qotd::integration
