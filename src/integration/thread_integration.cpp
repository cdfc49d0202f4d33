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

/**
 * @file thread_integration.cpp
 * @brief basic_thread_pool implementation
 */

#include "kcenon/qotd/integration/thread_integration.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::qotd::integration {

class basic_thread_pool::impl {
public:
    explicit impl(std::size_t num_threads) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency());
        }

        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { drain(); });
        }
    }

    std::future<void> submit(std::function<void()> task) {
        std::packaged_task<void()> job(std::move(task));
        auto future = job.get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!accepting_) {
                std::promise<void> rejected;
                rejected.set_exception(std::make_exception_ptr(
                    std::runtime_error("basic_thread_pool: submit after stop")));
                return rejected.get_future();
            }
            queue_.push_back(std::move(job));
        }

        wake_.notify_one();
        return future;
    }

    bool is_running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accepting_;
    }

    void stop(bool wait_for_tasks) {
        std::deque<std::packaged_task<void()>> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            accepting_ = false;
            if (!wait_for_tasks) {
                dropped.swap(queue_);
            }
        }
        wake_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
        // Destroying the dropped jobs hands broken_promise to their futures.
    }

private:
    void drain() {
        for (;;) {
            std::packaged_task<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wake_.wait(lock, [this] { return !accepting_ || !queue_.empty(); });
                if (queue_.empty()) {
                    return;
                }
                job = std::move(queue_.front());
                queue_.pop_front();
            }
            job();
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::packaged_task<void()>> queue_;
    bool accepting_ = true;
    std::vector<std::thread> workers_;
};

basic_thread_pool::basic_thread_pool(std::size_t num_threads)
    : pimpl_(std::make_unique<impl>(num_threads)) {}

basic_thread_pool::~basic_thread_pool() {
    pimpl_->stop(true);
}

std::future<void> basic_thread_pool::submit(std::function<void()> task) {
    return pimpl_->submit(std::move(task));
}

bool basic_thread_pool::is_running() const {
    return pimpl_->is_running();
}

void basic_thread_pool::stop(bool wait_for_tasks) {
    pimpl_->stop(wait_for_tasks);
}

} // namespace kcenon::qotd::integration
