/**
 * @file thread_pool.cpp
 * @brief ThreadPool worker lifecycle.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

namespace edge_twin {

namespace {

size_t resolve_thread_count(size_t requested) noexcept {
    if (requested != 0) return requested;
    const size_t hw = std::thread::hardware_concurrency();
    return hw != 0 ? hw : 4;
}

}  // anonymous namespace

ThreadPool::ThreadPool(size_t num_threads) {
    const size_t n = resolve_thread_count(num_threads);
    workers_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { run_worker(stop); });
    }
}

ThreadPool::~ThreadPool() {
    for (auto& worker : workers_) worker.request_stop();
    queue_cv_.notify_all();
    // Join here: the queue and its lock are destroyed before workers_
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::run_worker(std::stop_token stop) {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });
            // Queued jobs still run after stop so no submitted future is abandoned
            if (task_queue_.empty()) return;
            job = std::move(task_queue_.front());
            task_queue_.pop();
        }
        job();
    }
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace edge_twin
