/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool for data-parallel evaluation.
 * @author Dimitris Kafetzis
 *
 * Used by the allocation optimizer to score population members in
 * parallel. Work items never touch shared mutable state; results are
 * written to distinct slots and published by the final wait.
 */

#pragma once

#include <algorithm>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace edge_twin {

/**
 * @brief Fixed-size thread pool; workers finish queued jobs and join on destruction.
 */
class ThreadPool {
public:
    /// 0 = one worker per hardware thread.
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /**
     * @brief Run `body(i)` for every i in [0, count) and wait for all of them.
     *
     * Indices are split into contiguous blocks, one per worker. The first
     * exception thrown by `body` is rethrown after every block finished.
     */
    template <std::invocable<size_t> F>
    void parallel_for(size_t count, const F& body);

    [[nodiscard]] size_t thread_count() const noexcept;

private:
    /// Pop and run jobs until stopped and the queue is drained.
    void run_worker(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push([p = std::move(promise), f = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    f();
                    p->set_value();
                } else {
                    p->set_value(f());
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
    }
    queue_cv_.notify_one();
    return future;
}

template <std::invocable<size_t> F>
void ThreadPool::parallel_for(size_t count, const F& body) {
    if (count == 0) return;

    const size_t blocks = std::min(count, workers_.size());
    const size_t per_block = (count + blocks - 1) / blocks;

    std::vector<std::future<void>> pending;
    pending.reserve(blocks);
    for (size_t begin = 0; begin < count; begin += per_block) {
        const size_t end = std::min(count, begin + per_block);
        pending.push_back(submit([&body, begin, end] {
            for (size_t i = begin; i < end; ++i) body(i);
        }));
    }

    // Wait for every block before surfacing a failure; blocks reference `body`.
    for (auto& f : pending) f.wait();
    for (auto& f : pending) f.get();
}

}  // namespace edge_twin
