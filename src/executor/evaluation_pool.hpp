/**
 * @file evaluation_pool.hpp
 * @brief std::jthread-based pool for independent horizon evaluations.
 *
 * Each submitted job owns its inputs; the pool shares nothing between jobs
 * but the queue. Jobs that throw deliver the exception through their future.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace squad_rotation {

class EvaluationPool {
public:
    explicit EvaluationPool(size_t num_threads = 0);
    ~EvaluationPool();

    // Non-copyable, non-movable
    EvaluationPool(const EvaluationPool&) = delete;
    EvaluationPool& operator=(const EvaluationPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /**
     * @brief Run func(0) .. func(count - 1) on the pool and collect the
     *        results in index order.
     *
     * Blocks until every job has finished. The first exception thrown by a
     * job is rethrown after all jobs complete.
     */
    template <typename F>
        requires std::invocable<F&, size_t>
    std::vector<std::invoke_result_t<F&, size_t>> run_indexed(size_t count, F func);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const;
    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] size_t completed_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_jobs_{0};
    std::atomic<size_t> completed_jobs_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> EvaluationPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        job_queue_.push([p = std::move(promise), f = std::forward<F>(func)]() mutable {
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

template <typename F>
    requires std::invocable<F&, size_t>
std::vector<std::invoke_result_t<F&, size_t>> EvaluationPool::run_indexed(size_t count, F func) {
    using ReturnType = std::invoke_result_t<F&, size_t>;

    std::vector<std::future<ReturnType>> futures;
    futures.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        futures.push_back(submit([&func, i] { return func(i); }));
    }

    // Wait for every job before rethrowing so no job outlives func
    for (auto& f : futures) f.wait();

    std::vector<ReturnType> results;
    results.reserve(count);
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    return results;
}

}  // namespace squad_rotation
