/**
 * @file evaluation_pool.cpp
 * @brief EvaluationPool implementation.
 */

#include "executor/evaluation_pool.hpp"

namespace squad_rotation {

EvaluationPool::EvaluationPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

EvaluationPool::~EvaluationPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    // jthreads join in their destructors
}

void EvaluationPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::function<void()> job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !job_queue_.empty(); });

            if (job_queue_.empty()) continue;

            job = std::move(job_queue_.front());
            job_queue_.pop();
        }

        ++active_jobs_;
        job();
        --active_jobs_;
        ++completed_jobs_;
    }
}

size_t EvaluationPool::active_count() const noexcept {
    return active_jobs_.load();
}

size_t EvaluationPool::queued_count() const {
    std::lock_guard lock(queue_mutex_);
    return job_queue_.size();
}

size_t EvaluationPool::thread_count() const noexcept {
    return workers_.size();
}

size_t EvaluationPool::completed_count() const noexcept {
    return completed_jobs_.load();
}

}  // namespace squad_rotation
