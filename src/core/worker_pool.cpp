#include "rlmkit/core/worker_pool.h"
#include "rlmkit/core/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace rlmkit::core {

WorkerPool::WorkerPool(size_t num_threads, std::string name)
    : name_(std::move(name)) {
    // Auto-detect thread count
    if (num_threads == 0) {
        num_threads = std::max(2u, std::thread::hardware_concurrency());
    }

    spdlog::debug("Starting worker pool '{}' with {} threads", name_, num_threads);

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::WorkerThread, this);
    }
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

void WorkerPool::Shutdown() {
    size_t queued = 0;
    {
        // Set under the queue lock so a worker between its predicate check
        // and wait() cannot miss the wakeup
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_.exchange(true)) {
            return;
        }
        queued = queue_.size();
    }

    spdlog::debug("Shutting down worker pool '{}' ({} busy, {} queued)",
        name_, busy_.load(), queued);

    queue_cv_.notify_all();

    // Workers drain the queue before exiting so no future is left unresolved
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t WorkerPool::GetQueuedCount() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void WorkerPool::Enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_.load()) {
            throw RlmkitError("worker pool '" + name_ + "' is shut down");
        }
        queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
}

void WorkerPool::WorkerThread() {
    while (true) {
        std::function<void()> job;

        // Wait for a job
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return shutdown_.load() || !queue_.empty();
            });

            if (shutdown_.load() && queue_.empty()) {
                return;
            }

            job = std::move(queue_.front());
            queue_.pop();
        }

        // Jobs are packaged tasks: their exceptions land in the future
        busy_.fetch_add(1);
        job();
        busy_.fetch_sub(1);
    }
}

} // namespace rlmkit::core
