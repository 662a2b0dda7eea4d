#pragma once

#include "rlmkit/api_export.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace rlmkit::core {

/**
 * WorkerPool - fixed set of threads that run blocking evaluations.
 *
 * The tool layer submits each Run() here and waits on the returned future
 * with a deadline. A task that outlives its deadline keeps its worker busy
 * until it returns; nothing is ever killed.
 *
 * The destructor drains the queue and joins every worker, so it blocks until
 * the slowest running task finishes.
 */
class RLMKIT_API WorkerPool {
public:
    // num_threads == 0 picks hardware concurrency (at least 2)
    explicit WorkerPool(size_t num_threads = 0, std::string name = "rlmkit-worker");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template<typename Func>
    auto Submit(Func&& func) -> std::future<std::invoke_result_t<Func>>;

    size_t GetThreadCount() const { return workers_.size(); }
    size_t GetQueuedCount() const;
    size_t GetBusyCount() const { return busy_.load(); }

    void Shutdown();

private:
    void Enqueue(std::function<void()> job);
    void WorkerThread();

    std::string name_;
    std::vector<std::thread> workers_;
    std::atomic<bool> shutdown_{false};
    std::atomic<size_t> busy_{0};

    mutable std::mutex queue_mutex_;
    std::queue<std::function<void()>> queue_;
    std::condition_variable queue_cv_;
};

// Template implementation
template<typename Func>
auto WorkerPool::Submit(Func&& func) -> std::future<std::invoke_result_t<Func>> {
    using Result = std::invoke_result_t<Func>;

    // std::function needs a copyable callable, so the packaged_task is shared
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Func>(func));
    std::future<Result> future = task->get_future();
    Enqueue([task]() { (*task)(); });
    return future;
}

} // namespace rlmkit::core
