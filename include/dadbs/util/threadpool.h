// DADBS - Thread Pool
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// Worker pool used for validator fan-out. Tasks run in FIFO order; results
// come back through futures or are dropped. The pool starts with a fixed
// number of workers and only grows through Reserve.

#ifndef DADBS_UTIL_THREADPOOL_H
#define DADBS_UTIL_THREADPOOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace dadbs {
namespace util {

/**
 * A thread pool for executing tasks asynchronously.
 *
 * Submitting to a pool that is not running, or whose queue is full, throws
 * std::runtime_error. Shutdown stops accepting work, lets the workers finish
 * whatever is already queued and joins them.
 */
class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};        // 0 = hardware concurrency
        size_t maxQueueSize{10000};  // Maximum pending tasks
        std::string name{"pool"};    // Used in log messages
        bool startImmediately{true};
    };

    ThreadPool();

    explicit ThreadPool(size_t numThreads);

    explicit ThreadPool(const Config& config);

    /// Drains the queue and joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void Start();

    /// Block until the queue is empty and no task is executing
    void Wait();

    void Shutdown();

    bool IsRunning() const { return running_.load(); }

    size_t ThreadCount() const;

    size_t PendingTasks() const;

    size_t ActiveTasks() const { return activeTasks_.load(); }

    /**
     * Add workers until at least `slots` of them are free for tasks
     * submitted after this call, counting every running and queued task
     * as occupying one. Workers are never removed before Shutdown.
     * No effect on a pool that is not running.
     */
    void Reserve(size_t slots);

    /// Submit a callable and get a future for its result
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        using ReturnType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<ReturnType> result = task->get_future();

        Enqueue([task]() { (*task)(); });
        return result;
    }

    /// Submit a callable whose result is not needed
    template<typename F, typename... Args>
    void Execute(F&& f, Args&&... args) {
        Enqueue(std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    }

private:
    void Enqueue(std::function<void()> task);

    void WorkerLoop();

    Config config_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idleCondition_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> activeTasks_{0};
};

} // namespace util
} // namespace dadbs

#endif // DADBS_UTIL_THREADPOOL_H
