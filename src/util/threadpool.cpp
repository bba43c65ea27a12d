// DADBS - Thread Pool Implementation
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <dadbs/util/threadpool.h>
#include <dadbs/util/logging.h>

namespace dadbs {
namespace util {

ThreadPool::ThreadPool() : ThreadPool(Config{}) {}

ThreadPool::ThreadPool(size_t numThreads) {
    config_.numThreads = numThreads;
    if (config_.startImmediately) {
        Start();
    }
}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    if (config_.startImmediately) {
        Start();
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Start() {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (running_.exchange(true)) {
        return;
    }

    size_t numThreads = config_.numThreads;
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
        if (numThreads == 0) {
            numThreads = 2;
        }
    }

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idleCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_.load() == 0;
    });
}

void ThreadPool::Shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.exchange(false)) {
            return;
        }
        workers.swap(workers_);
    }

    condition_.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t ThreadPool::ThreadCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return workers_.size();
}

void ThreadPool::Reserve(size_t slots) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (!running_.load()) {
        return;
    }

    size_t needed = activeTasks_.load() + tasks_.size() + slots;
    if (workers_.size() >= needed) {
        return;
    }

    LOG_DEBUG(LogCategory::DEFAULT) << "ThreadPool " << config_.name << " growing from "
                                    << workers_.size() << " to " << needed << " workers";
    workers_.reserve(needed);
    while (workers_.size() < needed) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

void ThreadPool::Enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);

        if (!running_.load()) {
            throw std::runtime_error("ThreadPool " + config_.name + " not running");
        }

        if (tasks_.size() >= config_.maxQueueSize) {
            throw std::runtime_error("ThreadPool " + config_.name + " queue full");
        }

        tasks_.push(std::move(task));
    }

    condition_.notify_one();
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !running_.load() || !tasks_.empty();
            });

            if (tasks_.empty()) {
                return;  // stopped and drained
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            activeTasks_.fetch_add(1);
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(LogCategory::DEFAULT) << "ThreadPool " << config_.name
                                            << ": task threw: " << e.what();
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            activeTasks_.fetch_sub(1);
        }
        idleCondition_.notify_all();
    }
}

} // namespace util
} // namespace dadbs
