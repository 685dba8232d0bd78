#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <queue>
#include <functional>
#include <condition_variable>
#include <mutex>

namespace Watchman {

/**
 * Fixed-size worker pool. The worker count is the hard bound on concurrently
 * running tasks; anything submitted beyond that waits in FIFO order.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit a task; returns false once the pool is shut down
    bool submit(std::function<void()> task);

    // Tasks waiting for a free worker
    size_t getPendingTasks() const;

    // Tasks currently executing
    size_t getActiveTasks() const { return active.load(std::memory_order_relaxed); }

    size_t size() const { return workers.size(); }

    // Stop accepting work, drop queued tasks, join workers
    void shutdown();

private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queueMutex;  // mutable for const getPendingTasks
    std::condition_variable condition;
    std::atomic<bool> isRunning{true};
    std::atomic<size_t> active{0};
};

} // namespace Watchman
