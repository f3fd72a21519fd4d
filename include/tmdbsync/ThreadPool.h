/**
 * ThreadPool.h - Fixed-size worker pool for blocking fetch tasks
 *
 * Workers pull callables from a shared FIFO queue. The pool itself places
 * no bound on the queue; callers that need bounded admission (the fetch
 * scheduler) limit how many tasks they have outstanding.
 *
 * Tasks are expected to capture their own failures. An exception that
 * escapes a task is logged and the worker keeps running.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

class ThreadPool {
public:
    using Task = std::function<void()>;

    explicit ThreadPool(size_t worker_count = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Returns false once shutdown() has begun
    bool enqueue(Task task);

    // Drains queued work, then joins the workers
    void shutdown();

    size_t worker_count() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::queue<Task> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> is_running_{false};
    std::atomic<bool> should_stop_{false};

    void worker_loop();
};
