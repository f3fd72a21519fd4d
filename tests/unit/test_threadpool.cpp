/**
 * test_threadpool.cpp - ThreadPool unit and stress tests
 */

#include "tmdbsync/ThreadPool.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
    void log_info(const std::string& msg) {
        std::cout << "ℹ️  " << msg << std::endl;
    }

    void log_success(const std::string& msg) {
        std::cout << "✅ " << msg << std::endl;
    }

    void log_error(const std::string& msg) {
        std::cerr << "❌ " << msg << std::endl;
    }
}

int main() {
    log_info("=== ThreadPool Unit Tests ===\n");

    // Test 1: Basic task execution
    {
        log_info("Test 1: Basic task execution");
        ThreadPool pool(4);
        std::atomic<int> counter{0};

        for (int i = 0; i < 10; ++i) {
            pool.enqueue([&counter]() {
                counter.fetch_add(1);
            });
        }

        pool.shutdown();

        if (counter.load() == 10) {
            log_success("Test 1 passed: All 10 tasks executed");
        } else {
            log_error("Test 1 failed: Expected 10 tasks, got " + std::to_string(counter.load()));
            return 1;
        }
    }

    // Test 2: Default worker count
    {
        log_info("\nTest 2: Multiple workers (default count)");
        ThreadPool pool(0);
        size_t workers = pool.worker_count();

        if (workers > 0) {
            log_success("Test 2 passed: Created " + std::to_string(workers) + " worker threads");
        } else {
            log_error("Test 2 failed: No workers created");
            return 1;
        }
    }

    // Test 3: Blocking tasks run in parallel
    {
        log_info("\nTest 3: 64 blocking fetch-like tasks on 16 workers");
        ThreadPool pool(16);
        std::atomic<int> completed{0};

        auto start = std::chrono::steady_clock::now();
        for (int i = 0; i < 64; ++i) {
            pool.enqueue([&completed]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                completed.fetch_add(1);
            });
        }
        pool.shutdown();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        // Serial would be 3200ms; 4 rounds of 50ms is the ideal
        if (completed.load() == 64 && elapsed < 1600) {
            log_success("Test 3 passed: 64 tasks in " + std::to_string(elapsed) + "ms");
        } else {
            log_error("Test 3 failed: completed " + std::to_string(completed.load()) +
                      " in " + std::to_string(elapsed) + "ms");
            return 1;
        }
    }

    // Test 4: shutdown() drains the queue
    {
        log_info("\nTest 4: Graceful shutdown with pending tasks");
        ThreadPool pool(4);
        std::atomic<int> executed{0};

        for (int i = 0; i < 100; ++i) {
            pool.enqueue([&executed]() {
                executed.fetch_add(1);
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            });
        }

        pool.shutdown();

        if (executed.load() == 100 && !pool.enqueue([]() {})) {
            log_success("Test 4 passed: All tasks completed and late enqueue refused");
        } else {
            log_error("Test 4 failed: " + std::to_string(executed.load()) + " tasks completed");
            return 1;
        }
    }

    // Test 5: A throwing task does not take its worker down
    {
        log_info("\nTest 5: Exception handling in tasks");
        ThreadPool pool(2);
        std::atomic<int> ran{0};

        for (int i = 0; i < 10; ++i) {
            pool.enqueue([i, &ran]() {
                ran.fetch_add(1);
                if (i % 3 == 0) {
                    throw std::runtime_error("Test exception");
                }
            });
        }

        pool.shutdown();

        if (ran.load() == 10) {
            log_success("Test 5 passed: all 10 tasks ran despite 4 exceptions");
        } else {
            log_error("Test 5 failed: ran=" + std::to_string(ran.load()));
            return 1;
        }
    }

    log_info("\n=== All ThreadPool tests completed successfully ===");
    return 0;
}
