#ifndef VOLLEY_THREAD_POOL_HPP
#define VOLLEY_THREAD_POOL_HPP

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace concurrency {
    class ThreadPool {
       public:
        explicit ThreadPool(size_t num_threads);

        ~ThreadPool();
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;
        ThreadPool(ThreadPool&&) = delete;
        ThreadPool& operator=(ThreadPool&&) = delete;

        // Throws std::runtime_error once the pool is shutting down.
        void enqueue(std::function<void()> next_task);
        void wait_all();

        [[nodiscard]] size_t size() const { return threads_.size(); }
        [[nodiscard]] size_t pending() const;

       private:
        void work_loop();

        std::vector<std::thread> threads_;
        std::queue<std::function<void()> > tasks_;
        mutable std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        std::atomic<bool> stop_ = false;
        size_t active_tasks_ = 0;
        std::condition_variable completion_cv_;
    };
}  // namespace concurrency

#endif
