#include "thread_pool.hpp"

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <exception>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace concurrency {

    ThreadPool::ThreadPool(size_t num_threads) {
        if (num_threads == 0) {
            throw std::invalid_argument("ThreadPool requires at least one thread");
        }

        threads_.reserve(num_threads);

        for (size_t i = 0; i < num_threads; ++i) {
            threads_.emplace_back([this] { work_loop(); });
        };
    }

    ThreadPool::~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }

        condition_variable_.notify_all();

        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    void ThreadPool::work_loop() {
        while (true) {
            std::function<void()> activate_task_from_queue;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                condition_variable_.wait(lock, [this]() { return !tasks_.empty() || stop_; });

                if (stop_ && tasks_.empty()) {
                    return;
                }

                activate_task_from_queue = std::move(tasks_.front());
                tasks_.pop();

                ++active_tasks_;
            }

            try {
                activate_task_from_queue();
            } catch (const std::exception& e) {
                spdlog::error("thread pool task failed: {}", e.what());
            }

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                --active_tasks_;
            }
            completion_cv_.notify_all();
        }
    }

    void ThreadPool::enqueue(std::function<void()> next_task) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("enqueue on a stopped ThreadPool");
            }
            tasks_.emplace(std::move(next_task));
        }

        condition_variable_.notify_one();
    }

    void ThreadPool::wait_all() {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        completion_cv_.wait(lock, [this]() { return tasks_.empty() && active_tasks_ == 0; });
    }

    size_t ThreadPool::pending() const {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return tasks_.size() + active_tasks_;
    }
};  // namespace concurrency
