#ifndef VOLLEY_CHANNEL_HPP
#define VOLLEY_CHANNEL_HPP

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace concurrency {
    // Unbounded multi-producer queue. receive() blocks until a value arrives or the channel is closed and drained.
    template <typename T>
    class Channel {
       public:
        Channel() = default;

        ~Channel() = default;
        Channel(const Channel&) = delete;
        Channel& operator=(const Channel&) = delete;
        Channel(Channel&&) = delete;
        Channel& operator=(Channel&&) = delete;

        void send(T value) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (closed_) {
                    throw std::logic_error("send on closed channel");
                }
                items_.push_back(std::move(value));
            }
            not_empty_.notify_one();
        }

        std::optional<T> receive() {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this]() { return !items_.empty() || closed_; });

            if (items_.empty()) {
                return std::nullopt;
            }

            T value = std::move(items_.front());
            items_.pop_front();
            return value;
        }

        std::optional<T> try_receive() {
            std::unique_lock<std::mutex> lock(mutex_);
            if (items_.empty()) {
                return std::nullopt;
            }

            T value = std::move(items_.front());
            items_.pop_front();
            return value;
        }

        // Idempotent. Pending values stay receivable.
        void close() {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                closed_ = true;
            }
            not_empty_.notify_all();
        }

        [[nodiscard]] bool closed() const {
            std::unique_lock<std::mutex> lock(mutex_);
            return closed_;
        }

        [[nodiscard]] size_t size() const {
            std::unique_lock<std::mutex> lock(mutex_);
            return items_.size();
        }

       private:
        mutable std::mutex mutex_;
        std::condition_variable not_empty_;
        std::deque<T> items_;
        bool closed_ = false;
    };
}  // namespace concurrency

#endif
