#ifndef VOLLEY_BURST_DISPATCHER_HPP
#define VOLLEY_BURST_DISPATCHER_HPP

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>

#include "../../utils/thread_pool.hpp"
#include "../models.hpp"
#include "../report/report.hpp"

namespace volley {
    class BurstDispatcher {
       public:
        BurstDispatcher(BurstConfig config, HttpClientFactory client_factory, Report& report);

        ~BurstDispatcher();
        BurstDispatcher(const BurstDispatcher&) = delete;
        BurstDispatcher& operator=(const BurstDispatcher&) = delete;
        BurstDispatcher(BurstDispatcher&&) = delete;
        BurstDispatcher& operator=(BurstDispatcher&&) = delete;

        // Fires a burst every tick interval, first one interval after the call, until stop is requested.
        void run(std::stop_token stop);

        // Launches one burst right away. Returns its 1-based burst number.
        size_t launch_burst();

        // Waits up to grace for in-flight bursts, then cancels the remaining workers and waits for them.
        void shutdown(std::chrono::milliseconds grace);

        [[nodiscard]] size_t bursts_launched() const { return bursts_launched_.load(); }
        [[nodiscard]] size_t outcomes_observed() const { return outcomes_observed_.load(); }
        [[nodiscard]] size_t in_flight() const;
        [[nodiscard]] size_t worker_threads() const { return worker_pool_.size(); }

        // rqs x max in-flight bursts, capped at max_worker_threads_.
        [[nodiscard]] static size_t worker_pool_size(const BurstConfig& config);

       private:
        struct Burst;

        bool wait_for_capacity(std::stop_token& stop);
        void finish_collector(Burst& burst, size_t observed);
        void reap_finished_locked();
        [[nodiscard]] bool all_finished_locked() const;

        BurstConfig config_;
        HttpClientFactory client_factory_;
        Report& report_;
        std::stop_source abort_;

        mutable std::mutex mutex_;
        std::condition_variable_any burst_done_cv_;
        std::deque<std::shared_ptr<Burst> > in_flight_;

        std::atomic<size_t> bursts_launched_ = 0;
        std::atomic<size_t> outcomes_observed_ = 0;

        // Declared last: pools drain and join before anything their tasks touch is destroyed
        concurrency::ThreadPool worker_pool_;
        concurrency::ThreadPool collector_pool_;
    };
}  // namespace volley

#endif
