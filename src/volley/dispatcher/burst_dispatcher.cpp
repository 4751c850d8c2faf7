#include "burst_dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

#include "../collector/collector.hpp"
#include "../worker/worker.hpp"

using namespace std::chrono;

namespace volley {

    // Channels and bookkeeping scoped to one tick. Both channels close when the last worker finishes.
    struct BurstDispatcher::Burst {
        static constexpr int COLLECTORS_PER_BURST = 2;

        Burst(size_t index, int workers) : index_(index), remaining_workers_(workers) {}

        size_t index_;
        std::atomic<int> remaining_workers_;
        int collectors_done_ = 0;  // guarded by BurstDispatcher::mutex_

        OutcomeChannel successes_;
        OutcomeChannel errors_;

        void worker_done() {
            if (remaining_workers_.fetch_sub(1) == 1) {
                successes_.close();
                errors_.close();
            }
        }

        [[nodiscard]] bool finished() const { return collectors_done_ == COLLECTORS_PER_BURST; }
    };

    namespace {
        // Counts the worker down even if publishing throws, so collectors always see the channels close.
        class WorkerCompletion {
           public:
            explicit WorkerCompletion(std::function<void()> on_done) : on_done_(std::move(on_done)) {}
            ~WorkerCompletion() { on_done_(); }
            WorkerCompletion(const WorkerCompletion&) = delete;
            WorkerCompletion& operator=(const WorkerCompletion&) = delete;
            WorkerCompletion(WorkerCompletion&&) = delete;
            WorkerCompletion& operator=(WorkerCompletion&&) = delete;

           private:
            std::function<void()> on_done_;
        };
    }  // namespace

    BurstDispatcher::BurstDispatcher(BurstConfig config, HttpClientFactory client_factory, Report& report)
        : config_(std::move(config)),
          client_factory_(std::move(client_factory)),
          report_(report),
          worker_pool_(worker_pool_size(config_)),
          collector_pool_(static_cast<size_t>(Burst::COLLECTORS_PER_BURST) * static_cast<size_t>(config_.max_inflight_bursts_)) {}

    size_t BurstDispatcher::worker_pool_size(const BurstConfig& config) {
        const size_t wanted = static_cast<size_t>(config.requests_per_tick_) * static_cast<size_t>(config.max_inflight_bursts_);
        return std::clamp<size_t>(wanted, 1, std::max<size_t>(config.max_worker_threads_, 1));
    }

    BurstDispatcher::~BurstDispatcher() { abort_.request_stop(); }

    void BurstDispatcher::run(std::stop_token stop) {
        const auto interval = config_.tick_interval_;
        auto next_tick = steady_clock::now() + interval;

        while (!stop.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                burst_done_cv_.wait_until(lock, stop, next_tick, [] { return false; });
            }

            if (stop.stop_requested() || !wait_for_capacity(stop)) {
                break;
            }

            launch_burst();

            // Missed ticks collapse into a single immediate one, then the regular cadence resumes
            next_tick += interval;
            const auto now = steady_clock::now();
            if (next_tick + interval <= now) {
                spdlog::warn("burst dispatch fell behind the {} ms tick, skipping missed ticks", interval.count());
            }
            while (next_tick + interval <= now) {
                next_tick += interval;
            }
        }

        spdlog::debug("dispatcher stopped after {} burst(s)", bursts_launched());
    }

    size_t BurstDispatcher::launch_burst() {
        const size_t index = bursts_launched_.fetch_add(1) + 1;
        const int workers = config_.requests_per_tick_;
        auto burst = std::make_shared<Burst>(index, workers);

        {
            std::unique_lock<std::mutex> lock(mutex_);
            in_flight_.push_back(burst);
        }

        spdlog::debug("launching burst #{} with {} request(s)", index, workers);

        collector_pool_.enqueue([this, burst]() {
            Collector collector(CollectorKind::SUCCESS, burst->index_, config_.verbose_);
            finish_collector(*burst, collector.drain(burst->successes_));
        });
        collector_pool_.enqueue([this, burst]() {
            Collector collector(CollectorKind::FAILURE, burst->index_, config_.verbose_);
            finish_collector(*burst, collector.drain(burst->errors_));
        });

        const std::stop_token abort_token = abort_.get_token();
        for (int idx = 1; idx <= workers; ++idx) {
            worker_pool_.enqueue([this, burst, idx, abort_token]() {
                WorkerCompletion completion([&burst]() { burst->worker_done(); });
                Worker worker(idx, config_, report_);
                worker.run(client_factory_, abort_token, burst->successes_, burst->errors_);
            });
        }

        return index;
    }

    bool BurstDispatcher::wait_for_capacity(std::stop_token& stop) {
        std::unique_lock<std::mutex> lock(mutex_);
        reap_finished_locked();

        const auto capacity = static_cast<size_t>(config_.max_inflight_bursts_);
        if (in_flight_.size() < capacity) {
            return true;
        }

        spdlog::debug("{} burst(s) in flight, waiting for burst #{}", in_flight_.size(), in_flight_.front()->index_);
        return burst_done_cv_.wait(lock, stop, [this, capacity]() {
            reap_finished_locked();
            return in_flight_.size() < capacity;
        });
    }

    void BurstDispatcher::finish_collector(Burst& burst, size_t observed) {
        outcomes_observed_.fetch_add(observed);
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++burst.collectors_done_;
        }
        burst_done_cv_.notify_all();
    }

    void BurstDispatcher::reap_finished_locked() {
        std::erase_if(in_flight_, [](const std::shared_ptr<Burst>& burst) { return burst->finished(); });
    }

    bool BurstDispatcher::all_finished_locked() const {
        return std::ranges::all_of(in_flight_, [](const std::shared_ptr<Burst>& burst) { return burst->finished(); });
    }

    size_t BurstDispatcher::in_flight() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::ranges::count_if(in_flight_, [](const std::shared_ptr<Burst>& burst) { return !burst->finished(); }));
    }

    void BurstDispatcher::shutdown(milliseconds grace) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            const bool drained = burst_done_cv_.wait_for(lock, grace, [this]() { return all_finished_locked(); });

            if (!drained) {
                reap_finished_locked();
                spdlog::warn("{} burst(s) still in flight after {} ms, cancelling outstanding requests", in_flight_.size(), grace.count());
                abort_.request_stop();
                burst_done_cv_.wait(lock, [this]() { return all_finished_locked(); });
            }

            in_flight_.clear();
        }

        worker_pool_.wait_all();
        collector_pool_.wait_all();
    }
}  // namespace volley
