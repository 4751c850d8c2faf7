#include "run_controller.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <thread>

#include "../dispatcher/burst_dispatcher.hpp"

using namespace std::chrono;

namespace volley {

    //
    // RunControllerBuilder implementation
    //

    RunControllerBuilder& RunControllerBuilder::with_config(const config::RunConfig& cfg) {
        cfg_ = cfg;
        return *this;
    }

    RunControllerBuilder& RunControllerBuilder::with_http_client_factory(HttpClientFactory client_factory) {
        client_factory_ = std::move(client_factory);
        return *this;
    }

    RunControllerBuilder& RunControllerBuilder::with_output(std::ostream& out) {
        out_ = &out;
        return *this;
    }

    RunControllerBuilder& RunControllerBuilder::validate() {
        if (!cfg_) {
            throw std::runtime_error("Run configuration is required");
        }
        if (client_factory_ == nullptr) {
            throw std::runtime_error("HTTP client factory is required");
        }
        config::validate(*cfg_);
        return *this;
    }

    std::unique_ptr<RunController> RunControllerBuilder::build() {
        validate();
        return std::make_unique<RunController>(*cfg_, std::move(client_factory_), *out_);
    }

    //
    // RunController implementation
    //

    BurstConfig to_burst_config(const config::RunConfig& cfg) {
        return BurstConfig{
            .url_ = cfg.url_,
            .api_key_ = cfg.api_key_,
            .requests_per_tick_ = cfg.requests_per_tick_,
            .verbose_ = cfg.verbose_,
            .max_inflight_bursts_ = cfg.max_inflight_bursts_,
            .tick_interval_ = cfg.tick_interval_,
        };
    }

    RunController::RunController(config::RunConfig cfg, HttpClientFactory client_factory, std::ostream& out)
        : cfg_(std::move(cfg)), client_factory_(std::move(client_factory)), out_(out) {}

    ReportSnapshot RunController::run() {
        BurstDispatcher dispatcher(to_burst_config(cfg_), client_factory_, report_);

        spdlog::info("Waiting for all requests to be executed...");
        {
            std::jthread ticker([&dispatcher](std::stop_token stop) { dispatcher.run(std::move(stop)); });

            // +1 covers the first tick, which fires one interval after start
            std::this_thread::sleep_for(seconds(cfg_.duration_s_ + 1));
            ticker.request_stop();
        }

        dispatcher.shutdown(milliseconds(cfg_.drain_timeout_ms_));
        outcomes_observed_ = dispatcher.outcomes_observed();

        spdlog::info("Requests executed successfully.");
        spdlog::info("--------------------REPORT--------------------");

        const ReportSnapshot snapshot = report_.snapshot();
        out_ << render(snapshot) << std::endl;
        return snapshot;
    }
}  // namespace volley
