#ifndef VOLLEY_MODELS_HPP
#define VOLLEY_MODELS_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../http/client/interface.hpp"
#include "../http/error/http_error.hpp"
#include "../http/model/model.hpp"
#include "../utils/channel.hpp"
#include "../utils/constants.hpp"

namespace volley {
    using HttpClientFactory = std::function<std::unique_ptr<http::client::IHttpClient>()>;

    struct BurstConfig {
        std::string url_;
        std::string api_key_;
        int requests_per_tick_ = 1;
        bool verbose_ = false;
        int max_inflight_bursts_ = 1;
        std::chrono::milliseconds tick_interval_ = constants::DEFAULT_TICK_INTERVAL;
        // Upper bound on worker threads; requests beyond it queue until a thread frees up.
        size_t max_worker_threads_ = constants::MAX_WORKER_THREADS;
    };

    // Exactly one of response_ / error_ is set.
    struct RequestOutcome {
        int sequence_index_ = 0;
        std::optional<http::model::Response> response_;
        std::optional<http::http_error::TransportError> error_;
    };

    using OutcomeChannel = concurrency::Channel<RequestOutcome>;
}  // namespace volley

#endif
