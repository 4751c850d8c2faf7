#ifndef VOLLEY_WORKER_HPP
#define VOLLEY_WORKER_HPP

#include <optional>
#include <stop_token>
#include <string>

#include "../../http/client/interface.hpp"
#include "../../http/model/model.hpp"
#include "../models.hpp"
#include "../report/report.hpp"

namespace volley {
    // Performs a single POST for one sequence index of a burst. Never retries.
    class Worker {
       public:
        Worker(int sequence_index, const BurstConfig& config, Report& report);

        // Returns nullopt when stop was requested before dispatch; nothing is counted in that case.
        std::optional<RequestOutcome> execute(const HttpClientFactory& client_factory, std::stop_token stop);

        // execute() followed by publishing on the channel matching the classification.
        void run(const HttpClientFactory& client_factory, std::stop_token stop, OutcomeChannel& successes, OutcomeChannel& errors);

        [[nodiscard]] static bool is_accepted_status(long status);
        [[nodiscard]] static bool is_success(const RequestOutcome& outcome);
        [[nodiscard]] static std::string build_body(int sequence_index, const std::string& timestamp);
        [[nodiscard]] static std::string api_key_header(const std::string& api_key);
        [[nodiscard]] static http::model::Request build_request(int sequence_index, const std::string& url, const std::string& api_key);

       private:
        int sequence_index_;
        const BurstConfig& config_;
        Report& report_;
    };
}  // namespace volley

#endif
