#include "worker.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "../../http/error/http_error.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/json_utils.hpp"
#include "../../utils/time_utils.hpp"

namespace volley {
    Worker::Worker(int sequence_index, const BurstConfig& config, Report& report) : sequence_index_(sequence_index), config_(config), report_(report) {}

    bool Worker::is_accepted_status(long status) {
        return std::ranges::any_of(constants::ACCEPTED_STATUS_CODES, [status](long accepted) { return accepted == status; });
    }

    bool Worker::is_success(const RequestOutcome& outcome) { return outcome.response_.has_value() && is_accepted_status(outcome.response_->status_); }

    std::string Worker::build_body(int sequence_index, const std::string& timestamp) {
        const json_utils::Json body = {
            {"name", "request #" + std::to_string(sequence_index)},
            {"date", timestamp},
            {"requests_sent", sequence_index},
        };
        return json_utils::dump(body);
    }

    std::string Worker::api_key_header(const std::string& api_key) {
        // libcurl drops "Name:" with an empty value; "Name;" sends the header empty
        if (api_key.empty()) {
            return std::string(constants::API_KEY_HEADER_NAME) + ";";
        }
        return std::string(constants::API_KEY_HEADER_NAME) + ": " + api_key;
    }

    http::model::Request Worker::build_request(int sequence_index, const std::string& url, const std::string& api_key) {
        http::model::Request r;
        r.url_ = url;
        r.body_ = build_body(sequence_index, time_utils::now_timestamp());
        r.headers_ = {constants::CONTENT_TYPE_HEADER, api_key_header(api_key)};
        return r;
    }

    std::optional<RequestOutcome> Worker::execute(const HttpClientFactory& client_factory, std::stop_token stop) {
        if (stop.stop_requested()) {
            return std::nullopt;
        }

        const http::model::Request req = build_request(sequence_index_, config_.url_, config_.api_key_);
        RequestOutcome outcome{.sequence_index_ = sequence_index_};

        report_.record_attempt();

        // A response, whatever its status, takes precedence: an outcome never carries both
        try {
            auto client = client_factory();
            if (client == nullptr) {
                throw std::runtime_error("HTTP client factory returned no client");
            }
            outcome.response_ = client->post(req, stop);
        } catch (const http::http_error::TransportError& e) {
            outcome.error_ = e;
        } catch (const std::exception& e) {
            outcome.error_ = http::http_error::TransportError(http::http_error::CLIENT_SETUP_FAILED, req.url_, e.what());
        }

        if (is_success(outcome)) {
            report_.record_success();
        } else {
            report_.record_failure();
        }

        return outcome;
    }

    void Worker::run(const HttpClientFactory& client_factory, std::stop_token stop, OutcomeChannel& successes, OutcomeChannel& errors) {
        std::optional<RequestOutcome> outcome = execute(client_factory, std::move(stop));
        if (!outcome) {
            return;
        }

        if (is_success(*outcome)) {
            successes.send(std::move(*outcome));
        } else {
            errors.send(std::move(*outcome));
        }
    }
}  // namespace volley
