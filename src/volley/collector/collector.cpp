#include "collector.hpp"

#include <spdlog/spdlog.h>

#include <optional>

#include "../../utils/json_utils.hpp"

namespace volley {
    Collector::Collector(CollectorKind kind, size_t burst_index, bool verbose) : kind_(kind), burst_index_(burst_index), verbose_(verbose) {}

    size_t Collector::drain(OutcomeChannel& channel) {
        while (std::optional<RequestOutcome> outcome = channel.receive()) {
            log_outcome(*outcome);
        }
        return observed_;
    }

    void Collector::log_outcome(const RequestOutcome& outcome) {
        if (++observed_ == 1) {
            spdlog::info("buffer # {}", burst_index_);
        }

        if (kind_ == CollectorKind::SUCCESS) {
            log_success(outcome);
        } else {
            log_error(outcome);
        }
    }

    void Collector::log_success(const RequestOutcome& outcome) const {
        const long status = outcome.response_ ? outcome.response_->status_ : 0;
        spdlog::info("request #{} >> http status response {}", outcome.sequence_index_, status);

        if (!verbose_ || !outcome.response_) {
            return;
        }

        const std::string& body = outcome.response_->body_;
        if (body.empty()) {
            return;
        }

        try {
            spdlog::info("request #{} >> response: {}", outcome.sequence_index_, json_utils::pretty_print(body));
        } catch (const json_utils::SerializationError& e) {
            spdlog::warn("request #{} >> response is not JSON ({}): {}", outcome.sequence_index_, e.what(), body);
        }
    }

    void Collector::log_error(const RequestOutcome& outcome) const {
        if (outcome.error_ && outcome.error_->is_cancelled()) {
            spdlog::warn("error on request #{} >> cancelled at shutdown", outcome.sequence_index_);
            return;
        }

        if (outcome.error_) {
            spdlog::error("error on request #{} >> {}", outcome.sequence_index_, outcome.error_->what());
            return;
        }

        if (!outcome.response_) {
            spdlog::error("error on request #{} >> no response", outcome.sequence_index_);
            return;
        }

        spdlog::error("error on request #{} >> http status code: {}", outcome.sequence_index_, outcome.response_->status_);
        if (verbose_ && !outcome.response_->body_.empty()) {
            spdlog::info("request #{} >> response: {}", outcome.sequence_index_, outcome.response_->body_);
        }
    }
}  // namespace volley
