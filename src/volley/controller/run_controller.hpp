#ifndef VOLLEY_RUN_CONTROLLER_HPP
#define VOLLEY_RUN_CONTROLLER_HPP

#pragma once

#include <iostream>
#include <memory>
#include <optional>
#include <ostream>

#include "../../config/config.hpp"
#include "../models.hpp"
#include "../report/report.hpp"

namespace volley {
    BurstConfig to_burst_config(const config::RunConfig& cfg);

    class RunController {
       public:
        RunController(config::RunConfig cfg, HttpClientFactory client_factory, std::ostream& out);

        // Dispatches for duration + 1 seconds, drains in-flight bursts, prints the report and returns it.
        ReportSnapshot run();

        [[nodiscard]] const Report& report() const { return report_; }
        [[nodiscard]] size_t outcomes_observed() const { return outcomes_observed_; }

       private:
        config::RunConfig cfg_;
        HttpClientFactory client_factory_;
        std::ostream& out_;
        Report report_;
        size_t outcomes_observed_ = 0;
    };

    class RunControllerBuilder {
       public:
        RunControllerBuilder& with_config(const config::RunConfig& cfg);
        RunControllerBuilder& with_http_client_factory(HttpClientFactory client_factory);
        RunControllerBuilder& with_output(std::ostream& out);
        RunControllerBuilder& validate();
        std::unique_ptr<RunController> build();

       private:
        std::optional<config::RunConfig> cfg_;
        HttpClientFactory client_factory_;
        std::ostream* out_ = &std::cout;
    };
}  // namespace volley

#endif
