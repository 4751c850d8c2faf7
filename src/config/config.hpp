#ifndef VOLLEY_CONFIG_HPP
#define VOLLEY_CONFIG_HPP

#include <chrono>
#include <ostream>
#include <stdexcept>
#include <string>

#include "../utils/constants.hpp"

namespace config {
    struct Defaults {
        static constexpr const char* URL = "https://postman-echo.com/post";
        static constexpr int REQUESTS_PER_TICK = 10;
        static constexpr int DURATION_S = 1;
        static constexpr long TIMEOUT_MS = 30'000L;
        static constexpr long CONNECT_TIMEOUT_MS = 10'000L;
        static constexpr int MAX_INFLIGHT_BURSTS = 2;
        static constexpr long DRAIN_TIMEOUT_MS = 5'000L;
    };

    struct ConfigError : public std::runtime_error {
        explicit ConfigError(const std::string& msg);
    };

    struct RunConfig {
        std::string url_ = Defaults::URL;
        std::string api_key_;
        int requests_per_tick_ = Defaults::REQUESTS_PER_TICK;
        int duration_s_ = Defaults::DURATION_S;
        bool verbose_ = false;

        long timeout_ms_ = Defaults::TIMEOUT_MS;
        long connect_timeout_ms_ = Defaults::CONNECT_TIMEOUT_MS;
        int max_inflight_bursts_ = Defaults::MAX_INFLIGHT_BURSTS;
        long drain_timeout_ms_ = Defaults::DRAIN_TIMEOUT_MS;

        // Not exposed on the command line; tests shorten it.
        std::chrono::milliseconds tick_interval_ = constants::DEFAULT_TICK_INTERVAL;

        bool show_help_ = false;
    };

    // Accepts -flag, --flag, -flag=value and --flag value. Throws ConfigError.
    RunConfig parse_args(int argc, char* argv[]);

    // Throws ConfigError on the first invalid field.
    void validate(const RunConfig& cfg);

    std::string usage(const std::string& program);

    // Echoes the resolved flags, one "name: value" per line.
    void print(const RunConfig& cfg, std::ostream& out);
}  // namespace config

#endif
