#include "config.hpp"

#include <getopt.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "../utils/constants.hpp"

namespace config {
    namespace {
        enum OptionId : int {
            OPT_URL = 1000,
            OPT_KEY,
            OPT_RQS,
            OPT_DURATION,
            OPT_VERBOSE,
            OPT_TIMEOUT_MS,
            OPT_CONNECT_TIMEOUT_MS,
            OPT_MAX_INFLIGHT,
            OPT_DRAIN_MS,
            OPT_HELP,
        };

        const std::vector<option> LONG_OPTIONS = {
            {"url", required_argument, nullptr, OPT_URL},
            {"key", required_argument, nullptr, OPT_KEY},
            {"rqs", required_argument, nullptr, OPT_RQS},
            {"duration", required_argument, nullptr, OPT_DURATION},
            {"verbose", optional_argument, nullptr, OPT_VERBOSE},
            {"timeout-ms", required_argument, nullptr, OPT_TIMEOUT_MS},
            {"connect-timeout-ms", required_argument, nullptr, OPT_CONNECT_TIMEOUT_MS},
            {"max-inflight", required_argument, nullptr, OPT_MAX_INFLIGHT},
            {"drain-ms", required_argument, nullptr, OPT_DRAIN_MS},
            {"help", no_argument, nullptr, OPT_HELP},
            {nullptr, 0, nullptr, 0},
        };

        long parse_long(const char* flag, const char* value) {
            if (value == nullptr || *value == '\0') {
                throw ConfigError(std::string("missing value for -") + flag);
            }

            char* end = nullptr;
            errno = 0;
            const long parsed = std::strtol(value, &end, constants::BASE_10);
            if (errno != 0 || end == value || *end != '\0') {
                throw ConfigError(std::string("invalid value \"") + value + "\" for -" + flag);
            }
            return parsed;
        }

        int parse_int(const char* flag, const char* value) {
            const long parsed = parse_long(flag, value);
            if (parsed > INT_MAX || parsed < INT_MIN) {
                throw ConfigError(std::string("value out of range for -") + flag);
            }
            return static_cast<int>(parsed);
        }

        bool parse_bool(const char* value) {
            if (value == nullptr) {
                return true;
            }
            const std::string v(value);
            if (v == "1" || v == "t" || v == "true" || v == "TRUE" || v == "True") {
                return true;
            }
            if (v == "0" || v == "f" || v == "false" || v == "FALSE" || v == "False") {
                return false;
            }
            throw ConfigError("invalid boolean value \"" + v + "\" for -verbose");
        }
    }  // namespace

    ConfigError::ConfigError(const std::string& msg) : std::runtime_error(msg) {}

    RunConfig parse_args(int argc, char* argv[]) {
        RunConfig cfg;

        // glibc: optind = 0 forces a full rescan, so repeated calls behave
        optind = 0;
        opterr = 0;

        while (true) {
            int index = 0;
            const int c = getopt_long_only(argc, argv, ":h", LONG_OPTIONS.data(), &index);
            if (c == -1) {
                break;
            }

            switch (c) {
                case OPT_URL:
                    cfg.url_ = optarg;
                    break;
                case OPT_KEY:
                    cfg.api_key_ = optarg;
                    break;
                case OPT_RQS:
                    cfg.requests_per_tick_ = parse_int("rqs", optarg);
                    break;
                case OPT_DURATION:
                    cfg.duration_s_ = parse_int("duration", optarg);
                    break;
                case OPT_VERBOSE:
                    cfg.verbose_ = parse_bool(optarg);
                    break;
                case OPT_TIMEOUT_MS:
                    cfg.timeout_ms_ = parse_long("timeout-ms", optarg);
                    break;
                case OPT_CONNECT_TIMEOUT_MS:
                    cfg.connect_timeout_ms_ = parse_long("connect-timeout-ms", optarg);
                    break;
                case OPT_MAX_INFLIGHT:
                    cfg.max_inflight_bursts_ = parse_int("max-inflight", optarg);
                    break;
                case OPT_DRAIN_MS:
                    cfg.drain_timeout_ms_ = parse_long("drain-ms", optarg);
                    break;
                case OPT_HELP:
                case 'h':
                    cfg.show_help_ = true;
                    break;
                case ':':
                    throw ConfigError(std::string("missing value for ") + argv[optind - 1]);
                default:
                    throw ConfigError(std::string("unknown option ") + argv[optind - 1]);
            }
        }

        if (optind < argc) {
            throw ConfigError(std::string("unexpected argument ") + argv[optind]);
        }

        return cfg;
    }

    void validate(const RunConfig& cfg) {
        if (cfg.url_.empty()) {
            throw ConfigError("url must not be empty");
        }
        if (cfg.requests_per_tick_ <= 0) {
            throw ConfigError("rqs must be a positive integer, got " + std::to_string(cfg.requests_per_tick_));
        }
        if (cfg.duration_s_ <= 0) {
            throw ConfigError("duration must be a positive integer, got " + std::to_string(cfg.duration_s_));
        }
        if (cfg.timeout_ms_ <= 0) {
            throw ConfigError("timeout-ms must be positive");
        }
        if (cfg.connect_timeout_ms_ <= 0) {
            throw ConfigError("connect-timeout-ms must be positive");
        }
        if (cfg.max_inflight_bursts_ <= 0) {
            throw ConfigError("max-inflight must be positive");
        }
        if (cfg.drain_timeout_ms_ < 0) {
            throw ConfigError("drain-ms must not be negative");
        }
        if (cfg.tick_interval_.count() <= 0) {
            throw ConfigError("tick interval must be positive");
        }
    }

    std::string usage(const std::string& program) {
        std::ostringstream out;
        out << "Usage: " << program << " [options]\n"
            << "Options:\n"
            << "  -url string              the server POST url (default \"" << Defaults::URL << "\")\n"
            << "  -key string              the server API key, sent as X-Api-Key\n"
            << "  -rqs int                 requests per tick (default " << Defaults::REQUESTS_PER_TICK << ")\n"
            << "  -duration int            duration in seconds (default " << Defaults::DURATION_S << ")\n"
            << "  -verbose                 print out the response of each request\n"
            << "  -timeout-ms int          per-request deadline (default " << Defaults::TIMEOUT_MS << ")\n"
            << "  -connect-timeout-ms int  per-request connect deadline (default " << Defaults::CONNECT_TIMEOUT_MS << ")\n"
            << "  -max-inflight int        bursts allowed to overlap (default " << Defaults::MAX_INFLIGHT_BURSTS << ")\n"
            << "  -drain-ms int            grace period for in-flight bursts at shutdown (default " << Defaults::DRAIN_TIMEOUT_MS << ")\n"
            << "  -help                    show this message\n";
        return out.str();
    }

    void print(const RunConfig& cfg, std::ostream& out) {
        out << "url: " << cfg.url_ << "\n"
            << "key: " << cfg.api_key_ << "\n"
            << "rqs: " << cfg.requests_per_tick_ << "\n"
            << "duration: " << cfg.duration_s_ << "\n"
            << "verbose: " << (cfg.verbose_ ? "true" : "false") << std::endl;
    }
}  // namespace config
