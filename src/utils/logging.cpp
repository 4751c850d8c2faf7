#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

#include "constants.hpp"

namespace logging {
    std::shared_ptr<spdlog::logger> init(bool verbose) {
        auto logger = spdlog::get(constants::LOGGER_NAME);
        if (logger == nullptr) {
            logger = spdlog::stderr_color_mt(constants::LOGGER_NAME);
        }

        logger->set_pattern(constants::LOG_PATTERN);
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        spdlog::set_default_logger(logger);
        return logger;
    }
}  // namespace logging
