#ifndef VOLLEY_LOGGING_HPP
#define VOLLEY_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>

namespace logging {
    // Installs the stderr logger as spdlog's default. Safe to call more than once.
    std::shared_ptr<spdlog::logger> init(bool verbose);
}  // namespace logging

#endif
