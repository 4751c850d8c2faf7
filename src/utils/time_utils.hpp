#ifndef VOLLEY_TIME_UTILS_HPP
#define VOLLEY_TIME_UTILS_HPP

#include <chrono>
#include <string>

namespace time_utils {
    // Local time as 2006-01-02T15:04:05.000+0000
    std::string format_timestamp(std::chrono::system_clock::time_point tp);

    std::string now_timestamp();
}  // namespace time_utils

#endif
