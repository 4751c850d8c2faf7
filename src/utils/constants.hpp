#ifndef VOLLEY_CONSTANTS_HPP
#define VOLLEY_CONSTANTS_HPP

#include <array>
#include <chrono>
#include <cstddef>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr long MILLISECONDS_PER_SECOND = 1000L;
    inline constexpr std::array<long, 4> ACCEPTED_STATUS_CODES = {200, 201, 202, 204};
    inline constexpr std::chrono::milliseconds DEFAULT_TICK_INTERVAL{1000};
    inline constexpr size_t MAX_WORKER_THREADS = 256;
    inline constexpr const char* CONTENT_TYPE_HEADER = "Content-Type: application/json; charset=UTF-8";
    inline constexpr const char* API_KEY_HEADER_NAME = "X-Api-Key";
    inline constexpr const char* LOGGER_NAME = "volley";
    inline constexpr const char* LOG_PATTERN = "%Y/%m/%d %H:%M:%S.%e [%l] %v";

}  // namespace constants

#endif
