#include "time_utils.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

#include "constants.hpp"

using namespace std::chrono;

namespace time_utils {
    std::string format_timestamp(system_clock::time_point tp) {
        const std::time_t secs = system_clock::to_time_t(tp);
        const auto millis = duration_cast<milliseconds>(tp.time_since_epoch()).count() % constants::MILLISECONDS_PER_SECOND;

        std::tm local{};
        localtime_r(&secs, &local);

        std::array<char, 32> date{};
        std::array<char, 8> zone{};
        std::strftime(date.data(), date.size(), "%Y-%m-%dT%H:%M:%S", &local);
        std::strftime(zone.data(), zone.size(), "%z", &local);

        std::array<char, 48> out{};
        std::snprintf(out.data(), out.size(), "%s.%03lld%s", date.data(), static_cast<long long>(millis), zone.data());
        return {out.data()};
    }

    std::string now_timestamp() { return format_timestamp(system_clock::now()); }
}  // namespace time_utils
