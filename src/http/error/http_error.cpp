#include "http_error.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

namespace http::http_error {
    TransportError::TransportError(int code, std::string u,
                                   const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), code_(code), url_(std::move(u)) {}

    bool TransportError::is_timeout() const { return code_ == static_cast<int>(CURLE_OPERATION_TIMEDOUT); }

    bool TransportError::is_cancelled() const { return code_ == static_cast<int>(CURLE_ABORTED_BY_CALLBACK); }
};  // namespace http::http_error
