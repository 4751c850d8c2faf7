#ifndef VOLLEY_HTTP_ERROR_HPP
#define VOLLEY_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::http_error {
    // Transport code used when the client itself could not be set up.
    inline constexpr int CLIENT_SETUP_FAILED = -1;

    // Raised when no HTTP response could be obtained (DNS, refused connection, timeout, abort).
    struct TransportError : public std::runtime_error {
        int code_;
        std::string url_;
        explicit TransportError(int code, std::string u, const std::string &msg);

        [[nodiscard]] bool is_timeout() const;
        [[nodiscard]] bool is_cancelled() const;
    };
}  // namespace http::http_error

#endif
