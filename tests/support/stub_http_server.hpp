#ifndef VOLLEY_TESTS_STUB_HTTP_SERVER_HPP
#define VOLLEY_TESTS_STUB_HTTP_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace test_support {
    struct CapturedRequest {
        std::string request_line_;
        std::vector<std::string> headers_;
        std::string body_;
    };

    // Minimal HTTP/1.1 endpoint on 127.0.0.1 answering every request with a fixed status and body.
    class StubHttpServer {
       public:
        StubHttpServer(long status, std::string body);

        ~StubHttpServer();
        StubHttpServer(const StubHttpServer&) = delete;
        StubHttpServer& operator=(const StubHttpServer&) = delete;
        StubHttpServer(StubHttpServer&&) = delete;
        StubHttpServer& operator=(StubHttpServer&&) = delete;

        [[nodiscard]] uint16_t port() const { return port_; }
        [[nodiscard]] std::string url(const std::string& path = "/post") const;
        [[nodiscard]] int requests_served() const { return served_.load(); }
        [[nodiscard]] std::vector<CapturedRequest> captured();

        // A port with nothing listening on it, for refused connections.
        static uint16_t unused_port();

       private:
        void accept_loop();
        void handle(int fd);

        long status_;
        std::string body_;
        int listen_fd_ = -1;
        uint16_t port_ = 0;
        std::atomic<bool> stop_ = false;
        std::atomic<int> served_ = 0;

        std::mutex mutex_;
        std::vector<CapturedRequest> captured_;
        std::thread thread_;
    };
}  // namespace test_support

#endif
