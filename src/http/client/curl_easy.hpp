#ifndef VOLLEY_CURL_EASY_HPP
#define VOLLEY_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <stop_token>
#include <string>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    struct CurlOptions {
        long connect_timeout_ms_ = 10'000L;
        long timeout_ms_ = 30'000L;
    };

    // One easy handle per instance. Not safe to share between threads; build one per worker.
    class CurlEasy : public IHttpClient {
       public:
        explicit CurlEasy(const CurlOptions& options = {});

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response post(const http::model::Request& req, std::stop_token stop) override;
        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void perform_throw(const std::string& url);
        http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once();
        void prepare_for_new_request(std::string& body, const std::string& payload, std::stop_token* stop);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static int xferinfo_cb(void* clientp, curl_off_t dl_total, curl_off_t dl_now, curl_off_t ul_total, curl_off_t ul_now);

        CurlOptions options_;
        std::string last_content_type_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace http::client

#endif
