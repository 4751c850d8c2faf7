#include "curl_easy.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr const char* USER_AGENT = "volley/1.0";
        static constexpr long PROGRESS = 0L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long POST = 1L;
    };

    struct HeaderKeys {
        static constexpr const char* CONTENT_TYPE = "content-type:";
    };

    CurlEasy::CurlEasy(const CurlOptions& options) : options_(options), handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }
        // Also clears a list freed above when hs is empty
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms_);
        setopt(CURLOPT_TIMEOUT_MS, options_.timeout_ms_);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
    }

    void CurlEasy::prepare_for_new_request(std::string& body, const std::string& payload, std::stop_token* stop) {
        last_content_type_.clear();
        body.clear();
        error_buf_[0] = '\0';

        setopt(CURLOPT_POST, CurlDefaults::POST);
        setopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        setopt(CURLOPT_POSTFIELDS, payload.c_str());

        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);

        // Progress callback doubles as the cancellation point for in-flight transfers
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::PROGRESS);
        setopt(CURLOPT_XFERINFOFUNCTION, &CurlEasy::xferinfo_cb);
        setopt(CURLOPT_XFERINFODATA, stop);
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;
        const size_t key_length = std::char_traits<char>::length(HeaderKeys::CONTENT_TYPE);

        if (bytes > key_length && ::string_utils::ieq_prefix(buffer, bytes, HeaderKeys::CONTENT_TYPE)) {
            self->last_content_type_ = ::string_utils::trim(std::string(buffer + key_length, bytes - key_length));
        }

        return bytes;
    }

    int CurlEasy::xferinfo_cb(void* clientp, curl_off_t /*dl_total*/, curl_off_t /*dl_now*/, curl_off_t /*ul_total*/, curl_off_t /*ul_now*/) {
        const auto* stop = static_cast<const std::stop_token*>(clientp);
        return (stop != nullptr && stop->stop_requested()) ? 1 : 0;
    }

    http::model::Response CurlEasy::post(const http::model::Request& req, std::stop_token stop) {
        set_url(req.url_);
        set_headers(req.headers_);

        std::string body;
        prepare_for_new_request(body, req.body_, &stop);

        perform_throw(req.url_);
        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }
    template void CurlEasy::setopt<long>(int, long);
    template void CurlEasy::setopt<const char*>(int, const char*);
    template void CurlEasy::setopt<void*>(int, void*);

    void CurlEasy::perform_throw(const std::string& url) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw http::http_error::TransportError(static_cast<int>(rc), url, err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.content_type_ = std::move(last_content_type_);
        return r;
    }

}  // namespace http::client
