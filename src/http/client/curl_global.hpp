#ifndef VOLLEY_CURL_GLOBAL_HPP
#define VOLLEY_CURL_GLOBAL_HPP

namespace http::client {

    // Scopes curl_global_init / curl_global_cleanup. Create one before any worker thread starts.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace http::client

#endif
