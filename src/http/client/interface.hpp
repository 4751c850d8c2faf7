#ifndef VOLLEY_CLIENT_INTERFACE_HPP
#define VOLLEY_CLIENT_INTERFACE_HPP

#include <stop_token>

#include "../model/model.hpp"

namespace http::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        // Throws http_error::TransportError when no response is obtained. Any status code is a response.
        virtual http::model::Response post(const http::model::Request& req, std::stop_token stop) = 0;
    };
}  // namespace http::client

#endif
