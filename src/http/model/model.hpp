#ifndef VOLLEY_MODEL_HPP
#define VOLLEY_MODEL_HPP

#include <string>
#include <vector>

namespace http::model {
    struct Request {
        std::string url_;
        std::string body_;

        std::vector<std::string> headers_;
    };

    struct Response {
        long status_ = 0;

        std::string body_;
        std::string content_type_;
    };
}  // namespace http::model

#endif
