#ifndef VOLLEY_STRING_UTILS_HPP
#define VOLLEY_STRING_UTILS_HPP

#include <cstddef>
#include <string>

namespace string_utils {
    // libcurl CURLOPT_WRITEFUNCTION target; userdata is a std::string*.
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    std::string trim(std::string s);
}  // namespace string_utils

#endif
