#ifndef VOLLEY_JSON_UTILS_HPP
#define VOLLEY_JSON_UTILS_HPP

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace json_utils {
    // Keeps members in insertion order so rendered documents read the way they were built.
    using Json = nlohmann::ordered_json;

    inline constexpr int DEFAULT_INDENT = 2;

    struct SerializationError : public std::runtime_error {
        explicit SerializationError(const std::string& msg);
    };

    // Parses with simdjson. Throws SerializationError on invalid input.
    Json parse(std::string_view json);

    std::string dump(const Json& doc, int indent = -1);

    // Re-renders a JSON document with one member per line. Throws SerializationError on invalid input.
    std::string pretty_print(std::string_view json, int indent = DEFAULT_INDENT);
}  // namespace json_utils

#endif
