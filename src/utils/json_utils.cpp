#include "json_utils.hpp"

#include <simdjson.h>

#include <string>

namespace json_utils {
    namespace {
        Json from_element(const simdjson::dom::element& el) {
            switch (el.type()) {
                case simdjson::dom::element_type::OBJECT: {
                    Json obj = Json::object();
                    for (simdjson::dom::key_value_pair field : el.get_object()) {
                        obj[std::string(field.key)] = from_element(field.value);
                    }
                    return obj;
                }
                case simdjson::dom::element_type::ARRAY: {
                    Json arr = Json::array();
                    for (simdjson::dom::element child : el.get_array()) {
                        arr.push_back(from_element(child));
                    }
                    return arr;
                }
                case simdjson::dom::element_type::STRING:
                    return std::string(el.get_string().value());
                case simdjson::dom::element_type::INT64:
                    return el.get_int64().value();
                case simdjson::dom::element_type::UINT64:
                    return el.get_uint64().value();
                case simdjson::dom::element_type::DOUBLE:
                    return el.get_double().value();
                case simdjson::dom::element_type::BOOL:
                    return el.get_bool().value();
                case simdjson::dom::element_type::NULL_VALUE:
                default:
                    return nullptr;
            }
        }
    }  // namespace

    SerializationError::SerializationError(const std::string& msg) : std::runtime_error(msg) {}

    Json parse(std::string_view json) {
        simdjson::dom::parser parser;
        simdjson::dom::element doc;

        const auto error = parser.parse(json.data(), json.size()).get(doc);
        if (error != simdjson::SUCCESS) {
            throw SerializationError("Failed to parse JSON: " + std::string(simdjson::error_message(error)));
        }

        try {
            return from_element(doc);
        } catch (const simdjson::simdjson_error& e) {
            throw SerializationError("Failed to read JSON: " + std::string(e.what()));
        }
    }

    std::string dump(const Json& doc, int indent) {
        try {
            return doc.dump(indent);
        } catch (const nlohmann::json::exception& e) {
            throw SerializationError("Failed to render JSON: " + std::string(e.what()));
        }
    }

    std::string pretty_print(std::string_view json, int indent) { return dump(parse(json), indent); }
}  // namespace json_utils
