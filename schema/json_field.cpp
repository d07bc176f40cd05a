#include "json_field.hpp"
#include "malformed_document_error.hpp"

namespace indoorgml::schema {

namespace {

std::string describe_type(const nlohmann::json& value) {
    return std::string(value.type_name());
}

}  // namespace

const nlohmann::json& require(const nlohmann::json& node, const char* pointer,
                              const std::string& location) {
    nlohmann::json::json_pointer ptr(pointer);
    if (!node.contains(ptr)) {
        throw MalformedDocumentError(location + pointer, "required member is missing");
    }
    const nlohmann::json& value = node.at(ptr);
    if (value.is_null()) {
        throw MalformedDocumentError(location + pointer, "required member is null");
    }
    return value;
}

const nlohmann::json& require_array(const nlohmann::json& node, const char* pointer,
                                    const std::string& location) {
    const nlohmann::json& value = require(node, pointer, location);
    if (!value.is_array()) {
        throw MalformedDocumentError(location + pointer,
                                     "expected an array, found " + describe_type(value));
    }
    return value;
}

const nlohmann::json* find(const nlohmann::json& node, const char* pointer) {
    nlohmann::json::json_pointer ptr(pointer);
    if (!node.contains(ptr)) {
        return nullptr;
    }
    const nlohmann::json& value = node.at(ptr);
    return value.is_null() ? nullptr : &value;
}

std::string optional_string(const nlohmann::json& node, const char* pointer,
                            const std::string& fallback) {
    const nlohmann::json* value = find(node, pointer);
    if (value == nullptr || !value->is_string()) {
        return fallback;
    }
    return value->get<std::string>();
}

Vec3 require_coordinate(const nlohmann::json& node, const char* pointer,
                        const std::string& location) {
    const nlohmann::json& value = require_array(node, pointer, location);
    if (value.size() != 3) {
        throw MalformedDocumentError(location + pointer,
                                     "expected 3 coordinates, found " + std::to_string(value.size()));
    }
    for (size_t i = 0; i < 3; ++i) {
        if (!value[i].is_number()) {
            throw MalformedDocumentError(location + pointer + "/" + std::to_string(i),
                                         "coordinate is " + describe_type(value[i]) + ", not a number");
        }
    }
    return Vec3(value[0].get<double>(), value[1].get<double>(), value[2].get<double>());
}

std::string indexed(const std::string& collection, size_t index) {
    return collection + "[" + std::to_string(index) + "]";
}

}  // namespace indoorgml::schema
