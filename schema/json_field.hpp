#ifndef INDOORGML_SCHEMA_JSON_FIELD_HPP
#define INDOORGML_SCHEMA_JSON_FIELD_HPP

#include <math/vec3.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace indoorgml::schema {

// Navigation helpers over the converted document.
//
// `location` is the human-readable position of `node` in the document
// (e.g. "stateMember[4]"); it prefixes the pointer in error paths.
// A member that is present but null counts as absent everywhere.

// Required value; throws MalformedDocumentError when absent or null.
const nlohmann::json& require(const nlohmann::json& node, const char* pointer,
                              const std::string& location);

// Required array; throws MalformedDocumentError when absent, null or not an array.
const nlohmann::json& require_array(const nlohmann::json& node, const char* pointer,
                                    const std::string& location);

// Optional value; nullptr when absent or null.
const nlohmann::json* find(const nlohmann::json& node, const char* pointer);

// Optional string with default; non-string values also give the default.
std::string optional_string(const nlohmann::json& node, const char* pointer,
                            const std::string& fallback = std::string());

// 3-element numeric array at `pointer`.
Vec3 require_coordinate(const nlohmann::json& node, const char* pointer,
                        const std::string& location);

// "cellSpaceMember" + 3 -> "cellSpaceMember[3]"
std::string indexed(const std::string& collection, size_t index);

}  // namespace indoorgml::schema

#endif // INDOORGML_SCHEMA_JSON_FIELD_HPP
