#ifndef INDOORGML_SERIALIZATION_JSON_IO_HPP
#define INDOORGML_SERIALIZATION_JSON_IO_HPP

#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <string>

namespace indoorgml::json {

// Read JSON from file. Missing files throw std::runtime_error; syntax
// errors propagate as nlohmann::json::parse_error.
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    return nlohmann::json::parse(file);
}

// Write JSON to file
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);  // Pretty print with 2-space indent
}

}  // namespace indoorgml::json

#endif // INDOORGML_SERIALIZATION_JSON_IO_HPP
