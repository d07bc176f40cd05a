#ifndef INDOORGML_SERIALIZATION_CONFIG_JSON_HPP
#define INDOORGML_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <model/bounding_box.hpp>
#include <schema/schema_extractor.hpp>
#include <transform/transform_pipeline.hpp>
#include <stdexcept>
#include <string>

namespace indoorgml {

inline std::string to_string(BoundsSeeding seeding) {
    switch (seeding) {
        case BoundsSeeding::Zero: return "zero";
        case BoundsSeeding::FirstObservation: return "first_observation";
    }
    return "zero";
}

inline BoundsSeeding bounds_seeding_from_string(const std::string& name) {
    if (name == "zero") return BoundsSeeding::Zero;
    if (name == "first_observation") return BoundsSeeding::FirstObservation;
    throw std::invalid_argument("Unknown bounds seeding: " + name);
}

// BoundsSeeding serialization
inline void to_json(nlohmann::json& j, const BoundsSeeding& seeding) {
    j = to_string(seeding);
}

inline void from_json(const nlohmann::json& j, BoundsSeeding& seeding) {
    seeding = bounds_seeding_from_string(j.get<std::string>());
}

// ExtractionConfig serialization
inline void to_json(nlohmann::json& j, const ExtractionConfig& config) {
    j = {
        {"bounds_seeding", config.bounds_seeding},
        {"unwrap_root_value", config.unwrap_root_value}
    };
}

inline void from_json(const nlohmann::json& j, ExtractionConfig& config) {
    if (j.contains("bounds_seeding")) {
        config.bounds_seeding = j["bounds_seeding"].get<BoundsSeeding>();
    }
    config.unwrap_root_value = j.value("unwrap_root_value", true);
}

// AnchorConfig serialization
inline void to_json(nlohmann::json& j, const AnchorConfig& config) {
    j = {
        {"enabled", config.enabled},
        {"longitude_deg", config.longitude_deg},
        {"latitude_deg", config.latitude_deg},
        {"height", config.height},
        {"rotation_deg", config.rotation_deg}
    };
}

inline void from_json(const nlohmann::json& j, AnchorConfig& config) {
    config.enabled = j.value("enabled", true);
    config.longitude_deg = j.value("longitude_deg", 0.0);
    config.latitude_deg = j.value("latitude_deg", 0.0);
    config.height = j.value("height", 0.0);
    config.rotation_deg = j.value("rotation_deg", 0.0);
}

}  // namespace indoorgml

#endif // INDOORGML_SERIALIZATION_CONFIG_JSON_HPP
