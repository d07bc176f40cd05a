#ifndef INDOORGML_CLI_COMMON_HPP
#define INDOORGML_CLI_COMMON_HPP

#include <serialization/config_json.hpp>
#include <serialization/json_io.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace indoorgml::cli {

// Settings a config file can carry
struct CliConfig {
    ExtractionConfig extraction;
    AnchorConfig anchor;
};

inline void to_json(nlohmann::json& j, const CliConfig& config) {
    j = {
        {"extraction", config.extraction},
        {"anchor", config.anchor}
    };
}

inline void from_json(const nlohmann::json& j, CliConfig& config) {
    if (j.contains("extraction")) {
        config.extraction = j["extraction"].get<ExtractionConfig>();
    }
    if (j.contains("anchor")) {
        config.anchor = j["anchor"].get<AnchorConfig>();
    }
}

// Parsed command line
struct CommandContext {
    std::string input_path;
    std::optional<std::string> config_path;
    std::optional<std::string> anchor;      // "lon,lat[,height]" in degrees/meters
    std::optional<double> rotation_deg;
    std::optional<std::string> log_level;
    bool seed_first = false;
    bool help = false;
};

inline double parse_number(const std::string& text, const std::string& what) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + what + ": '" + text + "'");
    }
    if (consumed != text.size()) {
        throw std::runtime_error("Invalid " + what + ": '" + text + "'");
    }
    return value;
}

inline CommandContext parse_args(int argc, char** argv) {
    CommandContext ctx;
    int i = 1;

    auto next_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        i += 2;
        return argv[i - 1];
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = next_value(arg);
        } else if (arg == "--anchor") {
            ctx.anchor = next_value(arg);
        } else if (arg == "--rotate") {
            ctx.rotation_deg = parse_number(next_value(arg), "rotation");
        } else if (arg == "--log-level") {
            ctx.log_level = next_value(arg);
        } else if (arg == "--seed-first") {
            ctx.seed_first = true;
            ++i;
        } else if (!arg.empty() && arg[0] != '-') {
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return ctx;
}

// "lon,lat" or "lon,lat,height"
inline AnchorConfig parse_anchor(const std::string& text, AnchorConfig anchor = AnchorConfig{}) {
    std::vector<std::string> parts;
    std::stringstream stream(text);
    std::string part;
    while (std::getline(stream, part, ',')) {
        parts.push_back(part);
    }
    if (parts.size() < 2 || parts.size() > 3) {
        throw std::runtime_error("--anchor expects lon,lat[,height], got '" + text + "'");
    }

    anchor.enabled = true;
    anchor.longitude_deg = parse_number(parts[0], "longitude");
    anchor.latitude_deg = parse_number(parts[1], "latitude");
    anchor.height = parts.size() == 3 ? parse_number(parts[2], "height") : 0.0;
    return anchor;
}

// Config file first, then command-line overrides
inline CliConfig resolve_config(const CommandContext& ctx) {
    CliConfig config;
    if (ctx.config_path) {
        config = json::read_json_file(*ctx.config_path).get<CliConfig>();
    }
    if (ctx.seed_first) {
        config.extraction.bounds_seeding = BoundsSeeding::FirstObservation;
    }
    if (ctx.anchor) {
        config.anchor = parse_anchor(*ctx.anchor, config.anchor);
    }
    if (ctx.rotation_deg) {
        config.anchor.rotation_deg = *ctx.rotation_deg;
    }
    return config;
}

}  // namespace indoorgml::cli

#endif // INDOORGML_CLI_COMMON_HPP
