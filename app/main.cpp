#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>
#include <model/indoor_model.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options] <document.json>\n";
    std::cerr << "\n";
    std::cerr << "Loads an IndoorGML document converted to JSON and prints a summary.\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c, --config <file>        JSON config (extraction, anchor sections)\n";
    std::cerr << "  --anchor <lon,lat[,h]>     Place the building at this position (degrees, meters)\n";
    std::cerr << "  --rotate <deg>             Yaw applied before anchoring\n";
    std::cerr << "  --seed-first               Seed bounds from the first coordinate instead of 0\n";
    std::cerr << "  --log-level <level>        trace, debug, info, warn, error, off\n";
    std::cerr << "  -h, --help                 Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  INDOORGML_LOG_LEVEL - Initial log level\n";
}

void print_summary(const indoorgml::IndoorModel& model) {
    auto stats = model.statistics();
    std::cout << "nodes:           " << stats.node_count << "\n";
    std::cout << "edges:           " << stats.edge_count << "\n";
    std::cout << "cell spaces:     " << stats.cell_space_count << "\n";
    std::cout << "boundaries:      " << stats.boundary_count << "\n";
    std::cout << "surface rings:   " << stats.ring_count << "\n";
    std::cout << "coordinates:     " << stats.coordinate_count << "\n";
    std::cout << "bounds min:      " << model.min_x() << " " << model.min_y() << " " << model.min_z() << "\n";
    std::cout << "bounds max:      " << model.max_x() << " " << model.max_y() << " " << model.max_z() << "\n";
    std::cout << "center:          " << model.center_x() << " " << model.center_y() << "\n";
}

int main(int argc, char* argv[]) {
    auto log = indoorgml::logging::get_logger();

    try {
        indoorgml::cli::CommandContext ctx = indoorgml::cli::parse_args(argc, argv);

        if (ctx.help) {
            print_usage(argv[0]);
            return 0;
        }
        if (ctx.input_path.empty()) {
            print_usage(argv[0]);
            return 1;
        }
        if (ctx.log_level) {
            indoorgml::logging::set_level(*ctx.log_level);
        }

        indoorgml::cli::CliConfig config = indoorgml::cli::resolve_config(ctx);

        log->info("Loading document: {}", ctx.input_path);
        log->debug("Bounds seeding: {}", indoorgml::to_string(config.extraction.bounds_seeding));
        indoorgml::IndoorModel model =
            indoorgml::IndoorModel::from_file(ctx.input_path, config.extraction);

        print_summary(model);

        if (config.anchor.enabled) {
            log->debug("Anchoring at {}, {} (h={}), rotation {} deg",
                       config.anchor.longitude_deg, config.anchor.latitude_deg,
                       config.anchor.height, config.anchor.rotation_deg);
            model.apply_transform(config.anchor.position(), config.anchor.rotation_radians());

            const auto& frame = model.anchor_frame();
            std::cout << "anchor origin:   " << frame.at(0, 3) << " " << frame.at(1, 3) << " "
                      << frame.at(2, 3) << "\n";
            if (!model.nodes().empty()) {
                const auto& first = model.nodes().front();
                std::cout << "first node:      " << first.x << " " << first.y << " " << first.z << "\n";
            }
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
