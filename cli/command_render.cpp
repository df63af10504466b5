#include "cli_common.hpp"
#include <serialization/config_json.hpp>
#include <serialization/diagram_json.hpp>
#include <serialization/json_serialization.hpp>
#include <common/logging.hpp>

namespace mermaidgen::cli {

int command_render(int argc, char** argv) {
    auto log = mermaidgen::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: mermaidgen render <diagram.json> [-o <diagram.mmd>] [-c <config.json>]\n";
            return 1;
        }
        if (ctx.verbose) {
            logging::set_level(spdlog::level::debug);
        }

        log->info("Rendering diagram from: {}", ctx.input_path);
        nlohmann::json description = json::read_json_file(ctx.input_path);

        // Keys of the config file win over the description's own "config"
        if (ctx.config_path) {
            log->info("Applying configuration from: {}", *ctx.config_path);
            nlohmann::json overrides = json::read_json_file(*ctx.config_path);
            if (!overrides.is_object()) {
                throw std::runtime_error("Configuration file must hold a JSON object: " +
                                         *ctx.config_path);
            }
            if (!description.contains("config")) {
                description["config"] = nlohmann::json::object();
            }
            description["config"].update(overrides);
            log->debug("Effective configuration: {}",
                       nlohmann::json(description["config"].get<ClassDiagramConfiguration>()).dump());
        }

        std::string text = json::render_description(description);

        if (ctx.output_path.empty()) {
            std::cout << text;
        } else {
            write_file(ctx.output_path, text);
            log->info("Wrote {} ({} bytes)", ctx.output_path, text.size());
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace mermaidgen::cli
