#include "er_diagram.hpp"
#include <common/label.hpp>
#include <common/logging.hpp>
#include <sstream>

namespace mermaidgen {

std::string ErDiagramDialect::render(const Diagram<ErDiagramDialect>& diagram) {
    auto log = mermaidgen::logging::get_logger();
    const auto& config = diagram.configuration();

    std::ostringstream ss;

    ss << "---\n";
    ss << "config:\n";
    ss << "  layout: " << renderer_token(config.renderer) << "\n";
    ss << "  theme: " << theme_token(config.theme) << "\n";
    ss << "  look: " << look_token(config.look) << "\n";
    if (config.title) {
        ss << "title: " << quote_yaml(*config.title) << "\n";
    }
    ss << "---\n";
    ss << "erDiagram\n";
    ss << "direction " << direction_token(config.direction) << "\n";

    for (const auto& node : diagram.nodes()) {
        ss << node_ref(node.id) << "[\"" << escape_label(node.label) << "\"]";
        if (node.attributes.empty()) {
            ss << "\n";
            continue;
        }
        ss << " {\n";
        for (const auto& attribute : node.attributes) {
            ss << "    " << attribute.type << " " << attribute.name << "\n";
        }
        ss << "}\n";
    }

    // Mermaid requires a label on every relationship, so an unset one is ""
    for (const auto& edge : diagram.edges()) {
        ss << node_ref(edge.source) << " " << relationship_token(edge) << " "
           << node_ref(edge.destination) << " : \"" << escape_label(edge.label) << "\"\n";
    }

    std::string text = ss.str();
    log->debug("erDiagram: rendered {} nodes, {} edges, {} bytes",
               diagram.nodes().size(), diagram.edges().size(), text.size());
    return text;
}

}  // namespace mermaidgen
