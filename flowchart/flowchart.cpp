#include "flowchart.hpp"
#include <common/label.hpp>
#include <common/logging.hpp>
#include <sstream>

namespace mermaidgen {

std::string FlowchartDialect::render(const Diagram<FlowchartDialect>& diagram) {
    auto log = mermaidgen::logging::get_logger();
    const auto& config = diagram.configuration();

    std::ostringstream ss;

    if (config.title || config.renderer != Renderer::Dagre) {
        ss << "---\n";
        ss << "config:\n";
        ss << "  theme: " << theme_token(config.theme) << "\n";
        ss << "  look: " << look_token(config.look) << "\n";
        ss << "  flowchart:\n";
        ss << "    defaultRenderer: \"" << renderer_token(config.renderer) << "\"\n";
        if (config.title) {
            ss << "title: " << quote_yaml(*config.title) << "\n";
        }
        ss << "---\n";
    }

    ss << "flowchart " << direction_token(config.direction) << "\n";

    for (const auto& node : diagram.nodes()) {
        ss << node_ref(node.id) << "@{shape: " << shape_token(node.shape)
           << ", label: \"" << escape_label(node.label) << "\"}\n";
    }

    for (const auto& edge : diagram.edges()) {
        ss << node_ref(edge.source) << " " << arrow_token(edge);
        if (!edge.label.empty()) {
            ss << "|\"" << escape_label(edge.label) << "\"|";
        }
        ss << " " << node_ref(edge.destination) << "\n";
    }

    std::string text = ss.str();
    log->debug("flowchart: rendered {} nodes, {} edges, {} bytes",
               diagram.nodes().size(), diagram.edges().size(), text.size());
    return text;
}

}  // namespace mermaidgen
