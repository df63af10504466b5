#include "class_diagram.hpp"
#include <common/label.hpp>
#include <common/logging.hpp>
#include <sstream>

namespace mermaidgen {

std::string ClassDiagramDialect::render(const Diagram<ClassDiagramDialect>& diagram) {
    auto log = mermaidgen::logging::get_logger();
    const auto& config = diagram.configuration();

    std::ostringstream ss;

    ss << "---\n";
    ss << "config:\n";
    ss << "  layout: " << renderer_token(config.renderer) << "\n";
    ss << "  theme: " << theme_token(config.theme) << "\n";
    ss << "  look: " << look_token(config.look) << "\n";
    ss << "  class:\n";
    ss << "    hideEmptyMembersBox: " << (config.hide_empty_members_box ? "true" : "false") << "\n";
    if (config.title) {
        ss << "title: " << quote_yaml(*config.title) << "\n";
    }
    ss << "---\n";
    ss << "classDiagram\n";
    ss << "direction " << direction_token(config.direction) << "\n";

    for (const auto& node : diagram.nodes()) {
        ss << "class " << node_ref(node.id) << "[\"" << escape_label(node.label) << "\"]";
        // hideEmptyMembersBox only changes how Mermaid draws an empty body
        if (!node.has_body()) {
            ss << " { }\n";
            continue;
        }

        ss << " {\n";
        if (node.annotation) {
            ss << "    <<" << *node.annotation << ">>\n";
        }
        for (const auto& member : node.members) {
            ss << "    " << member << "\n";
        }
        ss << "}\n";
    }

    for (const auto& edge : diagram.edges()) {
        ss << node_ref(edge.source) << " ";
        if (edge.source_multiplicity) {
            ss << "\"" << multiplicity_token(*edge.source_multiplicity) << "\" ";
        }
        ss << arrow_token(edge);
        if (edge.destination_multiplicity) {
            ss << " \"" << multiplicity_token(*edge.destination_multiplicity) << "\"";
        }
        ss << " " << node_ref(edge.destination);
        if (!edge.label.empty()) {
            ss << " : " << escape_label(edge.label);
        }
        ss << "\n";
    }

    std::string text = ss.str();
    log->debug("classDiagram: rendered {} nodes, {} edges, {} bytes",
               diagram.nodes().size(), diagram.edges().size(), text.size());
    return text;
}

}  // namespace mermaidgen
