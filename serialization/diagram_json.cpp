#include "diagram_json.hpp"
#include "config_json.hpp"
#include "json_serialization.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <cstdint>
#include <limits>

namespace mermaidgen::json {

namespace {

const nlohmann::json& section(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty_array = nlohmann::json::array();
    if (!j.contains(key)) {
        return empty_array;
    }
    if (!j[key].is_array()) {
        throw InvalidValueError(key, "must be an array");
    }
    return j[key];
}

// Ids and lengths: a JSON unsigned integer that fits in 32 bits
uint32_t uint32_from_json(const nlohmann::json& j, const char* field) {
    if (!j.is_number_unsigned() ||
        j.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        throw InvalidValueError(field, "expected an unsigned 32-bit integer, got " + j.dump());
    }
    return static_cast<uint32_t>(j.get<uint64_t>());
}

template <typename Configuration>
Configuration configuration_from_json(const nlohmann::json& j) {
    if (!j.contains("config")) {
        return Configuration{};
    }
    return j["config"].get<Configuration>();
}

// Endpoints shared by every edge builder
template <typename EdgeBuilder>
void endpoints_from_json(const nlohmann::json& e, EdgeBuilder& builder) {
    if (e.contains("source")) {
        builder.set_source(uint32_from_json(e["source"], "source"));
    }
    if (e.contains("destination")) {
        builder.set_destination(uint32_from_json(e["destination"], "destination"));
    }
    if (e.contains("label")) {
        builder.set_label(e["label"].get<std::string>());
    }
}

}  // namespace

Flowchart flowchart_from_json(const nlohmann::json& j) {
    FlowchartBuilder builder;
    builder.set_configuration(configuration_from_json<DiagramConfiguration>(j));

    for (const auto& n : section(j, "nodes")) {
        FlowchartNodeBuilder node;
        if (n.contains("label")) {
            node.set_label(n["label"].get<std::string>());
        }
        if (n.contains("shape")) {
            std::string name = n["shape"].get<std::string>();
            auto shape = parse_shape(name);
            if (!shape) {
                throw InvalidValueError("shape", "unknown value \"" + name + "\"");
            }
            node.set_shape(*shape);
        }
        builder.add_node(node);
    }

    for (const auto& e : section(j, "edges")) {
        FlowchartEdgeBuilder edge;
        endpoints_from_json(e, edge);
        if (e.contains("arrow")) {
            edge.set_arrow_shape(enum_from_json<FlowchartArrowShape>(e["arrow"], "arrow"));
        }
        if (e.contains("left_arrow")) {
            edge.set_left_arrow_shape(
                enum_from_json<FlowchartArrowShape>(e["left_arrow"], "left_arrow"));
        }
        if (e.contains("line_style")) {
            edge.set_line_style(enum_from_json<LineStyle>(e["line_style"], "line_style"));
        }
        if (e.contains("length")) {
            edge.set_length(uint32_from_json(e["length"], "length"));
        }
        builder.add_edge(edge);
    }

    return builder.finalize();
}

ClassDiagram class_diagram_from_json(const nlohmann::json& j) {
    ClassDiagramBuilder builder;
    builder.set_configuration(configuration_from_json<ClassDiagramConfiguration>(j));

    for (const auto& n : section(j, "nodes")) {
        ClassNodeBuilder node;
        if (n.contains("label")) {
            node.set_label(n["label"].get<std::string>());
        }
        if (n.contains("annotation")) {
            node.set_annotation(n["annotation"].get<std::string>());
        }
        for (const auto& member : section(n, "members")) {
            node.add_member(member.get<std::string>());
        }
        builder.add_node(node);
    }

    for (const auto& e : section(j, "edges")) {
        ClassEdgeBuilder edge;
        endpoints_from_json(e, edge);
        if (e.contains("arrow")) {
            edge.set_arrow_shape(enum_from_json<ClassArrowShape>(e["arrow"], "arrow"));
        }
        if (e.contains("left_arrow")) {
            edge.set_left_arrow_shape(
                enum_from_json<ClassArrowShape>(e["left_arrow"], "left_arrow"));
        }
        if (e.contains("dashed")) {
            edge.set_dashed(e["dashed"].get<bool>());
        }
        if (e.contains("source_multiplicity")) {
            edge.set_source_multiplicity(
                enum_from_json<Multiplicity>(e["source_multiplicity"], "source_multiplicity"));
        }
        if (e.contains("destination_multiplicity")) {
            edge.set_destination_multiplicity(enum_from_json<Multiplicity>(
                e["destination_multiplicity"], "destination_multiplicity"));
        }
        builder.add_edge(edge);
    }

    return builder.finalize();
}

ErDiagram er_diagram_from_json(const nlohmann::json& j) {
    ErDiagramBuilder builder;
    builder.set_configuration(configuration_from_json<DiagramConfiguration>(j));

    for (const auto& n : section(j, "nodes")) {
        EntityNodeBuilder node;
        if (n.contains("label")) {
            node.set_label(n["label"].get<std::string>());
        }
        for (const auto& attribute : section(n, "attributes")) {
            if (!attribute.contains("type")) {
                throw MissingFieldError("attribute_type");
            }
            if (!attribute.contains("name")) {
                throw MissingFieldError("attribute_name");
            }
            node.add_attribute(attribute["type"].get<std::string>(),
                               attribute["name"].get<std::string>());
        }
        builder.add_node(node);
    }

    for (const auto& e : section(j, "edges")) {
        EntityEdgeBuilder edge;
        endpoints_from_json(e, edge);
        if (e.contains("cardinality")) {
            const auto& pair = e["cardinality"];
            if (!pair.is_array() || pair.size() != 2) {
                throw InvalidValueError("cardinality", "must be a [left, right] pair");
            }
            edge.set_cardinality(enum_from_json<Cardinality>(pair[0], "cardinality"),
                                 enum_from_json<Cardinality>(pair[1], "cardinality"));
        }
        if (e.contains("identifying")) {
            edge.set_identifying(e["identifying"].get<bool>());
        }
        builder.add_edge(edge);
    }

    return builder.finalize();
}

std::string render_description(const nlohmann::json& j) {
    auto log = mermaidgen::logging::get_logger();

    if (!j.contains("type")) {
        throw MissingFieldError("type");
    }
    std::string type = j["type"].get<std::string>();
    log->debug("Loading {} description", type);

    if (type == "flowchart") {
        return flowchart_from_json(j).render();
    }
    if (type == "class") {
        return class_diagram_from_json(j).render();
    }
    if (type == "er") {
        return er_diagram_from_json(j).render();
    }
    throw InvalidValueError("type", "unknown diagram type \"" + type + "\"");
}

}  // namespace mermaidgen::json
