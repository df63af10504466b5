#ifndef MERMAIDGEN_SERIALIZATION_DIAGRAM_JSON_HPP
#define MERMAIDGEN_SERIALIZATION_DIAGRAM_JSON_HPP

#include <class_diagram/class_diagram.hpp>
#include <entity_relationship/er_diagram.hpp>
#include <flowchart/flowchart.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace mermaidgen {

NLOHMANN_JSON_SERIALIZE_ENUM(FlowchartArrowShape, {
    {FlowchartArrowShape::Normal, "normal"},
    {FlowchartArrowShape::Circle, "circle"},
    {FlowchartArrowShape::Cross, "cross"},
    {FlowchartArrowShape::Open, "open"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(LineStyle, {
    {LineStyle::Solid, "solid"},
    {LineStyle::Thick, "thick"},
    {LineStyle::Dashed, "dashed"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ClassArrowShape, {
    {ClassArrowShape::Normal, "normal"},
    {ClassArrowShape::Triangle, "triangle"},
    {ClassArrowShape::Star, "star"},
    {ClassArrowShape::Circle, "circle"},
    {ClassArrowShape::Open, "open"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Multiplicity, {
    {Multiplicity::One, "1"},
    {Multiplicity::ZeroOrOne, "0..1"},
    {Multiplicity::OneOrMore, "1..*"},
    {Multiplicity::Many, "*"},
    {Multiplicity::N, "n"},
    {Multiplicity::ZeroToN, "0..n"},
    {Multiplicity::OneToN, "1..n"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Cardinality, {
    {Cardinality::ExactlyOne, "exactly_one"},
    {Cardinality::ZeroOrOne, "zero_or_one"},
    {Cardinality::OneOrMore, "one_or_more"},
    {Cardinality::ZeroOrMore, "zero_or_more"},
})

namespace json {

// Diagram descriptions:
//   {"type": "flowchart" | "class" | "er", "config": {...},
//    "nodes": [...], "edges": [{"source": 0, "destination": 1, ...}]}
// Edge endpoints are indices into "nodes". Everything goes through the
// builders, so missing fields and dangling endpoints raise the same errors
// as the C++ API.

Flowchart flowchart_from_json(const nlohmann::json& j);
ClassDiagram class_diagram_from_json(const nlohmann::json& j);
ErDiagram er_diagram_from_json(const nlohmann::json& j);

// Dispatches on "type" and renders the matching dialect.
// Throws InvalidValueError("type") for an unknown diagram type.
std::string render_description(const nlohmann::json& j);

}  // namespace json

}  // namespace mermaidgen

#endif // MERMAIDGEN_SERIALIZATION_DIAGRAM_JSON_HPP
