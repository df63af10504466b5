#include <gtest/gtest.h>
#include <serialization/diagram_json.hpp>
#include "test_helpers.hpp"
#include <string>

using namespace mermaidgen;

TEST(DiagramJson, RendersFlowchartDescription) {
    auto j = nlohmann::json::parse(R"({
        "type": "flowchart",
        "nodes": [{"label": "Start"}, {"label": "End"}],
        "edges": [{"source": 0, "destination": 1, "arrow": "normal"}]
    })");

    EXPECT_EQ(json::render_description(j),
              "flowchart LR\n"
              "v0@{shape: rect, label: \"Start\"}\n"
              "v1@{shape: rect, label: \"End\"}\n"
              "v0 ---> v1\n");
}

TEST(DiagramJson, ReadsFlowchartEdgeStyle) {
    auto j = nlohmann::json::parse(R"({
        "type": "flowchart",
        "config": {"direction": "TB"},
        "nodes": [{"label": "Ask", "shape": "decision"}, {"label": "Save", "shape": "DB"}],
        "edges": [{"source": 0, "destination": 1, "arrow": "cross", "left_arrow": "circle",
                   "line_style": "thick", "length": 2, "label": "ok"}]
    })");

    Flowchart diagram = json::flowchart_from_json(j);
    ASSERT_EQ(diagram.nodes().size(), 2u);
    EXPECT_EQ(diagram.nodes()[0].shape, FlowchartNodeShape::Diamond);
    EXPECT_EQ(diagram.nodes()[1].shape, FlowchartNodeShape::Cylinder);

    EXPECT_EQ(diagram.render(),
              "flowchart TB\n"
              "v0@{shape: diamond, label: \"Ask\"}\n"
              "v1@{shape: cyl, label: \"Save\"}\n"
              "v0 o====x|\"ok\"| v1\n");
}

TEST(DiagramJson, RendersClassDescription) {
    auto j = nlohmann::json::parse(R"({
        "type": "class",
        "config": {"hide_empty_members_box": true, "theme": "neutral"},
        "nodes": [
            {"label": "Owner", "annotation": "entity", "members": ["+name: String"]},
            {"label": "Pet"}
        ],
        "edges": [{"source": 0, "destination": 1, "arrow": "open", "left_arrow": "circle",
                   "source_multiplicity": "1", "destination_multiplicity": "0..n",
                   "label": "keeps"}]
    })");

    EXPECT_EQ(json::render_description(j),
              "---\n"
              "config:\n"
              "  layout: dagre\n"
              "  theme: neutral\n"
              "  look: classic\n"
              "  class:\n"
              "    hideEmptyMembersBox: true\n"
              "---\n"
              "classDiagram\n"
              "direction LR\n"
              "class v0[\"Owner\"] {\n"
              "    <<entity>>\n"
              "    +name: String\n"
              "}\n"
              "class v1[\"Pet\"] { }\n"
              "v0 \"1\" o-- \"0..n\" v1 : keeps\n");
}

TEST(DiagramJson, RendersErDescription) {
    auto j = nlohmann::json::parse(R"({
        "type": "er",
        "nodes": [
            {"label": "CUSTOMER", "attributes": [{"type": "string", "name": "email"}]},
            {"label": "ORDER"}
        ],
        "edges": [{"source": 0, "destination": 1,
                   "cardinality": ["exactly_one", "zero_or_more"],
                   "identifying": false, "label": "places"}]
    })");

    ErDiagram diagram = json::er_diagram_from_json(j);
    ASSERT_EQ(diagram.edges().size(), 1u);
    EXPECT_EQ(diagram.edges()[0].left, Cardinality::ExactlyOne);
    EXPECT_EQ(diagram.edges()[0].right, Cardinality::ZeroOrMore);
    EXPECT_FALSE(diagram.edges()[0].identifying);

    std::string text = json::render_description(j);
    EXPECT_NE(text.find("v0[\"CUSTOMER\"] {\n    string email\n}\n"), std::string::npos);
    EXPECT_NE(text.find("v0 ||..o{ v1 : \"places\"\n"), std::string::npos);
}

TEST(DiagramJson, MissingArrowIsAMissingRelationship) {
    auto j = nlohmann::json::parse(R"({
        "type": "flowchart",
        "nodes": [{"label": "A"}, {"label": "B"}],
        "edges": [{"source": 0, "destination": 1}]
    })");

    auto field = test::thrown_field<MissingFieldError>([&] { json::render_description(j); });
    ASSERT_TRUE(field.has_value());
    EXPECT_EQ(*field, "relationship");
}

TEST(DiagramJson, MissingLabelIsReported) {
    auto j = nlohmann::json::parse(R"({"type": "er", "nodes": [{}]})");

    auto field = test::thrown_field<MissingFieldError>([&] { json::render_description(j); });
    ASSERT_TRUE(field.has_value());
    EXPECT_EQ(*field, "label");
}

TEST(DiagramJson, DanglingEndpointIsReported) {
    auto j = nlohmann::json::parse(R"({
        "type": "class",
        "nodes": [{"label": "A"}],
        "edges": [{"source": 0, "destination": 5, "arrow": "triangle"}]
    })");

    auto id = test::thrown_node_id([&] { json::render_description(j); });
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, 5u);
}

TEST(DiagramJson, UnknownNamesAreInvalid) {
    auto unknown_type = nlohmann::json::parse(R"({"type": "sequence"})");
    EXPECT_EQ(test::thrown_field<InvalidValueError>([&] { json::render_description(unknown_type); }),
              "type");

    auto unknown_shape = nlohmann::json::parse(R"({
        "type": "flowchart", "nodes": [{"label": "A", "shape": "blob"}]
    })");
    EXPECT_EQ(test::thrown_field<InvalidValueError>([&] { json::render_description(unknown_shape); }),
              "shape");

    auto unknown_arrow = nlohmann::json::parse(R"({
        "type": "class",
        "nodes": [{"label": "A"}, {"label": "B"}],
        "edges": [{"source": 0, "destination": 1, "arrow": "diamond"}]
    })");
    EXPECT_EQ(test::thrown_field<InvalidValueError>([&] { json::render_description(unknown_arrow); }),
              "arrow");

    auto bad_pair = nlohmann::json::parse(R"({
        "type": "er",
        "nodes": [{"label": "A"}, {"label": "B"}],
        "edges": [{"source": 0, "destination": 1, "cardinality": ["exactly_one"]}]
    })");
    EXPECT_EQ(test::thrown_field<InvalidValueError>([&] { json::render_description(bad_pair); }),
              "cardinality");
}

TEST(DiagramJson, MissingTypeIsReported) {
    auto j = nlohmann::json::parse(R"({"nodes": []})");
    EXPECT_EQ(test::thrown_field<MissingFieldError>([&] { json::render_description(j); }), "type");
}

TEST(DiagramJson, InvalidTitleIsRejected) {
    auto j = nlohmann::json::parse(R"({"type": "flowchart", "config": {"title": ""}})");
    EXPECT_EQ(test::thrown_field<InvalidValueError>([&] { json::render_description(j); }), "title");
}

TEST(DiagramJson, EndpointsMustFitANodeId) {
    auto wrapped = nlohmann::json::parse(R"({
        "type": "flowchart",
        "nodes": [{"label": "A"}, {"label": "B"}],
        "edges": [{"source": 4294967296, "destination": 1, "arrow": "normal"}]
    })");
    EXPECT_EQ(test::thrown_field<InvalidValueError>([&] { json::render_description(wrapped); }),
              "source");

    auto negative = nlohmann::json::parse(R"({
        "type": "er",
        "nodes": [{"label": "A"}, {"label": "B"}],
        "edges": [{"source": 0, "destination": -1, "cardinality": ["exactly_one", "exactly_one"]}]
    })");
    EXPECT_EQ(test::thrown_field<InvalidValueError>([&] { json::render_description(negative); }),
              "destination");

    auto fractional = nlohmann::json::parse(R"({
        "type": "class",
        "nodes": [{"label": "A"}, {"label": "B"}],
        "edges": [{"source": 0.5, "destination": 1, "arrow": "normal"}]
    })");
    EXPECT_EQ(test::thrown_field<InvalidValueError>([&] { json::render_description(fractional); }),
              "source");
}

TEST(DiagramJson, LengthMustBeInRange) {
    auto negative = nlohmann::json::parse(R"({
        "type": "flowchart",
        "nodes": [{"label": "A"}, {"label": "B"}],
        "edges": [{"source": 0, "destination": 1, "arrow": "normal", "length": -1}]
    })");
    EXPECT_EQ(test::thrown_field<InvalidValueError>([&] { json::render_description(negative); }),
              "length");

    auto too_long = nlohmann::json::parse(R"({
        "type": "flowchart",
        "nodes": [{"label": "A"}, {"label": "B"}],
        "edges": [{"source": 0, "destination": 1, "arrow": "normal", "length": 256}]
    })");
    EXPECT_EQ(test::thrown_field<InvalidValueError>([&] { json::render_description(too_long); }),
              "length");
}

TEST(DiagramJson, AbsentAttributeKeysAreMissingFields) {
    auto no_type = nlohmann::json::parse(R"({
        "type": "er", "nodes": [{"label": "A", "attributes": [{"name": "id"}]}]
    })");
    EXPECT_EQ(test::thrown_field<MissingFieldError>([&] { json::render_description(no_type); }),
              "attribute_type");

    auto no_name = nlohmann::json::parse(R"({
        "type": "er", "nodes": [{"label": "A", "attributes": [{"type": "int"}]}]
    })");
    EXPECT_EQ(test::thrown_field<MissingFieldError>([&] { json::render_description(no_name); }),
              "attribute_name");
}
