#include <gtest/gtest.h>
#include <class_diagram/class_diagram.hpp>
#include "test_helpers.hpp"
#include <set>
#include <string>

using namespace mermaidgen;

namespace {

const char* DEFAULT_HEADER =
    "---\n"
    "config:\n"
    "  layout: dagre\n"
    "  theme: default\n"
    "  look: classic\n"
    "  class:\n"
    "    hideEmptyMembersBox: false\n"
    "---\n"
    "classDiagram\n"
    "direction LR\n";

ClassDiagramBuilder two_classes() {
    ClassDiagramBuilder builder;
    builder.add_node(ClassNodeBuilder().set_label("Animal"));
    builder.add_node(ClassNodeBuilder().set_label("Dog"));
    return builder;
}

}  // namespace

TEST(ClassDiagram, RendersInheritance) {
    auto builder = two_classes();
    builder.add_edge(ClassEdgeBuilder()
                         .set_source(0)
                         .set_destination(1)
                         .set_arrow_shape(ClassArrowShape::Triangle));

    EXPECT_EQ(builder.finalize().render(),
              std::string(DEFAULT_HEADER) +
              "class v0[\"Animal\"] { }\n"
              "class v1[\"Dog\"] { }\n"
              "v0 --|> v1\n");
}

TEST(ClassDiagram, RendersAnnotationAndMembersInOrder) {
    ClassDiagramBuilder builder;
    builder.add_node(ClassNodeBuilder()
                         .set_label("Animal")
                         .set_annotation("abstract")
                         .add_attribute(Visibility::Public, "String", "name")
                         .add_method(Visibility::Public, "speak", {{"volume", "int"}})
                         .add_method(Visibility::Protected, "age", {}, std::string("int"))
                         .add_member("-List~Toy~ toys"));

    EXPECT_EQ(builder.finalize().render(),
              std::string(DEFAULT_HEADER) +
              "class v0[\"Animal\"] {\n"
              "    <<abstract>>\n"
              "    +name: String\n"
              "    +speak(volume: int): void\n"
              "    #age(): int\n"
              "    -List~Toy~ toys\n"
              "}\n");
}

TEST(ClassDiagram, MethodArgumentsAreCommaSeparated) {
    ClassNode node = ClassNodeBuilder()
                         .set_label("Shop")
                         .add_method(Visibility::Package, "sell",
                                     {{"item", "Item"}, {"count", "int"}}, std::string("bool"))
                         .build();

    ASSERT_EQ(node.members.size(), 1u);
    EXPECT_EQ(node.members[0], "~sell(item: Item, count: int): bool");
}

TEST(ClassDiagram, HideEmptyMembersBoxKeepsBraces) {
    ClassDiagramConfiguration config;
    config.hide_empty_members_box = true;
    config.title = "Pets";
    config.direction = Direction::TopToBottom;

    ClassDiagramBuilder builder;
    builder.set_configuration(config);
    builder.add_node(ClassNodeBuilder().set_label("Empty"));
    builder.add_node(ClassNodeBuilder().set_label("Full").add_member("+id: int"));

    EXPECT_EQ(builder.finalize().render(),
              "---\n"
              "config:\n"
              "  layout: dagre\n"
              "  theme: default\n"
              "  look: classic\n"
              "  class:\n"
              "    hideEmptyMembersBox: true\n"
              "title: \"Pets\"\n"
              "---\n"
              "classDiagram\n"
              "direction TB\n"
              "class v0[\"Empty\"] { }\n"
              "class v1[\"Full\"] {\n"
              "    +id: int\n"
              "}\n");
}

TEST(ClassDiagram, RendersMultiplicitiesAndLabel) {
    auto builder = two_classes();
    builder.add_edge(ClassEdgeBuilder()
                         .set_source(0)
                         .set_destination(1)
                         .set_arrow_shape(ClassArrowShape::Normal)
                         .set_left_arrow_shape(ClassArrowShape::Star)
                         .set_dashed(true)
                         .set_source_multiplicity(Multiplicity::One)
                         .set_destination_multiplicity(Multiplicity::Many)
                         .set_label("owns"));
    builder.add_edge(ClassEdgeBuilder()
                         .set_source(1)
                         .set_destination(0)
                         .set_arrow_shape(ClassArrowShape::Open));

    ClassDiagram diagram = builder.finalize();
    const auto& edges = diagram.edges();
    ASSERT_EQ(edges.size(), 2u);

    std::string text = diagram.render();
    EXPECT_NE(text.find("v0 \"1\" *..> \"*\" v1 : owns\n"), std::string::npos);
    EXPECT_NE(text.find("v1 -- v0\n"), std::string::npos);
}

TEST(ClassArrow, TokensCoverEveryRelationship) {
    ClassEdge edge;
    edge.arrow = ClassArrowShape::Triangle;
    EXPECT_EQ(arrow_token(edge), "--|>");

    edge.arrow = ClassArrowShape::Circle;
    edge.dashed = true;
    EXPECT_EQ(arrow_token(edge), "..o");

    edge.arrow = ClassArrowShape::Triangle;
    edge.left_arrow = ClassArrowShape::Triangle;
    EXPECT_EQ(arrow_token(edge), "<|..|>");
}

TEST(ClassArrow, TokensAreDistinct) {
    std::set<std::string> left;
    std::set<std::string> right;
    for (auto shape : {ClassArrowShape::Normal, ClassArrowShape::Triangle, ClassArrowShape::Star,
                       ClassArrowShape::Circle, ClassArrowShape::Open}) {
        left.insert(left_head_token(shape));
        right.insert(right_head_token(shape));
    }
    EXPECT_EQ(left.size(), 5u);
    EXPECT_EQ(right.size(), 5u);

    std::set<std::string> multiplicities;
    for (auto m : {Multiplicity::One, Multiplicity::ZeroOrOne, Multiplicity::OneOrMore,
                   Multiplicity::Many, Multiplicity::N, Multiplicity::ZeroToN,
                   Multiplicity::OneToN}) {
        multiplicities.insert(multiplicity_token(m));
    }
    EXPECT_EQ(multiplicities.size(), 7u);

    std::set<std::string> visibilities;
    for (auto v : {Visibility::Public, Visibility::Private, Visibility::Protected,
                   Visibility::Package}) {
        visibilities.insert(visibility_token(v));
    }
    EXPECT_EQ(visibilities.size(), 4u);
}

TEST(ClassDiagramValidation, RejectsEmptyMember) {
    ClassDiagramBuilder builder;

    auto field = test::thrown_field<InvalidValueError>(
        [&] { builder.add_node(ClassNodeBuilder().set_label("A").add_member("")); });
    ASSERT_TRUE(field.has_value());
    EXPECT_EQ(*field, "member");
    EXPECT_EQ(builder.node_count(), 0u);
}

TEST(ClassDiagramValidation, RejectsEmptyAnnotation) {
    ClassDiagramBuilder builder;
    EXPECT_THROW(builder.add_node(ClassNodeBuilder().set_label("A").set_annotation("")),
                 InvalidValueError);
}

TEST(ClassDiagramValidation, LabelIsCheckedFirst) {
    auto field = test::thrown_field<MissingFieldError>(
        [] { ClassNodeBuilder().add_member("").build(); });
    ASSERT_TRUE(field.has_value());
    EXPECT_EQ(*field, "label");
}

TEST(ClassDiagramValidation, RequiresArrowShape) {
    auto builder = two_classes();

    auto field = test::thrown_field<MissingFieldError>(
        [&] { builder.add_edge(ClassEdgeBuilder().set_source(0).set_destination(1).set_dashed(true)); });
    ASSERT_TRUE(field.has_value());
    EXPECT_EQ(*field, "relationship");
}
