#ifndef MERMAIDGEN_CLASS_EDGE_HPP
#define MERMAIDGEN_CLASS_EDGE_HPP

#include <common/node_id.hpp>
#include <optional>
#include <string>

namespace mermaidgen {

// Relationship markers. Triangle is inheritance, Star composition and
// Circle aggregation; Open draws no head.
enum class ClassArrowShape {
    Normal,
    Triangle,
    Star,
    Circle,
    Open
};

enum class Multiplicity {
    One,
    ZeroOrOne,
    OneOrMore,
    Many,
    N,
    ZeroToN,
    OneToN
};

const char* left_head_token(ClassArrowShape shape);
const char* right_head_token(ClassArrowShape shape);
const char* multiplicity_token(Multiplicity multiplicity);

struct ClassEdge {
    NodeId source = 0;
    NodeId destination = 0;
    ClassArrowShape arrow = ClassArrowShape::Normal;
    std::optional<ClassArrowShape> left_arrow;
    bool dashed = false;
    std::optional<Multiplicity> source_multiplicity;
    std::optional<Multiplicity> destination_multiplicity;
    std::string label;
};

// Link token without multiplicities, e.g. "--|>", "*..", "<-->"
std::string arrow_token(const ClassEdge& edge);

class ClassEdgeBuilder {
public:
    ClassEdgeBuilder& set_source(NodeId source);
    ClassEdgeBuilder& set_destination(NodeId destination);
    ClassEdgeBuilder& set_arrow_shape(ClassArrowShape shape);
    ClassEdgeBuilder& set_left_arrow_shape(ClassArrowShape shape);
    ClassEdgeBuilder& set_dashed(bool dashed);
    ClassEdgeBuilder& set_source_multiplicity(Multiplicity multiplicity);
    ClassEdgeBuilder& set_destination_multiplicity(Multiplicity multiplicity);
    ClassEdgeBuilder& set_label(std::string label);

    ClassEdge build() const;

private:
    std::optional<NodeId> source_;
    std::optional<NodeId> destination_;
    std::optional<ClassArrowShape> arrow_;
    std::optional<ClassArrowShape> left_arrow_;
    bool dashed_ = false;
    std::optional<Multiplicity> source_multiplicity_;
    std::optional<Multiplicity> destination_multiplicity_;
    std::string label_;
};

}  // namespace mermaidgen

#endif // MERMAIDGEN_CLASS_EDGE_HPP
