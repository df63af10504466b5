#include "class_edge.hpp"
#include <common/errors.hpp>
#include <utility>

namespace mermaidgen {

const char* left_head_token(ClassArrowShape shape) {
    switch (shape) {
        case ClassArrowShape::Normal: return "<";
        case ClassArrowShape::Triangle: return "<|";
        case ClassArrowShape::Star: return "*";
        case ClassArrowShape::Circle: return "o";
        case ClassArrowShape::Open: return "";
    }
    return "";
}

const char* right_head_token(ClassArrowShape shape) {
    switch (shape) {
        case ClassArrowShape::Normal: return ">";
        case ClassArrowShape::Triangle: return "|>";
        case ClassArrowShape::Star: return "*";
        case ClassArrowShape::Circle: return "o";
        case ClassArrowShape::Open: return "";
    }
    return "";
}

const char* multiplicity_token(Multiplicity multiplicity) {
    switch (multiplicity) {
        case Multiplicity::One: return "1";
        case Multiplicity::ZeroOrOne: return "0..1";
        case Multiplicity::OneOrMore: return "1..*";
        case Multiplicity::Many: return "*";
        case Multiplicity::N: return "n";
        case Multiplicity::ZeroToN: return "0..n";
        case Multiplicity::OneToN: return "1..n";
    }
    return "1";
}

std::string arrow_token(const ClassEdge& edge) {
    std::string token;
    if (edge.left_arrow) {
        token += left_head_token(*edge.left_arrow);
    }
    token += edge.dashed ? ".." : "--";
    token += right_head_token(edge.arrow);
    return token;
}

ClassEdgeBuilder& ClassEdgeBuilder::set_source(NodeId source) {
    source_ = source;
    return *this;
}

ClassEdgeBuilder& ClassEdgeBuilder::set_destination(NodeId destination) {
    destination_ = destination;
    return *this;
}

ClassEdgeBuilder& ClassEdgeBuilder::set_arrow_shape(ClassArrowShape shape) {
    arrow_ = shape;
    return *this;
}

ClassEdgeBuilder& ClassEdgeBuilder::set_left_arrow_shape(ClassArrowShape shape) {
    left_arrow_ = shape;
    return *this;
}

ClassEdgeBuilder& ClassEdgeBuilder::set_dashed(bool dashed) {
    dashed_ = dashed;
    return *this;
}

ClassEdgeBuilder& ClassEdgeBuilder::set_source_multiplicity(Multiplicity multiplicity) {
    source_multiplicity_ = multiplicity;
    return *this;
}

ClassEdgeBuilder& ClassEdgeBuilder::set_destination_multiplicity(Multiplicity multiplicity) {
    destination_multiplicity_ = multiplicity;
    return *this;
}

ClassEdgeBuilder& ClassEdgeBuilder::set_label(std::string label) {
    label_ = std::move(label);
    return *this;
}

ClassEdge ClassEdgeBuilder::build() const {
    if (!source_) {
        throw MissingFieldError("source");
    }
    if (!destination_) {
        throw MissingFieldError("destination");
    }
    if (!arrow_) {
        throw MissingFieldError("relationship");
    }

    ClassEdge edge;
    edge.source = *source_;
    edge.destination = *destination_;
    edge.arrow = *arrow_;
    edge.left_arrow = left_arrow_;
    edge.dashed = dashed_;
    edge.source_multiplicity = source_multiplicity_;
    edge.destination_multiplicity = destination_multiplicity_;
    edge.label = label_;
    return edge;
}

}  // namespace mermaidgen
