#include "entity_edge.hpp"
#include <common/errors.hpp>
#include <utility>

namespace mermaidgen {

const char* left_cardinality_token(Cardinality cardinality) {
    switch (cardinality) {
        case Cardinality::ExactlyOne: return "||";
        case Cardinality::ZeroOrOne: return "|o";
        case Cardinality::OneOrMore: return "}|";
        case Cardinality::ZeroOrMore: return "}o";
    }
    return "||";
}

const char* right_cardinality_token(Cardinality cardinality) {
    switch (cardinality) {
        case Cardinality::ExactlyOne: return "||";
        case Cardinality::ZeroOrOne: return "o|";
        case Cardinality::OneOrMore: return "|{";
        case Cardinality::ZeroOrMore: return "o{";
    }
    return "||";
}

std::string relationship_token(const EntityEdge& edge) {
    std::string token = left_cardinality_token(edge.left);
    token += edge.identifying ? "--" : "..";
    token += right_cardinality_token(edge.right);
    return token;
}

EntityEdgeBuilder EntityEdgeBuilder::symmetric(NodeId source, NodeId destination,
                                               Cardinality cardinality) {
    EntityEdgeBuilder builder;
    builder.set_source(source).set_destination(destination).set_cardinality(cardinality, cardinality);
    return builder;
}

EntityEdgeBuilder EntityEdgeBuilder::one_to_one(NodeId source, NodeId destination) {
    return symmetric(source, destination, Cardinality::ExactlyOne);
}

EntityEdgeBuilder EntityEdgeBuilder::zero_or_one(NodeId source, NodeId destination) {
    return symmetric(source, destination, Cardinality::ZeroOrOne);
}

EntityEdgeBuilder EntityEdgeBuilder::one_or_more(NodeId source, NodeId destination) {
    return symmetric(source, destination, Cardinality::OneOrMore);
}

EntityEdgeBuilder EntityEdgeBuilder::zero_or_more(NodeId source, NodeId destination) {
    return symmetric(source, destination, Cardinality::ZeroOrMore);
}

EntityEdgeBuilder& EntityEdgeBuilder::set_source(NodeId source) {
    source_ = source;
    return *this;
}

EntityEdgeBuilder& EntityEdgeBuilder::set_destination(NodeId destination) {
    destination_ = destination;
    return *this;
}

EntityEdgeBuilder& EntityEdgeBuilder::set_cardinality(Cardinality left, Cardinality right) {
    left_ = left;
    right_ = right;
    return *this;
}

EntityEdgeBuilder& EntityEdgeBuilder::set_identifying(bool identifying) {
    identifying_ = identifying;
    return *this;
}

EntityEdgeBuilder& EntityEdgeBuilder::set_label(std::string label) {
    label_ = std::move(label);
    return *this;
}

EntityEdge EntityEdgeBuilder::build() const {
    if (!source_) {
        throw MissingFieldError("source");
    }
    if (!destination_) {
        throw MissingFieldError("destination");
    }
    if (!left_ || !right_) {
        throw MissingFieldError("relationship");
    }

    EntityEdge edge;
    edge.source = *source_;
    edge.destination = *destination_;
    edge.left = *left_;
    edge.right = *right_;
    edge.identifying = identifying_;
    edge.label = label_;
    return edge;
}

}  // namespace mermaidgen
