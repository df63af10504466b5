#ifndef MERMAIDGEN_ENTITY_EDGE_HPP
#define MERMAIDGEN_ENTITY_EDGE_HPP

#include <common/node_id.hpp>
#include <optional>
#include <string>

namespace mermaidgen {

// Crow's foot markers
enum class Cardinality {
    ExactlyOne,
    ZeroOrOne,
    OneOrMore,
    ZeroOrMore
};

// Marker as written on the source side ("||", "|o", "}|", "}o")
const char* left_cardinality_token(Cardinality cardinality);
// Marker as written on the destination side ("||", "o|", "|{", "o{")
const char* right_cardinality_token(Cardinality cardinality);

struct EntityEdge {
    NodeId source = 0;
    NodeId destination = 0;
    Cardinality left = Cardinality::ExactlyOne;
    Cardinality right = Cardinality::ExactlyOne;
    bool identifying = true;
    std::string label;
};

// Relationship token, e.g. "||--o{" or "}|..|{"
std::string relationship_token(const EntityEdge& edge);

class EntityEdgeBuilder {
public:
    // Symmetric shortcuts: both ends carry the same cardinality
    static EntityEdgeBuilder one_to_one(NodeId source, NodeId destination);
    static EntityEdgeBuilder zero_or_one(NodeId source, NodeId destination);
    static EntityEdgeBuilder one_or_more(NodeId source, NodeId destination);
    static EntityEdgeBuilder zero_or_more(NodeId source, NodeId destination);

    EntityEdgeBuilder& set_source(NodeId source);
    EntityEdgeBuilder& set_destination(NodeId destination);
    EntityEdgeBuilder& set_cardinality(Cardinality left, Cardinality right);
    // Identifying relationships draw a solid line, others a dotted one
    EntityEdgeBuilder& set_identifying(bool identifying);
    EntityEdgeBuilder& set_label(std::string label);

    EntityEdge build() const;

private:
    static EntityEdgeBuilder symmetric(NodeId source, NodeId destination, Cardinality cardinality);

    std::optional<NodeId> source_;
    std::optional<NodeId> destination_;
    std::optional<Cardinality> left_;
    std::optional<Cardinality> right_;
    bool identifying_ = true;
    std::string label_;
};

}  // namespace mermaidgen

#endif // MERMAIDGEN_ENTITY_EDGE_HPP
