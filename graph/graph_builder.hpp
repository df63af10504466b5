#ifndef MERMAIDGEN_GRAPH_BUILDER_HPP
#define MERMAIDGEN_GRAPH_BUILDER_HPP

#include <common/errors.hpp>
#include <common/logging.hpp>
#include <common/node_id.hpp>
#include <config/configuration.hpp>
#include <string>
#include <utility>
#include <vector>

namespace mermaidgen {

// A Dialect is a traits type providing:
//   Node, NodeBuilder     NodeBuilder::build() const -> Node (id left at 0)
//   Edge, EdgeBuilder     EdgeBuilder::build() const -> Edge
//   Configuration         derived from DiagramConfiguration
//   name                  human readable dialect name, used in logs
//   render(const Diagram<Dialect>&) -> std::string

template <typename Dialect>
class GraphBuilder;

// Finalized, immutable diagram. Only a GraphBuilder can create one.
template <typename Dialect>
class Diagram {
public:
    using Node = typename Dialect::Node;
    using Edge = typename Dialect::Edge;
    using Configuration = typename Dialect::Configuration;

    const Configuration& configuration() const { return configuration_; }
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }

    // Nodes are stored in id order, so lookup is an index
    const Node* get_node(NodeId id) const {
        if (id >= nodes_.size()) {
            return nullptr;
        }
        return &nodes_[id];
    }

    // Full Mermaid document for this diagram
    std::string render() const { return Dialect::render(*this); }

private:
    friend class GraphBuilder<Dialect>;

    Diagram(Configuration configuration, std::vector<Node> nodes, std::vector<Edge> edges)
        : configuration_(std::move(configuration)),
          nodes_(std::move(nodes)),
          edges_(std::move(edges)) {}

    Configuration configuration_;
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
};

// Collects validated nodes and edges for one diagram.
// Appending is the only mutation; a failed append leaves the builder unchanged.
template <typename Dialect>
class GraphBuilder {
public:
    using Node = typename Dialect::Node;
    using NodeBuilder = typename Dialect::NodeBuilder;
    using Edge = typename Dialect::Edge;
    using EdgeBuilder = typename Dialect::EdgeBuilder;
    using Configuration = typename Dialect::Configuration;

    GraphBuilder() = default;

    void set_configuration(Configuration configuration) {
        validate_configuration(configuration);
        configuration_ = std::move(configuration);
    }

    const Configuration& configuration() const { return configuration_; }

    // Validates the builder, then allocates an id for the new node
    NodeId add_node(const NodeBuilder& builder) {
        auto log = mermaidgen::logging::get_logger();

        Node node = builder.build();
        node.id = allocator_.next();
        log->debug("{}: added node {} \"{}\"", Dialect::name, node_ref(node.id), node.label);
        nodes_.push_back(std::move(node));
        return nodes_.back().id;
    }

    void add_edge(const EdgeBuilder& builder) {
        auto log = mermaidgen::logging::get_logger();

        Edge edge = builder.build();
        if (!has_node(edge.source)) {
            log->debug("{}: rejected edge with unknown source {}", Dialect::name,
                       node_ref(edge.source));
            throw UnknownNodeReferenceError(edge.source);
        }
        if (!has_node(edge.destination)) {
            log->debug("{}: rejected edge with unknown destination {}", Dialect::name,
                       node_ref(edge.destination));
            throw UnknownNodeReferenceError(edge.destination);
        }

        log->debug("{}: added edge {} -> {}", Dialect::name,
                   node_ref(edge.source), node_ref(edge.destination));
        edges_.push_back(std::move(edge));
    }

    bool has_node(NodeId id) const { return id < allocator_.issued(); }

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }

    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }

    // Snapshot of the current contents. Cannot fail: every invariant was
    // checked when the entries were appended.
    Diagram<Dialect> finalize() const {
        return Diagram<Dialect>(configuration_, nodes_, edges_);
    }

private:
    IdAllocator allocator_;
    Configuration configuration_;
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
};

}  // namespace mermaidgen

#endif // MERMAIDGEN_GRAPH_BUILDER_HPP
