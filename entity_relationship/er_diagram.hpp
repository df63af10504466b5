#ifndef MERMAIDGEN_ER_DIAGRAM_HPP
#define MERMAIDGEN_ER_DIAGRAM_HPP

#include "entity_edge.hpp"
#include "entity_node.hpp"
#include <config/configuration.hpp>
#include <graph/graph_builder.hpp>
#include <string>

namespace mermaidgen {

struct ErDiagramDialect {
    using Node = EntityNode;
    using NodeBuilder = EntityNodeBuilder;
    using Edge = EntityEdge;
    using EdgeBuilder = EntityEdgeBuilder;
    using Configuration = DiagramConfiguration;

    static constexpr const char* name = "erDiagram";

    static std::string render(const Diagram<ErDiagramDialect>& diagram);
};

using ErDiagram = Diagram<ErDiagramDialect>;
using ErDiagramBuilder = GraphBuilder<ErDiagramDialect>;

}  // namespace mermaidgen

#endif // MERMAIDGEN_ER_DIAGRAM_HPP
