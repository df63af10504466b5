#ifndef MERMAIDGEN_FLOWCHART_HPP
#define MERMAIDGEN_FLOWCHART_HPP

#include "flowchart_edge.hpp"
#include "flowchart_node.hpp"
#include <config/configuration.hpp>
#include <graph/graph_builder.hpp>
#include <string>

namespace mermaidgen {

struct FlowchartDialect {
    using Node = FlowchartNode;
    using NodeBuilder = FlowchartNodeBuilder;
    using Edge = FlowchartEdge;
    using EdgeBuilder = FlowchartEdgeBuilder;
    using Configuration = DiagramConfiguration;

    static constexpr const char* name = "flowchart";

    // Mermaid "flowchart" document. The YAML front matter is only written
    // when it carries something besides defaults (a title or a non-dagre
    // renderer).
    static std::string render(const Diagram<FlowchartDialect>& diagram);
};

using Flowchart = Diagram<FlowchartDialect>;
using FlowchartBuilder = GraphBuilder<FlowchartDialect>;

}  // namespace mermaidgen

#endif // MERMAIDGEN_FLOWCHART_HPP
