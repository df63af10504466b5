#ifndef MERMAIDGEN_CLASS_DIAGRAM_HPP
#define MERMAIDGEN_CLASS_DIAGRAM_HPP

#include "class_edge.hpp"
#include "class_node.hpp"
#include <config/configuration.hpp>
#include <graph/graph_builder.hpp>
#include <string>

namespace mermaidgen {

struct ClassDiagramDialect {
    using Node = ClassNode;
    using NodeBuilder = ClassNodeBuilder;
    using Edge = ClassEdge;
    using EdgeBuilder = ClassEdgeBuilder;
    using Configuration = ClassDiagramConfiguration;

    static constexpr const char* name = "classDiagram";

    static std::string render(const Diagram<ClassDiagramDialect>& diagram);
};

using ClassDiagram = Diagram<ClassDiagramDialect>;
using ClassDiagramBuilder = GraphBuilder<ClassDiagramDialect>;

}  // namespace mermaidgen

#endif // MERMAIDGEN_CLASS_DIAGRAM_HPP
