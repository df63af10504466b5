#ifndef MERMAIDGEN_FLOWCHART_NODE_HPP
#define MERMAIDGEN_FLOWCHART_NODE_HPP

#include <common/node_id.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace mermaidgen {

// Node shapes of the Mermaid flowchart "@{shape: ...}" syntax
enum class FlowchartNodeShape {
    Rectangle,
    RoundEdges,
    StadiumShape,
    Subprocess,
    Cylinder,
    Circle,
    Odd,
    Diamond,
    Hexagon,
    LRParallelogram,
    LLParallelogram,
    Trapezoid,
    ReverseTrapezoid,
    DoubleCircle,
    NotchedRectangle,
    LinedRectangle,
    SmallCircle,
    FramedCircle,
    LongRectangle,
    Hourglass,
    LeftCurlyBrace,
    RightCurlyBrace,
    CurlyBraces,
    LightningBolt,
    Document,
    HalfRoundedRectangle,
    HorizontalCylinder,
    LinedCylinder,
    CurvedTrapezoid,
    DividedRectangle,
    SmallTriangle,
    WindowPane,
    FilledCircle,
    LinedDocument,
    NotchedPentagon,
    FlippedTriangle,
    SlopedRectangle,
    StackedDocument,
    StackedRectangle,
    Flag,
    BowTieRectangle,
    CrossedCircle,
    TaggedDocument,
    TaggedRectangle,
    FramedRectangle,
    TextBlock
};

// Canonical Mermaid name of the shape ("rect", "diamond", ...)
const char* shape_token(FlowchartNodeShape shape);

// Accepts the canonical name and Mermaid's aliases ("process", "decision",
// "db", ...), case-insensitively
std::optional<FlowchartNodeShape> parse_shape(std::string_view name);

struct FlowchartNode {
    NodeId id = 0;
    std::string label;
    FlowchartNodeShape shape = FlowchartNodeShape::Rectangle;
};

class FlowchartNodeBuilder {
public:
    FlowchartNodeBuilder& set_label(std::string label);
    FlowchartNodeBuilder& set_shape(FlowchartNodeShape shape);

    // Throws MissingFieldError("label") if no non-empty label was set
    FlowchartNode build() const;

private:
    std::optional<std::string> label_;
    FlowchartNodeShape shape_ = FlowchartNodeShape::Rectangle;
};

}  // namespace mermaidgen

#endif // MERMAIDGEN_FLOWCHART_NODE_HPP
