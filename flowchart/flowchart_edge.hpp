#ifndef MERMAIDGEN_FLOWCHART_EDGE_HPP
#define MERMAIDGEN_FLOWCHART_EDGE_HPP

#include <common/node_id.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace mermaidgen {

enum class FlowchartArrowShape {
    Normal,
    Circle,
    Cross,
    Open
};

enum class LineStyle {
    Solid,
    Thick,
    Dashed
};

// Longest link accepted by FlowchartEdgeBuilder
constexpr uint32_t MAX_LINK_LENGTH = 255;

// Head drawn at the source end ("<", "o", "x" or nothing)
const char* left_head_token(FlowchartArrowShape shape);
// Head drawn at the destination end (">", "o", "x" or nothing)
const char* right_head_token(FlowchartArrowShape shape);

struct FlowchartEdge {
    NodeId source = 0;
    NodeId destination = 0;
    FlowchartArrowShape arrow = FlowchartArrowShape::Normal;
    std::optional<FlowchartArrowShape> left_arrow;
    LineStyle line_style = LineStyle::Solid;
    uint32_t length = 1;
    std::string label;
};

// Complete link token, e.g. "--->", "<==>", "o-.-x"
std::string arrow_token(const FlowchartEdge& edge);

class FlowchartEdgeBuilder {
public:
    FlowchartEdgeBuilder& set_source(NodeId source);
    FlowchartEdgeBuilder& set_destination(NodeId destination);
    FlowchartEdgeBuilder& set_arrow_shape(FlowchartArrowShape shape);
    FlowchartEdgeBuilder& set_left_arrow_shape(FlowchartArrowShape shape);
    FlowchartEdgeBuilder& set_line_style(LineStyle style);
    FlowchartEdgeBuilder& set_length(uint32_t length);
    FlowchartEdgeBuilder& set_label(std::string label);

    FlowchartEdge build() const;

private:
    std::optional<NodeId> source_;
    std::optional<NodeId> destination_;
    std::optional<FlowchartArrowShape> arrow_;
    std::optional<FlowchartArrowShape> left_arrow_;
    LineStyle line_style_ = LineStyle::Solid;
    uint32_t length_ = 1;
    std::string label_;
};

}  // namespace mermaidgen

#endif // MERMAIDGEN_FLOWCHART_EDGE_HPP
