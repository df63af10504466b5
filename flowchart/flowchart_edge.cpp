#include "flowchart_edge.hpp"
#include <common/errors.hpp>
#include <utility>

namespace mermaidgen {

const char* left_head_token(FlowchartArrowShape shape) {
    switch (shape) {
        case FlowchartArrowShape::Normal: return "<";
        case FlowchartArrowShape::Circle: return "o";
        case FlowchartArrowShape::Cross: return "x";
        case FlowchartArrowShape::Open: return "";
    }
    return "";
}

const char* right_head_token(FlowchartArrowShape shape) {
    switch (shape) {
        case FlowchartArrowShape::Normal: return ">";
        case FlowchartArrowShape::Circle: return "o";
        case FlowchartArrowShape::Cross: return "x";
        case FlowchartArrowShape::Open: return "";
    }
    return "";
}

namespace {

std::string segment_token(LineStyle style, uint32_t length) {
    size_t count = static_cast<size_t>(length);
    switch (style) {
        case LineStyle::Solid: return std::string(count + 2, '-');
        case LineStyle::Thick: return std::string(count + 2, '=');
        case LineStyle::Dashed: return "-" + std::string(count, '.') + "-";
    }
    return std::string(count + 2, '-');
}

}  // namespace

std::string arrow_token(const FlowchartEdge& edge) {
    std::string token;
    if (edge.left_arrow) {
        token += left_head_token(*edge.left_arrow);
    }
    token += segment_token(edge.line_style, edge.length);
    token += right_head_token(edge.arrow);
    return token;
}

FlowchartEdgeBuilder& FlowchartEdgeBuilder::set_source(NodeId source) {
    source_ = source;
    return *this;
}

FlowchartEdgeBuilder& FlowchartEdgeBuilder::set_destination(NodeId destination) {
    destination_ = destination;
    return *this;
}

FlowchartEdgeBuilder& FlowchartEdgeBuilder::set_arrow_shape(FlowchartArrowShape shape) {
    arrow_ = shape;
    return *this;
}

FlowchartEdgeBuilder& FlowchartEdgeBuilder::set_left_arrow_shape(FlowchartArrowShape shape) {
    left_arrow_ = shape;
    return *this;
}

FlowchartEdgeBuilder& FlowchartEdgeBuilder::set_line_style(LineStyle style) {
    line_style_ = style;
    return *this;
}

FlowchartEdgeBuilder& FlowchartEdgeBuilder::set_length(uint32_t length) {
    length_ = length;
    return *this;
}

FlowchartEdgeBuilder& FlowchartEdgeBuilder::set_label(std::string label) {
    label_ = std::move(label);
    return *this;
}

FlowchartEdge FlowchartEdgeBuilder::build() const {
    if (!source_) {
        throw MissingFieldError("source");
    }
    if (!destination_) {
        throw MissingFieldError("destination");
    }
    if (!arrow_) {
        throw MissingFieldError("relationship");
    }
    if (length_ == 0 || length_ > MAX_LINK_LENGTH) {
        throw InvalidValueError("length", "must be between 1 and " +
                                              std::to_string(MAX_LINK_LENGTH));
    }

    FlowchartEdge edge;
    edge.source = *source_;
    edge.destination = *destination_;
    edge.arrow = *arrow_;
    edge.left_arrow = left_arrow_;
    edge.line_style = line_style_;
    edge.length = length_;
    edge.label = label_;
    return edge;
}

}  // namespace mermaidgen
