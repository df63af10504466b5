#include "flowchart_node.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <cctype>
#include <utility>

namespace mermaidgen {

const char* shape_token(FlowchartNodeShape shape) {
    switch (shape) {
        case FlowchartNodeShape::Rectangle: return "rect";
        case FlowchartNodeShape::RoundEdges: return "rounded";
        case FlowchartNodeShape::StadiumShape: return "stadium";
        case FlowchartNodeShape::Subprocess: return "subproc";
        case FlowchartNodeShape::Cylinder: return "cyl";
        case FlowchartNodeShape::Circle: return "circle";
        case FlowchartNodeShape::Odd: return "odd";
        case FlowchartNodeShape::Diamond: return "diamond";
        case FlowchartNodeShape::Hexagon: return "hex";
        case FlowchartNodeShape::LRParallelogram: return "lean-r";
        case FlowchartNodeShape::LLParallelogram: return "lean-l";
        case FlowchartNodeShape::Trapezoid: return "trap-b";
        case FlowchartNodeShape::ReverseTrapezoid: return "trap-t";
        case FlowchartNodeShape::DoubleCircle: return "dbl-circ";
        case FlowchartNodeShape::NotchedRectangle: return "notch-rect";
        case FlowchartNodeShape::LinedRectangle: return "lin-rect";
        case FlowchartNodeShape::SmallCircle: return "sm-circ";
        case FlowchartNodeShape::FramedCircle: return "framed-circle";
        case FlowchartNodeShape::LongRectangle: return "fork";
        case FlowchartNodeShape::Hourglass: return "hourglass";
        case FlowchartNodeShape::LeftCurlyBrace: return "comment";
        case FlowchartNodeShape::RightCurlyBrace: return "brace-r";
        case FlowchartNodeShape::CurlyBraces: return "braces";
        case FlowchartNodeShape::LightningBolt: return "bolt";
        case FlowchartNodeShape::Document: return "doc";
        case FlowchartNodeShape::HalfRoundedRectangle: return "delay";
        case FlowchartNodeShape::HorizontalCylinder: return "das";
        case FlowchartNodeShape::LinedCylinder: return "lin-cyl";
        case FlowchartNodeShape::CurvedTrapezoid: return "curv-trap";
        case FlowchartNodeShape::DividedRectangle: return "div-rect";
        case FlowchartNodeShape::SmallTriangle: return "tri";
        case FlowchartNodeShape::WindowPane: return "win-pane";
        case FlowchartNodeShape::FilledCircle: return "f-circ";
        case FlowchartNodeShape::LinedDocument: return "lin-doc";
        case FlowchartNodeShape::NotchedPentagon: return "notch-pent";
        case FlowchartNodeShape::FlippedTriangle: return "flip-tri";
        case FlowchartNodeShape::SlopedRectangle: return "sl-rect";
        case FlowchartNodeShape::StackedDocument: return "docs";
        case FlowchartNodeShape::StackedRectangle: return "processes";
        case FlowchartNodeShape::Flag: return "flag";
        case FlowchartNodeShape::BowTieRectangle: return "bow-rect";
        case FlowchartNodeShape::CrossedCircle: return "cross-circ";
        case FlowchartNodeShape::TaggedDocument: return "tag-doc";
        case FlowchartNodeShape::TaggedRectangle: return "tag-rect";
        case FlowchartNodeShape::FramedRectangle: return "fr-rect";
        case FlowchartNodeShape::TextBlock: return "text";
    }
    return "rect";
}

namespace {

struct ShapeAlias {
    std::string_view name;
    FlowchartNodeShape shape;
};

// Aliases accepted by Mermaid besides the canonical token
constexpr ShapeAlias SHAPE_ALIASES[] = {
    {"rectangle", FlowchartNodeShape::Rectangle},
    {"proc", FlowchartNodeShape::Rectangle},
    {"process", FlowchartNodeShape::Rectangle},
    {"event", FlowchartNodeShape::RoundEdges},
    {"pill", FlowchartNodeShape::StadiumShape},
    {"terminal", FlowchartNodeShape::StadiumShape},
    {"subprocess", FlowchartNodeShape::Subprocess},
    {"subroutine", FlowchartNodeShape::Subprocess},
    {"framed-rectangle", FlowchartNodeShape::Subprocess},
    {"cylinder", FlowchartNodeShape::Cylinder},
    {"database", FlowchartNodeShape::Cylinder},
    {"db", FlowchartNodeShape::Cylinder},
    {"circ", FlowchartNodeShape::Circle},
    {"diam", FlowchartNodeShape::Diamond},
    {"decision", FlowchartNodeShape::Diamond},
    {"question", FlowchartNodeShape::Diamond},
    {"hexagon", FlowchartNodeShape::Hexagon},
    {"prepare", FlowchartNodeShape::Hexagon},
    {"lean-right", FlowchartNodeShape::LRParallelogram},
    {"in-out", FlowchartNodeShape::LRParallelogram},
    {"lean-left", FlowchartNodeShape::LLParallelogram},
    {"out-in", FlowchartNodeShape::LLParallelogram},
    {"trapezoid", FlowchartNodeShape::Trapezoid},
    {"priority", FlowchartNodeShape::Trapezoid},
    {"trapezoid-bottom", FlowchartNodeShape::Trapezoid},
    {"inv-trapezoid", FlowchartNodeShape::ReverseTrapezoid},
    {"manual", FlowchartNodeShape::ReverseTrapezoid},
    {"trapezoid-top", FlowchartNodeShape::ReverseTrapezoid},
    {"double-circle", FlowchartNodeShape::DoubleCircle},
    {"stop", FlowchartNodeShape::DoubleCircle},
    {"card", FlowchartNodeShape::NotchedRectangle},
    {"notched-rectangle", FlowchartNodeShape::NotchedRectangle},
    {"lin-proc", FlowchartNodeShape::LinedRectangle},
    {"lined-process", FlowchartNodeShape::LinedRectangle},
    {"lined-rectangle", FlowchartNodeShape::LinedRectangle},
    {"shaded-process", FlowchartNodeShape::LinedRectangle},
    {"small-circle", FlowchartNodeShape::SmallCircle},
    {"start", FlowchartNodeShape::SmallCircle},
    {"fr-circ", FlowchartNodeShape::FramedCircle},
    {"join", FlowchartNodeShape::LongRectangle},
    {"collate", FlowchartNodeShape::Hourglass},
    {"brace-l", FlowchartNodeShape::LeftCurlyBrace},
    {"com-link", FlowchartNodeShape::LightningBolt},
    {"lightning-bolt", FlowchartNodeShape::LightningBolt},
    {"document", FlowchartNodeShape::Document},
    {"half-rounded-rectangle", FlowchartNodeShape::HalfRoundedRectangle},
    {"h-cyl", FlowchartNodeShape::HorizontalCylinder},
    {"horizontal-cylinder", FlowchartNodeShape::HorizontalCylinder},
    {"disk", FlowchartNodeShape::LinedCylinder},
    {"lined-cylinder", FlowchartNodeShape::LinedCylinder},
    {"curved-trapezoid", FlowchartNodeShape::CurvedTrapezoid},
    {"display", FlowchartNodeShape::CurvedTrapezoid},
    {"div-proc", FlowchartNodeShape::DividedRectangle},
    {"divided-process", FlowchartNodeShape::DividedRectangle},
    {"divided-rectangle", FlowchartNodeShape::DividedRectangle},
    {"extract", FlowchartNodeShape::SmallTriangle},
    {"triangle", FlowchartNodeShape::SmallTriangle},
    {"internal-storage", FlowchartNodeShape::WindowPane},
    {"window-pane", FlowchartNodeShape::WindowPane},
    {"filled-circle", FlowchartNodeShape::FilledCircle},
    {"junction", FlowchartNodeShape::FilledCircle},
    {"lined-document", FlowchartNodeShape::LinedDocument},
    {"loop-limit", FlowchartNodeShape::NotchedPentagon},
    {"notched-pentagon", FlowchartNodeShape::NotchedPentagon},
    {"flipped-triangle", FlowchartNodeShape::FlippedTriangle},
    {"manual-file", FlowchartNodeShape::FlippedTriangle},
    {"manual-input", FlowchartNodeShape::SlopedRectangle},
    {"sloped-rectangle", FlowchartNodeShape::SlopedRectangle},
    {"documents", FlowchartNodeShape::StackedDocument},
    {"st-doc", FlowchartNodeShape::StackedDocument},
    {"stacked-document", FlowchartNodeShape::StackedDocument},
    {"procs", FlowchartNodeShape::StackedRectangle},
    {"st-rect", FlowchartNodeShape::StackedRectangle},
    {"stacked-rectangle", FlowchartNodeShape::StackedRectangle},
    {"paper-tape", FlowchartNodeShape::Flag},
    {"bow-tie-rectangle", FlowchartNodeShape::BowTieRectangle},
    {"stored-data", FlowchartNodeShape::BowTieRectangle},
    {"crossed-circle", FlowchartNodeShape::CrossedCircle},
    {"summary", FlowchartNodeShape::CrossedCircle},
    {"tagged-document", FlowchartNodeShape::TaggedDocument},
    {"tag-proc", FlowchartNodeShape::TaggedRectangle},
    {"tagged-process", FlowchartNodeShape::TaggedRectangle},
    {"tagged-rectangle", FlowchartNodeShape::TaggedRectangle},
    {"text-block", FlowchartNodeShape::TextBlock},
};

constexpr FlowchartNodeShape LAST_SHAPE = FlowchartNodeShape::TextBlock;

}  // namespace

std::optional<FlowchartNodeShape> parse_shape(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (int i = 0; i <= static_cast<int>(LAST_SHAPE); ++i) {
        auto shape = static_cast<FlowchartNodeShape>(i);
        if (lower == shape_token(shape)) {
            return shape;
        }
    }
    for (const auto& alias : SHAPE_ALIASES) {
        if (lower == alias.name) {
            return alias.shape;
        }
    }
    return std::nullopt;
}

FlowchartNodeBuilder& FlowchartNodeBuilder::set_label(std::string label) {
    label_ = std::move(label);
    return *this;
}

FlowchartNodeBuilder& FlowchartNodeBuilder::set_shape(FlowchartNodeShape shape) {
    shape_ = shape;
    return *this;
}

FlowchartNode FlowchartNodeBuilder::build() const {
    if (!label_ || label_->empty()) {
        throw MissingFieldError("label");
    }

    FlowchartNode node;
    node.label = *label_;
    node.shape = shape_;
    return node;
}

}  // namespace mermaidgen
