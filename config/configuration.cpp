#include "configuration.hpp"
#include <common/errors.hpp>
#include <common/label.hpp>

namespace mermaidgen {

const char* direction_token(Direction direction) {
    switch (direction) {
        case Direction::LeftToRight: return "LR";
        case Direction::TopToBottom: return "TB";
        case Direction::RightToLeft: return "RL";
        case Direction::BottomToTop: return "BT";
    }
    return "LR";
}

const char* renderer_token(Renderer renderer) {
    switch (renderer) {
        case Renderer::Dagre: return "dagre";
        case Renderer::EclipseLayoutKernel: return "elk";
    }
    return "dagre";
}

const char* theme_token(Theme theme) {
    switch (theme) {
        case Theme::MermaidChart: return "mc";
        case Theme::Neo: return "neo";
        case Theme::NeoDark: return "neo-dark";
        case Theme::Default: return "default";
        case Theme::Forest: return "forest";
        case Theme::Base: return "base";
        case Theme::Dark: return "dark";
        case Theme::Neutral: return "neutral";
        case Theme::Redux: return "redux";
        case Theme::ReduxDark: return "redux-dark";
    }
    return "default";
}

const char* look_token(Look look) {
    switch (look) {
        case Look::Neo: return "neo";
        case Look::HandDrawn: return "handDrawn";
        case Look::Classic: return "classic";
    }
    return "classic";
}

void validate_configuration(const DiagramConfiguration& config) {
    if (!config.title) {
        return;
    }
    if (config.title->empty()) {
        throw InvalidValueError("title", "must not be empty");
    }
    // The title lives on a single YAML line
    if (has_line_break(*config.title)) {
        throw InvalidValueError("title", "must be a single line");
    }
}

}  // namespace mermaidgen
