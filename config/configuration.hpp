#ifndef MERMAIDGEN_CONFIGURATION_HPP
#define MERMAIDGEN_CONFIGURATION_HPP

#include <optional>
#include <string>

namespace mermaidgen {

// Direction in which the diagram extends
enum class Direction {
    LeftToRight,
    TopToBottom,
    RightToLeft,
    BottomToTop
};

// Layout engine used by the external Mermaid renderer
enum class Renderer {
    Dagre,
    EclipseLayoutKernel
};

enum class Theme {
    MermaidChart,
    Neo,
    NeoDark,
    Default,
    Forest,
    Base,
    Dark,
    Neutral,
    Redux,
    ReduxDark
};

enum class Look {
    Neo,
    HandDrawn,
    Classic
};

const char* direction_token(Direction direction);
const char* renderer_token(Renderer renderer);
const char* theme_token(Theme theme);
const char* look_token(Look look);

// Document-level options shared by every dialect.
// Only the title is validated; every enum combination is renderable.
struct DiagramConfiguration {
    std::optional<std::string> title;
    Direction direction = Direction::LeftToRight;
    Renderer renderer = Renderer::Dagre;
    Theme theme = Theme::Default;
    Look look = Look::Classic;
};

// Class diagrams add a switch for empty member bodies
struct ClassDiagramConfiguration : DiagramConfiguration {
    bool hide_empty_members_box = false;
};

// Throws InvalidValueError if the title is set but empty or spans several lines
void validate_configuration(const DiagramConfiguration& config);

}  // namespace mermaidgen

#endif // MERMAIDGEN_CONFIGURATION_HPP
