#ifndef MERMAIDGEN_SERIALIZATION_CONFIG_JSON_HPP
#define MERMAIDGEN_SERIALIZATION_CONFIG_JSON_HPP

#include "json_serialization.hpp"
#include <config/configuration.hpp>
#include <nlohmann/json.hpp>

namespace mermaidgen {

// Enum names are the tokens written into the Mermaid header

NLOHMANN_JSON_SERIALIZE_ENUM(Direction, {
    {Direction::LeftToRight, "LR"},
    {Direction::TopToBottom, "TB"},
    {Direction::RightToLeft, "RL"},
    {Direction::BottomToTop, "BT"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Renderer, {
    {Renderer::Dagre, "dagre"},
    {Renderer::EclipseLayoutKernel, "elk"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Theme, {
    {Theme::MermaidChart, "mc"},
    {Theme::Neo, "neo"},
    {Theme::NeoDark, "neo-dark"},
    {Theme::Default, "default"},
    {Theme::Forest, "forest"},
    {Theme::Base, "base"},
    {Theme::Dark, "dark"},
    {Theme::Neutral, "neutral"},
    {Theme::Redux, "redux"},
    {Theme::ReduxDark, "redux-dark"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Look, {
    {Look::Neo, "neo"},
    {Look::HandDrawn, "handDrawn"},
    {Look::Classic, "classic"},
})

// DiagramConfiguration serialization
inline void to_json(nlohmann::json& j, const DiagramConfiguration& config) {
    j = {
        {"direction", config.direction},
        {"renderer", config.renderer},
        {"theme", config.theme},
        {"look", config.look}
    };
    if (config.title) {
        j["title"] = *config.title;
    }
}

// Absent keys keep their defaults; unknown enum names throw InvalidValueError
inline void from_json(const nlohmann::json& j, DiagramConfiguration& config) {
    config = DiagramConfiguration{};
    if (j.contains("title") && !j["title"].is_null()) {
        config.title = j["title"].get<std::string>();
    }
    if (j.contains("direction")) {
        config.direction = json::enum_from_json<Direction>(j["direction"], "direction");
    }
    if (j.contains("renderer")) {
        config.renderer = json::enum_from_json<Renderer>(j["renderer"], "renderer");
    }
    if (j.contains("theme")) {
        config.theme = json::enum_from_json<Theme>(j["theme"], "theme");
    }
    if (j.contains("look")) {
        config.look = json::enum_from_json<Look>(j["look"], "look");
    }
}

// ClassDiagramConfiguration serialization
inline void to_json(nlohmann::json& j, const ClassDiagramConfiguration& config) {
    to_json(j, static_cast<const DiagramConfiguration&>(config));
    j["hide_empty_members_box"] = config.hide_empty_members_box;
}

inline void from_json(const nlohmann::json& j, ClassDiagramConfiguration& config) {
    from_json(j, static_cast<DiagramConfiguration&>(config));
    config.hide_empty_members_box = j.value("hide_empty_members_box", false);
}

}  // namespace mermaidgen

#endif // MERMAIDGEN_SERIALIZATION_CONFIG_JSON_HPP
