#include "entity_node.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <cctype>
#include <utility>

namespace mermaidgen {

namespace {

// Attribute rows are "<type> <name>", so each part must be one word
bool is_single_word(const std::string& text) {
    return !text.empty() &&
           std::none_of(text.begin(), text.end(),
                        [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

EntityNodeBuilder& EntityNodeBuilder::set_label(std::string label) {
    label_ = std::move(label);
    return *this;
}

EntityNodeBuilder& EntityNodeBuilder::add_attribute(std::string type, std::string name) {
    attributes_.push_back({std::move(type), std::move(name)});
    return *this;
}

EntityNode EntityNodeBuilder::build() const {
    if (!label_ || label_->empty()) {
        throw MissingFieldError("label");
    }
    for (const auto& attribute : attributes_) {
        if (!is_single_word(attribute.type)) {
            throw InvalidValueError("attribute_type", "must be a single word without whitespace");
        }
        if (!is_single_word(attribute.name)) {
            throw InvalidValueError("attribute_name", "must be a single word without whitespace");
        }
    }

    EntityNode node;
    node.label = *label_;
    node.attributes = attributes_;
    return node;
}

}  // namespace mermaidgen
