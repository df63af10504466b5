#include "class_node.hpp"
#include <common/errors.hpp>
#include <common/label.hpp>
#include <utility>

namespace mermaidgen {

const char* visibility_token(Visibility visibility) {
    switch (visibility) {
        case Visibility::Public: return "+";
        case Visibility::Private: return "-";
        case Visibility::Protected: return "#";
        case Visibility::Package: return "~";
    }
    return "+";
}

ClassNodeBuilder& ClassNodeBuilder::set_label(std::string label) {
    label_ = std::move(label);
    return *this;
}

ClassNodeBuilder& ClassNodeBuilder::set_annotation(std::string annotation) {
    annotation_ = std::move(annotation);
    return *this;
}

ClassNodeBuilder& ClassNodeBuilder::add_member(std::string member) {
    members_.push_back(std::move(member));
    return *this;
}

ClassNodeBuilder& ClassNodeBuilder::add_attribute(Visibility visibility, const std::string& type,
                                                  const std::string& name) {
    members_.push_back(visibility_token(visibility) + name + ": " + type);
    return *this;
}

ClassNodeBuilder& ClassNodeBuilder::add_method(Visibility visibility, const std::string& name,
                                               const std::vector<MethodArgument>& arguments,
                                               const std::optional<std::string>& return_type) {
    std::string member = visibility_token(visibility) + name + "(";
    for (size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) {
            member += ", ";
        }
        member += arguments[i].name + ": " + arguments[i].type;
    }
    member += "): ";
    member += return_type ? *return_type : "void";
    members_.push_back(std::move(member));
    return *this;
}

ClassNode ClassNodeBuilder::build() const {
    if (!label_ || label_->empty()) {
        throw MissingFieldError("label");
    }
    // Members and annotations are written inside the class body, one per line
    if (annotation_ && (annotation_->empty() || has_line_break(*annotation_))) {
        throw InvalidValueError("annotation", "must be a non-empty single line");
    }
    for (const auto& member : members_) {
        if (member.empty() || has_line_break(member)) {
            throw InvalidValueError("member", "must be a non-empty single line");
        }
    }

    ClassNode node;
    node.label = *label_;
    node.annotation = annotation_;
    node.members = members_;
    return node;
}

}  // namespace mermaidgen
