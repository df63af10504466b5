#ifndef MERMAIDGEN_CLASS_NODE_HPP
#define MERMAIDGEN_CLASS_NODE_HPP

#include <common/node_id.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mermaidgen {

enum class Visibility {
    Public,
    Private,
    Protected,
    Package
};

const char* visibility_token(Visibility visibility);

struct MethodArgument {
    std::string name;
    std::string type;
};

struct ClassNode {
    NodeId id = 0;
    std::string label;
    std::optional<std::string> annotation;
    std::vector<std::string> members;  // rendered verbatim, in order

    bool has_body() const { return annotation.has_value() || !members.empty(); }
};

class ClassNodeBuilder {
public:
    ClassNodeBuilder& set_label(std::string label);

    // Stereotype shown as <<annotation>>, e.g. "interface"
    ClassNodeBuilder& set_annotation(std::string annotation);

    // Raw member line, e.g. "+String name" or "+bark() void"
    ClassNodeBuilder& add_member(std::string member);

    // Appends "<vis><name>: <type>"
    ClassNodeBuilder& add_attribute(Visibility visibility, const std::string& type,
                                    const std::string& name);

    // Appends "<vis><name>(<arg>: <type>, ...): <return type>", with "void"
    // when no return type is given
    ClassNodeBuilder& add_method(Visibility visibility, const std::string& name,
                                 const std::vector<MethodArgument>& arguments,
                                 const std::optional<std::string>& return_type = std::nullopt);

    // Throws MissingFieldError("label"), or InvalidValueError for an empty
    // or multi-line member or annotation
    ClassNode build() const;

private:
    std::optional<std::string> label_;
    std::optional<std::string> annotation_;
    std::vector<std::string> members_;
};

}  // namespace mermaidgen

#endif // MERMAIDGEN_CLASS_NODE_HPP
