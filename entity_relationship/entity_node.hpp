#ifndef MERMAIDGEN_ENTITY_NODE_HPP
#define MERMAIDGEN_ENTITY_NODE_HPP

#include <common/node_id.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mermaidgen {

// Column of an entity, rendered as "<type> <name>"
struct EntityAttribute {
    std::string type;
    std::string name;
};

struct EntityNode {
    NodeId id = 0;
    std::string label;
    std::vector<EntityAttribute> attributes;
};

class EntityNodeBuilder {
public:
    EntityNodeBuilder& set_label(std::string label);
    EntityNodeBuilder& add_attribute(std::string type, std::string name);

    EntityNode build() const;

private:
    std::optional<std::string> label_;
    std::vector<EntityAttribute> attributes_;
};

}  // namespace mermaidgen

#endif // MERMAIDGEN_ENTITY_NODE_HPP
