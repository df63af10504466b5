#ifndef MERMAIDGEN_NODE_ID_HPP
#define MERMAIDGEN_NODE_ID_HPP

#include <cstdint>
#include <string>

namespace mermaidgen {

// Dense, zero-based handle of a node within one diagram.
using NodeId = uint32_t;

// Prefix used for node identifiers in rendered text ("v0", "v1", ...)
constexpr const char* NODE_PREFIX = "v";

inline std::string node_ref(NodeId id) {
    return NODE_PREFIX + std::to_string(id);
}

// Issues node ids in insertion order. Each graph builder owns one, so ids
// are only unique within a single diagram.
class IdAllocator {
public:
    NodeId next() { return next_++; }

    // Number of ids issued so far
    NodeId issued() const { return next_; }

private:
    NodeId next_ = 0;
};

}  // namespace mermaidgen

#endif // MERMAIDGEN_NODE_ID_HPP
