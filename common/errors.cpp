#include "errors.hpp"

namespace mermaidgen {

MissingFieldError::MissingFieldError(const std::string& field)
    : DiagramError("Missing required field: " + field), field_(field) {}

UnknownNodeReferenceError::UnknownNodeReferenceError(NodeId id)
    : DiagramError("Unknown node reference: " + node_ref(id)), node_id_(id) {}

InvalidValueError::InvalidValueError(const std::string& field, const std::string& reason)
    : DiagramError("Invalid value for " + field + ": " + reason), field_(field) {}

}  // namespace mermaidgen
