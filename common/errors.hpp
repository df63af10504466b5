#ifndef MERMAIDGEN_ERRORS_HPP
#define MERMAIDGEN_ERRORS_HPP

#include "node_id.hpp"
#include <stdexcept>
#include <string>

namespace mermaidgen {

// Base class for every validation failure raised while building a diagram.
class DiagramError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A required attribute was never set before finalizing a builder.
class MissingFieldError : public DiagramError {
public:
    explicit MissingFieldError(const std::string& field);

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// An edge endpoint does not name a node of the target graph builder.
class UnknownNodeReferenceError : public DiagramError {
public:
    explicit UnknownNodeReferenceError(NodeId id);

    NodeId node_id() const { return node_id_; }

private:
    NodeId node_id_;
};

// A value was supplied but cannot be rendered (empty title, zero length, ...).
class InvalidValueError : public DiagramError {
public:
    InvalidValueError(const std::string& field, const std::string& reason);

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

}  // namespace mermaidgen

#endif // MERMAIDGEN_ERRORS_HPP
