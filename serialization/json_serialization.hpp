#ifndef MERMAIDGEN_SERIALIZATION_JSON_SERIALIZATION_HPP
#define MERMAIDGEN_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <common/errors.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <string>

namespace mermaidgen::json {

// Read JSON from file
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

// Strict enum lookup. NLOHMANN_JSON_SERIALIZE_ENUM maps unknown names to the
// first entry; a value that does not serialize back to the input is rejected.
template <typename Enum>
Enum enum_from_json(const nlohmann::json& j, const std::string& field) {
    Enum value = j.get<Enum>();
    if (nlohmann::json(value) != j) {
        throw InvalidValueError(field, "unknown value " + j.dump());
    }
    return value;
}

}  // namespace mermaidgen::json

#endif // MERMAIDGEN_SERIALIZATION_JSON_SERIALIZATION_HPP
