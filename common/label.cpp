#include "label.hpp"

namespace mermaidgen {

std::string escape_label(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '"') {
            result += "#quot;";
        } else if (c == '\r') {
            // \r\n counts as a single break
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            result += "<br>";
        } else if (c == '\n') {
            result += "<br>";
        } else {
            result += c;
        }
    }

    return result;
}

std::string quote_yaml(std::string_view text) {
    std::string result;
    result.reserve(text.size() + 2);

    result += '"';
    for (char c : text) {
        if (c == '"' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    result += '"';

    return result;
}

bool has_line_break(std::string_view text) {
    return text.find_first_of("\r\n") != std::string_view::npos;
}

}  // namespace mermaidgen
