#ifndef MERMAIDGEN_LABEL_HPP
#define MERMAIDGEN_LABEL_HPP

#include <string>
#include <string_view>

namespace mermaidgen {

// Make free text safe to place between double quotes in any dialect.
// '"' becomes the entity code #quot; and each line break (\n, \r\n, \r)
// becomes <br>. Everything else is copied unchanged.
std::string escape_label(std::string_view text);

// Double-quoted YAML scalar for front matter values such as the title.
// Backslash and '"' are backslash-escaped so ':' and '#' stay part of the text.
std::string quote_yaml(std::string_view text);

// True if the text contains a line break
bool has_line_break(std::string_view text);

}  // namespace mermaidgen

#endif // MERMAIDGEN_LABEL_HPP
