#pragma once

/**
 * @file rainbow_markup.hpp
 * @brief Strict well-formedness reader for the HTML, XML and SVG carriers
 *
 * Produces a flat event list (declaration, doctype, open/close tags,
 * text, comments, CDATA).  Rejects anything a validating consumer would
 * choke on: unbalanced or crossed tags, duplicate attributes, unquoted
 * XML attributes, unknown entities, "--" inside comments, stray text or a
 * second element outside the root.  Whitespace-only text is dropped.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rainbow {
namespace markup {

enum class Dialect {
    XML,    // also used for SVG and RSS
    HTML    // HTML5 serialisation: doctype, void and raw-text elements
};

enum class NodeKind {
    DECLARATION,  // <?xml ... ?>
    DOCTYPE,
    OPEN,
    CLOSE,
    TEXT,
    COMMENT,
    CDATA
};

struct Attribute {
    std::string name;
    std::string value;   // entities decoded
};

struct Node {
    NodeKind kind = NodeKind::TEXT;
    std::string name;                   // element name, lowercased for HTML
    std::vector<Attribute> attributes;
    std::string text;                   // TEXT (decoded), COMMENT, CDATA, raw-text
    bool self_closing = false;          // OPEN with no matching CLOSE
    size_t depth = 0;                   // 0 for the root element

    const std::string* attribute(const std::string& attr_name) const;
};

/// Throws FormatError on the first violation.
std::vector<Node> parse(std::string_view input, Dialect dialect);

/// Escape &, <, >, " for element text or a double-quoted attribute.
std::string escape(std::string_view raw);

} // namespace markup
} // namespace rainbow
