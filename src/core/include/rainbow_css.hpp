#pragma once

/**
 * @file rainbow_css.hpp
 * @brief Strict stylesheet reader for the CSS and font carriers
 *
 * Rules, declarations and the nested blocks of @keyframes, @media and
 * @supports.  Comments are skipped.  Unbalanced braces, parentheses or
 * quotes, empty selectors, malformed property names and empty values are
 * rejected with FormatError.
 */

#include <string>
#include <string_view>
#include <vector>

namespace rainbow {
namespace css {

struct Declaration {
    std::string property;
    std::string value;      // trimmed, comments removed
};

struct Rule {
    std::string prelude;                 // selector or "@keyframes name" etc.
    std::vector<Declaration> declarations;
    std::vector<Rule> children;          // nested rules of grouping at-rules
    bool is_at_rule = false;
    bool has_block = true;               // false for "@import ...;"

    /// Value of the only declaration of @p property; nullptr if absent.
    /// Throws FormatError when the property is declared more than once.
    const std::string* value_of(const std::string& property) const;
};

std::vector<Rule> parse(std::string_view input);

/// Split a declaration value on top-level commas, each part trimmed.
std::vector<std::string> split_list(std::string_view value);

/// Split on whitespace outside quotes and parentheses.
std::vector<std::string> split_tokens(std::string_view value);

} // namespace css
} // namespace rainbow
