/**
 * @file css.cpp
 * @brief Strict stylesheet reader
 */

#include "../include/rainbow_css.hpp"
#include "../include/rainbow_error.hpp"

#include <cctype>

namespace rainbow {
namespace css {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::string trim(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return std::string(s.substr(b, e - b));
}

bool is_grouping_at_rule(const std::string& prelude) {
    static const char* const kGrouping[] = {
        "@keyframes", "@-webkit-keyframes", "@media", "@supports"
    };
    for (const char* g : kGrouping) {
        std::string_view gv(g);
        if (prelude.compare(0, gv.size(), gv.data(), gv.size()) == 0 &&
            (prelude.size() == gv.size() || is_space(prelude[gv.size()]))) {
            return true;
        }
    }
    return false;
}

class Scanner {
public:
    explicit Scanner(std::string_view in) : in_(in) {}

    std::vector<Rule> run() {
        return parse_rules(false);
    }

private:
    [[noreturn]] void fail(const std::string& why) const {
        throw FormatError("css: " + why + " at offset " + std::to_string(pos_));
    }

    bool eof() const { return pos_ >= in_.size(); }

    void check_char(char c) const {
        unsigned char u = static_cast<unsigned char>(c);
        if ((u < 0x20 && !is_space(c)) || u == 0x7f) fail("control character");
    }

    // Positioned on "/*"
    void skip_comment() {
        size_t end = in_.find("*/", pos_ + 2);
        if (end == std::string_view::npos) fail("unterminated comment");
        pos_ = end + 2;
    }

    void skip_ws_comments() {
        while (!eof()) {
            if (is_space(in_[pos_])) {
                ++pos_;
            } else if (in_.compare(pos_, 2, "/*") == 0) {
                skip_comment();
            } else {
                break;
            }
        }
    }

    // Positioned on the opening quote; appends the whole literal to @p out.
    void read_string(std::string& out) {
        char quote = in_[pos_];
        out += in_[pos_++];
        while (!eof()) {
            char c = in_[pos_++];
            check_char(c);
            if (c == '\n' || c == '\r') fail("newline in string");
            out += c;
            if (c == '\\') {
                if (eof()) break;
                out += in_[pos_++];
                continue;
            }
            if (c == quote) return;
        }
        fail("unterminated string");
    }

    /// Reads up to (not including) a top-level terminator.
    std::string read_until(const char* terminators, bool allow_close_brace) {
        std::string out;
        int parens = 0;
        while (!eof()) {
            char c = in_[pos_];
            if (c == '"' || c == '\'') {
                read_string(out);
                continue;
            }
            if (in_.compare(pos_, 2, "/*") == 0) {
                skip_comment();
                out += ' ';
                continue;
            }
            check_char(c);
            if (parens == 0) {
                for (const char* t = terminators; *t; ++t) {
                    if (c == *t) {
                        return out;
                    }
                }
            }
            if (c == '(') {
                ++parens;
            } else if (c == ')') {
                if (parens == 0) fail("unbalanced ')'");
                --parens;
            } else if (c == '{' || (c == '}' && !allow_close_brace)) {
                fail(std::string("unexpected '") + c + "'");
            }
            out += c;
            ++pos_;
        }
        if (parens != 0) fail("unbalanced '('");
        return out;
    }

    std::vector<Rule> parse_rules(bool nested) {
        std::vector<Rule> rules;
        for (;;) {
            skip_ws_comments();
            if (eof()) {
                if (nested) fail("unterminated block");
                return rules;
            }
            if (in_[pos_] == '}') {
                if (!nested) fail("unexpected '}'");
                ++pos_;
                return rules;
            }
            rules.push_back(parse_rule());
        }
    }

    Rule parse_rule() {
        Rule rule;
        rule.prelude = trim(read_until("{;", false));
        if (eof()) fail("rule without block");
        if (rule.prelude.empty()) fail("empty selector");
        rule.is_at_rule = rule.prelude[0] == '@';

        if (in_[pos_] == ';') {
            if (!rule.is_at_rule) fail("selector without block");
            ++pos_;
            rule.has_block = false;
            return rule;
        }

        ++pos_;  // '{'
        if (rule.is_at_rule && is_grouping_at_rule(rule.prelude)) {
            rule.children = parse_rules(true);
        } else {
            rule.declarations = parse_declarations();
        }
        return rule;
    }

    std::vector<Declaration> parse_declarations() {
        std::vector<Declaration> decls;
        for (;;) {
            skip_ws_comments();
            if (eof()) fail("unterminated declaration block");
            char c = in_[pos_];
            if (c == '}') {
                ++pos_;
                return decls;
            }
            if (c == ';') {
                ++pos_;
                continue;
            }

            Declaration d;
            size_t start = pos_;
            while (!eof()) {
                char p = in_[pos_];
                if (std::isalnum(static_cast<unsigned char>(p)) || p == '-' || p == '_') {
                    ++pos_;
                } else {
                    break;
                }
            }
            d.property = std::string(in_.substr(start, pos_ - start));
            if (d.property.empty() || std::isdigit(static_cast<unsigned char>(d.property[0])) ||
                d.property == "-" || (d.property.size() > 1 && d.property[0] == '-' &&
                                      std::isdigit(static_cast<unsigned char>(d.property[1])))) {
                fail("bad property name");
            }

            skip_ws_comments();
            if (eof() || in_[pos_] != ':') fail("expected ':' after " + d.property);
            ++pos_;

            d.value = trim(read_until(";}", true));
            if (eof()) fail("unterminated declaration block");
            if (d.value.empty()) fail("empty value for " + d.property);
            decls.push_back(std::move(d));
        }
    }

    std::string_view in_;
    size_t pos_ = 0;
};

// Shared walker for split_list/split_tokens: true at top level.
template <class OnChar>
void walk_top_level(std::string_view s, OnChar on_char) {
    int parens = 0;
    char quote = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (quote) {
            if (c == '\\' && i + 1 < s.size()) {
                on_char(i, false);
                on_char(++i, false);
                continue;
            }
            if (c == quote) quote = 0;
            on_char(i, false);
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            on_char(i, false);
            continue;
        }
        if (c == '(') ++parens;
        else if (c == ')' && parens > 0) --parens;
        on_char(i, parens == 0 && c != ')');
    }
}

} // namespace

const std::string* Rule::value_of(const std::string& property) const {
    const std::string* found = nullptr;
    for (const auto& d : declarations) {
        if (d.property != property) continue;
        if (found) throw FormatError("css: duplicate declaration of " + property);
        found = &d.value;
    }
    return found;
}

std::vector<Rule> parse(std::string_view input) {
    return Scanner(input).run();
}

std::vector<std::string> split_list(std::string_view value) {
    std::vector<std::string> parts;
    size_t start = 0;
    walk_top_level(value, [&](size_t i, bool top) {
        if (top && value[i] == ',') {
            parts.push_back(trim(value.substr(start, i - start)));
            start = i + 1;
        }
    });
    parts.push_back(trim(value.substr(start)));
    return parts;
}

std::vector<std::string> split_tokens(std::string_view value) {
    std::vector<std::string> tokens;
    std::string current;
    walk_top_level(value, [&](size_t i, bool top) {
        if (top && is_space(value[i])) {
            if (!current.empty()) tokens.push_back(std::move(current));
            current.clear();
        } else {
            current += value[i];
        }
    });
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

} // namespace css
} // namespace rainbow
