/**
 * @file markup.cpp
 * @brief HTML/XML well-formedness reader
 */

#include "../include/rainbow_markup.hpp"
#include "../include/rainbow_error.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>

namespace rainbow {
namespace markup {

static const std::array<const char*, 9> HTML_VOID_ELEMENTS = {{
    "area", "br", "col", "hr", "img", "input", "link", "meta", "source"
}};

static bool is_void_element(const std::string& name) {
    return std::any_of(HTML_VOID_ELEMENTS.begin(), HTML_VOID_ELEMENTS.end(),
                       [&](const char* v) { return name == v; });
}

static bool is_raw_text_element(const std::string& name) {
    return name == "style" || name == "script";
}

static bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == ':';
}

static bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '_' || c == ':' || c == '-' || c == '.';
}

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

static std::string decode_entities(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] != '&') {
            out += raw[i];
            continue;
        }
        size_t semi = raw.find(';', i + 1);
        if (semi == std::string_view::npos || semi - i > 10) {
            throw FormatError("markup: unterminated entity");
        }
        std::string_view ent = raw.substr(i + 1, semi - i - 1);
        if (ent == "amp") out += '&';
        else if (ent == "lt") out += '<';
        else if (ent == "gt") out += '>';
        else if (ent == "quot") out += '"';
        else if (ent == "apos") out += '\'';
        else if (ent.size() > 1 && ent[0] == '#') {
            uint32_t cp = 0;
            bool hex = (ent[1] == 'x');
            std::string_view digits = ent.substr(hex ? 2 : 1);
            if (digits.empty()) throw FormatError("markup: empty character reference");
            for (char c : digits) {
                int v;
                if (c >= '0' && c <= '9') v = c - '0';
                else if (hex && c >= 'a' && c <= 'f') v = c - 'a' + 10;
                else if (hex && c >= 'A' && c <= 'F') v = c - 'A' + 10;
                else throw FormatError("markup: bad character reference");
                cp = cp * (hex ? 16 : 10) + static_cast<uint32_t>(v);
                if (cp > 0x10FFFF) throw FormatError("markup: character reference out of range");
            }
            if (cp == 0 || (cp >= 0xD800 && cp <= 0xDFFF)) {
                throw FormatError("markup: invalid code point");
            }
            append_utf8(out, cp);
        } else {
            throw FormatError("markup: unknown entity &" + std::string(ent) + ";");
        }
        i = semi;
    }
    return out;
}

const std::string* Node::attribute(const std::string& attr_name) const {
    for (const auto& a : attributes) {
        if (a.name == attr_name) return &a.value;
    }
    return nullptr;
}

std::string escape(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default:  out += c; break;
        }
    }
    return out;
}

namespace {

class Parser {
public:
    Parser(std::string_view in, Dialect dialect) : in_(in), dialect_(dialect) {}

    std::vector<Node> run() {
        if (dialect_ == Dialect::XML && starts_with("<?xml")) {
            parse_declaration();
        }
        while (pos_ < in_.size()) {
            if (starts_with("<!--")) {
                parse_comment();
            } else if (starts_with("<![CDATA[")) {
                parse_cdata();
            } else if (starts_with("<!")) {
                parse_doctype();
            } else if (starts_with("<?")) {
                fail("processing instruction not allowed here");
            } else if (starts_with("</")) {
                parse_close();
            } else if (in_[pos_] == '<') {
                parse_open();
            } else {
                parse_text();
            }
        }
        if (!stack_.empty()) fail("unclosed element <" + stack_.back() + ">");
        if (!root_closed_) fail("no root element");
        if (dialect_ == Dialect::HTML && !doctype_seen_) fail("missing doctype");
        return std::move(out_);
    }

private:
    [[noreturn]] void fail(const std::string& why) const {
        throw FormatError("markup: " + why + " at offset " + std::to_string(pos_));
    }

    bool starts_with(std::string_view s) const {
        return in_.substr(pos_, s.size()) == s;
    }

    void skip_space() {
        while (pos_ < in_.size() && is_space(in_[pos_])) ++pos_;
    }

    std::string read_name() {
        if (pos_ >= in_.size() || !is_name_start(in_[pos_])) fail("expected a name");
        size_t start = pos_;
        while (pos_ < in_.size() && is_name_char(in_[pos_])) ++pos_;
        std::string name(in_.substr(start, pos_ - start));
        return dialect_ == Dialect::HTML ? to_lower(name) : name;
    }

    void parse_declaration() {
        size_t end = in_.find("?>", pos_);
        if (end == std::string_view::npos) fail("unterminated XML declaration");
        Node n;
        n.kind = NodeKind::DECLARATION;
        n.text = std::string(in_.substr(pos_ + 5, end - pos_ - 5));
        if (n.text.find("version=") == std::string::npos) fail("XML declaration without version");
        out_.push_back(std::move(n));
        pos_ = end + 2;
    }

    void parse_comment() {
        size_t start = pos_ + 4;
        size_t end = in_.find("-->", start);
        if (end == std::string_view::npos) fail("unterminated comment");
        std::string_view body = in_.substr(start, end - start);
        if (body.find("--") != std::string_view::npos) fail("'--' inside comment");
        if (!body.empty() && body.back() == '-') fail("comment ends with '-'");
        if (!body.empty() && body.front() == '>') fail("comment starts with '>'");
        Node n;
        n.kind = NodeKind::COMMENT;
        n.text = std::string(body);
        n.depth = stack_.size();
        out_.push_back(std::move(n));
        pos_ = end + 3;
    }

    void parse_cdata() {
        if (dialect_ == Dialect::HTML) fail("CDATA section in HTML");
        if (stack_.empty()) fail("CDATA outside root element");
        size_t start = pos_ + 9;
        size_t end = in_.find("]]>", start);
        if (end == std::string_view::npos) fail("unterminated CDATA section");
        Node n;
        n.kind = NodeKind::CDATA;
        n.text = std::string(in_.substr(start, end - start));
        n.depth = stack_.size();
        out_.push_back(std::move(n));
        pos_ = end + 3;
    }

    void parse_doctype() {
        if (doctype_seen_ || root_seen_) fail("misplaced doctype");
        size_t end = in_.find('>', pos_);
        if (end == std::string_view::npos) fail("unterminated doctype");
        std::string body(in_.substr(pos_ + 2, end - pos_ - 2));
        if (body.find('[') != std::string::npos) fail("internal DTD subset not supported");
        std::string lowered = to_lower(body);
        if (lowered.compare(0, 7, "doctype") != 0) fail("unknown markup declaration");
        if (dialect_ == Dialect::HTML && lowered != "doctype html") fail("not an HTML5 doctype");
        Node n;
        n.kind = NodeKind::DOCTYPE;
        n.text = body;
        out_.push_back(std::move(n));
        doctype_seen_ = true;
        pos_ = end + 1;
    }

    void parse_open() {
        ++pos_;
        Node n;
        n.kind = NodeKind::OPEN;
        n.name = read_name();
        n.depth = stack_.size();

        for (;;) {
            bool had_space = pos_ < in_.size() && is_space(in_[pos_]);
            skip_space();
            if (pos_ >= in_.size()) fail("unterminated tag <" + n.name + ">");
            if (starts_with("/>")) {
                n.self_closing = true;
                pos_ += 2;
                break;
            }
            if (in_[pos_] == '>') {
                ++pos_;
                break;
            }
            if (!had_space) fail("attributes must be separated by whitespace");
            parse_attribute(n);
        }

        if (root_closed_) fail("content after the root element");
        root_seen_ = true;

        if (dialect_ == Dialect::HTML) {
            bool is_void = is_void_element(n.name);
            if (n.self_closing && !is_void) fail("self-closing non-void element <" + n.name + ">");
            n.self_closing = is_void;
        }

        std::string name = n.name;
        bool self_closing = n.self_closing;
        out_.push_back(std::move(n));

        if (self_closing) {
            if (stack_.empty()) root_closed_ = true;
            return;
        }
        stack_.push_back(name);

        if (dialect_ == Dialect::HTML && is_raw_text_element(name)) {
            parse_raw_text(name);
        }
    }

    void parse_attribute(Node& n) {
        Attribute a;
        size_t name_start = pos_;
        if (pos_ >= in_.size() || !is_name_start(in_[pos_])) fail("bad attribute name");
        while (pos_ < in_.size() && is_name_char(in_[pos_])) ++pos_;
        a.name = std::string(in_.substr(name_start, pos_ - name_start));
        if (dialect_ == Dialect::HTML) a.name = to_lower(a.name);
        if (n.attribute(a.name)) fail("duplicate attribute " + a.name);

        skip_space();
        if (pos_ < in_.size() && in_[pos_] == '=') {
            ++pos_;
            skip_space();
            if (pos_ >= in_.size() || (in_[pos_] != '"' && in_[pos_] != '\'')) {
                fail("attribute value must be quoted");
            }
            char quote = in_[pos_++];
            size_t end = in_.find(quote, pos_);
            if (end == std::string_view::npos) fail("unterminated attribute value");
            std::string_view raw = in_.substr(pos_, end - pos_);
            if (raw.find('<') != std::string_view::npos) fail("'<' in attribute value");
            a.value = decode_entities(raw);
            pos_ = end + 1;
        } else if (dialect_ == Dialect::XML) {
            fail("attribute without value");
        }
        n.attributes.push_back(std::move(a));
    }

    void parse_raw_text(const std::string& name) {
        std::string closing = "</" + name;
        size_t end = pos_;
        for (;;) {
            end = in_.find("</", end);
            if (end == std::string_view::npos) fail("unterminated <" + name + ">");
            if (to_lower(std::string(in_.substr(end, closing.size()))) == closing) break;
            end += 2;
        }
        std::string_view body = in_.substr(pos_, end - pos_);
        if (body.find_first_not_of(" \t\r\n") != std::string_view::npos) {
            Node t;
            t.kind = NodeKind::TEXT;
            t.text = std::string(body);
            t.depth = stack_.size();
            out_.push_back(std::move(t));
        }
        pos_ = end;
    }

    void parse_close() {
        pos_ += 2;
        std::string name = read_name();
        skip_space();
        if (pos_ >= in_.size() || in_[pos_] != '>') fail("malformed closing tag");
        ++pos_;
        if (stack_.empty() || stack_.back() != name) {
            fail("unexpected closing tag </" + name + ">");
        }
        stack_.pop_back();
        Node n;
        n.kind = NodeKind::CLOSE;
        n.name = name;
        n.depth = stack_.size();
        out_.push_back(std::move(n));
        if (stack_.empty()) root_closed_ = true;
    }

    void parse_text() {
        size_t end = in_.find('<', pos_);
        if (end == std::string_view::npos) end = in_.size();
        std::string_view raw = in_.substr(pos_, end - pos_);
        bool blank = raw.find_first_not_of(" \t\r\n") == std::string_view::npos;
        if (stack_.empty() && !blank) fail("text outside the root element");
        if (!blank) {
            Node n;
            n.kind = NodeKind::TEXT;
            n.text = decode_entities(raw);
            n.depth = stack_.size();
            out_.push_back(std::move(n));
        }
        pos_ = end;
    }

    std::string_view in_;
    Dialect dialect_;
    size_t pos_ = 0;
    std::vector<std::string> stack_;
    std::vector<Node> out_;
    bool doctype_seen_ = false;
    bool root_seen_ = false;
    bool root_closed_ = false;
};

} // namespace

std::vector<Node> parse(std::string_view input, Dialect dialect) {
    return Parser(input, dialect).run();
}

} // namespace markup
} // namespace rainbow
