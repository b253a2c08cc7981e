/**
 * @file carriers_html.cpp
 * @brief text/html carriers: comment payload, nested div classes, embedded audio
 */

#include "../include/rainbow_carriers.hpp"
#include "../include/rainbow_error.hpp"
#include "../include/rainbow_markup.hpp"
#include "../include/rainbow_text_codec.hpp"
#include "carrier_common.hpp"

#include <algorithm>
#include <array>
#include <sstream>

namespace rainbow {

namespace {

const std::array<const char*, 5> LANGS = {{ "en", "en-US", "en-GB", "de", "fr" }};

const char* COMMENT_MARKER = "fp:";

void write_head(std::ostringstream& html, RandomSource& rng) {
    html << "<!DOCTYPE html>\n"
         << "<html lang=\"" << rng.choose(LANGS) << "\">\n"
         << "<head>\n"
         << "<meta charset=\"utf-8\">\n"
         << "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n"
         << "<title>" << markup::escape(carrier::title(rng, 2, 5)) << "</title>\n";
}

std::string trim_spaces(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

void require_html_root(const std::vector<markup::Node>& nodes) {
    auto root = std::find_if(nodes.begin(), nodes.end(), [](const markup::Node& n) {
        return n.kind == markup::NodeKind::OPEN;
    });
    if (root == nodes.end() || root->name != "html") {
        throw FormatError("html: root element is not <html>");
    }
}

} // namespace

// ==================== html_comment ====================

ByteVector HtmlCommentCodec::encode_body(const ByteVector& chunk, Role, RandomSource& rng) const {
    std::ostringstream html;
    write_head(html, rng);
    html << "</head>\n<body>\n"
         << "<main id=\"" << carrier::slug(rng, 1) << "-" << carrier::random_hex(rng, 6) << "\">\n"
         << "<h1>" << markup::escape(carrier::title(rng, 2, 6)) << "</h1>\n";

    int before = rng.range(1, 3);
    for (int i = 0; i < before; ++i) {
        html << "<p>" << carrier::sentence(rng, 6, 18) << "</p>\n";
    }
    html << "<!-- " << COMMENT_MARKER << text::base64_encode(chunk) << " -->\n";
    int after = rng.range(0, 2);
    for (int i = 0; i < after; ++i) {
        html << "<p>" << carrier::sentence(rng, 6, 18) << "</p>\n";
    }
    html << "</main>\n</body>\n</html>\n";
    return carrier::as_bytes(html.str());
}

ByteVector HtmlCommentCodec::decode_body(const ByteVector& body, Role) const {
    auto nodes = markup::parse(carrier::as_text(body), markup::Dialect::HTML);
    require_html_root(nodes);

    const std::string marker(COMMENT_MARKER);
    std::optional<std::string> payload;
    for (const auto& n : nodes) {
        if (n.kind != markup::NodeKind::COMMENT) continue;
        std::string t = trim_spaces(n.text);
        if (t.compare(0, marker.size(), marker) != 0) continue;
        if (payload) throw FormatError("html: more than one payload comment");
        payload = t.substr(marker.size());
    }
    if (!payload) throw FormatError("html: payload comment not found");

    auto data = text::base64_decode(*payload);
    if (!data) throw FormatError("html: payload comment is not valid base64");
    return *data;
}

// ==================== html_nested_div ====================

ByteVector HtmlNestedDivCodec::encode_body(const ByteVector& chunk, Role, RandomSource& rng) const {
    std::ostringstream html;
    write_head(html, rng);
    html << "<style>\n"
         << "#app div { min-height: " << rng.range(1, 4) << "px; }\n"
         << "</style>\n"
         << "</head>\n<body>\n"
         << "<header><h1>" << markup::escape(carrier::title(rng, 1, 4)) << "</h1></header>\n"
         << "<div id=\"app\">\n";

    size_t i = 0;
    while (i < chunk.size()) {
        size_t run = std::min(static_cast<size_t>(rng.range(1, static_cast<int>(MAX_RUN))),
                              chunk.size() - i);
        for (size_t k = 0; k < run; ++k) {
            html << "<div class=\"u-" << text::hex_byte(chunk[i + k]) << "\">";
        }
        for (size_t k = 0; k < run; ++k) {
            html << "</div>";
        }
        html << "\n";
        i += run;
    }

    html << "</div>\n"
         << "<footer><p>" << carrier::sentence(rng, 3, 8) << "</p></footer>\n"
         << "</body>\n</html>\n";
    return carrier::as_bytes(html.str());
}

ByteVector HtmlNestedDivCodec::decode_body(const ByteVector& body, Role) const {
    auto nodes = markup::parse(carrier::as_text(body), markup::Dialect::HTML);
    require_html_root(nodes);

    size_t container = nodes.size();
    for (size_t i = 0; i < nodes.size(); ++i) {
        const auto& n = nodes[i];
        if (n.kind != markup::NodeKind::OPEN || n.name != "div") continue;
        const std::string* id = n.attribute("id");
        if (id && *id == "app") {
            if (container != nodes.size()) throw FormatError("html: duplicate #app container");
            container = i;
        }
    }
    if (container == nodes.size()) throw FormatError("html: #app container not found");

    const size_t base_depth = nodes[container].depth;
    ByteVector out;
    for (size_t i = container + 1; i < nodes.size(); ++i) {
        const auto& n = nodes[i];
        if (n.kind == markup::NodeKind::CLOSE) {
            if (n.depth == base_depth) return out;
            continue;
        }
        if (n.kind != markup::NodeKind::OPEN) {
            throw FormatError("html: unexpected content inside #app");
        }
        if (n.name != "div" || n.attributes.size() != 1 || n.attributes[0].name != "class") {
            throw FormatError("html: unexpected element inside #app");
        }
        if (n.depth > base_depth + MAX_RUN) {
            throw FormatError("html: div run nested too deep");
        }
        const std::string& cls = n.attributes[0].value;
        std::optional<uint8_t> b;
        if (cls.size() == 4 && cls.compare(0, 2, "u-") == 0) {
            b = text::parse_hex_byte(std::string_view(cls).substr(2));
        }
        if (!b) throw FormatError("html: bad class '" + cls + "'");
        out.push_back(*b);
        if (out.size() > CAPACITY) throw FormatError("html: too many divs");
    }
    throw FormatError("html: #app container not closed");
}

// ==================== audio_html ====================

ByteVector AudioHtmlCodec::encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const {
    ByteVector wav = wav_.encode(chunk, role, rng);

    std::ostringstream html;
    write_head(html, rng);
    html << "</head>\n<body>\n"
         << "<article>\n"
         << "<h2>" << markup::escape(carrier::title(rng, 2, 5)) << "</h2>\n"
         << "<p>" << carrier::sentence(rng, 5, 14) << "</p>\n"
         << "<audio controls preload=\"" << (rng.coin() ? "none" : "metadata") << "\" src=\""
         << DATA_URI_PREFIX << text::base64_encode(wav) << "\"></audio>\n"
         << "</article>\n</body>\n</html>\n";
    return carrier::as_bytes(html.str());
}

ByteVector AudioHtmlCodec::decode_body(const ByteVector& body, Role role) const {
    auto nodes = markup::parse(carrier::as_text(body), markup::Dialect::HTML);
    require_html_root(nodes);

    const std::string prefix(DATA_URI_PREFIX);
    std::optional<std::string> uri;
    for (const auto& n : nodes) {
        if (n.kind != markup::NodeKind::OPEN || n.name != "audio") continue;
        const std::string* src = n.attribute("src");
        if (!src || src->compare(0, prefix.size(), prefix) != 0) continue;
        if (uri) throw FormatError("audio_html: more than one embedded clip");
        uri = src->substr(prefix.size());
    }
    if (!uri) throw FormatError("audio_html: no embedded wav clip");

    auto wav = text::base64_decode(*uri);
    if (!wav) throw FormatError("audio_html: data URI is not valid base64");
    try {
        return wav_.decode(*wav, role);
    } catch (const RainbowError& e) {
        throw FormatError(std::string("audio_html: ") + e.what());
    }
}

} // namespace rainbow
