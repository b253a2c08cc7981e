/**
 * @file carriers_xml.cpp
 * @brief XML family carriers: configuration document, RSS feed, SVG paths
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

const char* XML_DECLARATION = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";

const std::array<const char*, 5> FEED_HOSTS = {{
    "blog.example.com", "news.example.org", "updates.example.net",
    "journal.example.io", "press.example.com"
}};

struct SettingTemplate {
    const char* name;
    int lo;
    int hi;
};

const std::array<SettingTemplate, 8> SETTINGS = {{
    {"cache.ttl", 60, 3600},
    {"pool.max_connections", 4, 128},
    {"retry.attempts", 1, 8},
    {"retry.backoff_ms", 100, 5000},
    {"session.timeout", 300, 7200},
    {"upload.max_kb", 256, 16384},
    {"worker.threads", 1, 32},
    {"log.rotate_mb", 8, 512}
}};

std::vector<markup::Node> parse_document(const ByteVector& body, const char* root_name) {
    auto nodes = markup::parse(carrier::as_text(body), markup::Dialect::XML);
    auto root = std::find_if(nodes.begin(), nodes.end(), [](const markup::Node& n) {
        return n.kind == markup::NodeKind::OPEN;
    });
    if (root == nodes.end() || root->name != root_name) {
        throw FormatError(std::string("xml: root element is not <") + root_name + ">");
    }
    return nodes;
}

bool is_close(const std::vector<markup::Node>& nodes, size_t i, const std::string& name) {
    return i < nodes.size() && nodes[i].kind == markup::NodeKind::CLOSE && nodes[i].name == name;
}

} // namespace

// ==================== xml_config ====================

ByteVector XmlConfigCodec::encode_body(const ByteVector& chunk, Role, RandomSource& rng) const {
    std::ostringstream xml;
    xml << XML_DECLARATION
        << "<configuration version=\"" << rng.range(1, 3) << "." << rng.range(0, 9) << "\">\n"
        << "  <settings>\n";

    // Distinct settings, drawn in catalogue order
    int wanted = rng.range(2, 4);
    int remaining = static_cast<int>(SETTINGS.size());
    for (const auto& s : SETTINGS) {
        if (wanted > 0 && static_cast<int>(rng.pick(static_cast<size_t>(remaining))) < wanted) {
            xml << "    <setting name=\"" << s.name << "\" value=\"" << rng.range(s.lo, s.hi) << "\"/>\n";
            --wanted;
        }
        --remaining;
    }

    xml << "  </settings>\n"
        << "  <data encoding=\"base64\"><![CDATA[" << text::base64_encode(chunk) << "]]></data>\n"
        << "</configuration>\n";
    return carrier::as_bytes(xml.str());
}

ByteVector XmlConfigCodec::decode_body(const ByteVector& body, Role) const {
    auto nodes = parse_document(body, "configuration");

    std::optional<std::string> payload;
    for (size_t i = 0; i < nodes.size(); ++i) {
        const auto& n = nodes[i];
        if (n.kind != markup::NodeKind::OPEN || n.name != "data") continue;
        if (payload) throw FormatError("xml: more than one <data> element");
        const std::string* enc = n.attribute("encoding");
        if (!enc || *enc != "base64" || n.self_closing) {
            throw FormatError("xml: <data> must be base64 encoded content");
        }
        if (i + 2 >= nodes.size() || nodes[i + 1].kind != markup::NodeKind::CDATA ||
            !is_close(nodes, i + 2, "data")) {
            throw FormatError("xml: <data> must hold exactly one CDATA section");
        }
        payload = nodes[i + 1].text;
    }
    if (!payload) throw FormatError("xml: <data> element not found");

    auto data = text::base64_decode(*payload);
    if (!data) throw FormatError("xml: <data> is not valid base64");
    return *data;
}

// ==================== xml_rss ====================

ByteVector XmlRssCodec::encode_body(const ByteVector& chunk, Role, RandomSource& rng) const {
    const char* host = rng.choose(FEED_HOSTS);
    std::string encoded = text::base64_encode(chunk);
    int64_t published = carrier::random_epoch(rng);

    std::ostringstream xml;
    xml << XML_DECLARATION
        << "<rss version=\"2.0\">\n"
        << "<channel>\n"
        << "<title>" << carrier::title(rng, 2, 4) << "</title>\n"
        << "<link>https://" << host << "/</link>\n"
        << "<description>" << carrier::sentence(rng, 5, 12) << "</description>\n"
        << "<language>en-us</language>\n";

    for (size_t off = 0; off < encoded.size(); off += GUID_CHARS) {
        xml << "<item>\n"
            << "<title>" << carrier::title(rng, 3, 7) << "</title>\n"
            << "<link>https://" << host << "/posts/" << carrier::slug(rng, 3) << "</link>\n"
            << "<guid isPermaLink=\"false\">" << encoded.substr(off, GUID_CHARS) << "</guid>\n"
            << "<pubDate>" << carrier::http_date(published) << "</pubDate>\n"
            << "</item>\n";
        published -= rng.range(3600, 7 * 86400);
    }

    xml << "</channel>\n</rss>\n";
    return carrier::as_bytes(xml.str());
}

ByteVector XmlRssCodec::decode_body(const ByteVector& body, Role) const {
    auto nodes = parse_document(body, "rss");

    std::string encoded;
    size_t last_len = GUID_CHARS;
    for (size_t i = 0; i < nodes.size(); ++i) {
        const auto& n = nodes[i];
        if (n.kind != markup::NodeKind::OPEN || n.name != "guid") continue;
        const std::string* permalink = n.attribute("isPermaLink");
        if (!permalink || *permalink != "false") throw FormatError("xml: guid must not be a permalink");
        if (i + 2 >= nodes.size() || nodes[i + 1].kind != markup::NodeKind::TEXT ||
            !is_close(nodes, i + 2, "guid")) {
            throw FormatError("xml: guid must hold plain text");
        }
        if (last_len != GUID_CHARS) throw FormatError("xml: short guid before the last item");
        const std::string& piece = nodes[i + 1].text;
        if (piece.size() > GUID_CHARS) throw FormatError("xml: guid too long");
        last_len = piece.size();
        encoded += piece;
    }

    auto data = text::base64_decode(encoded);
    if (!data) throw FormatError("xml: guid sequence is not valid base64");
    return *data;
}

// ==================== svg_path ====================

ByteVector SvgPathCodec::encode_body(const ByteVector& chunk, Role, RandomSource& rng) const {
    int width = rng.range(16, 64) * 10;
    int height = rng.range(16, 48) * 10;

    std::ostringstream svg;
    svg << XML_DECLARATION
        << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width << "\" height=\"" << height
        << "\" viewBox=\"0 0 " << width << " " << height << "\">\n"
        << "<title>" << carrier::title(rng, 1, 3) << "</title>\n"
        << "<rect width=\"" << width << "\" height=\"" << height << "\" fill=\"#"
        << carrier::random_hex(rng, 6) << "\"/>\n"
        << "<g fill=\"none\" stroke=\"#" << carrier::random_hex(rng, 6) << "\" stroke-width=\""
        << rng.range(1, 3) << "\">\n";

    for (size_t off = 0; off < chunk.size(); off += SEGMENTS_PER_PATH) {
        size_t end = std::min(chunk.size(), off + SEGMENTS_PER_PATH);
        svg << "<path d=\"M " << rng.range(0, width / 2) << " " << rng.range(0, height / 2);
        for (size_t i = off; i < end; ++i) {
            svg << " l " << (chunk[i] & 0x0F) * STEP << " " << (chunk[i] >> 4) * STEP;
        }
        svg << "\"/>\n";
    }

    svg << "</g>\n</svg>\n";
    return carrier::as_bytes(svg.str());
}

ByteVector SvgPathCodec::decode_body(const ByteVector& body, Role) const {
    auto nodes = parse_document(body, "svg");
    const uint64_t max_offset = 15 * STEP;

    ByteVector out;
    size_t last_segments = SEGMENTS_PER_PATH;
    for (const auto& n : nodes) {
        if (n.kind != markup::NodeKind::OPEN || n.name != "path") continue;
        const std::string* d = n.attribute("d");
        if (!d) throw FormatError("svg: path without data");

        std::vector<std::string> tokens;
        std::istringstream in(*d);
        for (std::string t; in >> t;) tokens.push_back(t);
        if (tokens.size() < 6 || tokens[0] != "M" || (tokens.size() - 3) % 3 != 0) {
            throw FormatError("svg: malformed path data");
        }
        carrier::require_decimal(tokens[1], 100000, "path origin");
        carrier::require_decimal(tokens[2], 100000, "path origin");

        size_t segments = (tokens.size() - 3) / 3;
        if (segments > SEGMENTS_PER_PATH) throw FormatError("svg: too many segments in one path");
        if (last_segments != SEGMENTS_PER_PATH) throw FormatError("svg: short path before the last one");
        last_segments = segments;

        for (size_t t = 3; t < tokens.size(); t += 3) {
            if (tokens[t] != "l") throw FormatError("svg: unexpected path command '" + tokens[t] + "'");
            uint64_t dx = carrier::require_decimal(tokens[t + 1], max_offset, "segment");
            uint64_t dy = carrier::require_decimal(tokens[t + 2], max_offset, "segment");
            if (dx % STEP != 0 || dy % STEP != 0) throw FormatError("svg: segment off the grid");
            out.push_back(static_cast<uint8_t>(((dy / STEP) << 4) | (dx / STEP)));
        }
    }
    return out;
}

} // namespace rainbow
