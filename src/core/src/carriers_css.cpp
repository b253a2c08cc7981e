/**
 * @file carriers_css.cpp
 * @brief text/css carriers: grid tracks, animation delays, paint worklet
 *        colours, variable font axes
 */

#include "../include/rainbow_carriers.hpp"
#include "../include/rainbow_css.hpp"
#include "../include/rainbow_error.hpp"
#include "../include/rainbow_text_codec.hpp"
#include "carrier_common.hpp"

#include <algorithm>
#include <sstream>

namespace rainbow {

namespace {

std::vector<css::Rule> parse_sheet(const ByteVector& body) {
    auto rules = css::parse(carrier::as_text(body));
    if (rules.empty()) throw FormatError("css: empty stylesheet");
    return rules;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

const std::string& require_value(const css::Rule& rule, const std::string& property) {
    const std::string* v = rule.value_of(property);
    if (!v) throw FormatError("css: " + rule.prelude + " lacks " + property);
    return *v;
}

void require_prelude(const css::Rule& rule, const std::string& expected) {
    if (rule.prelude != expected) {
        throw FormatError("css: expected '" + expected + "', found '" + rule.prelude + "'");
    }
}

} // namespace

// ==================== css_grid ====================

ByteVector CssGridCodec::encode_body(const ByteVector& chunk, Role, RandomSource& rng) const {
    std::ostringstream sheet;
    sheet << "/* " << carrier::slug(rng, 2) << " layout */\n"
          << ".grid-" << carrier::random_hex(rng, 6) << " {\n"
          << "  display: grid;\n"
          << "  gap: " << rng.range(4, 16) << "px;\n"
          << "  max-width: " << rng.range(960, 1440) << "px;\n"
          << "}\n";

    for (size_t offset = 0, row = 0; offset < chunk.size(); offset += TRACKS_PER_RULE, ++row) {
        size_t end = std::min(chunk.size(), offset + TRACKS_PER_RULE);
        sheet << ".row-" << row << " {\n"
              << "  display: grid;\n"
              << "  grid-template-columns:";
        for (size_t i = offset; i < end; ++i) {
            sheet << ' ' << static_cast<int>(chunk[i]) << "px";
        }
        sheet << ";\n}\n";
    }
    return carrier::as_bytes(sheet.str());
}

ByteVector CssGridCodec::decode_body(const ByteVector& body, Role) const {
    auto rules = parse_sheet(body);
    if (rules[0].is_at_rule || !starts_with(rules[0].prelude, ".grid-")) {
        throw FormatError("css: grid container rule missing");
    }

    ByteVector out;
    for (size_t r = 1; r < rules.size(); ++r) {
        const auto& rule = rules[r];
        require_prelude(rule, ".row-" + std::to_string(r - 1));
        if (rule.declarations.size() != 2 || require_value(rule, "display") != "grid") {
            throw FormatError("css: unexpected declarations in " + rule.prelude);
        }
        auto tracks = css::split_tokens(require_value(rule, "grid-template-columns"));
        if (tracks.empty() || tracks.size() > TRACKS_PER_RULE) {
            throw FormatError("css: bad track count in " + rule.prelude);
        }
        if (r + 1 < rules.size() && tracks.size() != TRACKS_PER_RULE) {
            throw FormatError("css: short row before the last one");
        }
        for (const auto& t : tracks) {
            out.push_back(static_cast<uint8_t>(carrier::require_unit(t, "px", 255, "track")));
        }
    }
    return out;
}

// ==================== css_animation ====================

ByteVector CssAnimationCodec::encode_body(const ByteVector& chunk, Role, RandomSource& rng) const {
    std::ostringstream sheet;
    std::string prefix = "k" + carrier::random_hex(rng, 4);
    sheet << ".stage-" << carrier::random_hex(rng, 6) << " {\n"
          << "  animation-play-state: running;\n"
          << "  perspective: " << rng.range(400, 1200) << "px;\n"
          << "}\n";

    for (size_t i = 0; i < chunk.size(); ++i) {
        std::string name = prefix + "-" + std::to_string(i);
        int hi = chunk[i] >> 4;
        int lo = chunk[i] & 0x0F;
        sheet << "@keyframes " << name << " {\n"
              << "  from { opacity: 0; transform: translateY(" << rng.range(2, 24) << "px); }\n"
              << "  to { opacity: 1; transform: none; }\n"
              << "}\n"
              << ".anim-" << i << " {\n"
              << "  animation-name: " << name << ";\n"
              << "  animation-duration: " << rng.range(200, 900) << "ms;\n"
              << "  animation-delay: " << hi * DELAY_STEP_MS << "ms, " << lo * DELAY_STEP_MS << "ms;\n"
              << "}\n";
    }
    return carrier::as_bytes(sheet.str());
}

ByteVector CssAnimationCodec::decode_body(const ByteVector& body, Role) const {
    auto rules = parse_sheet(body);
    if (rules[0].is_at_rule || !starts_with(rules[0].prelude, ".stage-")) {
        throw FormatError("css: animation stage rule missing");
    }
    if ((rules.size() - 1) % 2 != 0) {
        throw FormatError("css: keyframes and element rules do not pair up");
    }

    const uint64_t max_delay = 15 * DELAY_STEP_MS;
    ByteVector out;
    for (size_t r = 1, i = 0; r < rules.size(); r += 2, ++i) {
        const auto& frames = rules[r];
        const auto& element = rules[r + 1];
        if (!starts_with(frames.prelude, "@keyframes ") || frames.children.empty()) {
            throw FormatError("css: expected @keyframes, found '" + frames.prelude + "'");
        }
        require_prelude(element, ".anim-" + std::to_string(i));
        if (require_value(element, "animation-name") != frames.prelude.substr(11)) {
            throw FormatError("css: " + element.prelude + " names the wrong keyframes");
        }
        auto delays = css::split_list(require_value(element, "animation-delay"));
        if (delays.size() != 2) throw FormatError("css: expected two animation delays");
        uint64_t hi = carrier::require_unit(delays[0], "ms", max_delay, "delay");
        uint64_t lo = carrier::require_unit(delays[1], "ms", max_delay, "delay");
        if (hi % DELAY_STEP_MS != 0 || lo % DELAY_STEP_MS != 0) {
            throw FormatError("css: delay off the step grid");
        }
        out.push_back(static_cast<uint8_t>(((hi / DELAY_STEP_MS) << 4) | (lo / DELAY_STEP_MS)));
    }
    return out;
}

// ==================== css_paint_worklet ====================

ByteVector CssPaintWorkletCodec::encode_body(const ByteVector& chunk, Role, RandomSource& rng) const {
    // Pad to whole colours with random bytes; --x-stops bounds the payload.
    size_t colours = std::max<size_t>(1, (chunk.size() + 2) / 3);
    ByteVector padded(colours * 3);
    rng.fill(padded.data(), padded.size());
    std::copy(chunk.begin(), chunk.end(), padded.begin());

    std::ostringstream sheet;
    sheet << "@property --x-stops {\n"
          << "  syntax: '<integer>';\n"
          << "  inherits: false;\n"
          << "  initial-value: 0;\n"
          << "}\n"
          << "@property --x-colors {\n"
          << "  syntax: '<color>#';\n"
          << "  inherits: false;\n"
          << "  initial-value: #000000;\n"
          << "}\n"
          << ".paint-" << carrier::random_hex(rng, 6) << " {\n"
          << "  --x-stops: " << chunk.size() << ";\n"
          << "  --x-colors:";
    for (size_t i = 0; i < colours; ++i) {
        sheet << (i == 0 ? " #" : ", #") << text::hex_encode(&padded[i * 3], 3);
    }
    sheet << ";\n"
          << "  background-image: paint(" << carrier::word(rng) << "-" << carrier::random_hex(rng, 4) << ");\n"
          << "  min-height: " << rng.range(80, 640) << "px;\n"
          << "}\n";
    return carrier::as_bytes(sheet.str());
}

ByteVector CssPaintWorkletCodec::decode_body(const ByteVector& body, Role) const {
    auto rules = parse_sheet(body);
    if (rules.size() != 3) throw FormatError("css: unexpected rule count for paint worklet");
    require_prelude(rules[0], "@property --x-stops");
    require_prelude(rules[1], "@property --x-colors");
    if (rules[2].is_at_rule || !starts_with(rules[2].prelude, ".paint-")) {
        throw FormatError("css: paint rule missing");
    }

    size_t stops = carrier::require_decimal(require_value(rules[2], "--x-stops"), CAPACITY, "stop count");
    auto colours = css::split_list(require_value(rules[2], "--x-colors"));
    size_t expected = std::max<size_t>(1, (stops + 2) / 3);
    if (colours.size() != expected) throw FormatError("css: colour count does not match --x-stops");

    ByteVector out;
    out.reserve(expected * 3);
    for (const auto& c : colours) {
        std::optional<ByteVector> rgb;
        if (c.size() == 7 && c[0] == '#') rgb = text::hex_decode(std::string_view(c).substr(1));
        if (!rgb) throw FormatError("css: bad colour '" + c + "'");
        out.insert(out.end(), rgb->begin(), rgb->end());
    }
    out.resize(stops);
    return out;
}

// ==================== font_property ====================

namespace {

constexpr int WGHT_BASE = 100;
constexpr int WGHT_STEP = 50;
constexpr int WDTH_BASE = 50;
constexpr int WDTH_STEP = 5;

int read_axis(const std::string& setting, const char* tag, int base, int step) {
    auto tokens = css::split_tokens(setting);
    if (tokens.size() != 2 || tokens[0] != std::string("'") + tag + "'") {
        throw FormatError("css: bad font axis '" + setting + "'");
    }
    uint64_t v = carrier::require_decimal(tokens[1], static_cast<uint64_t>(base + 15 * step), tag);
    if (v < static_cast<uint64_t>(base) || (v - static_cast<uint64_t>(base)) % static_cast<uint64_t>(step) != 0) {
        throw FormatError("css: font axis value off the grid");
    }
    return static_cast<int>((v - static_cast<uint64_t>(base)) / static_cast<uint64_t>(step));
}

} // namespace

ByteVector FontPropertyCodec::encode_body(const ByteVector& chunk, Role, RandomSource& rng) const {
    std::string family = carrier::title(rng, 1, 2);
    std::ostringstream sheet;
    sheet << "@font-face {\n"
          << "  font-family: \"" << family << "\";\n"
          << "  src: url(\"/fonts/" << carrier::slug(rng, 1) << "-var.woff2\") format(\"woff2\");\n"
          << "  font-weight: 100 900;\n"
          << "  font-stretch: 50% 200%;\n"
          << "  font-display: swap;\n"
          << "}\n";

    for (size_t i = 0; i < chunk.size(); ++i) {
        int hi = chunk[i] >> 4;
        int lo = chunk[i] & 0x0F;
        sheet << ".fv-" << i << " {\n"
              << "  font-family: \"" << family << "\", sans-serif;\n"
              << "  font-variation-settings: 'wght' " << WGHT_BASE + hi * WGHT_STEP
              << ", 'wdth' " << WDTH_BASE + lo * WDTH_STEP << ";\n"
              << "}\n";
    }
    return carrier::as_bytes(sheet.str());
}

ByteVector FontPropertyCodec::decode_body(const ByteVector& body, Role) const {
    auto rules = parse_sheet(body);
    require_prelude(rules[0], "@font-face");
    require_value(rules[0], "font-family");

    ByteVector out;
    for (size_t r = 1; r < rules.size(); ++r) {
        const auto& rule = rules[r];
        require_prelude(rule, ".fv-" + std::to_string(r - 1));
        auto axes = css::split_list(require_value(rule, "font-variation-settings"));
        if (axes.size() != 2) throw FormatError("css: expected two variation axes");
        int hi = read_axis(axes[0], "wght", WGHT_BASE, WGHT_STEP);
        int lo = read_axis(axes[1], "wdth", WDTH_BASE, WDTH_STEP);
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace rainbow
