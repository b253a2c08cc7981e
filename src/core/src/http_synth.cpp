/**
 * @file http_synth.cpp
 * @brief Request/response synthesis, framing parser, packet tags
 */

#include "../include/rainbow_http_synth.hpp"
#include "../include/rainbow_error.hpp"
#include "../include/rainbow_logger.hpp"
#include "../include/rainbow_text_codec.hpp"
#include "carrier_common.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <sstream>

namespace rainbow {

namespace {

const std::array<const char*, 4> HOSTS = {{
    "www.example.com", "cdn.example.net", "api.example.org", "static.example.io"
}};

const std::array<const char*, 4> USER_AGENTS = {{
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36",
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.4 Safari/605.1.15",
    "Mozilla/5.0 (X11; Linux x86_64; rv:125.0) Gecko/20100101 Firefox/125.0",
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36 Edg/124.0.0.0"
}};

const std::array<const char*, 4> ACCEPT_LANGUAGES = {{
    "en-US,en;q=0.9", "en-GB,en;q=0.8", "de-DE,de;q=0.9,en;q=0.7", "fr-FR,fr;q=0.9,en;q=0.6"
}};

const std::array<const char*, 3> ACCEPTS = {{
    "*/*", "application/json, text/plain, */*",
    "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8"
}};

const std::array<const char*, 5> SERVERS = {{
    "nginx/1.24.0", "Apache/2.4.58 (Ubuntu)", "cloudflare", "Microsoft-IIS/10.0", "envoy"
}};

const std::array<const char*, 7> TAG_COOKIE_NAMES = {{
    "sessionId", "visitor", "track", "_ga", "_gid", "JSESSIONID", "cf_id"
}};

const std::array<const char*, 3> CACHE_CONTROLS = {{
    "no-cache", "max-age=0", "private, max-age=600"
}};

struct StatusLine {
    int code;
    const char* reason;
};

const std::array<StatusLine, 3> MINOR_STATUSES = {{
    {201, "Created"}, {202, "Accepted"}, {203, "Non-Authoritative Information"}
}};

const char* pick_path_template(const std::string& mime, RandomSource& rng) {
    static const std::array<const char*, 4> html = {{ "/", "/contact", "/account/settings", "/blog/" }};
    static const std::array<const char*, 2> css = {{ "/static/css/", "/assets/theme/" }};
    static const std::array<const char*, 4> json = {{ "/api/v1/events", "/api/v2/telemetry", "/graphql", "/api/track" }};
    static const std::array<const char*, 3> xml = {{ "/api/config", "/soap/endpoint", "/services/sync" }};
    static const std::array<const char*, 2> rss = {{ "/feed", "/rss.xml" }};
    static const std::array<const char*, 2> svg = {{ "/upload/icons", "/api/v1/avatar" }};
    static const std::array<const char*, 2> wav = {{ "/api/voice/upload", "/media/upload" }};

    if (mime == "text/html") return rng.choose(html);
    if (mime == "text/css") return rng.choose(css);
    if (mime == "application/json") return rng.choose(json);
    if (mime == "application/xml" || mime == "text/xml") return rng.choose(xml);
    if (mime == "application/rss+xml") return rng.choose(rss);
    if (mime == "image/svg+xml") return rng.choose(svg);
    if (mime.compare(0, 6, "audio/") == 0) return rng.choose(wav);
    return "/api/upload";
}

std::string request_path(const std::string& mime, bool query, RandomSource& rng) {
    static const std::array<const char*, 4> gets = {{
        "/api/v1/status", "/api/v1/user/profile", "/search", "/api/v2/notifications"
    }};
    std::string path = query ? rng.choose(gets) : pick_path_template(mime, rng);
    // Templates ending in '/' take a generated leaf
    if (path.size() > 1 && path.back() == '/') {
        path += carrier::slug(rng, 2);
        if (mime == "text/css") path += ".css";
    }
    return path;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '!' ||
           c == '#' || c == '$' || c == '%' || c == '&' || c == '\'' || c == '*' ||
           c == '+' || c == '.' || c == '^' || c == '`' || c == '|' || c == '~';
}

[[noreturn]] void corrupt(const std::string& why) {
    throw RainbowError(ErrorCode::CORRUPT_PACKET, why);
}

std::vector<std::string> split(std::string_view s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    for (;;) {
        size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.emplace_back(s.substr(start));
            return out;
        }
        out.emplace_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string ga_cookie(RandomSource& rng) {
    return "GA1.2." + std::to_string(1000000000u + rng.uniform(900000000u)) + "." +
           std::to_string(1600000000u + rng.uniform(200000000u));
}

} // namespace

// ==================== HttpMessage ====================

const std::string* HttpMessage::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (iequals(h.first, name)) return &h.second;
    }
    return nullptr;
}

std::vector<std::string> HttpMessage::headers_named(const std::string& name) const {
    std::vector<std::string> out;
    for (const auto& h : headers) {
        if (iequals(h.first, name)) out.push_back(h.second);
    }
    return out;
}

// ==================== MessageSynthesizer ====================

MessageSynthesizer::MessageSynthesizer(std::shared_ptr<const CodecRegistry> registry,
                                       SynthOptions options)
    : registry_(std::move(registry))
    , options_(std::move(options))
{
    if (!registry_) {
        throw std::invalid_argument("MessageSynthesizer requires a codec registry");
    }
}

ByteVector MessageSynthesizer::wrap(const ByteVector& body, const std::string& mime, Role role,
                                    const std::optional<PacketTag>& tag, RandomSource& rng,
                                    const std::string& padding) const {
    const std::string media = normalize_mime(mime);
    const std::string content_type = is_text_mime(media) ? media + "; charset=utf-8" : media;
    const std::string date = carrier::http_date(
        options_.fixed_date != 0 ? options_.fixed_date : static_cast<int64_t>(std::time(nullptr)));

    // Cookie jar: session id, the tag, maybe an analytics cookie
    std::vector<std::pair<std::string, std::string>> cookies;
    cookies.emplace_back("sid", carrier::random_hex(rng, 32));
    std::string tag_name;
    if (tag) {
        tag_name = rng.choose(TAG_COOKIE_NAMES);
        cookies.emplace_back(tag_name, encode_tag(*tag));
    }
    bool analytics = rng.coin();
    if (analytics && tag_name != "_ga") {
        cookies.emplace_back("_ga", ga_cookie(rng));
    }

    std::ostringstream ss;
    if (role == Role::CLIENT) {
        std::string host = options_.host.empty() ? std::string(rng.choose(HOSTS)) : options_.host;
        std::string agent = options_.user_agent.empty() ? std::string(rng.choose(USER_AGENTS))
                                                        : options_.user_agent;
        bool dnt = rng.coin();
        bool cache_control = rng.coin();
        bool query = sends_as_query(media, role);

        ss << (query ? "GET " : "POST ") << request_path(media, query, rng) << " HTTP/1.1\r\n";
        ss << "Host: " << host << "\r\n";
        ss << "User-Agent: " << agent << "\r\n";
        ss << "Accept: " << rng.choose(ACCEPTS) << "\r\n";
        ss << "Accept-Language: " << rng.choose(ACCEPT_LANGUAGES) << "\r\n";
        ss << "Accept-Encoding: gzip, deflate, br\r\n";
        if (dnt) ss << "DNT: 1\r\n";
        if (cache_control) ss << "Cache-Control: no-cache\r\n";
        ss << "Date: " << date << "\r\n";
        ss << "Origin: https://" << host << "\r\n";
        ss << "Cookie: ";
        for (size_t i = 0; i < cookies.size(); ++i) {
            if (i > 0) ss << "; ";
            ss << cookies[i].first << "=" << cookies[i].second;
        }
        ss << "\r\n";
        if (query) {
            ss << QUERY_HEADER << ": " << text::base64_encode(body) << "\r\n";
        } else {
            ss << "Content-Type: " << content_type << "\r\n";
            ss << "Content-Length: " << body.size() << "\r\n";
        }
    } else {
        // 200 dominates like real traffic
        StatusLine status{200, "OK"};
        if (rng.uniform(100) >= 90) status = rng.choose(MINOR_STATUSES);
        bool hsts = rng.coin();
        bool csp = rng.coin();
        bool cache_control = rng.coin();

        ss << "HTTP/1.1 " << status.code << " " << status.reason << "\r\n";
        ss << "Date: " << date << "\r\n";
        ss << "Server: " << rng.choose(SERVERS) << "\r\n";
        ss << "Content-Type: " << content_type << "\r\n";
        ss << "Content-Length: " << body.size() << "\r\n";
        for (const auto& c : cookies) {
            ss << "Set-Cookie: " << c.first << "=" << c.second << "; Path=/; HttpOnly; SameSite=Lax\r\n";
        }
        ss << "X-Frame-Options: " << (rng.coin() ? "SAMEORIGIN" : "DENY") << "\r\n";
        ss << "X-Content-Type-Options: nosniff\r\n";
        if (hsts) ss << "Strict-Transport-Security: max-age=31536000; includeSubDomains\r\n";
        if (csp) ss << "Content-Security-Policy: default-src 'self'\r\n";
        if (cache_control) ss << "Cache-Control: " << rng.choose(CACHE_CONTROLS) << "\r\n";
    }
    if (!padding.empty()) ss << PADDING_HEADER << ": " << padding << "\r\n";
    ss << "Connection: keep-alive\r\n";
    ss << "\r\n";

    std::string head = ss.str();
    ByteVector packet(head.begin(), head.end());
    if (!sends_as_query(media, role)) packet.insert(packet.end(), body.begin(), body.end());
    return packet;
}

bool MessageSynthesizer::sends_as_query(const std::string& mime, Role role) {
    return role == Role::CLIENT && normalize_mime(mime) == QUERY_MIME;
}

ByteVector MessageSynthesizer::generate_cover(size_t target_length, Role role,
                                              RandomSource& rng) const {
    // Small covers are always JSON; larger ones try the compatible codecs in random order
    std::vector<const CarrierCodec*> candidates;
    if (target_length < COVER_JSON_LIMIT) {
        candidates.push_back(&registry_->by_technique(Technique::JSON_METADATA));
    } else {
        candidates = registry_->compatible_codecs(role);
        for (size_t i = candidates.size(); i > 1; --i) {
            std::swap(candidates[i - 1], candidates[rng.pick(i)]);
        }
    }

    size_t smallest_seen = SIZE_MAX;
    for (const CarrierCodec* codec : candidates) {
        auto packet = cover_with(*codec, target_length, role, rng, smallest_seen);
        if (packet) {
            RAINBOW_CLOG_DEBUG("synth", "cover packet of " + std::to_string(target_length) +
                                        " bytes via " + codec->name());
            return *packet;
        }
    }
    if (target_length < smallest_seen) {
        throw RainbowError(ErrorCode::INVALID_ARGUMENT,
                           "cover packet of " + std::to_string(target_length) +
                           " bytes cannot be built, the smallest is " +
                           std::to_string(smallest_seen) + " bytes");
    }
    throw RainbowError(ErrorCode::INVALID_ARGUMENT,
                       "cover packet length " + std::to_string(target_length) +
                       " is unreachable: above the " + std::to_string(smallest_seen) +
                       "-byte minimum but too short for a padding header");
}

std::optional<ByteVector> MessageSynthesizer::cover_with(const CarrierCodec& codec, size_t target_length,
                                                         Role role, RandomSource& rng,
                                                         size_t& smallest_seen) const {
    const size_t cap = codec.capacity(role);
    ByteVector payload(cap);
    rng.fill(payload.data(), payload.size());
    std::array<uint8_t, SeededRandomSource::SEED_BYTES> seed;
    rng.fill(seed.data(), seed.size());

    // Same seed for every attempt, so the decoration is identical and only
    // the payload length moves the size.
    auto build = [&](size_t n, const std::string& pad) {
        SeededRandomSource attempt(seed);
        ByteVector chunk(payload.begin(), payload.begin() + static_cast<std::ptrdiff_t>(n));
        PacketTag tag;
        tag.technique = codec.name();
        tag.index = 0;
        tag.total = 1;
        tag.length = n;
        tag.digest = text::digest32(chunk);
        ByteVector body = codec.encode(chunk, role, attempt);
        return wrap(body, codec.mime_type(), role, tag, attempt, pad);
    };

    // "<name>: " + value + CRLF
    const size_t pad_overhead = std::char_traits<char>::length(PADDING_HEADER) + 4;
    auto fits = [&](size_t base) { return base + pad_overhead + 1 <= target_length; };

    ByteVector smallest = build(0, std::string());
    smallest_seen = std::min(smallest_seen, smallest.size());
    if (smallest.size() == target_length) return smallest;
    if (smallest.size() > target_length) return std::nullopt;
    if (!fits(smallest.size())) {
        // Too close to the minimum for a padding header: only payload bytes can close the gap
        for (size_t n = 1; n <= cap; ++n) {
            ByteVector packet = build(n, std::string());
            if (packet.size() == target_length) return packet;
            if (packet.size() > target_length) break;
        }
        return std::nullopt;
    }

    size_t lo = 0, hi = cap;
    while (lo < hi) {
        size_t mid = lo + (hi - lo + 1) / 2;
        if (fits(build(mid, std::string()).size())) lo = mid;
        else hi = mid - 1;
    }

    for (size_t n = lo;; --n) {
        size_t base = build(n, std::string()).size();
        if (fits(base)) {
            std::string pad = carrier::random_hex(rng, target_length - base - pad_overhead);
            ByteVector packet = build(n, pad);
            if (packet.size() == target_length) return packet;
        }
        if (n == 0) break;
    }
    return std::nullopt;
}

// ==================== Framing ====================

HttpMessage MessageSynthesizer::parse(const ByteVector& packet) {
    static const char kEnd[] = "\r\n\r\n";
    auto head_end = std::search(packet.begin(), packet.end(), kEnd, kEnd + 4);
    if (head_end == packet.end()) corrupt("missing end of header block");

    std::string head(packet.begin(), head_end);
    HttpMessage msg;
    msg.body.assign(head_end + 4, packet.end());

    auto lines = split(head, '\n');
    for (size_t i = 0; i + 1 < lines.size(); ++i) {
        if (lines[i].empty() || lines[i].back() != '\r') corrupt("bare LF in header block");
        lines[i].pop_back();
    }
    // The last line ends right before CRLFCRLF; its CR was consumed by the search
    for (const auto& line : lines) {
        if (line.find('\r') != std::string::npos) corrupt("bare CR in header block");
    }

    const std::string& start = lines[0];
    if (start.compare(0, 9, "HTTP/1.1 ") == 0) {
        msg.is_request = false;
        if (start.size() < 13 || start[12] != ' ' ||
            !std::isdigit(static_cast<unsigned char>(start[9])) ||
            !std::isdigit(static_cast<unsigned char>(start[10])) ||
            !std::isdigit(static_cast<unsigned char>(start[11]))) {
            corrupt("malformed status line");
        }
        msg.status = std::stoi(start.substr(9, 3));
        msg.reason = start.substr(13);
    } else {
        auto parts = split(start, ' ');
        if (parts.size() != 3 || parts[2] != "HTTP/1.1" || parts[0].empty() || parts[1].empty() ||
            !std::all_of(parts[0].begin(), parts[0].end(),
                         [](char c) { return c >= 'A' && c <= 'Z'; })) {
            corrupt("malformed request line");
        }
        msg.is_request = true;
        msg.method = parts[0];
        msg.target = parts[1];
    }

    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0 ||
            !std::all_of(line.begin(), line.begin() + static_cast<std::ptrdiff_t>(colon), is_token_char)) {
            corrupt("malformed header line");
        }
        msg.headers.emplace_back(line.substr(0, colon),
                                 std::string(trim(std::string_view(line).substr(colon + 1))));
    }

    auto lengths = msg.headers_named("Content-Length");
    // A request without Content-Length has no body
    if (lengths.empty() && msg.is_request) {
        if (!msg.body.empty()) corrupt("request body without Content-Length");
        return msg;
    }
    if (lengths.size() != 1) corrupt("expected exactly one Content-Length");
    auto declared = text::parse_decimal(lengths[0], SIZE_MAX);
    if (!declared) corrupt("bad Content-Length");
    if (*declared != msg.body.size()) {
        corrupt("Content-Length " + lengths[0] + " but body has " +
                std::to_string(msg.body.size()) + " bytes");
    }
    return msg;
}

std::pair<ByteVector, std::string> MessageSynthesizer::carrier_body(const HttpMessage& msg) {
    if (msg.is_request && msg.method == "GET") {
        const std::string* data = msg.header(QUERY_HEADER);
        if (!data) corrupt("GET request without " + std::string(QUERY_HEADER));
        if (!msg.body.empty()) corrupt("GET request with a body");
        auto raw = text::base64_decode(*data);
        if (!raw) corrupt(std::string(QUERY_HEADER) + " is not valid base64");
        return {std::move(*raw), QUERY_MIME};
    }
    const std::string* content_type = msg.header("Content-Type");
    if (!content_type) corrupt("packet has no Content-Type");
    return {msg.body, normalize_mime(*content_type)};
}

// ==================== Tags ====================

std::string MessageSynthesizer::encode_tag(const PacketTag& tag) {
    std::ostringstream ss;
    ss << TAG_VERSION << "." << tag.technique << "." << tag.index << "." << tag.total << "."
       << tag.length << "." << tag.digest;
    std::string plain = ss.str();
    return text::base64url_encode(reinterpret_cast<const uint8_t*>(plain.data()), plain.size());
}

std::optional<PacketTag> MessageSynthesizer::decode_tag(std::string_view cookie_value) {
    auto raw = text::base64url_decode(cookie_value);
    if (!raw) return std::nullopt;
    std::string plain(raw->begin(), raw->end());
    const std::string prefix = std::string(TAG_VERSION) + ".";
    if (plain.compare(0, prefix.size(), prefix) != 0) return std::nullopt;

    auto fields = split(std::string_view(plain).substr(prefix.size()), '.');
    if (fields.size() != 5) corrupt("packet tag has " + std::to_string(fields.size()) + " fields");

    PacketTag tag;
    tag.technique = fields[0];
    if (tag.technique.empty() ||
        !std::all_of(tag.technique.begin(), tag.technique.end(), [](char c) {
            return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        })) {
        corrupt("packet tag names an invalid technique");
    }
    auto index = text::parse_decimal(fields[1], UINT32_MAX);
    auto total = text::parse_decimal(fields[2], UINT32_MAX);
    auto length = text::parse_decimal(fields[3], UINT32_MAX);
    if (!index || !total || !length || *total == 0 || *index >= *total) {
        corrupt("packet tag carries invalid counters");
    }
    if (fields[4].size() != 8 || !text::hex_decode(fields[4])) {
        corrupt("packet tag carries an invalid digest");
    }
    tag.index = static_cast<size_t>(*index);
    tag.total = static_cast<size_t>(*total);
    tag.length = static_cast<size_t>(*length);
    tag.digest = fields[4];
    return tag;
}

std::optional<PacketTag> MessageSynthesizer::find_tag(const HttpMessage& msg) {
    std::vector<std::string> values;
    if (msg.is_request) {
        for (const auto& header : msg.headers_named("Cookie")) {
            for (const auto& pair : split(header, ';')) {
                std::string_view p = trim(pair);
                size_t eq = p.find('=');
                if (eq != std::string_view::npos) values.emplace_back(p.substr(eq + 1));
            }
        }
    } else {
        for (const auto& header : msg.headers_named("Set-Cookie")) {
            std::string_view p = trim(std::string_view(header).substr(0, header.find(';')));
            size_t eq = p.find('=');
            if (eq != std::string_view::npos) values.emplace_back(p.substr(eq + 1));
        }
    }

    std::optional<PacketTag> found;
    for (const auto& v : values) {
        auto tag = decode_tag(v);
        if (!tag) continue;
        if (found) corrupt("packet carries more than one tag");
        found = std::move(tag);
    }
    return found;
}

} // namespace rainbow
