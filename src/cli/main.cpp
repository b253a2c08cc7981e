#include "rainbow.hpp"
#include "rainbow_config.hpp"
#include "rainbow_logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

using namespace rainbow;

namespace fs = std::filesystem;

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    struct Command {
        std::string name;
        std::string description;
        std::function<void(const std::vector<std::string>&)> handler;
        std::vector<std::string> args_help;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(
        const std::string& name,
        const std::string& description,
        std::function<void(const std::vector<std::string>&)> handler,
        const std::vector<std::string>& args_help = {}
    ) {
        commands_[name] = {name, description, handler, args_help};
    }

    int parse_and_execute(const std::vector<std::string>& argv) {
        if (argv.empty()) {
            print_usage();
            return 1;
        }

        const std::string& cmd = argv[0];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }
        if (cmd == "version" || cmd == "--version" || cmd == "-v") {
            std::cout << prog_name_ << " " << version_ << std::endl;
            return 0;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }

        std::vector<std::string> args(argv.begin() + 1, argv.end());
        try {
            it->second.handler(args);
        } catch (const RainbowError& e) {
            std::cerr << "[!] " << e.what() << "\n";
            return 2;
        } catch (const std::exception& e) {
            std::cerr << "[!] " << e.what() << "\n";
            return 1;
        }
        return 0;
    }

private:
    void print_usage() const {
        std::cout << prog_name_ << " " << version_ << " - HTTP carrier steganography\n";
        std::cout << "\nUsage: " << prog_name_ << " [--config FILE] [--log-level LEVEL] <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << cmd.name;
            for (const auto& arg : cmd.args_help)
                std::cout << " " << arg;
            std::cout << "\n    " << cmd.description << "\n\n";
        }
        std::cout << "  help\n    Show this help message\n\n";
        std::cout << "  version\n    Show version information\n";
    }

    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Utility functions
// ============================================================================

static std::string get_arg(const std::vector<std::string>& args, size_t index, const std::string& default_val = "") {
    // Positional arguments skip "--option value" pairs and flags
    size_t seen = 0;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--mime" || args[i] == "--index") { ++i; continue; }
        if (args[i].rfind("--", 0) == 0) continue;
        if (seen++ == index) return args[i];
    }
    return default_val;
}

static bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

static std::string get_option(const std::vector<std::string>& args, const std::string& option, const std::string& default_val = "") {
    auto it = std::find(args.begin(), args.end(), option);
    if (it != args.end() && ++it != args.end()) return *it;
    return default_val;
}

static size_t get_option_size(const std::vector<std::string>& args, const std::string& option, size_t default_val = 0) {
    std::string val = get_option(args, option);
    if (val.empty()) return default_val;
    try {
        size_t used = 0;
        unsigned long long parsed = std::stoull(val, &used);
        if (used != val.size()) throw std::invalid_argument(val);
        return static_cast<size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid value for " + option + ": " + val);
    }
}

static ByteVector read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw std::runtime_error("cannot open " + path);
    return ByteVector(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void write_file(const std::string& path, const ByteVector& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("cannot write " + path);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) throw std::runtime_error("write failed: " + path);
}

static Rainbow make_engine() {
    return Rainbow(EngineOptions::from_config(Config::instance()));
}

/// Strip --config / --log-level and apply them. Returns the remaining argv.
static std::vector<std::string> apply_global_options(int argc, char* argv[]) {
    std::vector<std::string> rest;
    std::string config_path;
    std::string log_level;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "--config" || a == "--log-level") && i + 1 < argc) {
            (a == "--config" ? config_path : log_level) = argv[++i];
            continue;
        }
        rest.push_back(a);
    }

    auto& config = Config::instance();
    if (!config_path.empty() && !config.loadFromFile(config_path)) {
        std::cerr << "[!] Cannot read config file: " << config_path << "\n";
    }

    auto& logger = Logger::instance();
    if (log_level.empty()) log_level = config.get("log.level", "warn");
    logger.setLevel(Logger::levelFromString(log_level));
    logger.setConsoleOutput(config.getBool("log.console", true));
    std::string log_file = config.get("log.file");
    if (!log_file.empty() && !logger.setFileOutput(log_file)) {
        std::cerr << "[!] Cannot open log file: " << log_file << "\n";
    }
    return rest;
}

// ============================================================================
// Forward declarations
// ============================================================================

void handle_encode(const std::vector<std::string>& args);
void handle_decode(const std::vector<std::string>& args);
void handle_reassemble(const std::vector<std::string>& args);
void handle_cover(const std::vector<std::string>& args);
void handle_techniques(const std::vector<std::string>& args);

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    std::vector<std::string> rest = apply_global_options(argc, argv);

    ArgumentParser parser("rainbow", "v" RAINBOW_VERSION_STRING);

    parser.add_command("encode", "Split a file into carrier packets (packet_<i>.http)", handle_encode,
                       {"<input>", "<output_dir>", "[--client]", "[--mime TYPE]"});
    parser.add_command("decode", "Extract the chunk carried by one packet", handle_decode,
                       {"<packet>", "<output>", "[--index N]", "[--client]"});
    parser.add_command("reassemble", "Decode every packet_*.http in a directory", handle_reassemble,
                       {"<input_dir>", "<output>", "[--client]"});
    parser.add_command("cover", "Write a cover packet of an exact length", handle_cover,
                       {"<length>", "<output>", "[--client]"});
    parser.add_command("techniques", "List carrier techniques", handle_techniques);

    return parser.parse_and_execute(rest);
}

// ============================================================================
// Handler implementations
// ============================================================================

void handle_encode(const std::vector<std::string>& args) {
    std::string input = get_arg(args, 0);
    std::string output_dir = get_arg(args, 1);
    if (input.empty() || output_dir.empty()) {
        throw std::runtime_error("Usage: rainbow encode <input> <output_dir> [--client] [--mime TYPE]");
    }
    bool is_client = has_flag(args, "--client");
    std::string mime = get_option(args, "--mime");

    Rainbow engine = make_engine();
    ByteVector payload = read_file(input);
    EncodeResult result = engine.encode_write(
        payload, is_client, mime.empty() ? std::nullopt : std::optional<std::string>(mime));

    fs::create_directories(output_dir);
    for (const auto& packet : result.packets) {
        fs::path path = fs::path(output_dir) / ("packet_" + std::to_string(packet.index) + ".http");
        write_file(path.string(), packet.bytes);
        std::cout << "[+] " << path.string() << " (" << technique_to_string(packet.technique)
                  << ", " << packet.bytes.size() << " bytes)\n";
    }
    std::cout << "[+] " << result.total_len << " bytes in " << result.chunk_count << " "
              << (is_client ? "request" : "response") << " packet(s)\n";
}

void handle_decode(const std::vector<std::string>& args) {
    std::string input = get_arg(args, 0);
    std::string output = get_arg(args, 1);
    if (input.empty() || output.empty()) {
        throw std::runtime_error("Usage: rainbow decode <packet> <output> [--index N] [--client]");
    }
    size_t index = get_option_size(args, "--index", 0);

    Rainbow engine = make_engine();
    DecodeResult result = engine.decrypt_single_read(read_file(input), index, has_flag(args, "--client"));
    write_file(output, result.data);

    std::cout << "[+] " << result.data.size() << " bytes";
    if (result.technique) std::cout << " via " << technique_to_string(*result.technique);
    if (result.total > 0) std::cout << ", packet " << result.index + 1 << "/" << result.total;
    std::cout << (result.is_read_end ? " (last)" : "") << "\n";
}

void handle_reassemble(const std::vector<std::string>& args) {
    std::string input_dir = get_arg(args, 0);
    std::string output = get_arg(args, 1);
    if (input_dir.empty() || output.empty()) {
        throw std::runtime_error("Usage: rainbow reassemble <input_dir> <output> [--client]");
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(input_dir)) {
        std::string name = entry.path().filename().string();
        if (entry.is_regular_file() && name.rfind("packet_", 0) == 0 &&
            entry.path().extension() == ".http") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<ByteVector> packets;
    packets.reserve(files.size());
    for (const auto& f : files) packets.push_back(read_file(f.string()));

    Rainbow engine = make_engine();
    ByteVector payload = engine.decode_all(packets, has_flag(args, "--client"));
    write_file(output, payload);
    std::cout << "[+] Reassembled " << payload.size() << " bytes from " << packets.size() << " packet(s)\n";
}

void handle_cover(const std::vector<std::string>& args) {
    std::string length = get_arg(args, 0);
    std::string output = get_arg(args, 1);
    if (length.empty() || output.empty()) {
        throw std::runtime_error("Usage: rainbow cover <length> <output> [--client]");
    }
    size_t target = 0;
    try {
        target = static_cast<size_t>(std::stoull(length));
    } catch (const std::exception&) {
        throw std::runtime_error("invalid length: " + length);
    }

    Rainbow engine = make_engine();
    ByteVector packet = engine.generate_cover_packet(target, has_flag(args, "--client"));
    write_file(output, packet);
    std::cout << "[+] Cover packet written: " << packet.size() << " bytes\n";
}

void handle_techniques(const std::vector<std::string>& args) {
    (void)args;
    Rainbow engine = make_engine();
    const auto& registry = engine.registry();

    std::cout << "Carrier techniques:\n";
    for (Technique t : all_techniques()) {
        const CarrierCodec& codec = registry.by_technique(t);
        std::cout << "  " << codec.name() << "  " << codec.mime_type()
                  << "  client " << codec.capacity(Role::CLIENT)
                  << " / server " << codec.capacity(Role::SERVER) << " bytes\n";
    }
}
