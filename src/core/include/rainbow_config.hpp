#pragma once

#include <string>
#include <map>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace rainbow {

/**
 * @brief Runtime configuration store for the engine and CLI
 *
 * Flat "key = value" pairs, '#' or ';' starts a comment line:
 *   log.level, log.file, log.console
 *   http.host, http.user_agent
 *   selector.weight.<technique>
 *   encode.parallel, encode.parallel_threshold, encode.threads
 *   reply.client_min/max, reply.server_min/max
 * Thread-safe singleton.
 */
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    // Prevent copying
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return values_.count(key) != 0;
    }

    int getInt(const std::string& key, int default_val = 0) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        try {
            size_t used = 0;
            int parsed = std::stoi(v, &used);
            return used == v.size() ? parsed : default_val;
        } catch (const std::exception&) {
            return default_val;
        }
    }

    bool getBool(const std::string& key, bool default_val = false) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return (v == "true" || v == "1" || v == "yes" || v == "on");
    }

    /// All keys starting with @p prefix, prefix stripped.
    std::map<std::string, std::string> section(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::map<std::string, std::string> out;
        for (auto it = values_.lower_bound(prefix); it != values_.end(); ++it) {
            if (it->first.compare(0, prefix.size(), prefix) != 0) break;
            out[it->first.substr(prefix.size())] = it->second;
        }
        return out;
    }

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = value;
    }

    // ==================== File I/O ====================
    bool loadFromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) return false;

        std::lock_guard<std::mutex> lock(mtx_);
        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = trim(line.substr(0, pos));
            std::string val = trim(line.substr(pos + 1));
            if (key.empty()) continue;

            values_[key] = val;
        }
        return true;
    }

    // ==================== Defaults ====================
    void loadDefaults() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.clear();
        values_["log.level"] = "warn";
        values_["log.file"] = "";
        values_["log.console"] = "true";
        values_["http.host"] = "";
        values_["http.user_agent"] = "";
        values_["encode.parallel"] = "false";
        values_["encode.parallel_threshold"] = "8";
        values_["encode.threads"] = "0";
        values_["reply.client_min"] = "200";
        values_["reply.client_max"] = "8000";
        values_["reply.server_min"] = "100";
        values_["reply.server_max"] = "2000";
    }

private:
    Config() { loadDefaults(); }

    static std::string trim(const std::string& s) {
        auto first = s.find_first_not_of(" \t");
        if (first == std::string::npos) return {};
        auto last = s.find_last_not_of(" \t");
        return s.substr(first, last - first + 1);
    }

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

} // namespace rainbow
