#pragma once

#include "ncf_errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace ncf {

/**
 * @brief Runtime settings for netcurfew
 *
 * Flat `key = value` store: interface, API bind address, state file,
 * scan and spoof timings, logging. Values from --config are loaded over
 * the defaults, then command-line flags are applied with set().
 */
class Config {
public:
    Config() { loadDefaults(); }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    /// @throws ConfigError when the value is present but not an integer
    int getInt(const std::string& key, int default_val = 0) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        size_t used = 0;
        int out = 0;
        try {
            out = std::stoi(v, &used);
        } catch (const std::exception&) {
            throw ConfigError(key + ": expected an integer, got '" + v + "'");
        }
        if (used != v.size()) {
            throw ConfigError(key + ": expected an integer, got '" + v + "'");
        }
        return out;
    }

    std::chrono::milliseconds getMillis(const std::string& key, int default_ms) const {
        int v = getInt(key, default_ms);
        if (v < 0) throw ConfigError(key + ": must not be negative");
        return std::chrono::milliseconds(v);
    }

    bool getBool(const std::string& key, bool default_val = false) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return (v == "true" || v == "1" || v == "yes" || v == "on");
    }

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = value;
    }

    // ==================== File I/O ====================
    bool loadFromFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        std::ifstream file(path);
        if (!file.is_open()) return false;

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
        values_["network.interface"]     = "auto";
        values_["api.host"]              = "127.0.0.1";
        values_["api.port"]              = "8000";
        values_["state.file"]            = "netcurfew_state.json";
        values_["scan.timeout_ms"]       = "3000";
        values_["spoof.interval_ms"]     = "1000";
        values_["spoof.backoff_ms"]      = "2000";
        values_["spoof.restore_count"]   = "5";
        values_["spoof.stop_timeout_ms"] = "5000";
        values_["log.level"]             = "info";
        values_["log.console"]           = "true";
        values_["log.file"]              = "";
    }

private:
    static std::string trim(const std::string& s) {
        auto first = s.find_first_not_of(" \t");
        if (first == std::string::npos) return std::string();
        auto last = s.find_last_not_of(" \t");
        return s.substr(first, last - first + 1);
    }

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

} // namespace ncf
