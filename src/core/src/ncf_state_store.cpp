#include "ncf_state_store.hpp"
#include "ncf_arp.hpp"
#include "ncf_errors.hpp"
#include "ncf_logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace ncf {

using json = nlohmann::json;

namespace {

TimeOfDay require_time(const json& preset, const std::string& name, const char* field) {
    const std::string where = "presets." + name + "." + field;
    if (!preset.contains(field)) {
        throw ConfigError(where + ": missing");
    }
    const json& v = preset.at(field);
    if (!v.is_string()) {
        throw ConfigError(where + ": expected a \"HH:MM\" string");
    }
    auto t = TimeOfDay::parse(v.get<std::string>());
    if (!t) {
        throw ConfigError(where + ": expected HH:MM, got \"" + v.get<std::string>() + "\"");
    }
    return *t;
}

} // namespace

json preset_to_json(const PresetWindow& window) {
    return json{
        {"start",   window.start.to_string()},
        {"end",     window.end.to_string()},
        {"enabled", window.enabled}
    };
}

json presets_to_json(const PresetTable& presets) {
    json out = json::object();
    for (const auto& [name, window] : presets) {
        out[name] = preset_to_json(window);
    }
    return out;
}

StateStore::StateStore(std::string path)
    : path_(std::move(path))
{}

PersistedState StateStore::from_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("state document must be a JSON object");
    }

    PersistedState state;

    if (doc.contains("presets")) {
        const json& presets = doc.at("presets");
        if (!presets.is_object()) {
            throw ConfigError("presets: expected an object");
        }
        state.presets.clear();
        for (auto it = presets.begin(); it != presets.end(); ++it) {
            const std::string& name = it.key();
            const json& preset = it.value();
            if (!preset.is_object()) {
                throw ConfigError("presets." + name + ": expected an object");
            }
            PresetWindow w;
            w.name  = name;
            w.start = require_time(preset, name, "start");
            w.end   = require_time(preset, name, "end");
            if (preset.contains("enabled")) {
                if (!preset.at("enabled").is_boolean()) {
                    throw ConfigError("presets." + name + ".enabled: expected true or false");
                }
                w.enabled = preset.at("enabled").get<bool>();
            }
            state.presets[name] = w;
        }
    }

    if (doc.contains("target_mac") && !doc.at("target_mac").is_null()) {
        const json& mac = doc.at("target_mac");
        if (!mac.is_string()) {
            throw ConfigError("target_mac: expected a string or null");
        }
        auto normalized = normalize_mac(mac.get<std::string>());
        if (!normalized) {
            throw ConfigError("target_mac: \"" + mac.get<std::string>() + "\" is not a MAC address");
        }
        BlockTarget target;
        target.mac = *normalized;

        if (doc.contains("target_name") && !doc.at("target_name").is_null()) {
            const json& name = doc.at("target_name");
            if (!name.is_string()) {
                throw ConfigError("target_name: expected a string or null");
            }
            target.name = name.get<std::string>();
        }
        state.target = target;
    }

    return state;
}

json StateStore::to_json(const PersistedState& state) {
    json doc;
    doc["presets"] = presets_to_json(state.presets);
    if (state.target) {
        doc["target_mac"] = state.target->mac;
        doc["target_name"] = state.target->name ? json(*state.target->name) : json(nullptr);
    } else {
        doc["target_mac"] = nullptr;
        doc["target_name"] = nullptr;
    }
    return doc;
}

PersistedState StateStore::load() const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        NCF_LOG_WARN("State file not found: " << path_ << ", using defaults");
        return PersistedState{};
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        throw ConfigError(path_ + ": not valid JSON (" + e.what() + ")");
    }

    PersistedState state;
    try {
        state = from_json(doc);
    } catch (const ConfigError& e) {
        throw ConfigError(path_ + ": " + e.what());
    }
    NCF_LOG_INFO("State loaded from: " << path_);
    return state;
}

bool StateStore::save(const PersistedState& state) const {
    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            NCF_LOG_ERROR("Failed to save state to " << path_ << ": " << std::strerror(errno));
            return false;
        }
        out << to_json(state).dump(2) << '\n';
        out.flush();
        if (!out) {
            NCF_LOG_ERROR("Failed to save state to " << path_ << ": write error");
            return false;
        }
    }

    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        NCF_LOG_ERROR("Failed to save state to " << path_ << ": " << std::strerror(errno));
        std::remove(tmp.c_str());
        return false;
    }
    NCF_LOG_DEBUG("State saved to: " << path_);
    return true;
}

} // namespace ncf
