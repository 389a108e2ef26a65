#include "ncf_api_router.hpp"
#include "ncf_errors.hpp"
#include "ncf_logger.hpp"
#include "ncf_state_store.hpp"

#include <stdexcept>

namespace ncf {

using json = nlohmann::json;

namespace {

// Request-shape problems (422), distinct from domain validation (400)
class BadRequestBody : public std::runtime_error {
public:
    explicit BadRequestBody(const std::string& msg) : std::runtime_error(msg) {}
};

ApiResponse error(int status, const std::string& detail) {
    return ApiResponse{status, json{{"detail", detail}}};
}

json nullable(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

const json& require(const json& body, const char* field) {
    if (!body.is_object() || !body.contains(field)) {
        throw BadRequestBody(std::string("field required: ") + field);
    }
    return body.at(field);
}

bool require_bool(const json& body, const char* field) {
    const json& v = require(body, field);
    if (!v.is_boolean()) throw BadRequestBody(std::string(field) + ": expected a boolean");
    return v.get<bool>();
}

std::string require_string(const json& body, const char* field) {
    const json& v = require(body, field);
    if (!v.is_string()) throw BadRequestBody(std::string(field) + ": expected a string");
    return v.get<std::string>();
}

std::optional<std::string> optional_string(const json& body, const char* field) {
    if (!body.is_object() || !body.contains(field) || body.at(field).is_null()) {
        return std::nullopt;
    }
    if (!body.at(field).is_string()) {
        throw BadRequestBody(std::string(field) + ": expected a string or null");
    }
    return body.at(field).get<std::string>();
}

bool optional_bool(const json& body, const char* field, bool fallback) {
    if (!body.is_object() || !body.contains(field)) return fallback;
    if (!body.at(field).is_boolean()) {
        throw BadRequestBody(std::string(field) + ": expected a boolean");
    }
    return body.at(field).get<bool>();
}

} // namespace

ApiRouter::ApiRouter(ControlService& control)
    : control_(control)
{
    register_routes();
}

void ApiRouter::add(const std::string& method, const std::string& path, Handler h) {
    routes_[path][method] = std::move(h);
}

std::string ApiRouter::normalize_path(const std::string& raw) {
    std::string path = raw.substr(0, raw.find('?'));
    if (path.empty()) return "/";
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    return path;
}

std::string ApiRouter::allowed_methods(const std::string& path) const {
    auto it = routes_.find(normalize_path(path));
    if (it == routes_.end()) return std::string();

    std::string out;
    for (const auto& [method, handler] : it->second) {
        if (!out.empty()) out += ", ";
        out += method;
    }
    return out.empty() ? out : out + ", OPTIONS";
}

ApiResponse ApiRouter::handle(const std::string& method,
                              const std::string& raw_path,
                              const std::string& body) const {
    const std::string path = normalize_path(raw_path);

    auto route = routes_.find(path);
    if (route == routes_.end()) {
        return error(404, "Not Found");
    }
    if (method == "OPTIONS") {
        return ApiResponse{204, json()};
    }
    auto handler = route->second.find(method);
    if (handler == route->second.end()) {
        return error(405, "Method Not Allowed");
    }

    json parsed;
    if (!body.empty()) {
        parsed = json::parse(body, nullptr, false);
        if (parsed.is_discarded()) {
            return error(422, "request body is not valid JSON");
        }
    }

    try {
        return handler->second(parsed);
    } catch (const BadRequestBody& e) {
        return error(422, e.what());
    } catch (const ValidationError& e) {
        return error(400, e.what());
    } catch (const std::exception& e) {
        NCF_LOG_ERROR(method << " " << path << " failed: " << e.what());
        return error(500, e.what());
    }
}

void ApiRouter::register_routes() {
    add("GET", "/", [](const json&) {
        return ApiResponse{200, json{{"status", "ok"}, {"message", "NetCurfew backend running"}}};
    });

    add("GET", "/status", [this](const json&) {
        StatusSnapshot s = control_.status();
        return ApiResponse{200, json{
            {"is_blocking",           s.is_blocking},
            {"active_mode",           s.active_mode},
            {"target_mac",            nullable(s.target_mac)},
            {"target_name",           nullable(s.target_name)},
            {"presets",               presets_to_json(s.presets)},
            {"next_scheduled_action", nullable(s.next_scheduled_action)}
        }};
    });

    add("POST", "/toggle_block", [this](const json& body) {
        bool block = require_bool(body, "block");
        ToggleResult r = control_.toggle_block(block);
        if (!r.success) {
            return error(500, "Failed to toggle block");
        }
        return ApiResponse{200, json{
            {"success",     true},
            {"is_blocking", r.is_blocking},
            {"message",     std::string("Target ") + (r.is_blocking ? "BLOCKED" : "UNBLOCKED")}
        }};
    });

    add("POST", "/set_mode", [this](const json& body) {
        std::string mode = require_string(body, "mode");
        ModeResult r = control_.set_mode(mode);
        if (mode == kManualMode) {
            return ApiResponse{200, json{{"success", true}, {"active_mode", r.active_mode}}};
        }
        return ApiResponse{200, json{
            {"success",     true},
            {"active_mode", r.active_mode},
            {"is_blocking", r.is_blocking},
            {"message",     "Mode set to " + mode + (r.should_block ? " (currently blocking)" : "")}
        }};
    });

    add("POST", "/update_schedule", [this](const json& body) {
        std::string preset = require_string(body, "preset");
        std::string start  = require_string(body, "start");
        std::string end    = require_string(body, "end");
        bool enabled       = optional_bool(body, "enabled", true);

        PresetWindow w = control_.update_schedule(preset, start, end, enabled);
        return ApiResponse{200, json{
            {"success",  true},
            {"preset",   w.name},
            {"schedule", preset_to_json(w)}
        }};
    });

    add("GET", "/devices", [this](const json&) {
        json list = json::array();
        for (const auto& d : control_.devices()) {
            list.push_back(json{{"mac", d.mac}, {"ip", d.ip}, {"name", nullable(d.name)}});
        }
        return ApiResponse{200, list};
    });

    add("POST", "/target", [this](const json& body) {
        std::string mac = require_string(body, "mac");
        BlockTarget t = control_.set_target(mac, optional_string(body, "name"));
        return ApiResponse{200, json{
            {"success",     true},
            {"target_mac",  t.mac},
            {"target_name", nullable(t.name)}
        }};
    });

    add("DELETE", "/target", [this](const json&) {
        control_.clear_target();
        return ApiResponse{200, json{{"success", true}, {"message", "Target cleared"}}};
    });

    add("GET", "/presets", [this](const json&) {
        return ApiResponse{200, presets_to_json(control_.presets())};
    });
}

} // namespace ncf
