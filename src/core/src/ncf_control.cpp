#include "ncf_control.hpp"
#include "ncf_errors.hpp"
#include "ncf_logger.hpp"

namespace ncf {

ControlService::ControlService(AppState& state,
                               SpoofEngine& engine,
                               PresetScheduler& scheduler,
                               DeviceDirectory& directory,
                               const StateStore& store)
    : state_(state)
    , engine_(engine)
    , scheduler_(scheduler)
    , directory_(directory)
    , store_(store)
{}

void ControlService::persist_locked() const {
    if (!store_.save(state_.snapshot_locked())) {
        NCF_LOG_WARN("Continuing with in-memory state only");
    }
}

StatusSnapshot ControlService::status() const {
    std::lock_guard<std::mutex> lock(state_.mu);

    StatusSnapshot s;
    s.is_blocking = engine_.is_blocking();
    s.active_mode = state_.active_mode;
    if (state_.target) {
        s.target_mac  = state_.target->mac;
        s.target_name = state_.target->name;
    }
    s.presets = state_.presets;
    s.next_scheduled_action = scheduler_.next_scheduled_action();
    return s;
}

ToggleResult ControlService::toggle_block(bool block) {
    std::lock_guard<std::mutex> lock(state_.mu);

    if (!state_.target) {
        throw ValidationError("No target MAC address set");
    }

    state_.active_mode = kManualMode;

    ToggleResult r;
    if (block) {
        r.success = engine_.start(state_.target->mac);
    } else {
        engine_.stop();
        r.success = true;
    }
    r.is_blocking = engine_.is_blocking();
    return r;
}

ModeResult ControlService::set_mode(const std::string& mode) {
    return set_mode(mode, TimeOfDay::now());
}

ModeResult ControlService::set_mode(const std::string& mode, TimeOfDay now) {
    return scheduler_.set_mode(mode, now);
}

PresetWindow ControlService::update_schedule(const std::string& preset,
                                             const std::string& start,
                                             const std::string& end,
                                             bool enabled) {
    auto start_t = TimeOfDay::parse(start);
    if (!start_t) throw ValidationError("Invalid start time '" + start + "', expected HH:MM");
    auto end_t = TimeOfDay::parse(end);
    if (!end_t) throw ValidationError("Invalid end time '" + end + "', expected HH:MM");

    std::lock_guard<std::mutex> lock(state_.mu);

    auto it = state_.presets.find(preset);
    if (it == state_.presets.end()) {
        throw ValidationError("Unknown preset: " + preset);
    }

    it->second = PresetWindow{preset, *start_t, *end_t, enabled};
    NCF_LOG_INFO("Preset " << preset << " updated: " << start << " - " << end
                 << (enabled ? "" : " (disabled)"));

    persist_locked();
    scheduler_.reconfigure(state_.presets);
    return it->second;
}

std::vector<DeviceEntry> ControlService::devices() {
    // The sweep runs without the control lock; only the target label needs it
    std::vector<DeviceRecord> found = directory_.list_devices();

    std::optional<BlockTarget> target;
    {
        std::lock_guard<std::mutex> lock(state_.mu);
        target = state_.target;
    }

    std::vector<DeviceEntry> out;
    out.reserve(found.size());
    for (auto& rec : found) {
        DeviceEntry e;
        e.mac = std::move(rec.mac);
        e.ip  = std::move(rec.ip);
        if (target && target->mac == e.mac) e.name = target->name;
        out.push_back(std::move(e));
    }
    return out;
}

BlockTarget ControlService::set_target(const std::string& mac, std::optional<std::string> name) {
    auto normalized = normalize_mac(mac);
    if (!normalized) {
        throw ValidationError("Invalid MAC address: " + mac);
    }

    std::lock_guard<std::mutex> lock(state_.mu);
    // A running session keeps poisoning the device it resolved at start
    auto live = engine_.session();
    if (live && mac_to_string(live->target_mac) != *normalized) {
        NCF_LOG_INFO("Target changed while blocking " << mac_to_string(live->target_mac)
                     << ", stopping");
        if (!engine_.stop()) {
            NCF_LOG_WARN("Blocking could not be confirmed stopped");
        }
    }
    state_.target = BlockTarget{*normalized, std::move(name)};
    NCF_LOG_INFO("Target set to " << state_.target->mac
                 << (state_.target->name ? " (" + *state_.target->name + ")" : std::string()));
    persist_locked();
    return *state_.target;
}

void ControlService::clear_target() {
    std::lock_guard<std::mutex> lock(state_.mu);
    engine_.stop();
    state_.target.reset();
    NCF_LOG_INFO("Target cleared");
    persist_locked();
}

PresetTable ControlService::presets() const {
    std::lock_guard<std::mutex> lock(state_.mu);
    return state_.presets;
}

void ControlService::shutdown() {
    std::lock_guard<std::mutex> lock(state_.mu);
    if (!engine_.stop()) {
        NCF_LOG_WARN("Blocking could not be confirmed stopped before exit");
    }
    persist_locked();
}

} // namespace ncf
