#include "ncf_preset_scheduler.hpp"
#include "ncf_errors.hpp"
#include "ncf_logger.hpp"

namespace ncf {

PresetScheduler::PresetScheduler(AppState& state, SpoofEngine& engine,
                                 ITriggerScheduler& triggers)
    : state_(state)
    , engine_(engine)
    , triggers_(triggers)
{}

std::string PresetScheduler::trigger_id(const std::string& preset, PresetEdge edge) {
    return preset + (edge == PresetEdge::Start ? "_start" : "_end");
}

void PresetScheduler::reconfigure(const PresetTable& presets) {
    triggers_.clear();

    for (const auto& [name, window] : presets) {
        if (!window.enabled) continue;

        // Start is registered first so a zero-length window ends unblocked
        triggers_.schedule(trigger_id(name, PresetEdge::Start), window.start,
                           [this, name = name] { apply_preset(name, PresetEdge::Start); });
        triggers_.schedule(trigger_id(name, PresetEdge::End), window.end,
                           [this, name = name] { apply_preset(name, PresetEdge::End); });

        NCF_LOG_INFO("Scheduled " << name << ": " << window.start.to_string()
                     << " - " << window.end.to_string());
    }
}

void PresetScheduler::apply_preset(const std::string& name, PresetEdge edge) {
    std::lock_guard<std::mutex> lock(state_.mu);

    NCF_LOG_INFO("[SCHEDULER] Preset '" << name << "' - Action: "
                 << (edge == PresetEdge::Start ? "start" : "end"));

    if (edge == PresetEdge::Start) {
        state_.active_mode = name;
        if (!state_.target) {
            NCF_LOG_WARN("No target MAC set");
            return;
        }
        if (!engine_.start(state_.target->mac)) {
            NCF_LOG_ERROR("Preset '" << name << "' could not start blocking");
        }
        return;
    }

    if (state_.active_mode != name) {
        NCF_LOG_INFO("Preset '" << name << "' ended but active mode is '"
                     << state_.active_mode << "', leaving block state alone");
        return;
    }
    engine_.stop();
    state_.active_mode = kManualMode;
}

ModeResult PresetScheduler::set_mode(const std::string& mode, TimeOfDay now) {
    std::lock_guard<std::mutex> lock(state_.mu);

    ModeResult result;
    if (mode == kManualMode) {
        state_.active_mode = kManualMode;
        result.active_mode = kManualMode;
        result.is_blocking = engine_.is_blocking();
        return result;
    }

    auto it = state_.presets.find(mode);
    if (it == state_.presets.end()) {
        throw ValidationError("Unknown mode: " + mode);
    }

    result.should_block = should_block(now, it->second);
    state_.active_mode = mode;

    if (result.should_block) {
        if (!state_.target) {
            NCF_LOG_WARN("Mode " << mode << " wants to block but no target is set");
        } else if (!engine_.start(state_.target->mac)) {
            NCF_LOG_ERROR("Mode " << mode << " could not start blocking");
        }
    } else {
        engine_.stop();
    }

    NCF_LOG_INFO("Mode set to " << mode << (result.should_block ? " (currently blocking)" : ""));
    result.active_mode = mode;
    result.is_blocking = engine_.is_blocking();
    return result;
}

std::optional<std::string> PresetScheduler::next_scheduled_action() const {
    auto next = triggers_.next_fire();
    if (!next) return std::nullopt;
    return next->id + " at " + TimeOfDay::from_time_point(next->when).to_string();
}

} // namespace ncf
