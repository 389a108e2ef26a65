#pragma once

/**
 * @file ncf_preset_scheduler.hpp
 * @brief Preset triggers and the active-mode gate
 */

#include "ncf_app_state.hpp"
#include "ncf_schedule.hpp"
#include "ncf_spoof_engine.hpp"
#include "ncf_timer_scheduler.hpp"

#include <optional>
#include <string>

namespace ncf {

enum class PresetEdge {
    Start,
    End
};

struct ModeResult {
    std::string active_mode;
    bool        is_blocking  = false;
    bool        should_block = false;
};

/**
 * @brief Turns preset windows into engine transitions
 *
 * A preset's end trigger only stops blocking if that preset is still the
 * active mode, so an ending preset never tears down a block owned by a
 * manual override or another preset.
 */
class PresetScheduler {
public:
    PresetScheduler(AppState& state, SpoofEngine& engine, ITriggerScheduler& triggers);

    /**
     * @brief Drop every trigger, then register "<name>_start" and
     *        "<name>_end" for each enabled preset
     *
     * Touches only the trigger table, so it may be called with
     * AppState::mu held.
     */
    void reconfigure(const PresetTable& presets);

    /// Trigger callback body; takes AppState::mu
    void apply_preset(const std::string& name, PresetEdge edge);

    /**
     * @brief Switch to @p mode and reconcile blocking with @p now
     *
     * "Manual" only changes the active mode. A preset name starts or stops
     * the engine depending on should_block(now, window).
     * @throws ValidationError for an unknown mode
     */
    ModeResult set_mode(const std::string& mode, TimeOfDay now);

    /// "<id> at HH:MM" of the soonest trigger, std::nullopt if none
    std::optional<std::string> next_scheduled_action() const;

    static std::string trigger_id(const std::string& preset, PresetEdge edge);

private:
    AppState&          state_;
    SpoofEngine&       engine_;
    ITriggerScheduler& triggers_;
};

} // namespace ncf
