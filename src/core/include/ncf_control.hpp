#pragma once

/**
 * @file ncf_control.hpp
 * @brief Operations behind the HTTP API
 */

#include "ncf_app_state.hpp"
#include "ncf_device_directory.hpp"
#include "ncf_preset_scheduler.hpp"
#include "ncf_spoof_engine.hpp"
#include "ncf_state_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ncf {

struct StatusSnapshot {
    bool                       is_blocking = false;
    std::string                active_mode;
    std::optional<std::string> target_mac;
    std::optional<std::string> target_name;
    PresetTable                presets;
    std::optional<std::string> next_scheduled_action;
};

struct ToggleResult {
    bool success     = false;
    bool is_blocking = false;
};

struct DeviceEntry {
    std::string                mac;
    std::string                ip;
    std::optional<std::string> name;
};

/**
 * @brief Control plane façade
 *
 * Every mutating call persists through StateStore; a failed write is
 * logged by the store and otherwise ignored, the in-memory state stays
 * authoritative. Validation failures throw ValidationError before any
 * state changes.
 */
class ControlService {
public:
    ControlService(AppState& state,
                   SpoofEngine& engine,
                   PresetScheduler& scheduler,
                   DeviceDirectory& directory,
                   const StateStore& store);

    StatusSnapshot status() const;

    /**
     * @brief Manual override
     * @throws ValidationError if no target is set
     */
    ToggleResult toggle_block(bool block);

    /// @throws ValidationError for an unknown mode
    ModeResult set_mode(const std::string& mode);
    ModeResult set_mode(const std::string& mode, TimeOfDay now);

    /**
     * @brief Replace one preset window and re-register every trigger
     * @throws ValidationError for an unknown preset or a malformed time
     */
    PresetWindow update_schedule(const std::string& preset,
                                 const std::string& start,
                                 const std::string& end,
                                 bool enabled);

    /// Live subnet sweep; the current target is labelled with its name
    std::vector<DeviceEntry> devices();

    /**
     * @brief Set or replace the target
     *
     * Replacing a target that is being blocked with a different MAC stops
     * the block. Renaming the blocked target leaves it running.
     * @throws ValidationError if @p mac is not a MAC address
     */
    BlockTarget set_target(const std::string& mac, std::optional<std::string> name);

    /// Stops blocking first, then forgets the target
    void clear_target();

    PresetTable presets() const;

    /// Teardown hook: stop blocking before exit
    void shutdown();

private:
    void persist_locked() const;

    AppState&         state_;
    SpoofEngine&      engine_;
    PresetScheduler&  scheduler_;
    DeviceDirectory&  directory_;
    const StateStore& store_;
};

} // namespace ncf
