#pragma once

/**
 * @file ncf_app_state.hpp
 * @brief Control-plane state shared by the HTTP handlers and preset triggers
 */

#include "ncf_schedule.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace ncf {

/**
 * @brief Device being controlled
 */
struct BlockTarget {
    std::string                mac;    ///< Normalized "AA:BB:CC:DD:EE:FF"
    std::optional<std::string> name;

    bool operator==(const BlockTarget& o) const { return mac == o.mac && name == o.name; }
};

/**
 * @brief What survives a restart
 */
struct PersistedState {
    PresetTable                presets = default_presets();
    std::optional<BlockTarget> target;
};

/**
 * @brief Owned by Application, passed by reference to each component
 *
 * mu is the single control-plane critical section: every read or write of
 * target/presets/active_mode, and every engine transition made on their
 * behalf, happens with it held.
 */
struct AppState {
    PresetTable                presets = default_presets();
    std::optional<BlockTarget> target;
    std::string                active_mode = kManualMode;
    std::mutex                 mu;

    AppState() = default;
    explicit AppState(PersistedState persisted)
        : presets(std::move(persisted.presets))
        , target(std::move(persisted.target)) {}

    AppState(const AppState&) = delete;
    AppState& operator=(const AppState&) = delete;

    /// Caller holds mu
    PersistedState snapshot_locked() const {
        PersistedState p;
        p.presets = presets;
        p.target = target;
        return p;
    }
};

} // namespace ncf
