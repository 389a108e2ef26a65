#pragma once

/**
 * @file ncf_state_store.hpp
 * @brief JSON persistence of presets and target
 *
 * Document layout:
 *   {
 *     "presets": { "Bedtime": {"start": "21:00", "end": "06:00", "enabled": true}, ... },
 *     "target_mac": "AA:BB:CC:DD:EE:FF" | null,
 *     "target_name": "Tablet" | null
 *   }
 */

#include "ncf_app_state.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace ncf {

nlohmann::json preset_to_json(const PresetWindow& window);
nlohmann::json presets_to_json(const PresetTable& presets);

class StateStore {
public:
    explicit StateStore(std::string path);

    /**
     * @brief Read the document
     *
     * A missing file yields defaults. A missing top-level key yields that
     * key's default.
     * @throws ConfigError if the file is not JSON or a present field has the
     *         wrong type or an invalid value
     */
    PersistedState load() const;

    /**
     * @brief Write the document (indent 2)
     * @return false on an I/O error, which is logged
     */
    bool save(const PersistedState& state) const;

    const std::string& path() const { return path_; }

    /// @throws ConfigError as load()
    static PersistedState from_json(const nlohmann::json& doc);
    static nlohmann::json to_json(const PersistedState& state);

private:
    std::string path_;
};

} // namespace ncf
