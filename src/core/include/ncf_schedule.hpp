#pragma once

/**
 * @file ncf_schedule.hpp
 * @brief Preset windows and the "should we be blocking now" evaluator
 */

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace ncf {

/**
 * @brief Wall-clock time at minute granularity (24h)
 */
struct TimeOfDay {
    int hour = 0;
    int minute = 0;

    constexpr int minutes() const { return hour * 60 + minute; }

    /**
     * @brief Strict "HH:MM" parse (two digits each, 00-23 / 00-59)
     * @return std::nullopt on anything else
     */
    static std::optional<TimeOfDay> parse(const std::string& text);

    /// Host local time, seconds truncated
    static TimeOfDay now();
    static TimeOfDay from_time_point(std::chrono::system_clock::time_point tp);

    std::string to_string() const;

    friend constexpr bool operator==(TimeOfDay a, TimeOfDay b) { return a.minutes() == b.minutes(); }
    friend constexpr bool operator!=(TimeOfDay a, TimeOfDay b) { return !(a == b); }
    friend constexpr bool operator<(TimeOfDay a, TimeOfDay b)  { return a.minutes() < b.minutes(); }
    friend constexpr bool operator<=(TimeOfDay a, TimeOfDay b) { return a.minutes() <= b.minutes(); }
    friend constexpr bool operator>(TimeOfDay a, TimeOfDay b)  { return b < a; }
    friend constexpr bool operator>=(TimeOfDay a, TimeOfDay b) { return b <= a; }
};

/**
 * @brief Named daily blocking window
 *
 * start > end means the window crosses midnight. start == end is an
 * empty window.
 */
struct PresetWindow {
    std::string name;
    TimeOfDay   start;
    TimeOfDay   end;
    bool        enabled = true;

    bool operator==(const PresetWindow& o) const {
        return name == o.name && start == o.start && end == o.end && enabled == o.enabled;
    }
};

/// Keyed by preset name
using PresetTable = std::map<std::string, PresetWindow>;

/// Sentinel mode for operator-initiated blocking
inline const std::string kManualMode = "Manual";

/**
 * @brief Breakfast, Lunch, Dinner and an overnight Bedtime, all enabled
 */
PresetTable default_presets();

/**
 * @brief Is @p now inside @p window?
 *
 *   start <= end : start <= now < end   (start == end is never true)
 *   start >  end : now >= start || now < end
 *
 * The enabled flag is not consulted.
 */
bool should_block(TimeOfDay now, const PresetWindow& window);

} // namespace ncf
