#include "ncf_schedule.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace ncf {

std::optional<TimeOfDay> TimeOfDay::parse(const std::string& text) {
    if (text.size() != 5 || text[2] != ':') return std::nullopt;
    for (size_t i : {0u, 1u, 3u, 4u}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    }

    TimeOfDay t;
    t.hour   = (text[0] - '0') * 10 + (text[1] - '0');
    t.minute = (text[3] - '0') * 10 + (text[4] - '0');
    if (t.hour > 23 || t.minute > 59) return std::nullopt;
    return t;
}

TimeOfDay TimeOfDay::from_time_point(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    return TimeOfDay{local.tm_hour, local.tm_min};
}

TimeOfDay TimeOfDay::now() {
    return from_time_point(std::chrono::system_clock::now());
}

std::string TimeOfDay::to_string() const {
    char buf[6];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
    return std::string(buf);
}

PresetTable default_presets() {
    PresetTable t;
    t["Breakfast"] = PresetWindow{"Breakfast", {7, 0},  {8, 0},  true};
    t["Lunch"]     = PresetWindow{"Lunch",     {12, 0}, {13, 0}, true};
    t["Dinner"]    = PresetWindow{"Dinner",    {19, 0}, {20, 0}, true};
    t["Bedtime"]   = PresetWindow{"Bedtime",   {21, 0}, {6, 0},  true};
    return t;
}

bool should_block(TimeOfDay now, const PresetWindow& window) {
    if (window.start <= window.end) {
        return window.start <= now && now < window.end;
    }
    // Crosses midnight
    return now >= window.start || now < window.end;
}

} // namespace ncf
