#include "data.h"

#include <algorithm>

// -----------------------------------------------------------------------
// Report rate
// -----------------------------------------------------------------------

uint16_t report_rate_hz(ReportRate rate) {
    switch (rate) {
        case ReportRate::Hz1000: return 1000;
        case ReportRate::Hz500:  return 500;
        case ReportRate::Hz250:  return 250;
        case ReportRate::Hz125:  return 125;
    }
    return 0;
}

bool report_rate_from_hz(uint16_t hz, ReportRate& out) {
    switch (hz) {
        case 1000: out = ReportRate::Hz1000; return true;
        case 500:  out = ReportRate::Hz500;  return true;
        case 250:  out = ReportRate::Hz250;  return true;
        case 125:  out = ReportRate::Hz125;  return true;
        default:   return false;
    }
}

// -----------------------------------------------------------------------
// Button actions
// -----------------------------------------------------------------------

ButtonAction ButtonAction::simple(ActionType type) {
    ButtonAction a;
    a.type = type;
    return a;
}

ButtonAction ButtonAction::fire_key(uint8_t interval, uint8_t repeat) {
    ButtonAction a;
    a.type     = ActionType::FireKey;
    a.interval = interval;
    a.repeat   = repeat;
    return a;
}

ButtonAction ButtonAction::macro(uint8_t index) {
    ButtonAction a;
    a.type        = ActionType::Macro;
    a.macro_index = index;
    return a;
}

ButtonAction ButtonAction::dpi_lock(uint8_t step) {
    ButtonAction a;
    a.type     = ActionType::DpiLock;
    a.dpi_step = step;
    return a;
}

bool ButtonAction::operator==(const ButtonAction& o) const {
    return type == o.type && interval == o.interval && repeat == o.repeat &&
           macro_index == o.macro_index && dpi_step == o.dpi_step;
}

// -----------------------------------------------------------------------
// Equality
// -----------------------------------------------------------------------

bool DpiPreset::operator==(const DpiPreset& o) const {
    return x == o.x && y == o.y && reserved == o.reserved;
}

bool Color::operator==(const Color& o) const {
    return red == o.red && green == o.green && blue == o.blue;
}

bool KeyEvent::operator==(const KeyEvent& o) const {
    return state == o.state && kind == o.kind && code == o.code;
}

bool MacroEvent::operator==(const MacroEvent& o) const {
    return key == o.key && delay_ms == o.delay_ms;
}

bool Macro::operator==(const Macro& o) const {
    return name == o.name && events == o.events;
}

bool Profile::operator==(const Profile& o) const {
    return report_rate == o.report_rate &&
           dpi_count == o.dpi_count &&
           dpi_index == o.dpi_index &&
           unknown_0006 == o.unknown_0006 &&
           lift_off_distance == o.lift_off_distance &&
           dpi_presets == o.dpi_presets &&
           dpi_colors == o.dpi_colors &&
           charging_color == o.charging_color &&
           unknown_0050 == o.unknown_0050 &&
           buttons == o.buttons &&
           unknown_00a0 == o.unknown_00a0 &&
           debounce_ms == o.debounce_ms &&
           motion_sync == o.motion_sync &&
           unknown_00ad == o.unknown_00ad &&
           angle_snapping == o.angle_snapping &&
           ripple_control == o.ripple_control &&
           unknown_00b3 == o.unknown_00b3 &&
           peak_performance == o.peak_performance &&
           peak_performance_time == o.peak_performance_time &&
           performance_mode == o.performance_mode &&
           unknown_00bb == o.unknown_00bb &&
           combos == o.combos &&
           macros == o.macros;
}

// -----------------------------------------------------------------------
// PartialProfile
// -----------------------------------------------------------------------

template <typename T, size_t N>
static bool any_set(const std::array<std::optional<T>, N>& slots) {
    return std::any_of(slots.begin(), slots.end(),
                       [](const std::optional<T>& s) { return s.has_value(); });
}

bool PartialProfile::empty() const {
    return !report_rate && !dpi_count && !dpi_index && !lift_off_distance &&
           !any_set(dpi_presets) && !any_set(dpi_colors) && !charging_color &&
           !any_set(buttons) && !debounce_ms && !motion_sync &&
           !angle_snapping && !ripple_control && !peak_performance &&
           !peak_performance_time && !performance_mode &&
           !any_set(combos) && !any_set(macros);
}
