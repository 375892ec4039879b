#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

#include "data.h"

// -----------------------------------------------------------------------
// INI profile format
//
//   [device]   interface, endpoint, timeout_ms, retries
//   [mouse]    report_rate (Hz), dpi_count, dpi_index (1-based), lift_off,
//              debounce_ms, motion_sync, angle_snapping, ripple_control,
//              peak_performance, peak_performance_time (s), performance_mode
//   [dpi]      dpi1..dpi8 = 800 | 800x1600
//              color1..color8, charging_color = #rrggbb
//   [buttons]  button1..button16 = action name (see keys.h)
//   [combos]   combo1..combo16 = +ctrl_l +c -c -ctrl_l
//   [macros]   macro1..macro16 = +a:20 -a:50,  macroN_name = text
//
// Lines starting with '#' or ';' are comments. Keys are case-insensitive.
// Each key present becomes an engaged field of the PartialProfile; a
// combo or macro slot is always replaced as a whole.
// -----------------------------------------------------------------------

// [device] section. Unset values keep the built-in defaults.
struct DeviceConfig {
    std::optional<int>          interface;
    std::optional<uint8_t>      endpoint;
    std::optional<unsigned int> timeout_ms;
    std::optional<int>          retries;
};

struct Config {
    DeviceConfig   device;
    PartialProfile profile;
};

// Parse INI text. Throws ConfigError (with line number) on syntax errors,
// unknown keys in known sections and values the device cannot store.
// Unknown sections are ignored.
Config parse_config(std::istream& in);

// Throws ConfigError if the file cannot be read.
Config parse_config_file(const std::string& path);

// Emit `profile` in the same format ([mouse], [dpi], [buttons], and the
// non-empty [combos] / [macros] slots). Unknown ranges are not emitted.
void write_profile_ini(std::ostream& out, const Profile& profile);
