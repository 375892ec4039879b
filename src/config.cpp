#include "config.h"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include "errors.h"
#include "fields.h"
#include "keys.h"
#include "layout.h"
#include "macros.h"

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream ss(s);
    std::string tok;
    while (ss >> tok) out.push_back(tok);
    return out;
}

// Whole-string integer in [lo, hi]; base 0 accepts a 0x prefix.
static bool parse_int(const std::string& s, long lo, long hi, long& out, int base = 10) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, base);
    if (errno != 0 || end != s.c_str() + s.size() || v < lo || v > hi) return false;
    out = v;
    return true;
}

static bool parse_bool(const std::string& s, bool& out) {
    std::string sl = to_lower(s);
    if (sl == "1" || sl == "true" || sl == "on" || sl == "yes")   { out = true;  return true; }
    if (sl == "0" || sl == "false" || sl == "off" || sl == "no")  { out = false; return true; }
    return false;
}

// "#rrggbb" (the '#' is optional)
static bool parse_color(const std::string& s, Color& out) {
    std::string hex = s;
    if (!hex.empty() && hex[0] == '#') hex = hex.substr(1);
    if (hex.size() != 6) return false;

    long v = 0;
    if (!parse_int(hex, 0, 0xFFFFFF, v, 16)) return false;
    out.red   = static_cast<uint8_t>((v >> 16) & 0xFF);
    out.green = static_cast<uint8_t>((v >> 8) & 0xFF);
    out.blue  = static_cast<uint8_t>(v & 0xFF);
    return true;
}

// "800" or "800x1600"
static bool parse_dpi(const std::string& s, DpiPreset& out) {
    long x = 0, y = 0;
    size_t sep = to_lower(s).find('x');
    if (sep == std::string::npos) {
        if (!parse_int(s, 0, 0xFFFF, x)) return false;
        y = x;
    } else {
        if (!parse_int(trim(s.substr(0, sep)), 0, 0xFFFF, x) ||
            !parse_int(trim(s.substr(sep + 1)), 0, 0xFFFF, y))
            return false;
    }
    out.x = static_cast<uint16_t>(x);
    out.y = static_cast<uint16_t>(y);
    return true;
}

static std::string format_color(const Color& c) {
    std::ostringstream ss;
    ss << "#" << std::hex << std::setfill('0')
       << std::setw(2) << static_cast<int>(c.red)
       << std::setw(2) << static_cast<int>(c.green)
       << std::setw(2) << static_cast<int>(c.blue);
    return ss.str();
}

static std::string format_dpi(const DpiPreset& d) {
    if (d.x == d.y) return std::to_string(d.x);
    return std::to_string(d.x) + "x" + std::to_string(d.y);
}

// Run the binary encoder on a parsed value so that domain errors are
// reported against the line they came from.
template <typename Fn>
static void check_encodable(int lineno, Fn&& fn) {
    try {
        fn();
    } catch (const LamzuError& e) {
        throw ConfigError(e.what(), lineno);
    }
}

// -----------------------------------------------------------------------
// Section handlers
// -----------------------------------------------------------------------

namespace {

class IniReader {
public:
    explicit IniReader(Config& cfg) : _cfg(cfg) {}

    void line(const std::string& section, const std::string& key,
              const std::string& value, int lineno);
    void finish();

private:
    Config& _cfg;
    int     _lineno = 0;

    // Line of each macroN_name / macroN entry, 0 if absent
    std::array<int, NUM_MACRO_SLOTS> _macro_name_line{};
    std::array<int, NUM_MACRO_SLOTS> _macro_events_line{};

    [[noreturn]] void _fail(const std::string& msg) const { throw ConfigError(msg, _lineno); }

    long _int(const std::string& key, const std::string& value, long lo, long hi, int base = 10);
    bool _bool(const std::string& key, const std::string& value);
    int  _slot(const std::string& digits, int count, const std::string& key);

    void _device(const std::string& key, const std::string& value);
    void _mouse(const std::string& key, const std::string& value);
    void _dpi(const std::string& key, const std::string& value);
    void _buttons(const std::string& key, const std::string& value);
    void _combos(const std::string& key, const std::string& value);
    void _macros(const std::string& key, const std::string& value);
};

long IniReader::_int(const std::string& key, const std::string& value,
                     long lo, long hi, int base) {
    long v = 0;
    if (!parse_int(value, lo, hi, v, base))
        _fail("Invalid " + key + " '" + value + "' (expected " + std::to_string(lo) + "-" +
              std::to_string(hi) + ")");
    return v;
}

bool IniReader::_bool(const std::string& key, const std::string& value) {
    bool b = false;
    if (!parse_bool(value, b))
        _fail("Invalid " + key + " '" + value + "' (expected 0 or 1)");
    return b;
}

int IniReader::_slot(const std::string& digits, int count, const std::string& key) {
    long n = 0;
    if (!parse_int(digits, 1, count, n))
        _fail("Slot number out of range in '" + key + "' (1-" + std::to_string(count) + ")");
    return static_cast<int>(n - 1);
}

void IniReader::line(const std::string& section, const std::string& key,
                     const std::string& value, int lineno) {
    _lineno = lineno;

    if      (section == "device")  _device(key, value);
    else if (section == "mouse")   _mouse(key, value);
    else if (section == "dpi")     _dpi(key, value);
    else if (section == "buttons") _buttons(key, value);
    else if (section == "combos")  _combos(key, value);
    else if (section == "macros")  _macros(key, value);
    // Unknown sections are silently ignored
}

void IniReader::_device(const std::string& key, const std::string& value) {
    DeviceConfig& d = _cfg.device;

    if      (key == "interface")  d.interface  = static_cast<int>(_int(key, value, 0, 255));
    else if (key == "endpoint")   d.endpoint   = static_cast<uint8_t>(_int(key, value, 0, 255, 0));
    else if (key == "timeout_ms") d.timeout_ms = static_cast<unsigned int>(_int(key, value, 1, 60000));
    else if (key == "retries")    d.retries    = static_cast<int>(_int(key, value, 0, 10));
    else _fail("Unknown key '" + key + "' in [device]");
}

void IniReader::_mouse(const std::string& key, const std::string& value) {
    PartialProfile& p = _cfg.profile;

    if (key == "report_rate" || key == "polling_rate") {
        ReportRate rate;
        long hz = _int(key, value, 0, 0xFFFF);
        if (!report_rate_from_hz(static_cast<uint16_t>(hz), rate))
            _fail(key + " must be 125, 250, 500, or 1000 (got " + value + ")");
        p.report_rate = rate;
    } else if (key == "dpi_count") {
        p.dpi_count = static_cast<uint8_t>(_int(key, value, 1, NUM_DPI_PRESETS));
    } else if (key == "dpi_index") {
        p.dpi_index = static_cast<uint8_t>(_int(key, value, 1, NUM_DPI_PRESETS) - 1);
    } else if (key == "lift_off") {
        uint8_t v = static_cast<uint8_t>(_int(key, value, 0, 255));
        check_encodable(_lineno, [v]() { encode_lift_off(v); });
        p.lift_off_distance = v;
    } else if (key == "debounce_ms") {
        p.debounce_ms = static_cast<uint8_t>(_int(key, value, 0, DEBOUNCE_MAX_MS));
    } else if (key == "motion_sync") {
        p.motion_sync = _bool(key, value);
    } else if (key == "angle_snapping") {
        p.angle_snapping = _bool(key, value);
    } else if (key == "ripple_control") {
        p.ripple_control = _bool(key, value);
    } else if (key == "peak_performance") {
        p.peak_performance = _bool(key, value);
    } else if (key == "peak_performance_time") {
        uint16_t v = static_cast<uint16_t>(_int(key, value, 0, 0xFFFF));
        check_encodable(_lineno, [v]() { encode_peak_time(v); });
        p.peak_performance_time = v;
    } else if (key == "performance_mode") {
        p.performance_mode = _bool(key, value);
    } else {
        _fail("Unknown key '" + key + "' in [mouse]");
    }
}

void IniReader::_dpi(const std::string& key, const std::string& value) {
    static const std::regex re_dpi(R"(^dpi([0-9]+)$)");
    static const std::regex re_color(R"(^color([0-9]+)$)");

    PartialProfile& p = _cfg.profile;
    std::smatch m;

    if (std::regex_match(key, m, re_dpi)) {
        int slot = _slot(m[1].str(), NUM_DPI_PRESETS, key);
        DpiPreset dpi;
        if (!parse_dpi(value, dpi))
            _fail("Invalid DPI value '" + value + "'");
        check_encodable(_lineno, [&dpi]() { encode_dpi_preset(dpi); });
        p.dpi_presets[slot] = dpi;
    } else if (std::regex_match(key, m, re_color)) {
        int slot = _slot(m[1].str(), NUM_DPI_PRESETS, key);
        Color c;
        if (!parse_color(value, c))
            _fail("Invalid color '" + value + "'");
        p.dpi_colors[slot] = c;
    } else if (key == "charging_color") {
        Color c;
        if (!parse_color(value, c))
            _fail("Invalid color '" + value + "'");
        p.charging_color = c;
    } else {
        _fail("Unknown key '" + key + "' in [dpi]");
    }
}

void IniReader::_buttons(const std::string& key, const std::string& value) {
    static const std::regex re_button(R"(^button([0-9]+)$)");

    std::smatch m;
    if (!std::regex_match(key, m, re_button))
        _fail("Unknown key '" + key + "' in [buttons]");

    int slot = _slot(m[1].str(), NUM_BUTTONS, key);
    ButtonAction action;
    if (!parse_action(value, action))
        _fail("Unknown action '" + value + "' for " + key);
    check_encodable(_lineno, [&action]() { encode_button_action(action); });
    _cfg.profile.buttons[slot] = action;
}

void IniReader::_combos(const std::string& key, const std::string& value) {
    static const std::regex re_combo(R"(^combo([0-9]+)$)");

    std::smatch m;
    if (!std::regex_match(key, m, re_combo))
        _fail("Unknown key '" + key + "' in [combos]");

    int slot = _slot(m[1].str(), NUM_COMBO_SLOTS, key);
    KeyCombo combo;
    for (const std::string& tok : split_ws(value)) {
        KeyEvent e;
        if (!parse_key_event(tok, e))
            _fail("Unknown key event '" + tok + "' in " + key);
        combo.events.push_back(e);
    }
    check_encodable(_lineno, [&combo]() { encode_key_combo(combo); });
    _cfg.profile.combos[slot] = combo;
}

void IniReader::_macros(const std::string& key, const std::string& value) {
    static const std::regex re_macro(R"(^macro([0-9]+)(_name)?$)");

    std::smatch m;
    if (!std::regex_match(key, m, re_macro))
        _fail("Unknown key '" + key + "' in [macros]");

    int slot = _slot(m[1].str(), NUM_MACRO_SLOTS, key);
    std::optional<Macro>& macro = _cfg.profile.macros[slot];
    if (!macro) macro = Macro{};

    if (m[2].matched) {
        if (value.size() > static_cast<size_t>(MAX_MACRO_NAME))
            _fail(key + " is longer than " + std::to_string(MAX_MACRO_NAME) + " bytes");
        macro->name = value;
        _macro_name_line[slot] = _lineno;
        return;
    }

    _macro_events_line[slot] = _lineno;
    macro->events.clear();
    for (const std::string& tok : split_ws(value)) {
        MacroEvent e;
        if (!parse_macro_event(tok, e))
            _fail("Unknown macro event '" + tok + "' in " + key);
        macro->events.push_back(e);
    }
    check_encodable(_lineno, [&macro]() { encode_macro(*macro); });
}

// macroN_name needs macroN: the slot is replaced as a whole.
void IniReader::finish() {
    for (int i = 0; i < NUM_MACRO_SLOTS; ++i) {
        if (_macro_name_line[i] && !_macro_events_line[i])
            throw ConfigError("macro" + std::to_string(i + 1) + "_name requires macro" +
                                  std::to_string(i + 1) + " in the same file",
                              _macro_name_line[i]);
    }
}

}  // namespace

// -----------------------------------------------------------------------
// INI parser
// -----------------------------------------------------------------------

Config parse_config(std::istream& in) {
    Config cfg;
    IniReader reader(cfg);
    std::string section;
    int lineno = 0;

    // Regex patterns
    std::regex re_section(R"(^\[([^\]]+)\]$)");
    std::regex re_kv(R"(^([^=]+)=(.*)$)");

    std::string line;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);

        // Skip blank lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';')
            continue;

        std::smatch m;

        // Section header
        if (std::regex_match(line, m, re_section)) {
            section = to_lower(trim(m[1].str()));
            continue;
        }

        // Key=value pair
        if (std::regex_match(line, m, re_kv)) {
            reader.line(section, to_lower(trim(m[1].str())), trim(m[2].str()), lineno);
            continue;
        }

        throw ConfigError("Syntax error '" + line + "'", lineno);
    }

    reader.finish();
    return cfg;
}

Config parse_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw ConfigError("Cannot open config file: " + path, 0);
    return parse_config(f);
}

// -----------------------------------------------------------------------
// Writer
// -----------------------------------------------------------------------

static const char* const UNDECODED_NOTE = "stored bytes do not decode, left unchanged";

void write_profile_ini(std::ostream& out, const Profile& p) {
    out << "[mouse]\n"
        << "report_rate = " << report_rate_hz(p.report_rate) << "\n"
        << "dpi_count = " << static_cast<int>(p.dpi_count) << "\n"
        << "dpi_index = " << static_cast<int>(p.dpi_index) + 1 << "\n"
        << "lift_off = " << static_cast<int>(p.lift_off_distance) << "\n"
        << "debounce_ms = " << static_cast<int>(p.debounce_ms) << "\n"
        << "motion_sync = " << p.motion_sync << "\n"
        << "angle_snapping = " << p.angle_snapping << "\n"
        << "ripple_control = " << p.ripple_control << "\n"
        << "peak_performance = " << p.peak_performance << "\n"
        << "peak_performance_time = " << p.peak_performance_time << "\n"
        << "performance_mode = " << p.performance_mode << "\n";

    out << "\n[dpi]\n";
    for (int i = 0; i < NUM_DPI_PRESETS; ++i) {
        if (p.dpi_presets[i].decoded())
            out << "dpi" << i + 1 << " = " << format_dpi(*p.dpi_presets[i].value) << "\n";
        else
            out << "# dpi" << i + 1 << ": " << UNDECODED_NOTE << "\n";
    }
    for (int i = 0; i < NUM_DPI_PRESETS; ++i) {
        if (p.dpi_colors[i].decoded())
            out << "color" << i + 1 << " = " << format_color(*p.dpi_colors[i].value) << "\n";
        else
            out << "# color" << i + 1 << ": " << UNDECODED_NOTE << "\n";
    }
    out << "charging_color = " << format_color(p.charging_color) << "\n";

    out << "\n[buttons]\n";
    for (int i = 0; i < NUM_BUTTONS; ++i) {
        if (p.buttons[i].decoded())
            out << "button" << i + 1 << " = " << format_action(*p.buttons[i].value) << "\n";
        else
            out << "# button" << i + 1 << ": " << UNDECODED_NOTE << "\n";
    }

    out << "\n[combos]\n";
    for (int i = 0; i < NUM_COMBO_SLOTS; ++i) {
        if (!p.combos[i].decoded()) {
            out << "# combo" << i + 1 << ": " << UNDECODED_NOTE << "\n";
            continue;
        }
        const KeyCombo& c = *p.combos[i].value;
        if (c.events.empty()) continue;
        out << "combo" << i + 1 << " =";
        for (const KeyEvent& e : c.events)
            out << " " << format_key_event(e);
        out << "\n";
    }

    out << "\n[macros]\n";
    for (int i = 0; i < NUM_MACRO_SLOTS; ++i) {
        if (!p.macros[i].decoded()) {
            out << "# macro" << i + 1 << ": " << UNDECODED_NOTE << "\n";
            continue;
        }
        const Macro& mc = *p.macros[i].value;
        if (mc.name.empty() && mc.events.empty()) continue;
        if (!mc.name.empty())
            out << "macro" << i + 1 << "_name = " << mc.name << "\n";
        out << "macro" << i + 1 << " =";
        for (const MacroEvent& e : mc.events)
            out << " " << format_macro_event(e);
        out << "\n";
    }
}
