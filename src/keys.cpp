#include "keys.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <vector>

// -----------------------------------------------------------------------
// Button actions without parameters
// -----------------------------------------------------------------------
static const std::map<std::string, ActionType> simple_actions = {
    {"disabled",       ActionType::Disabled},
    {"left",           ActionType::LeftClick},
    {"right",          ActionType::RightClick},
    {"middle",         ActionType::MiddleClick},
    {"back",           ActionType::BackClick},
    {"forward",        ActionType::ForwardClick},
    {"dpi-loop",       ActionType::DpiLoop},
    {"dpi+",           ActionType::DpiUp},
    {"dpi-",           ActionType::DpiDown},
    {"scroll_left",    ActionType::ScrollLeft},
    {"scroll_right",   ActionType::ScrollRight},
    {"combo",          ActionType::KeyCombo},
    {"poll_rate_loop", ActionType::PollRateLoop},
    {"scroll_up",      ActionType::ScrollUp},
    {"scroll_down",    ActionType::ScrollDown},
};

static const std::map<std::string, std::string> action_aliases = {
    {"none",           "disabled"},
    {"disable",        "disabled"},
    {"backward",       "back"},
    {"dpi-cycle",      "dpi-loop"},
    {"polling_switch", "poll_rate_loop"},
    {"key_combo",      "combo"},
};

// -----------------------------------------------------------------------
// Keyboard modifier bits
// USB HID modifier byte: bit 0=LCtrl, 1=LShift, 2=LAlt, 3=LMeta,
//                        4=RCtrl, 5=RShift, 6=RAlt, 7=RMeta
// -----------------------------------------------------------------------
static const std::map<std::string, uint16_t> modifier_bits = {
    {"ctrl_l",  0x01},
    {"shift_l", 0x02},
    {"alt_l",   0x04},
    {"super_l", 0x08},
    {"ctrl_r",  0x10},
    {"shift_r", 0x20},
    {"alt_r",   0x40},
    {"super_r", 0x80},
};

// -----------------------------------------------------------------------
// Keyboard key USB HID usage codes
// Reference: USB HID Usage Tables, Section 10 (Keyboard/Keypad)
// -----------------------------------------------------------------------
static const std::map<std::string, uint16_t> key_codes = {
    // Letters
    {"a", 0x04}, {"b", 0x05}, {"c", 0x06}, {"d", 0x07},
    {"e", 0x08}, {"f", 0x09}, {"g", 0x0a}, {"h", 0x0b},
    {"i", 0x0c}, {"j", 0x0d}, {"k", 0x0e}, {"l", 0x0f},
    {"m", 0x10}, {"n", 0x11}, {"o", 0x12}, {"p", 0x13},
    {"q", 0x14}, {"r", 0x15}, {"s", 0x16}, {"t", 0x17},
    {"u", 0x18}, {"v", 0x19}, {"w", 0x1a}, {"x", 0x1b},
    {"y", 0x1c}, {"z", 0x1d},
    // Numbers (top row)
    {"1", 0x1e}, {"2", 0x1f}, {"3", 0x20}, {"4", 0x21},
    {"5", 0x22}, {"6", 0x23}, {"7", 0x24}, {"8", 0x25},
    {"9", 0x26}, {"0", 0x27},
    // Common non-alpha keys
    {"enter",     0x28},
    {"escape",    0x29},
    {"backspace", 0x2a},
    {"tab",       0x2b},
    {"space",     0x2c},
    {"minus",     0x2d},
    {"equal",     0x2e},
    {"lbracket",  0x2f},
    {"rbracket",  0x30},
    {"backslash", 0x31},
    {"semicolon", 0x33},
    {"quote",     0x34},
    {"grave",     0x35},
    {"comma",     0x36},
    {"dot",       0x37},
    {"slash",     0x38},
    {"capslock",  0x39},
    // Function keys
    {"f1",  0x3a}, {"f2",  0x3b}, {"f3",  0x3c}, {"f4",  0x3d},
    {"f5",  0x3e}, {"f6",  0x3f}, {"f7",  0x40}, {"f8",  0x41},
    {"f9",  0x42}, {"f10", 0x43}, {"f11", 0x44}, {"f12", 0x45},
    {"f13", 0x68}, {"f14", 0x69}, {"f15", 0x6a}, {"f16", 0x6b},
    {"f17", 0x6c}, {"f18", 0x6d}, {"f19", 0x6e}, {"f20", 0x6f},
    {"f21", 0x70}, {"f22", 0x71}, {"f23", 0x72}, {"f24", 0x73},
    // Navigation
    {"printscreen", 0x46},
    {"scrolllock",  0x47},
    {"pause",       0x48},
    {"insert",      0x49},
    {"home",        0x4a},
    {"pageup",      0x4b},
    {"delete",      0x4c},
    {"end",         0x4d},
    {"pagedown",    0x4e},
    {"right",       0x4f},
    {"left",        0x50},
    {"down",        0x51},
    {"up",          0x52},
    // Numpad
    {"num0", 0x62}, {"num1", 0x59}, {"num2", 0x5a}, {"num3", 0x5b},
    {"num4", 0x5c}, {"num5", 0x5d}, {"num6", 0x5e}, {"num7", 0x5f},
    {"num8", 0x60}, {"num9", 0x61},
    {"numenter", 0x58}, {"numdot", 0x63},
    {"numplus",  0x57}, {"numminus", 0x56},
    {"nummul",   0x55}, {"numdiv",   0x54},
    {"numlock",  0x53},
};

// -----------------------------------------------------------------------
// Consumer control usages (HID usage page 0x0C)
// -----------------------------------------------------------------------
static const std::map<std::string, uint16_t> consumer_codes = {
    {"media_play",     0x00cd},
    {"media_next",     0x00b5},
    {"media_prev",     0x00b6},
    {"media_stop",     0x00b7},
    {"media_vol_up",   0x00e9},
    {"media_vol_down", 0x00ea},
    {"media_mute",     0x00e2},
    {"media_player",   0x0183},
    {"media_email",    0x018a},
    {"media_calc",     0x0192},
    {"media_computer", 0x0194},
    {"media_search",   0x0221},
    {"media_home",     0x0223},
    {"www_back",       0x0224},
    {"www_forward",    0x0225},
    {"www_stop",       0x0226},
    {"www_refresh",    0x0227},
    {"www_favorites",  0x022a},
};

static const std::map<std::string, uint16_t> direction_codes = {
    {"dir_left",    static_cast<uint16_t>(Direction::Left)},
    {"dir_right",   static_cast<uint16_t>(Direction::Right)},
    {"dir_middle",  static_cast<uint16_t>(Direction::Middle)},
    {"dir_back",    static_cast<uint16_t>(Direction::Back)},
    {"dir_forward", static_cast<uint16_t>(Direction::Forward)},
};

static const std::map<std::string, std::string> key_aliases = {
    {"return",  "enter"},
    {"esc",     "escape"},
    {"-",       "minus"},
    {"=",       "equal"},
    {"[",       "lbracket"},
    {"]",       "rbracket"},
    {"\\",      "backslash"},
    {";",       "semicolon"},
    {"'",       "quote"},
    {"`",       "grave"},
    {",",       "comma"},
    {".",       "dot"},
    {"/",       "slash"},
    {"ctrl",    "ctrl_l"},
    {"shift",   "shift_l"},
    {"alt",     "alt_l"},
    {"super",   "super_l"},
    {"meta",    "super_l"},
    {"meta_l",  "super_l"},
    {"meta_r",  "super_r"},
    {"favorites", "www_favorites"},
};

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

// Split a string by a delimiter
static std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::istringstream ss(s);
    std::string part;
    while (std::getline(ss, part, delim))
        if (!part.empty()) parts.push_back(part);
    return parts;
}

// Convert a string to lowercase
static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return s;
}

// Whole-string unsigned number; base 0 accepts a 0x prefix.
static bool parse_uint(const std::string& s, int base, unsigned long max, unsigned long& out) {
    if (s.empty() || s[0] == '-' || s[0] == '+') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long v = std::strtoul(s.c_str(), &end, base);
    if (errno != 0 || end != s.c_str() + s.size() || v > max) return false;
    out = v;
    return true;
}

static bool is_decimal(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c){ return std::isdigit(c); });
}

static std::string hex16(uint16_t v) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(v > 0xFF ? 4 : 2) << std::setfill('0') << v;
    return ss.str();
}

template <typename T>
static bool lookup(const std::map<std::string, T>& table, const std::string& name, T& out) {
    auto it = table.find(name);
    if (it == table.end()) return false;
    out = it->second;
    return true;
}

template <typename T>
static const std::string* reverse_lookup(const std::map<std::string, T>& table, T value) {
    for (auto& [name, v] : table)
        if (v == value) return &name;
    return nullptr;
}

// -----------------------------------------------------------------------
// Button actions
// -----------------------------------------------------------------------

bool parse_action(const std::string& text, ButtonAction& out) {
    std::string action = to_lower(text);

    auto alias = action_aliases.find(action);
    if (alias != action_aliases.end()) action = alias->second;

    ActionType type;
    if (lookup(simple_actions, action, type)) {
        out = ButtonAction::simple(type);
        return true;
    }

    // Parameterised actions: "fire:I:R", "macro:N", "dpi_lock:S"
    auto parts = split(action, ':');
    unsigned long a = 0, b = 0;

    if (parts.size() == 3 && parts[0] == "fire") {
        if (!parse_uint(parts[1], 10, 0xFF, a) || !parse_uint(parts[2], 10, 0xFF, b))
            return false;
        out = ButtonAction::fire_key(static_cast<uint8_t>(a), static_cast<uint8_t>(b));
        return true;
    }
    if (parts.size() == 2 && parts[0] == "macro") {
        if (!parse_uint(parts[1], 10, NUM_MACRO_SLOTS, a) || a == 0) return false;
        out = ButtonAction::macro(static_cast<uint8_t>(a - 1));
        return true;
    }
    if (parts.size() == 2 && parts[0] == "dpi_lock") {
        if (!parse_uint(parts[1], 0, 0xFF, a)) return false;
        out = ButtonAction::dpi_lock(static_cast<uint8_t>(a));
        return true;
    }

    return false;
}

std::string format_action(const ButtonAction& action) {
    switch (action.type) {
        case ActionType::FireKey:
            return "fire:" + std::to_string(action.interval) + ":" +
                   std::to_string(action.repeat);
        case ActionType::Macro:
            return "macro:" + std::to_string(action.macro_index + 1);
        case ActionType::DpiLock:
            return "dpi_lock:" + std::to_string(action.dpi_step);
        default:
            break;
    }

    const std::string* name = reverse_lookup(simple_actions, action.type);
    return name ? *name : "disabled";
}

// -----------------------------------------------------------------------
// Keys
// -----------------------------------------------------------------------

bool parse_key(const std::string& text, KeyKind& kind, uint16_t& code) {
    std::string key = to_lower(text);

    auto alias = key_aliases.find(key);
    if (alias != key_aliases.end()) key = alias->second;

    if (lookup(key_codes, key, code))       { kind = KeyKind::Hid;       return true; }
    if (lookup(modifier_bits, key, code))   { kind = KeyKind::Modifier;  return true; }
    if (lookup(consumer_codes, key, code))  { kind = KeyKind::Consumer;  return true; }
    if (lookup(direction_codes, key, code)) { kind = KeyKind::Direction; return true; }

    // Raw "kind:0xNNNN"
    size_t colon = key.find(':');
    if (colon == std::string::npos) return false;

    std::string prefix = key.substr(0, colon);
    std::string value  = key.substr(colon + 1);
    if (value.compare(0, 2, "0x") != 0) return false;

    unsigned long v = 0;
    if (!parse_uint(value, 16, 0xFFFF, v)) return false;

    if      (prefix == "hid") kind = KeyKind::Hid;
    else if (prefix == "mod") kind = KeyKind::Modifier;
    else if (prefix == "cc")  kind = KeyKind::Consumer;
    else if (prefix == "dir") kind = KeyKind::Direction;
    else return false;

    code = static_cast<uint16_t>(v);
    return true;
}

std::string format_key(KeyKind kind, uint16_t code) {
    const std::string* name = nullptr;
    const char* prefix = "hid";

    switch (kind) {
        case KeyKind::Hid:
            name = reverse_lookup(key_codes, code);
            prefix = "hid";
            break;
        case KeyKind::Modifier:
            name = reverse_lookup(modifier_bits, code);
            prefix = "mod";
            break;
        case KeyKind::Consumer:
            name = reverse_lookup(consumer_codes, code);
            prefix = "cc";
            break;
        case KeyKind::Direction:
            name = reverse_lookup(direction_codes, code);
            prefix = "dir";
            break;
    }

    if (name) return *name;
    return std::string(prefix) + ":" + hex16(code);
}

// -----------------------------------------------------------------------
// Key / macro event tokens
// -----------------------------------------------------------------------

bool parse_key_event(const std::string& token, KeyEvent& out) {
    if (token.size() < 2) return false;

    KeyEvent e;
    if      (token[0] == '+') e.state = KeyState::Pressed;
    else if (token[0] == '-') e.state = KeyState::Released;
    else return false;

    if (!parse_key(token.substr(1), e.kind, e.code)) return false;
    out = e;
    return true;
}

std::string format_key_event(const KeyEvent& event) {
    char sign = event.state == KeyState::Released ? '-' : '+';
    return sign + format_key(event.kind, event.code);
}

bool parse_macro_event(const std::string& token, MacroEvent& out) {
    MacroEvent e;

    // The delay is the last ":NNN" group; raw key names carry a 0x value.
    size_t colon = token.rfind(':');
    if (colon != std::string::npos && is_decimal(token.substr(colon + 1))) {
        unsigned long delay = 0;
        if (!parse_uint(token.substr(colon + 1), 10, 0xFFFF, delay)) return false;
        e.delay_ms = static_cast<uint16_t>(delay);
        if (!parse_key_event(token.substr(0, colon), e.key)) return false;
    } else {
        if (!parse_key_event(token, e.key)) return false;
    }

    out = e;
    return true;
}

std::string format_macro_event(const MacroEvent& event) {
    return format_key_event(event.key) + ":" + std::to_string(event.delay_ms);
}

// -----------------------------------------------------------------------
// --list-actions
// -----------------------------------------------------------------------

static void print_columns(const std::map<std::string, uint16_t>& table) {
    std::cout << "  ";
    int col = 0;
    for (auto& [name, _] : table) {
        std::cout << name;
        if (++col % 10 == 0) std::cout << "\n  ";
        else std::cout << " ";
    }
    std::cout << "\n";
}

void list_actions() {
    std::cout << "Button actions:\n";
    for (auto& [name, _] : simple_actions)
        std::cout << "  " << name << "\n";
    std::cout << "  fire:INTERVAL:REPEAT  (interval " << int(FIRE_INTERVAL_MIN)
              << "-255, repeat 0-" << int(FIRE_REPEAT_MAX) << ")\n"
              << "  macro:N               (N 1-" << NUM_MACRO_SLOTS << ")\n"
              << "  dpi_lock:STEP         (step " << int(DPI_STEP_MIN) << "-"
              << int(DPI_STEP_MAX) << ")\n";

    std::cout << "\nModifier keys:\n";
    print_columns(modifier_bits);

    std::cout << "\nKeyboard keys:\n";
    print_columns(key_codes);

    std::cout << "\nConsumer keys:\n";
    print_columns(consumer_codes);

    std::cout << "\nDirections:\n";
    print_columns(direction_codes);

    std::cout << "\nRaw keys: hid:0x04, mod:0x05, cc:0x0183, dir:0x10\n";

    std::cout << "\nExample key combo / macro:\n"
              << "  combo1 = +ctrl_l +c -c -ctrl_l\n"
              << "  macro1 = +a:20 -a:50 +b:20 -b:0\n";
}
