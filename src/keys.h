#pragma once

#include <cstdint>
#include <string>

#include "data.h"

// -----------------------------------------------------------------------
// Text names for button actions and key events (used by the INI format)
//
// Button actions:
//   - Clicks:      "left", "right", "middle", "back", "forward"
//   - DPI:         "dpi-loop", "dpi+", "dpi-", "dpi_lock:STEP" (STEP 1-23)
//   - Scroll:      "scroll_up", "scroll_down", "scroll_left", "scroll_right"
//   - Fire button: "fire:INTERVAL:REPEAT" (INTERVAL 10-255, REPEAT 0-3)
//   - Slots:       "combo", "macro:N" (N 1-16)
//   - Special:     "disabled", "poll_rate_loop"
//
// Keys (data of a key event):
//   - HID usages:      "a", "f5", "enter", "num7", ...
//   - Modifier bits:   "ctrl_l", "shift_r", ...
//   - Consumer usages: "media_play", "media_vol_up", ...
//   - Directions:      "dir_left", "dir_forward", ...
//   - Raw:             "hid:0x04", "mod:0x05", "cc:0x0183", "dir:0x10"
//
// Key event tokens are "+KEY" (press) and "-KEY" (release); macro events
// append ":DELAY_MS", e.g. "+ctrl_l:20".
//
// Parsers return false for anything they do not recognize. They check
// names only; value domains are enforced by the binary codecs.
// -----------------------------------------------------------------------

bool        parse_action(const std::string& text, ButtonAction& out);
std::string format_action(const ButtonAction& action);

bool        parse_key(const std::string& text, KeyKind& kind, uint16_t& code);
std::string format_key(KeyKind kind, uint16_t code);

bool        parse_key_event(const std::string& token, KeyEvent& out);
std::string format_key_event(const KeyEvent& event);

bool        parse_macro_event(const std::string& token, MacroEvent& out);
std::string format_macro_event(const MacroEvent& event);

// Print all recognized action and key names to stdout (for --list-actions)
void list_actions();
