#pragma once

#include <cstdint>

#include "data.h"

// -----------------------------------------------------------------------
// Key combo / macro codecs
//
// Key event (3 bytes):
//   [flags][data lo][data hi]
//   flags bit 7 = press, bit 6 = release (exactly one)
//   flags bits 0-2 select the meaning of data (at most one set):
//     0x00 modifier mask, 0x01 HID usage, 0x02 consumer usage,
//     0x04 direction mask
//
// Macro event (5 bytes):  key event + delay in ms, big-endian
//
// Key combo slot (32 bytes):
//   [count][6 x key event][cksum][12 x pad]
//
// Macro slot (384 bytes):
//   [name len][30 x name][count][70 x macro event][cksum][pad]
//
// Both checksums use seed 181 and cover everything in front of them,
// unused event slots included (those are zero).
// -----------------------------------------------------------------------

static constexpr int KEY_EVENT_SIZE   = 3;
static constexpr int MACRO_EVENT_SIZE = 5;

// Flags byte for a key event. Throws InvalidFlags if state or kind is not
// one of the defined values.
uint8_t key_event_flags(KeyState state, KeyKind kind);

// Split a flags byte into state and kind. Throws InvalidFlags for an
// ambiguous or unknown combination.
void split_key_event_flags(uint8_t flags, KeyState& state, KeyKind& kind);

void     encode_key_event(const KeyEvent& event, uint8_t* dst);
KeyEvent decode_key_event(const uint8_t* src);

void       encode_macro_event(const MacroEvent& event, uint8_t* dst);
MacroEvent decode_macro_event(const uint8_t* src);

// Exactly COMBO_SLOT_SIZE bytes.
Bytes    encode_key_combo(const KeyCombo& combo);
KeyCombo decode_key_combo(const uint8_t* src);

// Exactly MACRO_SLOT_SIZE bytes. Names longer than 30 bytes are truncated.
Bytes encode_macro(const Macro& macro);
Macro decode_macro(const uint8_t* src);
