#include "macros.h"

#include <algorithm>

#include "checksum.h"
#include "errors.h"

static constexpr uint8_t FLAG_PRESS    = 0x80;
static constexpr uint8_t FLAG_RELEASE  = 0x40;
static constexpr uint8_t SELECTOR_MASK = 0x07;

// Combo slot offsets
static constexpr int COMBO_EVENTS   = 1;
static constexpr int COMBO_CHECKSUM = COMBO_EVENTS + MAX_COMBO_EVENTS * KEY_EVENT_SIZE;  // 19

// Macro slot offsets
static constexpr int MACRO_NAME     = 1;
static constexpr int MACRO_COUNT    = MACRO_NAME + MAX_MACRO_NAME;                       // 31
static constexpr int MACRO_EVENTS   = MACRO_COUNT + 1;                                   // 32
static constexpr int MACRO_CHECKSUM = MACRO_EVENTS + MAX_MACRO_EVENTS * MACRO_EVENT_SIZE; // 382

static_assert(COMBO_CHECKSUM + 1 + 12 == COMBO_SLOT_SIZE, "combo slot size");
static_assert(MACRO_CHECKSUM + 2 == MACRO_SLOT_SIZE, "macro slot size");

// -----------------------------------------------------------------------
// Key events
// -----------------------------------------------------------------------

static bool valid_direction(uint16_t code) {
    switch (static_cast<Direction>(code)) {
        case Direction::Left:
        case Direction::Right:
        case Direction::Middle:
        case Direction::Back:
        case Direction::Forward:
            return true;
    }
    return false;
}

uint8_t key_event_flags(KeyState state, KeyKind kind) {
    uint8_t s = static_cast<uint8_t>(state);
    uint8_t k = static_cast<uint8_t>(kind);
    if (s != FLAG_PRESS && s != FLAG_RELEASE)
        throw InvalidFlags("key event state", s);
    if (k != 0x00 && k != 0x01 && k != 0x02 && k != 0x04)
        throw InvalidFlags("key event kind", k);
    return static_cast<uint8_t>(s | k);
}

void split_key_event_flags(uint8_t flags, KeyState& state, KeyKind& kind) {
    uint8_t s = flags & (FLAG_PRESS | FLAG_RELEASE);
    uint8_t k = flags & SELECTOR_MASK;

    // Anything outside the state / selector bits is undocumented.
    if (flags & ~(FLAG_PRESS | FLAG_RELEASE | SELECTOR_MASK))
        throw InvalidFlags("key event", flags);
    if (s != FLAG_PRESS && s != FLAG_RELEASE)
        throw InvalidFlags("key event state", flags);
    // HID, consumer and direction are exclusive readings of the same data.
    if (k != 0x00 && k != 0x01 && k != 0x02 && k != 0x04)
        throw InvalidFlags("key event selector", flags);

    state = static_cast<KeyState>(s);
    kind  = static_cast<KeyKind>(k);
}

void encode_key_event(const KeyEvent& event, uint8_t* dst) {
    if (event.kind == KeyKind::Direction && !valid_direction(event.code))
        throw OutOfRange("key event direction", event.code);

    dst[0] = key_event_flags(event.state, event.kind);
    dst[1] = static_cast<uint8_t>(event.code & 0xFF);
    dst[2] = static_cast<uint8_t>(event.code >> 8);
}

KeyEvent decode_key_event(const uint8_t* src) {
    KeyEvent e;
    split_key_event_flags(src[0], e.state, e.kind);
    e.code = static_cast<uint16_t>(src[1] | (src[2] << 8));

    if (e.kind == KeyKind::Direction && !valid_direction(e.code))
        throw OutOfRange("key event direction", e.code);
    return e;
}

void encode_macro_event(const MacroEvent& event, uint8_t* dst) {
    encode_key_event(event.key, dst);
    dst[3] = static_cast<uint8_t>(event.delay_ms >> 8);
    dst[4] = static_cast<uint8_t>(event.delay_ms & 0xFF);
}

MacroEvent decode_macro_event(const uint8_t* src) {
    MacroEvent e;
    e.key      = decode_key_event(src);
    e.delay_ms = static_cast<uint16_t>((src[3] << 8) | src[4]);
    return e;
}

// -----------------------------------------------------------------------
// Key combos
// -----------------------------------------------------------------------

Bytes encode_key_combo(const KeyCombo& combo) {
    if (combo.events.size() > MAX_COMBO_EVENTS)
        throw CountOutOfRange("key combo events", static_cast<unsigned>(combo.events.size()),
                              MAX_COMBO_EVENTS);

    Bytes out(COMBO_SLOT_SIZE, 0);
    out[0] = static_cast<uint8_t>(combo.events.size());
    for (size_t i = 0; i < combo.events.size(); ++i)
        encode_key_event(combo.events[i], &out[COMBO_EVENTS + i * KEY_EVENT_SIZE]);

    out[COMBO_CHECKSUM] = compute_checksum(out.data(), COMBO_CHECKSUM, CHECKSUM_SEED_MACRO);
    return out;
}

KeyCombo decode_key_combo(const uint8_t* src) {
    uint8_t count = src[0];
    if (count > MAX_COMBO_EVENTS)
        throw CountOutOfRange("key combo events", count, MAX_COMBO_EVENTS);

    uint8_t expected = compute_checksum(src, COMBO_CHECKSUM, CHECKSUM_SEED_MACRO);
    if (expected != src[COMBO_CHECKSUM])
        throw ChecksumMismatch("key combo", expected, src[COMBO_CHECKSUM]);

    KeyCombo combo;
    combo.events.reserve(count);
    for (int i = 0; i < count; ++i)
        combo.events.push_back(decode_key_event(&src[COMBO_EVENTS + i * KEY_EVENT_SIZE]));
    return combo;
}

// -----------------------------------------------------------------------
// Macros
// -----------------------------------------------------------------------

Bytes encode_macro(const Macro& macro) {
    if (macro.events.size() > MAX_MACRO_EVENTS)
        throw CountOutOfRange("macro events", static_cast<unsigned>(macro.events.size()),
                              MAX_MACRO_EVENTS);

    Bytes out(MACRO_SLOT_SIZE, 0);

    size_t name_len = std::min<size_t>(macro.name.size(), MAX_MACRO_NAME);
    out[0] = static_cast<uint8_t>(name_len);
    for (size_t i = 0; i < name_len; ++i)
        out[MACRO_NAME + i] = static_cast<uint8_t>(macro.name[i]);

    out[MACRO_COUNT] = static_cast<uint8_t>(macro.events.size());
    for (size_t i = 0; i < macro.events.size(); ++i)
        encode_macro_event(macro.events[i], &out[MACRO_EVENTS + i * MACRO_EVENT_SIZE]);

    out[MACRO_CHECKSUM] = compute_checksum(out.data(), MACRO_CHECKSUM, CHECKSUM_SEED_MACRO);
    return out;
}

Macro decode_macro(const uint8_t* src) {
    uint8_t name_len = src[0];
    if (name_len > MAX_MACRO_NAME)
        throw CountOutOfRange("macro name", name_len, MAX_MACRO_NAME);

    uint8_t count = src[MACRO_COUNT];
    if (count > MAX_MACRO_EVENTS)
        throw CountOutOfRange("macro events", count, MAX_MACRO_EVENTS);

    uint8_t expected = compute_checksum(src, MACRO_CHECKSUM, CHECKSUM_SEED_MACRO);
    if (expected != src[MACRO_CHECKSUM])
        throw ChecksumMismatch("macro", expected, src[MACRO_CHECKSUM]);

    Macro macro;
    macro.name.assign(src + MACRO_NAME, src + MACRO_NAME + name_len);
    macro.events.reserve(count);
    for (int i = 0; i < count; ++i)
        macro.events.push_back(decode_macro_event(&src[MACRO_EVENTS + i * MACRO_EVENT_SIZE]));
    return macro;
}
