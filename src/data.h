#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// -----------------------------------------------------------------------
// Profile memory map (one profile = 0x1B00 bytes)
//
//   0x0000 - 0x00FF  settings, each followed by a seed-171 checksum
//   0x0100 - 0x02FF  16 key-combo slots, 32 bytes each
//   0x0300 - 0x1AFF  16 macro slots, 384 bytes each
//
// The exact per-field offsets live in layout.h.
// -----------------------------------------------------------------------

static constexpr uint16_t PROFILE_SIZE       = 0x1B00;
static constexpr uint16_t SETTINGS_SIZE      = 0x0100;
static constexpr uint16_t COMBO_BASE         = 0x0100;
static constexpr uint16_t COMBO_SLOT_SIZE    = 32;
static constexpr uint16_t MACRO_BASE         = 0x0300;
static constexpr uint16_t MACRO_SLOT_SIZE    = 384;
static constexpr uint16_t GROUP_WIDTH        = 4;     // DPI, color, action

static constexpr int NUM_PROFILES     = 4;
static constexpr int NUM_DPI_PRESETS  = 8;
static constexpr int NUM_BUTTONS      = 16;
static constexpr int NUM_MAPPED_BUTTONS = 6;   // wired buttons; later slots are never written
static constexpr int NUM_COMBO_SLOTS  = 16;
static constexpr int NUM_MACRO_SLOTS  = 16;

static constexpr int MAX_COMBO_EVENTS = 6;
static constexpr int MAX_MACRO_EVENTS = 70;
static constexpr int MAX_MACRO_NAME   = 30;

using ProfileBlob = std::array<uint8_t, PROFILE_SIZE>;
using Bytes       = std::vector<uint8_t>;

// Report rate is stored as a one-hot mask.
enum class ReportRate : uint8_t {
    Hz1000 = 0x01,
    Hz500  = 0x02,
    Hz250  = 0x04,
    Hz125  = 0x08,
};

uint16_t report_rate_hz(ReportRate rate);

// Returns false for anything other than 125, 250, 500, 1000.
bool report_rate_from_hz(uint16_t hz, ReportRate& out);

// -----------------------------------------------------------------------
// DPI / colors
// -----------------------------------------------------------------------

struct DpiPreset {
    uint16_t x        = 800;
    uint16_t y        = 800;
    uint8_t  reserved = 0;   // carried verbatim

    bool operator==(const DpiPreset& o) const;
    bool operator!=(const DpiPreset& o) const { return !(*this == o); }
};

struct Color {
    uint8_t red   = 0;
    uint8_t green = 0;
    uint8_t blue  = 0;

    bool operator==(const Color& o) const;
    bool operator!=(const Color& o) const { return !(*this == o); }
};

// -----------------------------------------------------------------------
// Button actions
// -----------------------------------------------------------------------

enum class ActionType : uint8_t {
    Disabled,
    LeftClick,
    RightClick,
    MiddleClick,
    BackClick,
    ForwardClick,
    DpiLoop,
    DpiUp,
    DpiDown,
    ScrollLeft,
    ScrollRight,
    FireKey,       // uses interval, repeat
    KeyCombo,      // events live in the combo slot of the same button
    Macro,         // uses macro_index
    PollRateLoop,
    DpiLock,       // uses dpi_step
    ScrollUp,
    ScrollDown,
};

static constexpr uint8_t FIRE_INTERVAL_MIN = 10;
static constexpr uint8_t FIRE_REPEAT_MAX   = 3;
static constexpr uint8_t DPI_STEP_MIN      = 1;
static constexpr uint8_t DPI_STEP_MAX      = 0x17;

// Parameters that do not belong to `type` are always zero.
struct ButtonAction {
    ActionType type        = ActionType::Disabled;
    uint8_t    interval    = 0;
    uint8_t    repeat      = 0;
    uint8_t    macro_index = 0;
    uint8_t    dpi_step    = 0;

    static ButtonAction simple(ActionType type);
    static ButtonAction fire_key(uint8_t interval, uint8_t repeat);
    static ButtonAction macro(uint8_t index);
    static ButtonAction dpi_lock(uint8_t step);

    bool operator==(const ButtonAction& o) const;
    bool operator!=(const ButtonAction& o) const { return !(*this == o); }
};

// -----------------------------------------------------------------------
// Key events, combos and macros
// -----------------------------------------------------------------------

enum class KeyState : uint8_t {
    Pressed  = 0x80,
    Released = 0x40,
};

// Selects how the 16-bit key data is interpreted.
enum class KeyKind : uint8_t {
    Modifier  = 0x00,   // HID modifier bit mask (ctrl_l = 0x01 ...)
    Hid       = 0x01,   // HID keyboard usage
    Consumer  = 0x02,   // HID consumer-control usage
    Direction = 0x04,   // pointer direction mask
};

// Direction masks accepted with KeyKind::Direction.
enum class Direction : uint16_t {
    Left    = 0x01,
    Right   = 0x02,
    Middle  = 0x04,
    Back    = 0x08,
    Forward = 0x10,
};

struct KeyEvent {
    KeyState state = KeyState::Pressed;
    KeyKind  kind  = KeyKind::Hid;
    uint16_t code  = 0;

    bool operator==(const KeyEvent& o) const;
    bool operator!=(const KeyEvent& o) const { return !(*this == o); }
};

struct MacroEvent {
    KeyEvent key;
    uint16_t delay_ms = 0;

    bool operator==(const MacroEvent& o) const;
    bool operator!=(const MacroEvent& o) const { return !(*this == o); }
};

struct KeyCombo {
    std::vector<KeyEvent> events;   // at most MAX_COMBO_EVENTS

    bool operator==(const KeyCombo& o) const { return events == o.events; }
    bool operator!=(const KeyCombo& o) const { return !(*this == o); }
};

struct Macro {
    std::string             name;     // raw bytes, at most MAX_MACRO_NAME
    std::vector<MacroEvent> events;   // at most MAX_MACRO_EVENTS

    bool operator==(const Macro& o) const;
    bool operator!=(const Macro& o) const { return !(*this == o); }
};

// -----------------------------------------------------------------------
// Slot
//
// One entry of a repeated profile field. Slots the vendor software never
// initialised (DPI presets past dpi_count, unwired buttons, unused combo
// and macro slots) may hold bytes that do not decode. Such a slot has no
// value and keeps its stored bytes in `raw`, which are written back
// unchanged. Assigning a value replaces the stored bytes.
// -----------------------------------------------------------------------

template <typename T, size_t Width>
struct Slot {
    std::optional<T>           value = T{};
    std::array<uint8_t, Width> raw{};   // only meaningful while value is empty

    Slot() = default;
    Slot(const T& v) : value(v) {}

    static Slot undecoded(const uint8_t* src) {
        Slot s;
        s.value.reset();
        std::copy(src, src + Width, s.raw.begin());
        return s;
    }

    bool decoded() const { return value.has_value(); }

    bool operator==(const Slot& o) const {
        if (value || o.value) return value == o.value;
        return raw == o.raw;
    }
    bool operator!=(const Slot& o) const { return !(*this == o); }
};

using DpiSlot    = Slot<DpiPreset, GROUP_WIDTH>;
using ColorSlot  = Slot<Color, GROUP_WIDTH>;
using ButtonSlot = Slot<ButtonAction, GROUP_WIDTH>;
using ComboSlot  = Slot<KeyCombo, COMBO_SLOT_SIZE>;
using MacroSlot  = Slot<Macro, MACRO_SLOT_SIZE>;

// -----------------------------------------------------------------------
// Profile
//
// Field order follows the byte layout. unknown_XXXX members are byte
// ranges at offset 0xXXXX whose meaning is unconfirmed; they are kept
// verbatim so a read-modify-write never changes them.
// -----------------------------------------------------------------------

struct Profile {
    ReportRate                                report_rate = ReportRate::Hz1000;
    uint8_t                                   dpi_count = 1;
    uint8_t                                   dpi_index = 0;
    std::array<uint8_t, 4>                    unknown_0006{};
    uint8_t                                   lift_off_distance = 1;
    std::array<DpiSlot, NUM_DPI_PRESETS>      dpi_presets{};
    std::array<ColorSlot, NUM_DPI_PRESETS>    dpi_colors{};
    Color                                     charging_color{};
    std::array<uint8_t, 16>                   unknown_0050{};
    std::array<ButtonSlot, NUM_BUTTONS>       buttons{};
    std::array<uint8_t, 9>                    unknown_00a0{};
    uint8_t                                   debounce_ms = 0;
    bool                                      motion_sync = false;
    std::array<uint8_t, 2>                    unknown_00ad{};
    bool                                      angle_snapping = false;
    bool                                      ripple_control = false;
    std::array<uint8_t, 2>                    unknown_00b3{};
    bool                                      peak_performance = false;
    uint16_t                                  peak_performance_time = 0;  // seconds
    bool                                      performance_mode = false;
    std::array<uint8_t, 69>                   unknown_00bb{};
    std::array<ComboSlot, NUM_COMBO_SLOTS>    combos{};
    std::array<MacroSlot, NUM_MACRO_SLOTS>    macros{};

    bool operator==(const Profile& o) const;
    bool operator!=(const Profile& o) const { return !(*this == o); }
};

// Same fields as Profile, each optional. Used for partial writes:
// only engaged members are applied on top of the device's current state.
// Unknown ranges are not part of the patch and can never be overwritten.
struct PartialProfile {
    std::optional<ReportRate>   report_rate;
    std::optional<uint8_t>      dpi_count;
    std::optional<uint8_t>      dpi_index;
    std::optional<uint8_t>      lift_off_distance;
    std::array<std::optional<DpiPreset>, NUM_DPI_PRESETS> dpi_presets{};
    std::array<std::optional<Color>, NUM_DPI_PRESETS>     dpi_colors{};
    std::optional<Color>        charging_color;
    std::array<std::optional<ButtonAction>, NUM_BUTTONS>  buttons{};
    std::optional<uint8_t>      debounce_ms;
    std::optional<bool>         motion_sync;
    std::optional<bool>         angle_snapping;
    std::optional<bool>         ripple_control;
    std::optional<bool>         peak_performance;
    std::optional<uint16_t>     peak_performance_time;
    std::optional<bool>         performance_mode;
    std::array<std::optional<KeyCombo>, NUM_COMBO_SLOTS>  combos{};
    std::array<std::optional<Macro>, NUM_MACRO_SLOTS>     macros{};

    // True if no field is engaged.
    bool empty() const;
};
