#include "fields.h"

#include <initializer_list>
#include <string>
#include <utility>

#include "checksum.h"
#include "errors.h"

// Action type bytes (first byte of a button action).
static constexpr uint8_t ACT_DISABLED   = 0x00;
static constexpr uint8_t ACT_BUTTON     = 0x01;
static constexpr uint8_t ACT_DPI        = 0x02;
static constexpr uint8_t ACT_HSCROLL    = 0x03;
static constexpr uint8_t ACT_FIRE       = 0x04;
static constexpr uint8_t ACT_COMBO      = 0x05;
static constexpr uint8_t ACT_MACRO      = 0x06;
static constexpr uint8_t ACT_POLL_LOOP  = 0x07;
static constexpr uint8_t ACT_DPI_LOCK   = 0x0a;
static constexpr uint8_t ACT_VSCROLL    = 0x0b;

// Button ids used with ACT_BUTTON.
static constexpr uint8_t BTN_LEFT    = 0x01;
static constexpr uint8_t BTN_RIGHT   = 0x02;
static constexpr uint8_t BTN_MIDDLE  = 0x04;
static constexpr uint8_t BTN_BACK    = 0x08;
static constexpr uint8_t BTN_FORWARD = 0x10;

// -----------------------------------------------------------------------
// Checksum framing
// -----------------------------------------------------------------------

Bytes append_checksum(const Bytes& data) {
    Bytes out = data;
    out.push_back(compute_checksum(data, CHECKSUM_SEED_SETTING));
    return out;
}

Bytes strip_checksum(const uint8_t* src, uint16_t width, const std::string& field) {
    uint16_t len      = static_cast<uint16_t>(width - 1);
    uint8_t  expected = compute_checksum(src, len, CHECKSUM_SEED_SETTING);
    if (expected != src[len])
        throw ChecksumMismatch(field, expected, src[len]);
    return Bytes(src, src + len);
}

// -----------------------------------------------------------------------
// Scalars
// -----------------------------------------------------------------------

Bytes encode_u8(uint8_t value) {
    return append_checksum({value});
}

uint8_t decode_u8(const uint8_t* src, const std::string& field) {
    return strip_checksum(src, SCALAR_WIDTH, field)[0];
}

Bytes encode_ranged(uint8_t value, uint8_t lo, uint8_t hi, const std::string& field) {
    if (value < lo || value > hi)
        throw OutOfRange(field, value);
    return encode_u8(value);
}

uint8_t decode_ranged(const uint8_t* src, uint8_t lo, uint8_t hi, const std::string& field) {
    uint8_t v = decode_u8(src, field);
    if (v < lo || v > hi)
        throw OutOfRange(field, v);
    return v;
}

Bytes encode_flag(bool value) {
    return encode_u8(value ? 1 : 0);
}

bool decode_flag(const uint8_t* src, const std::string& field) {
    return decode_ranged(src, 0, 1, field) == 1;
}

Bytes encode_report_rate(ReportRate rate) {
    uint8_t mask = static_cast<uint8_t>(rate);
    if (report_rate_hz(rate) == 0)
        throw OutOfRange("report_rate", mask);
    return encode_u8(mask);
}

ReportRate decode_report_rate(const uint8_t* src) {
    uint8_t mask = decode_u8(src, "report_rate");
    ReportRate rate = static_cast<ReportRate>(mask);
    if (report_rate_hz(rate) == 0)
        throw OutOfRange("report_rate", mask);
    return rate;
}

Bytes encode_lift_off(uint8_t distance) {
    return encode_ranged(distance, 1, 2, "lift_off_distance");
}

uint8_t decode_lift_off(const uint8_t* src) {
    return decode_ranged(src, 1, 2, "lift_off_distance");
}

Bytes encode_peak_time(uint16_t seconds) {
    if (seconds % 10 != 0 || seconds > 2550)
        throw OutOfRange("peak_performance_time", seconds);
    return encode_u8(static_cast<uint8_t>(seconds / 10));
}

uint16_t decode_peak_time(const uint8_t* src) {
    return static_cast<uint16_t>(decode_u8(src, "peak_performance_time") * 10);
}

// -----------------------------------------------------------------------
// DPI
// -----------------------------------------------------------------------

uint8_t dpi_to_raw(uint16_t dpi) {
    if (dpi < DPI_MIN || dpi > DPI_MAX || dpi % DPI_STEP != 0)
        throw OutOfRange("dpi", dpi);
    return static_cast<uint8_t>(dpi / DPI_STEP - 1);
}

uint16_t dpi_from_raw(uint8_t raw) {
    return static_cast<uint16_t>((raw + 1) * DPI_STEP);
}

Bytes encode_dpi_preset(const DpiPreset& dpi) {
    return append_checksum({dpi_to_raw(dpi.x), dpi_to_raw(dpi.y), dpi.reserved});
}

DpiPreset decode_dpi_preset(const uint8_t* src, const std::string& field) {
    Bytes d = strip_checksum(src, GROUP_WIDTH, field);
    DpiPreset dpi;
    dpi.x        = dpi_from_raw(d[0]);
    dpi.y        = dpi_from_raw(d[1]);
    dpi.reserved = d[2];
    return dpi;
}

// -----------------------------------------------------------------------
// Colors
// -----------------------------------------------------------------------

Bytes encode_color(const Color& color) {
    return append_checksum({color.red, color.green, color.blue});
}

Color decode_color(const uint8_t* src, const std::string& field) {
    Bytes d = strip_checksum(src, GROUP_WIDTH, field);
    Color c;
    c.red   = d[0];
    c.green = d[1];
    c.blue  = d[2];
    return c;
}

// -----------------------------------------------------------------------
// Button actions
// -----------------------------------------------------------------------

Bytes encode_button_action(const ButtonAction& action) {
    uint8_t b[3] = {0, 0, 0};

    switch (action.type) {
        case ActionType::Disabled:     b[0] = ACT_DISABLED;                   break;
        case ActionType::LeftClick:    b[0] = ACT_BUTTON;  b[1] = BTN_LEFT;    break;
        case ActionType::RightClick:   b[0] = ACT_BUTTON;  b[1] = BTN_RIGHT;   break;
        case ActionType::MiddleClick:  b[0] = ACT_BUTTON;  b[1] = BTN_MIDDLE;  break;
        case ActionType::BackClick:    b[0] = ACT_BUTTON;  b[1] = BTN_BACK;    break;
        case ActionType::ForwardClick: b[0] = ACT_BUTTON;  b[1] = BTN_FORWARD; break;
        case ActionType::DpiLoop:      b[0] = ACT_DPI;     b[1] = 0x01;        break;
        case ActionType::DpiUp:        b[0] = ACT_DPI;     b[1] = 0x02;        break;
        case ActionType::DpiDown:      b[0] = ACT_DPI;     b[1] = 0x03;        break;
        case ActionType::ScrollLeft:   b[0] = ACT_HSCROLL; b[1] = 0x01;        break;
        case ActionType::ScrollRight:  b[0] = ACT_HSCROLL; b[1] = 0x02;        break;
        case ActionType::ScrollUp:     b[0] = ACT_VSCROLL; b[1] = 0x01;        break;
        case ActionType::ScrollDown:   b[0] = ACT_VSCROLL; b[1] = 0x02;        break;
        case ActionType::KeyCombo:     b[0] = ACT_COMBO;                      break;
        case ActionType::PollRateLoop: b[0] = ACT_POLL_LOOP;                  break;

        case ActionType::FireKey:
            if (action.interval < FIRE_INTERVAL_MIN)
                throw OutOfRange("fire interval", action.interval);
            if (action.repeat > FIRE_REPEAT_MAX)
                throw OutOfRange("fire repeat", action.repeat);
            b[0] = ACT_FIRE;
            b[1] = action.interval;
            b[2] = action.repeat;
            break;

        case ActionType::Macro:
            if (action.macro_index >= NUM_MACRO_SLOTS)
                throw OutOfRange("macro index", action.macro_index);
            b[0] = ACT_MACRO;
            b[1] = action.macro_index;
            break;

        case ActionType::DpiLock:
            if (action.dpi_step < DPI_STEP_MIN || action.dpi_step > DPI_STEP_MAX)
                throw OutOfRange("dpi lock step", action.dpi_step);
            b[0] = ACT_DPI_LOCK;
            b[1] = action.dpi_step;
            break;

        default:
            throw OutOfRange("action type", static_cast<long>(action.type));
    }

    return append_checksum({b[0], b[1], b[2]});
}

// Bytes an action type does not use must be zero.
static void check_unused(const Bytes& d, size_t used, const std::string& field) {
    for (size_t i = used; i < d.size(); ++i)
        if (d[i] != 0) throw OutOfRange(field + " unused byte " + std::to_string(i), d[i]);
}

// Pick one of two or three sub-actions keyed by the second byte.
static ButtonAction sub_action(uint8_t sub, const std::string& field,
                               std::initializer_list<std::pair<uint8_t, ActionType>> table) {
    for (auto& [code, type] : table)
        if (code == sub) return ButtonAction::simple(type);
    throw OutOfRange(field + " sub-action", sub);
}

ButtonAction decode_button_action(const uint8_t* src, const std::string& field) {
    Bytes d = strip_checksum(src, GROUP_WIDTH, field);

    switch (d[0]) {
        case ACT_DISABLED:
        case ACT_COMBO:
        case ACT_POLL_LOOP:
            check_unused(d, 1, field);
            break;
        case ACT_BUTTON:
        case ACT_DPI:
        case ACT_HSCROLL:
        case ACT_VSCROLL:
        case ACT_MACRO:
        case ACT_DPI_LOCK:
            check_unused(d, 2, field);
            break;
        default:
            break;
    }

    switch (d[0]) {
        case ACT_DISABLED:
            return ButtonAction::simple(ActionType::Disabled);

        case ACT_BUTTON:
            return sub_action(d[1], field, {
                {BTN_LEFT,    ActionType::LeftClick},
                {BTN_RIGHT,   ActionType::RightClick},
                {BTN_MIDDLE,  ActionType::MiddleClick},
                {BTN_BACK,    ActionType::BackClick},
                {BTN_FORWARD, ActionType::ForwardClick},
            });

        case ACT_DPI:
            return sub_action(d[1], field, {
                {0x01, ActionType::DpiLoop},
                {0x02, ActionType::DpiUp},
                {0x03, ActionType::DpiDown},
            });

        case ACT_HSCROLL:
            return sub_action(d[1], field, {
                {0x01, ActionType::ScrollLeft},
                {0x02, ActionType::ScrollRight},
            });

        case ACT_VSCROLL:
            return sub_action(d[1], field, {
                {0x01, ActionType::ScrollUp},
                {0x02, ActionType::ScrollDown},
            });

        case ACT_FIRE:
            if (d[1] < FIRE_INTERVAL_MIN)
                throw OutOfRange(field + " fire interval", d[1]);
            if (d[2] > FIRE_REPEAT_MAX)
                throw OutOfRange(field + " fire repeat", d[2]);
            return ButtonAction::fire_key(d[1], d[2]);

        case ACT_COMBO:
            return ButtonAction::simple(ActionType::KeyCombo);

        case ACT_MACRO:
            if (d[1] >= NUM_MACRO_SLOTS)
                throw OutOfRange(field + " macro index", d[1]);
            return ButtonAction::macro(d[1]);

        case ACT_POLL_LOOP:
            return ButtonAction::simple(ActionType::PollRateLoop);

        case ACT_DPI_LOCK:
            if (d[1] < DPI_STEP_MIN || d[1] > DPI_STEP_MAX)
                throw OutOfRange(field + " dpi lock step", d[1]);
            return ButtonAction::dpi_lock(d[1]);

        default:
            throw OutOfRange(field + " action type", d[0]);
    }
}
