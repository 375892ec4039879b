#pragma once

#include <array>
#include <cstdint>

#include "data.h"

// -----------------------------------------------------------------------
// Profile offset table
//
// Each entry covers `count` consecutive slots of `width` bytes starting at
// `offset`. The table is ordered by offset, has no gaps and ends exactly
// at PROFILE_SIZE (checked at compile time in layout.cpp).
// -----------------------------------------------------------------------

enum class FieldId : uint8_t {
    ReportRate,
    DpiCount,
    DpiIndex,
    Unknown0006,
    LiftOffDistance,
    DpiPresets,
    DpiColors,
    ChargingColor,
    Unknown0050,
    Buttons,
    Unknown00A0,
    Debounce,
    MotionSync,
    Unknown00AD,
    AngleSnapping,
    RippleControl,
    Unknown00B3,
    PeakPerformance,
    PeakPerformanceTime,
    PerformanceMode,
    Unknown00BB,
    KeyCombos,
    Macros,
};

struct FieldSpan {
    FieldId     id;
    const char* name;
    uint16_t    offset;
    uint16_t    width;   // bytes per slot, checksum included
    uint8_t     count;   // number of slots

    constexpr uint16_t size() const { return static_cast<uint16_t>(width * count); }
    constexpr uint16_t end() const { return static_cast<uint16_t>(offset + size()); }
    constexpr uint16_t slot(int index) const {
        return static_cast<uint16_t>(offset + index * width);
    }
};

static constexpr size_t NUM_FIELDS = 23;

static constexpr std::array<FieldSpan, NUM_FIELDS> PROFILE_LAYOUT = {{
    {FieldId::ReportRate,          "report_rate",           0x0000,   2,  1},
    {FieldId::DpiCount,            "dpi_count",             0x0002,   2,  1},
    {FieldId::DpiIndex,            "dpi_index",             0x0004,   2,  1},
    {FieldId::Unknown0006,         "unknown_0006",          0x0006,   4,  1},
    {FieldId::LiftOffDistance,     "lift_off_distance",     0x000a,   2,  1},
    {FieldId::DpiPresets,          "dpi_presets",           0x000c,   4,  NUM_DPI_PRESETS},
    {FieldId::DpiColors,           "dpi_colors",            0x002c,   4,  NUM_DPI_PRESETS},
    {FieldId::ChargingColor,       "charging_color",        0x004c,   4,  1},
    {FieldId::Unknown0050,         "unknown_0050",          0x0050,  16,  1},
    {FieldId::Buttons,             "buttons",               0x0060,   4,  NUM_BUTTONS},
    {FieldId::Unknown00A0,         "unknown_00a0",          0x00a0,   9,  1},
    {FieldId::Debounce,            "debounce_ms",           0x00a9,   2,  1},
    {FieldId::MotionSync,          "motion_sync",           0x00ab,   2,  1},
    {FieldId::Unknown00AD,         "unknown_00ad",          0x00ad,   2,  1},
    {FieldId::AngleSnapping,       "angle_snapping",        0x00af,   2,  1},
    {FieldId::RippleControl,       "ripple_control",        0x00b1,   2,  1},
    {FieldId::Unknown00B3,         "unknown_00b3",          0x00b3,   2,  1},
    {FieldId::PeakPerformance,     "peak_performance",      0x00b5,   2,  1},
    {FieldId::PeakPerformanceTime, "peak_performance_time", 0x00b7,   2,  1},
    {FieldId::PerformanceMode,     "performance_mode",      0x00b9,   2,  1},
    {FieldId::Unknown00BB,         "unknown_00bb",          0x00bb,  69,  1},
    {FieldId::KeyCombos,           "combos",                COMBO_BASE, COMBO_SLOT_SIZE, NUM_COMBO_SLOTS},
    {FieldId::Macros,              "macros",                MACRO_BASE, MACRO_SLOT_SIZE, NUM_MACRO_SLOTS},
}};

static constexpr uint8_t DEBOUNCE_MAX_MS = 15;

const FieldSpan& field_span(FieldId id);

// Offset of slot `index` of `id`.
uint16_t field_offset(FieldId id, int index = 0);

// -----------------------------------------------------------------------
// Profile <-> blob
// -----------------------------------------------------------------------

// Decode every field in offset order. Stops at the first failing field;
// the thrown LamzuError carries the field name and offset.
Profile profile_from_bytes(const ProfileBlob& blob);

// Encode every field. Throws OutOfRange / CountOutOfRange / InvalidFlags
// (with location) for values that cannot be represented.
ProfileBlob profile_to_bytes(const Profile& profile);

// Overlay the engaged fields of `patch` on `base`. Everything else,
// unknown ranges included, is copied from `base` unchanged.
Profile merge(const Profile& base, const PartialProfile& patch);
