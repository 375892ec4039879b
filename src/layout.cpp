#include "layout.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "errors.h"
#include "fields.h"
#include "macros.h"

// Table order must match FieldId and tile the profile without gaps.
static constexpr bool layout_is_contiguous() {
    uint16_t next = 0;
    for (size_t i = 0; i < NUM_FIELDS; ++i) {
        if (static_cast<size_t>(PROFILE_LAYOUT[i].id) != i) return false;
        if (PROFILE_LAYOUT[i].offset != next) return false;
        next = PROFILE_LAYOUT[i].end();
    }
    return next == PROFILE_SIZE;
}

static_assert(layout_is_contiguous(), "profile layout must cover 0x0000-0x1AFF exactly");
static_assert(PROFILE_LAYOUT[static_cast<size_t>(FieldId::KeyCombos)].offset == SETTINGS_SIZE,
              "settings area is 256 bytes");

const FieldSpan& field_span(FieldId id) {
    return PROFILE_LAYOUT[static_cast<size_t>(id)];
}

uint16_t field_offset(FieldId id, int index) {
    const FieldSpan& f = field_span(id);
    if (index < 0 || index >= f.count)
        throw OutOfRange(std::string(f.name) + " slot", index);
    return f.slot(index);
}

// -----------------------------------------------------------------------
// Internal helpers
// -----------------------------------------------------------------------

static std::string slot_name(const FieldSpan& f, int index) {
    if (f.count == 1) return f.name;
    return std::string(f.name) + "[" + std::to_string(index) + "]";
}

// Run one field's codec; tag any error with where it happened.
template <typename Fn>
static void at_slot(const FieldSpan& f, int index, Fn&& fn) {
    try {
        fn(slot_name(f, index), f.slot(index));
    } catch (LamzuError& e) {
        e.set_location(slot_name(f, index), f.slot(index));
        throw;
    }
}

// Decode a slot that may never have been initialised. Anything that does
// not decode, or does not re-encode to the same bytes, is kept verbatim.
template <typename T, size_t W, typename Decode, typename Encode>
static Slot<T, W> decode_lenient(const uint8_t* src, Decode&& decode, Encode&& encode) {
    try {
        T value = decode(src);
        Bytes again = encode(value);
        if (std::equal(again.begin(), again.end(), src))
            return Slot<T, W>(value);
    } catch (const LamzuError&) {
        // falls through to the stored bytes
    }
    return Slot<T, W>::undecoded(src);
}

// A slot in use (preset below dpi_count, wired button) must hold a value.
template <typename T, size_t W, typename Encode>
static Bytes encode_slot(const Slot<T, W>& slot, bool in_use, const std::string& name,
                         Encode&& encode) {
    if (slot.value) return encode(*slot.value);
    if (in_use)
        throw LamzuError(name + " is in use but holds no decodable value");
    return Bytes(slot.raw.begin(), slot.raw.end());
}

template <size_t N>
static void load_opaque(std::array<uint8_t, N>& dst, const ProfileBlob& blob, uint16_t off) {
    std::copy(blob.begin() + off, blob.begin() + off + N, dst.begin());
}

template <size_t N>
static Bytes store_opaque(const std::array<uint8_t, N>& src) {
    return Bytes(src.begin(), src.end());
}

// -----------------------------------------------------------------------
// Decode
// -----------------------------------------------------------------------

Profile profile_from_bytes(const ProfileBlob& blob) {
    Profile p;

    for (const FieldSpan& f : PROFILE_LAYOUT) {
        for (int i = 0; i < f.count; ++i) {
            at_slot(f, i, [&](const std::string& name, uint16_t off) {
                const uint8_t* src = &blob[off];

                switch (f.id) {
                case FieldId::ReportRate:      p.report_rate = decode_report_rate(src); break;
                case FieldId::DpiCount:
                    p.dpi_count = decode_ranged(src, 1, NUM_DPI_PRESETS, name);
                    break;
                case FieldId::DpiIndex:
                    p.dpi_index = decode_ranged(src, 0, NUM_DPI_PRESETS - 1, name);
                    break;
                case FieldId::Unknown0006:     load_opaque(p.unknown_0006, blob, off); break;
                case FieldId::LiftOffDistance: p.lift_off_distance = decode_lift_off(src); break;
                case FieldId::DpiPresets:
                    if (i < p.dpi_count)
                        p.dpi_presets[i] = decode_dpi_preset(src, name);
                    else
                        p.dpi_presets[i] = decode_lenient<DpiPreset, GROUP_WIDTH>(
                            src, [&](const uint8_t* s) { return decode_dpi_preset(s, name); },
                            encode_dpi_preset);
                    break;
                case FieldId::DpiColors:
                    if (i < p.dpi_count)
                        p.dpi_colors[i] = decode_color(src, name);
                    else
                        p.dpi_colors[i] = decode_lenient<Color, GROUP_WIDTH>(
                            src, [&](const uint8_t* s) { return decode_color(s, name); },
                            encode_color);
                    break;
                case FieldId::ChargingColor:   p.charging_color = decode_color(src, name); break;
                case FieldId::Unknown0050:     load_opaque(p.unknown_0050, blob, off); break;
                case FieldId::Buttons:
                    if (i < NUM_MAPPED_BUTTONS)
                        p.buttons[i] = decode_button_action(src, name);
                    else
                        p.buttons[i] = decode_lenient<ButtonAction, GROUP_WIDTH>(
                            src, [&](const uint8_t* s) { return decode_button_action(s, name); },
                            encode_button_action);
                    break;
                case FieldId::Unknown00A0:     load_opaque(p.unknown_00a0, blob, off); break;
                case FieldId::Debounce:
                    p.debounce_ms = decode_ranged(src, 0, DEBOUNCE_MAX_MS, name);
                    break;
                case FieldId::MotionSync:      p.motion_sync = decode_flag(src, name); break;
                case FieldId::Unknown00AD:     load_opaque(p.unknown_00ad, blob, off); break;
                case FieldId::AngleSnapping:   p.angle_snapping = decode_flag(src, name); break;
                case FieldId::RippleControl:   p.ripple_control = decode_flag(src, name); break;
                case FieldId::Unknown00B3:     load_opaque(p.unknown_00b3, blob, off); break;
                case FieldId::PeakPerformance: p.peak_performance = decode_flag(src, name); break;
                case FieldId::PeakPerformanceTime:
                    p.peak_performance_time = decode_peak_time(src);
                    break;
                case FieldId::PerformanceMode: p.performance_mode = decode_flag(src, name); break;
                case FieldId::Unknown00BB:     load_opaque(p.unknown_00bb, blob, off); break;
                case FieldId::KeyCombos:
                    p.combos[i] = decode_lenient<KeyCombo, COMBO_SLOT_SIZE>(
                        src, decode_key_combo, encode_key_combo);
                    break;
                case FieldId::Macros:
                    p.macros[i] = decode_lenient<Macro, MACRO_SLOT_SIZE>(
                        src, decode_macro, encode_macro);
                    break;
                }
            });
        }
    }

    return p;
}

// -----------------------------------------------------------------------
// Encode
// -----------------------------------------------------------------------

ProfileBlob profile_to_bytes(const Profile& p) {
    ProfileBlob blob{};

    for (const FieldSpan& f : PROFILE_LAYOUT) {
        for (int i = 0; i < f.count; ++i) {
            at_slot(f, i, [&](const std::string& name, uint16_t off) {
                Bytes b;

                switch (f.id) {
                case FieldId::ReportRate:      b = encode_report_rate(p.report_rate); break;
                case FieldId::DpiCount:
                    b = encode_ranged(p.dpi_count, 1, NUM_DPI_PRESETS, name);
                    break;
                case FieldId::DpiIndex:
                    b = encode_ranged(p.dpi_index, 0, NUM_DPI_PRESETS - 1, name);
                    break;
                case FieldId::Unknown0006:     b = store_opaque(p.unknown_0006); break;
                case FieldId::LiftOffDistance: b = encode_lift_off(p.lift_off_distance); break;
                case FieldId::DpiPresets:      b = encode_slot(p.dpi_presets[i], i < p.dpi_count, name, encode_dpi_preset); break;
                case FieldId::DpiColors:       b = encode_slot(p.dpi_colors[i], i < p.dpi_count, name, encode_color); break;
                case FieldId::ChargingColor:   b = encode_color(p.charging_color); break;
                case FieldId::Unknown0050:     b = store_opaque(p.unknown_0050); break;
                case FieldId::Buttons:         b = encode_slot(p.buttons[i], i < NUM_MAPPED_BUTTONS, name, encode_button_action); break;
                case FieldId::Unknown00A0:     b = store_opaque(p.unknown_00a0); break;
                case FieldId::Debounce:
                    b = encode_ranged(p.debounce_ms, 0, DEBOUNCE_MAX_MS, name);
                    break;
                case FieldId::MotionSync:      b = encode_flag(p.motion_sync); break;
                case FieldId::Unknown00AD:     b = store_opaque(p.unknown_00ad); break;
                case FieldId::AngleSnapping:   b = encode_flag(p.angle_snapping); break;
                case FieldId::RippleControl:   b = encode_flag(p.ripple_control); break;
                case FieldId::Unknown00B3:     b = store_opaque(p.unknown_00b3); break;
                case FieldId::PeakPerformance: b = encode_flag(p.peak_performance); break;
                case FieldId::PeakPerformanceTime:
                    b = encode_peak_time(p.peak_performance_time);
                    break;
                case FieldId::PerformanceMode: b = encode_flag(p.performance_mode); break;
                case FieldId::Unknown00BB:     b = store_opaque(p.unknown_00bb); break;
                case FieldId::KeyCombos:       b = encode_slot(p.combos[i], false, name, encode_key_combo); break;
                case FieldId::Macros:          b = encode_slot(p.macros[i], false, name, encode_macro); break;
                }

                if (b.size() != f.width)
                    throw std::logic_error("encoder for " + name + " produced " +
                                           std::to_string(b.size()) + " bytes, slot is " +
                                           std::to_string(f.width));
                std::copy(b.begin(), b.end(), blob.begin() + off);
            });
        }
    }

    return blob;
}

// -----------------------------------------------------------------------
// Partial update
// -----------------------------------------------------------------------

template <typename T>
static void overlay(T& dst, const std::optional<T>& src) {
    if (src) dst = *src;
}

template <typename T, size_t W>
static void overlay(Slot<T, W>& dst, const std::optional<T>& src) {
    if (src) dst = *src;
}

template <typename D, typename T, size_t N>
static void overlay(std::array<D, N>& dst, const std::array<std::optional<T>, N>& src) {
    for (size_t i = 0; i < N; ++i)
        overlay(dst[i], src[i]);
}

Profile merge(const Profile& base, const PartialProfile& patch) {
    Profile p = base;

    overlay(p.report_rate,           patch.report_rate);
    overlay(p.dpi_count,             patch.dpi_count);
    overlay(p.dpi_index,             patch.dpi_index);
    overlay(p.lift_off_distance,     patch.lift_off_distance);
    overlay(p.dpi_presets,           patch.dpi_presets);
    overlay(p.dpi_colors,            patch.dpi_colors);
    overlay(p.charging_color,        patch.charging_color);
    overlay(p.buttons,               patch.buttons);
    overlay(p.debounce_ms,           patch.debounce_ms);
    overlay(p.motion_sync,           patch.motion_sync);
    overlay(p.angle_snapping,        patch.angle_snapping);
    overlay(p.ripple_control,        patch.ripple_control);
    overlay(p.peak_performance,      patch.peak_performance);
    overlay(p.peak_performance_time, patch.peak_performance_time);
    overlay(p.performance_mode,      patch.performance_mode);
    overlay(p.combos,                patch.combos);
    overlay(p.macros,                patch.macros);

    return p;
}
