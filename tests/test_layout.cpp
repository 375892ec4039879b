#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "errors.h"
#include "fields.h"
#include "layout.h"
#include "macros.h"

static void put(ProfileBlob& blob, uint16_t offset, const Bytes& bytes) {
  std::copy(bytes.begin(), bytes.end(), blob.begin() + offset);
}

static Profile sample_profile() {
  Profile p;
  p.report_rate       = ReportRate::Hz250;
  p.dpi_count         = 4;
  p.dpi_index         = 2;
  p.lift_off_distance = 2;
  p.dpi_presets[0]    = DpiPreset{400, 400, 0};
  p.dpi_presets[1]    = DpiPreset{1600, 3200, 0};
  p.dpi_colors[1]     = Color{0xff, 0x00, 0x80};
  p.charging_color    = {0x00, 0xff, 0x00};
  p.buttons[0]        = ButtonAction::simple(ActionType::LeftClick);
  p.buttons[4]        = ButtonAction::fire_key(20, 3);
  p.buttons[5]        = ButtonAction::simple(ActionType::KeyCombo);
  p.buttons[6]        = ButtonAction::macro(3);
  p.debounce_ms       = 4;
  p.motion_sync       = true;
  p.ripple_control    = true;
  p.peak_performance  = true;
  p.peak_performance_time = 120;

  KeyEvent down{KeyState::Pressed, KeyKind::Hid, 0x04};
  KeyEvent up{KeyState::Released, KeyKind::Hid, 0x04};
  p.combos[5] = KeyCombo{{down, up}};
  p.macros[3] = Macro{"tap", {{down, 15}, {up, 0}}};
  return p;
}

// ═══════════════════════════════════════════════════════════════════════════
// Offset table
// ═══════════════════════════════════════════════════════════════════════════

TEST(LayoutTest, KnownOffsets) {
  EXPECT_EQ(field_offset(FieldId::ReportRate), 0x0000);
  EXPECT_EQ(field_offset(FieldId::LiftOffDistance), 0x000a);
  EXPECT_EQ(field_offset(FieldId::DpiPresets, 1), 0x0010);
  EXPECT_EQ(field_offset(FieldId::ChargingColor), 0x004c);
  EXPECT_EQ(field_offset(FieldId::Buttons, 3), 0x006c);
  EXPECT_EQ(field_offset(FieldId::Debounce), 0x00a9);
  EXPECT_EQ(field_offset(FieldId::KeyCombos, 1), 0x0120);
  EXPECT_EQ(field_offset(FieldId::Macros, 0), 0x0300);
  EXPECT_EQ(field_offset(FieldId::Macros, 15), 0x1980);
}

TEST(LayoutTest, SlotIndexOutOfRange) {
  EXPECT_THROW(field_offset(FieldId::DpiPresets, 8), OutOfRange);
  EXPECT_THROW(field_offset(FieldId::Debounce, 1), OutOfRange);
  EXPECT_THROW(field_offset(FieldId::Buttons, -1), OutOfRange);
}

TEST(LayoutTest, TableEndsAtProfileSize) {
  EXPECT_EQ(PROFILE_LAYOUT.back().end(), PROFILE_SIZE);
  EXPECT_STREQ(field_span(FieldId::KeyCombos).name, "combos");
}

// ═══════════════════════════════════════════════════════════════════════════
// Profile <-> blob
// ═══════════════════════════════════════════════════════════════════════════

TEST(LayoutTest, DefaultProfileEncodes) {
  ProfileBlob blob = profile_to_bytes(Profile{});
  EXPECT_EQ(blob[0], 0x01) << "1000 Hz";
  EXPECT_EQ(profile_from_bytes(blob), Profile{});
}

TEST(LayoutTest, ProfileSurvivesBlob) {
  Profile p = sample_profile();
  ProfileBlob blob = profile_to_bytes(p);

  EXPECT_EQ(blob[0x0000], 0x04) << "250 Hz mask";
  EXPECT_EQ(blob[0x0011], 63) << "dpi_presets[1].y raw";
  EXPECT_EQ(blob[0x0070], 0x04) << "buttons[4] fire";
  EXPECT_EQ(blob[0x01a0], 2) << "combos[5] count";
  EXPECT_EQ(blob[0x0780], 3) << "macros[3] name length";

  EXPECT_EQ(profile_from_bytes(blob), p);
}

TEST(LayoutTest, UnknownRangesAreKept) {
  ProfileBlob blob = profile_to_bytes(Profile{});
  blob[0x0050] = 0xAB;
  blob[0x00a5] = 0x11;
  blob[0x00ff] = 0x5A;

  Profile p = profile_from_bytes(blob);
  EXPECT_EQ(p.unknown_0050[0], 0xAB);
  EXPECT_EQ(p.unknown_00a0[5], 0x11);
  EXPECT_EQ(p.unknown_00bb.back(), 0x5A);

  EXPECT_EQ(profile_to_bytes(p), blob);
}

TEST(LayoutTest, DecodeErrorCarriesLocation) {
  ProfileBlob blob = profile_to_bytes(Profile{});
  blob[0x0068 + 1] ^= 0x01;   // buttons[2], no longer matches its checksum

  try {
    profile_from_bytes(blob);
    FAIL() << "expected ChecksumMismatch";
  } catch (const ChecksumMismatch& e) {
    ASSERT_TRUE(e.has_location());
    EXPECT_EQ(e.field(), "buttons[2]");
    EXPECT_EQ(e.offset(), 0x0068);
  }
}

TEST(LayoutTest, FirstFailingFieldWins) {
  ProfileBlob blob = profile_to_bytes(Profile{});
  put(blob, field_offset(FieldId::Debounce), append_checksum({16}));
  put(blob, field_offset(FieldId::DpiCount), append_checksum({0}));

  try {
    profile_from_bytes(blob);
    FAIL() << "expected OutOfRange";
  } catch (const OutOfRange& e) {
    EXPECT_EQ(e.field(), "dpi_count");
    EXPECT_EQ(e.offset(), 0x0002);
    EXPECT_EQ(e.value(), 0);
  }
}

TEST(LayoutTest, ZeroedBlobIsRejected) {
  ProfileBlob blob{};
  EXPECT_THROW(profile_from_bytes(blob), LamzuError);
}

TEST(LayoutTest, CorruptMacroSlotIsKeptVerbatim) {
  ProfileBlob blob = profile_to_bytes(Profile{});
  blob[field_offset(FieldId::Macros, 7) + MAX_MACRO_NAME + 1] = 71;

  Profile p = profile_from_bytes(blob);
  EXPECT_FALSE(p.macros[7].decoded());
  EXPECT_EQ(p.macros[7].raw[MAX_MACRO_NAME + 1], 71);
  EXPECT_TRUE(p.macros[6].decoded());
  EXPECT_EQ(profile_to_bytes(p), blob);
}

// Slots the firmware never initialised: presets past dpi_count, unwired
// buttons, unused combo and macro slots.
static ProfileBlob blob_with_zeroed_slots() {
  Profile p = sample_profile();
  p.dpi_count = 2;
  ProfileBlob blob = profile_to_bytes(p);

  for (int i = 2; i < NUM_DPI_PRESETS; ++i) {
    std::fill_n(blob.begin() + field_offset(FieldId::DpiPresets, i), GROUP_WIDTH, 0);
    std::fill_n(blob.begin() + field_offset(FieldId::DpiColors, i), GROUP_WIDTH, 0);
  }
  std::fill_n(blob.begin() + field_offset(FieldId::Buttons, 10), GROUP_WIDTH, 0);
  std::fill_n(blob.begin() + field_offset(FieldId::KeyCombos, 15), COMBO_SLOT_SIZE, 0);
  std::fill_n(blob.begin() + field_offset(FieldId::Macros, 15), MACRO_SLOT_SIZE, 0);
  return blob;
}

TEST(LayoutTest, UninitialisedSlotsAreKeptVerbatim) {
  ProfileBlob blob = blob_with_zeroed_slots();

  Profile p = profile_from_bytes(blob);
  EXPECT_EQ(p.dpi_count, 2);
  EXPECT_EQ(p.dpi_presets[1], (DpiPreset{1600, 3200, 0}));
  for (int i = 2; i < NUM_DPI_PRESETS; ++i) {
    EXPECT_FALSE(p.dpi_presets[i].decoded()) << "preset " << i;
    EXPECT_FALSE(p.dpi_colors[i].decoded()) << "color " << i;
  }
  EXPECT_FALSE(p.buttons[10].decoded());
  EXPECT_TRUE(p.buttons[9].decoded());
  EXPECT_FALSE(p.combos[15].decoded());
  EXPECT_TRUE(p.combos[5].decoded());
  EXPECT_FALSE(p.macros[15].decoded());
  EXPECT_EQ(p.macros[3].value->name, "tap");

  EXPECT_EQ(profile_to_bytes(p), blob);
}

TEST(LayoutTest, ValidBytesPastDpiCountStillDecode) {
  Profile p = sample_profile();
  p.dpi_count = 1;
  Profile out = profile_from_bytes(profile_to_bytes(p));
  EXPECT_EQ(out.dpi_presets[1], (DpiPreset{1600, 3200, 0}));
  EXPECT_EQ(out, p);
}

TEST(LayoutTest, UnwiredButtonWithStrayBytesIsKeptVerbatim) {
  ProfileBlob blob = profile_to_bytes(Profile{});
  put(blob, field_offset(FieldId::Buttons, 12), append_checksum({0x01, 0x01, 0x05}));

  Profile p = profile_from_bytes(blob);
  EXPECT_FALSE(p.buttons[12].decoded());
  EXPECT_EQ(profile_to_bytes(p), blob);

  put(blob, field_offset(FieldId::Buttons, 0), append_checksum({0x01, 0x01, 0x05}));
  EXPECT_THROW(profile_from_bytes(blob), OutOfRange);
}

TEST(LayoutTest, ActiveSlotsStayStrict) {
  ProfileBlob blob = blob_with_zeroed_slots();
  std::fill_n(blob.begin() + field_offset(FieldId::DpiPresets, 1), GROUP_WIDTH, 0);
  try {
    profile_from_bytes(blob);
    FAIL() << "expected ChecksumMismatch";
  } catch (const ChecksumMismatch& e) {
    EXPECT_EQ(e.field(), "dpi_presets[1]");
  }

  blob = blob_with_zeroed_slots();
  std::fill_n(blob.begin() + field_offset(FieldId::Buttons, NUM_MAPPED_BUTTONS - 1),
              GROUP_WIDTH, 0);
  try {
    profile_from_bytes(blob);
    FAIL() << "expected ChecksumMismatch";
  } catch (const ChecksumMismatch& e) {
    EXPECT_EQ(e.field(), "buttons[5]");
    EXPECT_EQ(e.offset(), 0x0074);
  }
}

TEST(LayoutTest, PatchReplacesUndecodedSlot) {
  Profile base = profile_from_bytes(blob_with_zeroed_slots());

  PartialProfile patch;
  patch.combos[15] = KeyCombo{};
  patch.buttons[10] = ButtonAction::simple(ActionType::MiddleClick);

  Profile out = merge(base, patch);
  EXPECT_TRUE(out.combos[15].decoded());
  EXPECT_EQ(out.buttons[10], ButtonAction::simple(ActionType::MiddleClick));
  EXPECT_FALSE(out.macros[15].decoded());
  EXPECT_EQ(profile_from_bytes(profile_to_bytes(out)), out);
}

TEST(LayoutTest, RaisingDpiCountOverUndecodedSlotIsRejected) {
  Profile base = profile_from_bytes(blob_with_zeroed_slots());

  PartialProfile patch;
  patch.dpi_count = 3;
  try {
    profile_to_bytes(merge(base, patch));
    FAIL() << "expected LamzuError";
  } catch (const LamzuError& e) {
    EXPECT_EQ(e.field(), "dpi_presets[2]");
  }

  patch.dpi_presets[2] = DpiPreset{1200, 1200, 0};
  patch.dpi_colors[2]  = Color{0x00, 0x00, 0xff};
  Profile out = profile_from_bytes(profile_to_bytes(merge(base, patch)));
  EXPECT_EQ(out.dpi_count, 3);
  EXPECT_EQ(out.dpi_presets[2], (DpiPreset{1200, 1200, 0}));
}

TEST(LayoutTest, EncodeErrorCarriesLocation) {
  Profile p;
  p.dpi_presets[3] = DpiPreset{825, 800, 0};

  try {
    profile_to_bytes(p);
    FAIL() << "expected OutOfRange";
  } catch (const OutOfRange& e) {
    EXPECT_EQ(e.field(), "dpi_presets[3]");
    EXPECT_EQ(e.offset(), 0x0018);
  }
}

TEST(LayoutTest, EncodeRejectsBadScalars) {
  Profile p;
  p.debounce_ms = DEBOUNCE_MAX_MS + 1;
  EXPECT_THROW(profile_to_bytes(p), OutOfRange);

  p = Profile{};
  p.dpi_count = 9;
  EXPECT_THROW(profile_to_bytes(p), OutOfRange);

  p = Profile{};
  p.combos[0] = KeyCombo{std::vector<KeyEvent>(MAX_COMBO_EVENTS + 1)};
  EXPECT_THROW(profile_to_bytes(p), CountOutOfRange);
}

// ═══════════════════════════════════════════════════════════════════════════
// Merge
// ═══════════════════════════════════════════════════════════════════════════

TEST(LayoutTest, EmptyPatchChangesNothing) {
  Profile base = sample_profile();
  PartialProfile patch;
  EXPECT_TRUE(patch.empty());
  EXPECT_EQ(merge(base, patch), base);
}

TEST(LayoutTest, PatchOverlaysOnlyEngagedFields) {
  Profile base = sample_profile();
  base.unknown_0050[3] = 0x77;

  PartialProfile patch;
  patch.dpi_index      = 0;
  patch.buttons[4]     = ButtonAction::simple(ActionType::Disabled);
  patch.macros[3]      = Macro{};
  patch.angle_snapping = true;
  EXPECT_FALSE(patch.empty());

  Profile out = merge(base, patch);
  EXPECT_EQ(out.dpi_index, 0);
  EXPECT_EQ(out.buttons[4], ButtonAction::simple(ActionType::Disabled));
  ASSERT_TRUE(out.macros[3].decoded());
  EXPECT_TRUE(out.macros[3].value->events.empty());
  EXPECT_TRUE(out.angle_snapping);

  EXPECT_EQ(out.dpi_count, base.dpi_count);
  EXPECT_EQ(out.buttons[0], base.buttons[0]);
  EXPECT_EQ(out.combos[5], base.combos[5]);
  EXPECT_EQ(out.unknown_0050[3], 0x77);
}
