#include <gtest/gtest.h>

#include <vector>

#include "errors.h"
#include "fields.h"

// Setting bytes with a valid seed-171 checksum appended.
static Bytes setting(Bytes data) {
  return append_checksum(data);
}

// ═══════════════════════════════════════════════════════════════════════════
// Scalars
// ═══════════════════════════════════════════════════════════════════════════

TEST(FieldsTest, ScalarCarriesTrailingChecksum) {
  Bytes b = encode_u8(5);
  ASSERT_EQ(b.size(), SCALAR_WIDTH);
  EXPECT_EQ(b[0], 5);
  EXPECT_EQ(b[1], 0xFF - (171 + 5));
}

TEST(FieldsTest, ScalarChecksumMismatch) {
  Bytes b = encode_u8(3);
  b[1] ^= 0x01;
  EXPECT_THROW(decode_u8(b.data(), "x"), ChecksumMismatch);
}

TEST(FieldsTest, RangedRejectsOutsideBounds) {
  EXPECT_THROW(encode_ranged(9, 1, 8, "dpi_count"), OutOfRange);
  EXPECT_THROW(encode_ranged(0, 1, 8, "dpi_count"), OutOfRange);

  Bytes b = setting({9});
  EXPECT_THROW(decode_ranged(b.data(), 1, 8, "dpi_count"), OutOfRange);
}

TEST(FieldsTest, FlagAcceptsOnlyZeroOrOne) {
  Bytes on = encode_flag(true);
  EXPECT_TRUE(decode_flag(on.data(), "motion_sync"));
  EXPECT_FALSE(decode_flag(encode_flag(false).data(), "motion_sync"));

  Bytes two = setting({2});
  EXPECT_THROW(decode_flag(two.data(), "motion_sync"), OutOfRange);
}

TEST(FieldsTest, ReportRateMask) {
  Bytes b = encode_report_rate(ReportRate::Hz500);
  EXPECT_EQ(b[0], 0x02);
  EXPECT_EQ(decode_report_rate(b.data()), ReportRate::Hz500);

  Bytes bad = setting({0x03});
  EXPECT_THROW(decode_report_rate(bad.data()), OutOfRange);

  ReportRate r;
  EXPECT_TRUE(report_rate_from_hz(125, r));
  EXPECT_EQ(r, ReportRate::Hz125);
  EXPECT_FALSE(report_rate_from_hz(750, r));
  EXPECT_EQ(report_rate_hz(ReportRate::Hz1000), 1000);
}

TEST(FieldsTest, LiftOffDistance) {
  EXPECT_EQ(decode_lift_off(encode_lift_off(2).data()), 2);
  EXPECT_THROW(encode_lift_off(0), OutOfRange);
  EXPECT_THROW(encode_lift_off(3), OutOfRange);
}

TEST(FieldsTest, PeakTimeStoredInTensOfSeconds) {
  Bytes b = encode_peak_time(60);
  EXPECT_EQ(b[0], 6);
  EXPECT_EQ(decode_peak_time(b.data()), 60);

  EXPECT_THROW(encode_peak_time(65), OutOfRange);
  EXPECT_THROW(encode_peak_time(2560), OutOfRange);
  EXPECT_NO_THROW(encode_peak_time(2550));
}

// ═══════════════════════════════════════════════════════════════════════════
// DPI / color groups
// ═══════════════════════════════════════════════════════════════════════════

TEST(FieldsTest, DpiRawZeroIs50) {
  EXPECT_EQ(dpi_from_raw(0), 50);
  EXPECT_EQ(dpi_from_raw(2), 150);
  EXPECT_EQ(dpi_from_raw(255), 12800);
  EXPECT_EQ(dpi_to_raw(50), 0);
  EXPECT_EQ(dpi_to_raw(150), 2);
  EXPECT_EQ(dpi_to_raw(12800), 255);
}

TEST(FieldsTest, DpiOutsideGridIsRejected) {
  EXPECT_THROW(dpi_to_raw(0), OutOfRange);
  EXPECT_THROW(dpi_to_raw(825), OutOfRange);
  EXPECT_THROW(dpi_to_raw(12850), OutOfRange);
}

TEST(FieldsTest, DpiPresetLayout) {
  DpiPreset dpi{800, 1600, 7};
  Bytes b = encode_dpi_preset(dpi);

  ASSERT_EQ(b.size(), GROUP_WIDTH);
  EXPECT_EQ(b[0], 15);
  EXPECT_EQ(b[1], 31);
  EXPECT_EQ(b[2], 7) << "reserved byte carried verbatim";
  EXPECT_EQ(b[3], 0xFF - (171 + 15 + 31 + 7));

  EXPECT_EQ(decode_dpi_preset(b.data(), "dpi"), dpi);
}

TEST(FieldsTest, ColorChecksumMismatch) {
  Color c{0x10, 0x20, 0x30};
  Bytes b = encode_color(c);
  EXPECT_EQ(decode_color(b.data(), "color"), c);

  b[0] = 0x11;
  EXPECT_THROW(decode_color(b.data(), "color"), ChecksumMismatch);
}

// ═══════════════════════════════════════════════════════════════════════════
// Button actions
// ═══════════════════════════════════════════════════════════════════════════

TEST(FieldsTest, ButtonActionBytes) {
  EXPECT_EQ(encode_button_action(ButtonAction::simple(ActionType::Disabled)),
            setting({0x00, 0x00, 0x00}));
  EXPECT_EQ(encode_button_action(ButtonAction::simple(ActionType::ForwardClick)),
            setting({0x01, 0x10, 0x00}));
  EXPECT_EQ(encode_button_action(ButtonAction::simple(ActionType::DpiDown)),
            setting({0x02, 0x03, 0x00}));
  EXPECT_EQ(encode_button_action(ButtonAction::simple(ActionType::ScrollRight)),
            setting({0x03, 0x02, 0x00}));
  EXPECT_EQ(encode_button_action(ButtonAction::fire_key(50, 2)),
            setting({0x04, 50, 2}));
  EXPECT_EQ(encode_button_action(ButtonAction::simple(ActionType::KeyCombo)),
            setting({0x05, 0x00, 0x00}));
  EXPECT_EQ(encode_button_action(ButtonAction::macro(15)),
            setting({0x06, 15, 0x00}));
  EXPECT_EQ(encode_button_action(ButtonAction::simple(ActionType::PollRateLoop)),
            setting({0x07, 0x00, 0x00}));
  EXPECT_EQ(encode_button_action(ButtonAction::dpi_lock(0x17)),
            setting({0x0a, 0x17, 0x00}));
  EXPECT_EQ(encode_button_action(ButtonAction::simple(ActionType::ScrollUp)),
            setting({0x0b, 0x01, 0x00}));
}

TEST(FieldsTest, ButtonActionDecodesEveryVariant) {
  std::vector<ButtonAction> actions = {
      ButtonAction::simple(ActionType::LeftClick),
      ButtonAction::simple(ActionType::RightClick),
      ButtonAction::simple(ActionType::MiddleClick),
      ButtonAction::simple(ActionType::BackClick),
      ButtonAction::simple(ActionType::DpiLoop),
      ButtonAction::simple(ActionType::DpiUp),
      ButtonAction::simple(ActionType::ScrollLeft),
      ButtonAction::simple(ActionType::ScrollDown),
      ButtonAction::fire_key(10, 0),
      ButtonAction::macro(0),
      ButtonAction::dpi_lock(1),
  };
  for (const ButtonAction& a : actions) {
    Bytes b = encode_button_action(a);
    EXPECT_EQ(decode_button_action(b.data(), "button"), a);
  }
}

TEST(FieldsTest, ButtonActionParameterLimits) {
  EXPECT_THROW(encode_button_action(ButtonAction::fire_key(9, 0)), OutOfRange);
  EXPECT_THROW(encode_button_action(ButtonAction::fire_key(10, 4)), OutOfRange);
  EXPECT_THROW(encode_button_action(ButtonAction::macro(16)), OutOfRange);
  EXPECT_THROW(encode_button_action(ButtonAction::dpi_lock(0)), OutOfRange);
  EXPECT_THROW(encode_button_action(ButtonAction::dpi_lock(0x18)), OutOfRange);
}

TEST(FieldsTest, ButtonActionUnknownBytes) {
  Bytes bad_id = setting({0x01, 0x03, 0x00});
  EXPECT_THROW(decode_button_action(bad_id.data(), "button"), OutOfRange);

  Bytes bad_type = setting({0x09, 0x00, 0x00});
  EXPECT_THROW(decode_button_action(bad_type.data(), "button"), OutOfRange);

  Bytes slow_fire = setting({0x04, 5, 1});
  EXPECT_THROW(decode_button_action(slow_fire.data(), "button"), OutOfRange);
}

TEST(FieldsTest, ButtonActionUnusedBytesMustBeZero) {
  for (const Bytes& data : {Bytes{0x00, 0x01, 0x00}, Bytes{0x00, 0x00, 0x01},
                            Bytes{0x01, 0x01, 0x05}, Bytes{0x05, 0x01, 0x00},
                            Bytes{0x06, 0x02, 0x01}, Bytes{0x07, 0x00, 0x02},
                            Bytes{0x0a, 0x17, 0x01}}) {
    Bytes b = setting(data);
    EXPECT_THROW(decode_button_action(b.data(), "button"), OutOfRange)
        << int(data[0]) << " " << int(data[1]) << " " << int(data[2]);
  }

  Bytes fire = setting({0x04, 10, 3});
  EXPECT_EQ(decode_button_action(fire.data(), "button"), ButtonAction::fire_key(10, 3));
}
