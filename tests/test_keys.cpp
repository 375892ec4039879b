#include <gtest/gtest.h>

#include <string>

#include "keys.h"

// ═══════════════════════════════════════════════════════════════════════════
// Button actions
// ═══════════════════════════════════════════════════════════════════════════

TEST(KeysTest, SimpleActionNames) {
  ButtonAction a;
  ASSERT_TRUE(parse_action("left", a));
  EXPECT_EQ(a, ButtonAction::simple(ActionType::LeftClick));

  ASSERT_TRUE(parse_action("DPI+", a));
  EXPECT_EQ(a, ButtonAction::simple(ActionType::DpiUp));

  ASSERT_TRUE(parse_action("poll_rate_loop", a));
  EXPECT_EQ(a, ButtonAction::simple(ActionType::PollRateLoop));

  ASSERT_TRUE(parse_action("scroll_up", a));
  EXPECT_EQ(a, ButtonAction::simple(ActionType::ScrollUp));
}

TEST(KeysTest, ActionAliases) {
  ButtonAction a;
  ASSERT_TRUE(parse_action("backward", a));
  EXPECT_EQ(a, ButtonAction::simple(ActionType::BackClick));

  ASSERT_TRUE(parse_action("none", a));
  EXPECT_EQ(a, ButtonAction::simple(ActionType::Disabled));
}

TEST(KeysTest, ParameterisedActions) {
  ButtonAction a;
  ASSERT_TRUE(parse_action("fire:40:2", a));
  EXPECT_EQ(a, ButtonAction::fire_key(40, 2));

  ASSERT_TRUE(parse_action("macro:1", a));
  EXPECT_EQ(a, ButtonAction::macro(0));

  ASSERT_TRUE(parse_action("macro:16", a));
  EXPECT_EQ(a, ButtonAction::macro(15));

  ASSERT_TRUE(parse_action("dpi_lock:0x17", a));
  EXPECT_EQ(a, ButtonAction::dpi_lock(0x17));
}

TEST(KeysTest, MalformedActions) {
  ButtonAction a;
  EXPECT_FALSE(parse_action("jump", a));
  EXPECT_FALSE(parse_action("macro:0", a));
  EXPECT_FALSE(parse_action("macro:17", a));
  EXPECT_FALSE(parse_action("macro:x", a));
  EXPECT_FALSE(parse_action("fire:40", a));
  EXPECT_FALSE(parse_action("fire:-1:2", a));
  EXPECT_FALSE(parse_action("fire:300:1", a));
}

TEST(KeysTest, FormatActionIsParseable) {
  EXPECT_EQ(format_action(ButtonAction::simple(ActionType::DpiLoop)), "dpi-loop");
  EXPECT_EQ(format_action(ButtonAction::fire_key(10, 3)), "fire:10:3");
  EXPECT_EQ(format_action(ButtonAction::macro(4)), "macro:5");
  EXPECT_EQ(format_action(ButtonAction::dpi_lock(7)), "dpi_lock:7");

  ButtonAction a;
  ASSERT_TRUE(parse_action(format_action(ButtonAction::macro(4)), a));
  EXPECT_EQ(a, ButtonAction::macro(4));
}

// ═══════════════════════════════════════════════════════════════════════════
// Keys
// ═══════════════════════════════════════════════════════════════════════════

TEST(KeysTest, KeyTables) {
  KeyKind  kind;
  uint16_t code;

  ASSERT_TRUE(parse_key("a", kind, code));
  EXPECT_EQ(kind, KeyKind::Hid);
  EXPECT_EQ(code, 0x04);

  ASSERT_TRUE(parse_key("Ctrl", kind, code));
  EXPECT_EQ(kind, KeyKind::Modifier);
  EXPECT_EQ(code, 0x01);

  ASSERT_TRUE(parse_key("media_player", kind, code));
  EXPECT_EQ(kind, KeyKind::Consumer);
  EXPECT_EQ(code, 0x0183);

  ASSERT_TRUE(parse_key("dir_forward", kind, code));
  EXPECT_EQ(kind, KeyKind::Direction);
  EXPECT_EQ(code, 0x10);

  ASSERT_TRUE(parse_key("esc", kind, code));
  EXPECT_EQ(code, 0x29);
}

TEST(KeysTest, RawKeys) {
  KeyKind  kind;
  uint16_t code;

  ASSERT_TRUE(parse_key("mod:0x05", kind, code));
  EXPECT_EQ(kind, KeyKind::Modifier);
  EXPECT_EQ(code, 0x05);

  ASSERT_TRUE(parse_key("cc:0x0123", kind, code));
  EXPECT_EQ(kind, KeyKind::Consumer);
  EXPECT_EQ(code, 0x0123);

  EXPECT_FALSE(parse_key("hid:04", kind, code)) << "hex prefix is required";
  EXPECT_FALSE(parse_key("foo:0x04", kind, code));
  EXPECT_FALSE(parse_key("hid:0x10000", kind, code));
  EXPECT_FALSE(parse_key("nosuchkey", kind, code));
}

TEST(KeysTest, FormatKeyFallsBackToRaw) {
  EXPECT_EQ(format_key(KeyKind::Hid, 0x28), "enter");
  EXPECT_EQ(format_key(KeyKind::Modifier, 0x05), "mod:0x05");
  EXPECT_EQ(format_key(KeyKind::Consumer, 0x0123), "cc:0x0123");
}

// ═══════════════════════════════════════════════════════════════════════════
// Event tokens
// ═══════════════════════════════════════════════════════════════════════════

TEST(KeysTest, KeyEventTokens) {
  KeyEvent e;
  ASSERT_TRUE(parse_key_event("+shift_l", e));
  EXPECT_EQ(e.state, KeyState::Pressed);
  EXPECT_EQ(e.kind, KeyKind::Modifier);
  EXPECT_EQ(e.code, 0x02);

  ASSERT_TRUE(parse_key_event("--", e));
  EXPECT_EQ(e.state, KeyState::Released);
  EXPECT_EQ(e.code, 0x2d) << "minus";

  EXPECT_FALSE(parse_key_event("a", e));
  EXPECT_FALSE(parse_key_event("+", e));
  EXPECT_EQ(format_key_event({KeyState::Released, KeyKind::Hid, 0x06}), "-c");
}

TEST(KeysTest, MacroEventDelay) {
  MacroEvent e;
  ASSERT_TRUE(parse_macro_event("+a:20", e));
  EXPECT_EQ(e.key.code, 0x04);
  EXPECT_EQ(e.delay_ms, 20);

  ASSERT_TRUE(parse_macro_event("-hid:0x04", e));
  EXPECT_EQ(e.key.state, KeyState::Released);
  EXPECT_EQ(e.delay_ms, 0);

  ASSERT_TRUE(parse_macro_event("+hid:0x05:300", e));
  EXPECT_EQ(e.key.code, 0x05);
  EXPECT_EQ(e.delay_ms, 300);

  EXPECT_FALSE(parse_macro_event("+a:70000", e));
  EXPECT_EQ(format_macro_event({{KeyState::Pressed, KeyKind::Hid, 0x04}, 20}), "+a:20");
}
