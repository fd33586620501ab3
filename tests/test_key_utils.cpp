// test_key_utils.cpp
// Unit tests for key naming: canonical names and mouse button names.
//
// These tests use Google Test and exercise:
//  - uniqueness of the canonical names returned by keyToString
//  - the spellings the label normalizer keys off
//  - mouse button names, including the raw-code fallback
//
// To run these tests enable KEYCAST_BUILD_TESTS=ON when configuring the
// project.

#include <gtest/gtest.h>

#include <keycast/input/key.hpp>
#include <keycast/log.hpp>

#include <string>
#include <unordered_set>

using namespace keycast::input;

TEST(KeyUtilsTest, CanonicalNamesAreUnique) {
  KEYCAST_LOG_INFO("test_key_utils: uniqueness start");
  std::unordered_set<std::string> seen;
  int canonicalCount = 0;

  for (unsigned i = 0; i <= 255u; ++i) {
    Key k = static_cast<Key>(i);
    std::string name = keyToString(k);
    if (name == "Unknown")
      continue;

    ++canonicalCount;
    EXPECT_FALSE(name.empty());
    auto [it, inserted] = seen.emplace(name);
    EXPECT_TRUE(inserted) << "Canonical name '" << name << "' is duplicated";
  }

  EXPECT_GT(canonicalCount, 100);
}

TEST(KeyUtilsTest, CanonicalNamesMatchLabelTables) {
  // The normalizer keys off these spellings.
  EXPECT_EQ(keyToString(Key::Num1), "1");
  EXPECT_EQ(keyToString(Key::CtrlLeft), "ControlLeft");
  EXPECT_EQ(keyToString(Key::CtrlRight), "ControlRight");
  EXPECT_EQ(keyToString(Key::AltLeft), "Alt");
  EXPECT_EQ(keyToString(Key::AltRight), "AltGr");
  EXPECT_EQ(keyToString(Key::SuperLeft), "MetaLeft");
  EXPECT_EQ(keyToString(Key::Backslash), "BackSlash");
  EXPECT_EQ(keyToString(Key::Semicolon), "SemiColon");
  EXPECT_EQ(keyToString(Key::F24), "F24");
  EXPECT_EQ(keyToString(static_cast<Key>(250)), "Unknown");
}

TEST(KeyUtilsTest, MouseButtonNames) {
  EXPECT_EQ(mouseButtonName(MouseButton::Left), "MouseLeft");
  EXPECT_EQ(mouseButtonName(MouseButton::Right), "MouseRight");
  EXPECT_EQ(mouseButtonName(MouseButton::Middle), "MouseMiddle");
  EXPECT_EQ(mouseButtonName(MouseButton::Side), "MouseSide");
  EXPECT_EQ(mouseButtonName(MouseButton::Extra), "MouseExtra");
  EXPECT_EQ(mouseButtonName(MouseButton::Unknown, 0x118), "MouseUnknown(280)");
}

TEST(KeyUtilsTest, ShiftKeys) {
  EXPECT_TRUE(isShiftKey(Key::ShiftLeft));
  EXPECT_TRUE(isShiftKey(Key::ShiftRight));
  EXPECT_FALSE(isShiftKey(Key::CtrlLeft));
  EXPECT_FALSE(isShiftKey(Key::Unknown));
}
