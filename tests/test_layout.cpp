// test_layout.cpp
// Unit tests for keyboard layout detection and the shifted-label tables.
//
// Detection tests rewrite XKB_DEFAULT_LAYOUT / LC_ALL / LANG and restore them
// afterwards; the keyboard file is a temporary file, never the host's
// /etc/default/keyboard.

#include <gtest/gtest.h>

#include <keycast/input/layout.hpp>
#include <keycast/log.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unistd.h>

using namespace keycast::input;

namespace {

class EnvGuard {
public:
  explicit EnvGuard(const char *name) : m_name(name) {
    if (const char *v = std::getenv(name))
      m_saved = v;
  }
  ~EnvGuard() {
    if (m_saved)
      ::setenv(m_name, m_saved->c_str(), 1);
    else
      ::unsetenv(m_name);
  }

private:
  const char *m_name;
  std::optional<std::string> m_saved;
};

class LayoutDetectionTest : public ::testing::Test {
protected:
  void SetUp() override {
    ::unsetenv("XKB_DEFAULT_LAYOUT");
    ::unsetenv("LC_ALL");
    ::unsetenv("LC_MESSAGES");
    ::unsetenv("LANG");
    m_file = std::filesystem::temp_directory_path() /
             ("keycast_keyboard_" + std::to_string(::getpid()));
  }
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(m_file, ec);
  }

  void writeKeyboardFile(const std::string &contents) {
    std::ofstream out(m_file);
    out << contents;
  }

  EnvGuard m_xkb{"XKB_DEFAULT_LAYOUT"};
  EnvGuard m_lcAll{"LC_ALL"};
  EnvGuard m_lcMessages{"LC_MESSAGES"};
  EnvGuard m_lang{"LANG"};
  std::filesystem::path m_file;
};

} // namespace

TEST(LayoutTest, XkbNames) {
  EXPECT_EQ(layoutFromXkbName("us"), KeyboardLayout::unitedStates());
  EXPECT_EQ(layoutFromXkbName("gb"), KeyboardLayout::unitedKingdom());
  EXPECT_EQ(layoutFromXkbName("uk"), KeyboardLayout::unitedKingdom());
  EXPECT_EQ(layoutFromXkbName(" GB "), KeyboardLayout::unitedKingdom());
  // Only the primary layout of a list counts.
  EXPECT_EQ(layoutFromXkbName("gb,us"), KeyboardLayout::unitedKingdom());
  EXPECT_EQ(layoutFromXkbName("us,de"), KeyboardLayout::unitedStates());
  EXPECT_EQ(layoutFromXkbName(""), KeyboardLayout::other(0));

  KeyboardLayout de = layoutFromXkbName("de");
  EXPECT_EQ(de.kind, KeyboardLayout::Kind::Other);
  EXPECT_NE(de.id, 0);
  EXPECT_EQ(de, layoutFromXkbName("DE"));
  EXPECT_NE(de, layoutFromXkbName("fr"));
}

TEST(LayoutTest, LayoutToString) {
  EXPECT_EQ(layoutToString(KeyboardLayout::unitedStates()), "us");
  EXPECT_EQ(layoutToString(KeyboardLayout::unitedKingdom()), "gb");
  EXPECT_EQ(layoutToString(KeyboardLayout::other(7)), "other(7)");
}

TEST(LayoutTest, UsDigitRow) {
  const KeyboardLayout us = KeyboardLayout::unitedStates();
  const char *expected[] = {")", "!", "@", "#", "$", "%", "^", "&", "*", "("};
  for (int i = 0; i <= 9; ++i) {
    Key k = static_cast<Key>(static_cast<int>(Key::Num0) + i);
    EXPECT_EQ(resolveShiftedLabel(k, us), expected[i]) << "digit " << i;
  }
}

TEST(LayoutTest, UkDigitRow) {
  const KeyboardLayout uk = KeyboardLayout::unitedKingdom();
  EXPECT_EQ(resolveShiftedLabel(Key::Num1, uk), "!");
  EXPECT_EQ(resolveShiftedLabel(Key::Num2, uk), "\"");
  EXPECT_EQ(resolveShiftedLabel(Key::Num3, uk), "£");
  EXPECT_EQ(resolveShiftedLabel(Key::Num4, uk), "$");
  EXPECT_EQ(resolveShiftedLabel(Key::Num0, uk), ")");
}

TEST(LayoutTest, ShiftedPunctuation) {
  const KeyboardLayout us = KeyboardLayout::unitedStates();
  const KeyboardLayout uk = KeyboardLayout::unitedKingdom();
  EXPECT_EQ(resolveShiftedLabel(Key::Apostrophe, us), "\"");
  EXPECT_EQ(resolveShiftedLabel(Key::Apostrophe, uk), "@");
  EXPECT_EQ(resolveShiftedLabel(Key::Backslash, us), "|");
  EXPECT_EQ(resolveShiftedLabel(Key::Backslash, uk), "~");
  EXPECT_EQ(resolveShiftedLabel(Key::Grave, us), "~");
  EXPECT_EQ(resolveShiftedLabel(Key::Grave, uk), "¬");
  EXPECT_EQ(resolveShiftedLabel(Key::Minus, us), "_");
  EXPECT_EQ(resolveShiftedLabel(Key::Equal, uk), "+");
  EXPECT_EQ(resolveShiftedLabel(Key::IntlBackslash, uk), "|");
}

TEST(LayoutTest, OtherLayoutBehavesAsUs) {
  const KeyboardLayout us = KeyboardLayout::unitedStates();
  const KeyboardLayout other = KeyboardLayout::other(42);
  for (Key k : {Key::Num2, Key::Num3, Key::Apostrophe, Key::Backslash,
                Key::Grave, Key::A, Key::Space, Key::F5}) {
    EXPECT_EQ(resolveShiftedLabel(k, other), resolveShiftedLabel(k, us))
        << keyToString(k);
  }
}

TEST(LayoutTest, UnmappedKeysFallThroughToNormalizer) {
  const KeyboardLayout us = KeyboardLayout::unitedStates();
  EXPECT_EQ(resolveShiftedLabel(Key::A, us), "A");
  EXPECT_EQ(resolveShiftedLabel(Key::Space, us), "\U000F1050 space");
  EXPECT_EQ(resolveShiftedLabel(Key::Up, us), "↑");
  EXPECT_EQ(resolveShiftedLabel(Key::Comma, us), ",");
  EXPECT_EQ(resolveShiftedLabel(Key::F12, us), "F12");
}

TEST(LayoutTest, ShiftedLabelIsTotal) {
  for (unsigned i = 0; i <= 255u; ++i) {
    Key k = static_cast<Key>(i);
    EXPECT_FALSE(resolveShiftedLabel(k, KeyboardLayout::unitedStates()).empty());
    EXPECT_FALSE(
        resolveShiftedLabel(k, KeyboardLayout::unitedKingdom()).empty());
  }
}

TEST(LayoutTest, UnshiftedLabels) {
  const KeyboardLayout us = KeyboardLayout::unitedStates();
  const KeyboardLayout uk = KeyboardLayout::unitedKingdom();
  EXPECT_EQ(resolveLabel(Key::Num3, us, false), "3");
  EXPECT_EQ(resolveLabel(Key::Num3, us, true), "#");
  EXPECT_EQ(resolveLabel(Key::Backslash, us, false), "\\");
  EXPECT_EQ(resolveLabel(Key::Backslash, uk, false), "#");
  EXPECT_EQ(resolveLabel(Key::ShiftLeft, us, false), "⇧ shift");
  EXPECT_EQ(resolveLabel(Key::CtrlRight, us, false), "⌃ control");
  EXPECT_EQ(resolveLabel(Key::Escape, us, false), "\U000F0206 esc");
  EXPECT_EQ(resolveLabel(Key::Numpad7, us, false), "7");
  EXPECT_EQ(resolveLabel(Key::NumpadDecimal, us, false), ".");
  EXPECT_EQ(resolveLabel(Key::Mute, us, false), "\U000F0581 mute");
  EXPECT_EQ(resolveLabel(Key::Unknown, us, false), "\U000F0633 Unknown");
}

TEST_F(LayoutDetectionTest, EnvironmentWins) {
  writeKeyboardFile("XKBLAYOUT=\"us\"\n");
  ::setenv("XKB_DEFAULT_LAYOUT", "gb", 1);
  EXPECT_EQ(detectXkbLayoutName(m_file.string()), "gb");
  EXPECT_EQ(detectLayout(m_file.string()), KeyboardLayout::unitedKingdom());
}

TEST_F(LayoutDetectionTest, KeyboardFile) {
  writeKeyboardFile("# generated\nXKBMODEL=\"pc105\"\nXKBLAYOUT=\"gb,us\"\n"
                    "XKBVARIANT=\"\"\n");
  ::setenv("LANG", "en_US.UTF-8", 1);
  EXPECT_EQ(detectXkbLayoutName(m_file.string()), "gb,us");
  EXPECT_EQ(detectLayout(m_file.string()), KeyboardLayout::unitedKingdom());
}

TEST_F(LayoutDetectionTest, LocaleFallback) {
  const std::string missing = m_file.string() + ".missing";
  ::setenv("LANG", "en_GB.UTF-8", 1);
  EXPECT_EQ(detectXkbLayoutName(missing), "gb");

  ::setenv("LANG", "en_US.UTF-8", 1);
  EXPECT_EQ(detectXkbLayoutName(missing), "us");

  ::setenv("LC_ALL", "fr_FR.UTF-8", 1);
  EXPECT_EQ(detectXkbLayoutName(missing), "fr");
  EXPECT_EQ(detectLayout(missing).kind, KeyboardLayout::Kind::Other);

  ::setenv("LC_ALL", "C", 1);
  EXPECT_EQ(detectXkbLayoutName(missing), "");
  EXPECT_EQ(detectLayout(missing), KeyboardLayout::other(0));
}
