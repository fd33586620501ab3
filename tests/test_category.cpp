// test_category.cpp
// Unit tests for the priority-ordered label classifier.

#include <gtest/gtest.h>

#include <keycast/input/category.hpp>

#include <set>
#include <string>

using namespace keycast::input;

TEST(CategoryTest, Edges) {
  EXPECT_EQ(classify("f0"), KeyCategory::Unknown);
  EXPECT_EQ(classify("f12"), KeyCategory::Function);
  EXPECT_EQ(classify("F24"), KeyCategory::Function);
  EXPECT_EQ(classify("F25"), KeyCategory::Unknown);
  EXPECT_EQ(classify("f"), KeyCategory::Normal);
  EXPECT_EQ(classify("123"), KeyCategory::Numeric);
  EXPECT_EQ(classify("Ab1"), KeyCategory::Unknown);
  EXPECT_EQ(classify(""), KeyCategory::Unknown);
}

TEST(CategoryTest, Groups) {
  EXPECT_EQ(classify("left"), KeyCategory::Mouse);
  EXPECT_EQ(classify("\U000F037D"), KeyCategory::Mouse);
  EXPECT_EQ(classify("esc"), KeyCategory::Escape);
  EXPECT_EQ(classify("Meta"), KeyCategory::Escape);
  EXPECT_EQ(classify("shift"), KeyCategory::Modifier);
  EXPECT_EQ(classify("Control"), KeyCategory::Modifier);
  EXPECT_EQ(classify("tab"), KeyCategory::Modifier);
  EXPECT_EQ(classify("numlock"), KeyCategory::Modifier);
  EXPECT_EQ(classify("del"), KeyCategory::Editor);
  EXPECT_EQ(classify("back"), KeyCategory::Editor);
  EXPECT_EQ(classify("ps"), KeyCategory::Editor);
  EXPECT_EQ(classify("↑"), KeyCategory::Navigation);
  EXPECT_EQ(classify("→"), KeyCategory::Navigation);
  EXPECT_EQ(classify("pgdn"), KeyCategory::Scrollable);
  EXPECT_EQ(classify("scroll"), KeyCategory::Scrollable);
  EXPECT_EQ(classify("space"), KeyCategory::Space);
  EXPECT_EQ(classify("£"), KeyCategory::Symbol);
  EXPECT_EQ(classify("\""), KeyCategory::Symbol);
  EXPECT_EQ(classify("vol+"), KeyCategory::AltFunction);
  EXPECT_EQ(classify("mute"), KeyCategory::AltFunction);
  EXPECT_EQ(classify("App"), KeyCategory::AltFunction);
  EXPECT_EQ(classify("A"), KeyCategory::Normal);
  EXPECT_EQ(classify("7"), KeyCategory::Numeric);
  EXPECT_EQ(classify("Unknown(183)"), KeyCategory::Unknown);
}

TEST(CategoryTest, PriorityOrder) {
  // "home" alone is navigation-style paging, even though it also contains
  // the media keyword "home".
  EXPECT_EQ(classify("home"), KeyCategory::Scrollable);
  EXPECT_EQ(classify("HOME"), KeyCategory::Scrollable);
  // A label merely containing "home" falls through to the keyword match.
  EXPECT_EQ(classify("homepage"), KeyCategory::AltFunction);
  // "next"/"prev" are keywords; "f1" matches Function first.
  EXPECT_EQ(classify("next"), KeyCategory::AltFunction);
  EXPECT_EQ(classify("f1"), KeyCategory::Function);
  // "fn" is a keyword but not a Function key.
  EXPECT_EQ(classify("fn"), KeyCategory::AltFunction);
  // Mouse names win over everything ("left" is also all-alpha).
  EXPECT_EQ(classify("Left"), KeyCategory::Mouse);
  // "mail" contains no earlier-group name.
  EXPECT_EQ(classify("mail"), KeyCategory::AltFunction);
  // "stop" is a keyword even though it is all letters.
  EXPECT_EQ(classify("stop"), KeyCategory::AltFunction);
}

TEST(CategoryTest, ClassifyIsTotal) {
  const std::set<KeyCategory> all(allCategories().begin(),
                                  allCategories().end());
  EXPECT_EQ(all.size(), kKeyCategoryCount);
  for (const char *label :
       {"a", "Z", "0", "99", "f9", "f99", "?", "~", "⌦", "ümlaut", "x y",
        "\t", "  ", "Ctrl+C", "XF86Launch1", "\U000F0633"}) {
    EXPECT_EQ(all.count(classify(label)), 1u) << label;
  }
}

TEST(CategoryTest, NamesRoundTrip) {
  for (KeyCategory c : allCategories()) {
    auto parsed = parseCategory(categoryName(c));
    ASSERT_TRUE(parsed.has_value()) << categoryName(c);
    EXPECT_EQ(*parsed, c);
  }
  EXPECT_TRUE(parseCategory("AltFunction") == KeyCategory::AltFunction);
  EXPECT_FALSE(parseCategory("keyboard").has_value());
}
