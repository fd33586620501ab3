// test_debounce_gate.cpp
// Unit tests for the coarse 250 ms duplicate filter.

#include <gtest/gtest.h>

#include <keycast/display/debounce_gate.hpp>

#include <chrono>

using namespace keycast::display;
using namespace std::chrono_literals;

TEST(DebounceGateTest, DuplicateWithinWindowIsRejected) {
  const auto t0 = DebounceGate::Clock::time_point{} + 10s;
  DebounceGate gate(t0);
  EXPECT_TRUE(gate.admit("A"));
  EXPECT_FALSE(gate.admit("A"));
  EXPECT_TRUE(gate.admit("B"));
  EXPECT_TRUE(gate.contains("A"));
  EXPECT_EQ(gate.size(), 2u);
}

TEST(DebounceGateTest, WindowClearsOnlyAfterItElapsed) {
  const auto t0 = DebounceGate::Clock::time_point{} + 10s;
  DebounceGate gate(t0);
  ASSERT_TRUE(gate.admit("A"));

  EXPECT_FALSE(gate.update(t0 + 100ms));
  EXPECT_FALSE(gate.update(t0 + 250ms));
  EXPECT_FALSE(gate.admit("A"));

  EXPECT_TRUE(gate.update(t0 + 251ms));
  EXPECT_EQ(gate.size(), 0u);
  EXPECT_TRUE(gate.admit("A"));

  // The next window is measured from the clear, not from t0.
  EXPECT_FALSE(gate.update(t0 + 400ms));
  EXPECT_TRUE(gate.update(t0 + 502ms));
}

TEST(DebounceGateTest, AllLabelsAgeOutTogether) {
  const auto t0 = DebounceGate::Clock::time_point{} + 10s;
  DebounceGate gate(t0);
  gate.admit("A");
  gate.update(t0 + 200ms);
  gate.admit("B"); // recorded late in the window
  ASSERT_TRUE(gate.update(t0 + 260ms));
  EXPECT_FALSE(gate.contains("A"));
  EXPECT_FALSE(gate.contains("B"));
}

TEST(DebounceGateTest, TickClearsUnconditionally) {
  DebounceGate gate;
  gate.admit("A");
  gate.tick();
  EXPECT_TRUE(gate.admit("A"));
}

TEST(DebounceGateTest, CustomWindow) {
  const auto t0 = DebounceGate::Clock::time_point{} + 10s;
  DebounceGate gate(t0, 50ms);
  gate.admit("A");
  EXPECT_TRUE(gate.update(t0 + 51ms));
  EXPECT_TRUE(gate.admit("A"));
}
