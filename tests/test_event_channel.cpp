// test_event_channel.cpp
// Unit tests for the bounded capture -> frame loop channel.

#include <gtest/gtest.h>

#include <keycast/input/event_channel.hpp>
#include <keycast/log.hpp>

#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace keycast::input;

TEST(EventChannelTest, FifoOrder) {
  EventChannel ch;
  EXPECT_TRUE(ch.send(InputEvent::keyPress("A")));
  EXPECT_TRUE(ch.send(InputEvent::mouseClick("MouseLeft")));
  EXPECT_EQ(ch.size(), 2u);

  auto first = ch.tryReceive();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, InputEvent::keyPress("A"));
  auto second = ch.tryReceive();
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(second->isMouse());
  EXPECT_FALSE(ch.tryReceive().has_value());
}

TEST(EventChannelTest, DrainAppendsEverything) {
  EventChannel ch;
  for (int i = 0; i < 5; ++i)
    ch.send(InputEvent::keyPress(std::to_string(i)));

  std::vector<InputEvent> out{InputEvent::keyPress("existing")};
  EXPECT_EQ(ch.drainInto(out), 5u);
  ASSERT_EQ(out.size(), 6u);
  EXPECT_EQ(out[0].label, "existing");
  EXPECT_EQ(out[1].label, "0");
  EXPECT_EQ(out[5].label, "4");
  EXPECT_EQ(ch.size(), 0u);
  EXPECT_EQ(ch.drainInto(out), 0u);
}

TEST(EventChannelTest, FullQueueDropsOldest) {
  EventChannel ch(3);
  EXPECT_TRUE(ch.send(InputEvent::keyPress("1")));
  EXPECT_TRUE(ch.send(InputEvent::keyPress("2")));
  EXPECT_TRUE(ch.send(InputEvent::keyPress("3")));
  EXPECT_FALSE(ch.send(InputEvent::keyPress("4")));
  EXPECT_FALSE(ch.send(InputEvent::keyPress("5")));

  EXPECT_EQ(ch.size(), 3u);
  EXPECT_EQ(ch.droppedCount(), 2u);
  std::vector<InputEvent> out;
  ch.drainInto(out);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].label, "3");
  EXPECT_EQ(out[2].label, "5");
}

TEST(EventChannelTest, ZeroCapacityIsClampedToOne) {
  EventChannel ch(0);
  EXPECT_EQ(ch.capacity(), 1u);
  ch.send(InputEvent::keyPress("a"));
  ch.send(InputEvent::keyPress("b"));
  auto ev = ch.tryReceive();
  ASSERT_TRUE(ev.has_value());
  EXPECT_EQ(ev->label, "b");
}

TEST(EventChannelTest, SendAfterReceiverGoneIsIgnored) {
  auto ch = std::make_shared<EventChannel>();
  std::weak_ptr<EventChannel> weak = ch;
  sendIfAlive(weak, InputEvent::keyPress("A"));
  EXPECT_EQ(ch->size(), 1u);

  ch.reset();
  EXPECT_TRUE(weak.expired());
  sendIfAlive(weak, InputEvent::keyPress("B")); // must not crash
}

TEST(EventChannelTest, ConcurrentProducer) {
  KEYCAST_LOG_INFO("test_event_channel: concurrent producer start");
  auto ch = std::make_shared<EventChannel>();
  constexpr int kEvents = 500;
  std::thread producer([ch] {
    for (int i = 0; i < kEvents; ++i)
      ch->send(InputEvent::keyPress(std::to_string(i)));
  });

  std::vector<InputEvent> received;
  while (received.size() < static_cast<std::size_t>(kEvents)) {
    ch->drainInto(received);
    std::this_thread::yield();
  }
  producer.join();

  ASSERT_EQ(received.size(), static_cast<std::size_t>(kEvents));
  for (int i = 0; i < kEvents; ++i)
    EXPECT_EQ(received[static_cast<std::size_t>(i)].label, std::to_string(i));
}
