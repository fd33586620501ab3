#pragma once
/**
 * @file input/event_channel.hpp
 * @brief Bounded multi-producer queue between event sources and the overlay
 * loop.
 *
 * Producers (event source worker threads) call `send`; the single consumer
 * (the frame loop) drains without blocking. When the queue is full the
 * oldest event is discarded so a stalled consumer never causes unbounded
 * growth. Producers hold the channel through a `std::weak_ptr`; once the
 * consumer has dropped it, sends become no-ops.
 */

#include <keycast/core.hpp>
#include <keycast/input/input_event.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace keycast {
namespace input {

class KEYCAST_API EventChannel {
public:
  static constexpr std::size_t kDefaultCapacity = 1024;

  explicit EventChannel(std::size_t capacity = kDefaultCapacity);

  EventChannel(const EventChannel &) = delete;
  EventChannel &operator=(const EventChannel &) = delete;

  /**
   * @brief Enqueue an event, dropping the oldest one if the queue is full.
   * @return false when an older event had to be dropped.
   */
  bool send(InputEvent event);

  /// Pop the oldest event if one is available.
  [[nodiscard]] std::optional<InputEvent> tryReceive();

  /**
   * @brief Move every queued event into @p out (appended, oldest first).
   * @return Number of events moved.
   */
  std::size_t drainInto(std::vector<InputEvent> &out);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const { return m_capacity; }
  /// Total number of events discarded because the queue was full.
  [[nodiscard]] uint64_t droppedCount() const;

private:
  mutable std::mutex m_mutex;
  std::deque<InputEvent> m_queue;
  std::size_t m_capacity;
  uint64_t m_dropped{0};
};

/**
 * @brief Send through a weak channel reference.
 *
 * A channel that no longer exists means the consumer has shut down; the
 * event is discarded silently.
 */
inline void sendIfAlive(const std::weak_ptr<EventChannel> &channel,
                        InputEvent event) {
  if (auto ch = channel.lock())
    ch->send(std::move(event));
}

} // namespace input
} // namespace keycast
