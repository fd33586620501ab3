/**
 * @file input/event_channel.cpp
 * @brief EventChannel implementation.
 */

#include <keycast/input/event_channel.hpp>
#include <keycast/log.hpp>

#include <iterator>
#include <utility>

namespace keycast::input {

EventChannel::EventChannel(std::size_t capacity)
    : m_capacity(capacity == 0 ? 1 : capacity) {}

bool EventChannel::send(InputEvent event) {
  bool dropped = false;
  uint64_t total = 0;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queue.size() >= m_capacity) {
      m_queue.pop_front();
      dropped = true;
      total = ++m_dropped;
    }
    m_queue.push_back(std::move(event));
  }
  // Log the first drop and then every 256th so a stalled consumer does not
  // flood stderr.
  if (dropped && (total == 1 || total % 256 == 0)) {
    KEYCAST_LOG_WARN("EventChannel: queue full (capacity %zu), dropped %llu "
                     "oldest event(s) so far",
                     m_capacity, static_cast<unsigned long long>(total));
  }
  return !dropped;
}

std::optional<InputEvent> EventChannel::tryReceive() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_queue.empty())
    return std::nullopt;
  InputEvent ev = std::move(m_queue.front());
  m_queue.pop_front();
  return ev;
}

std::size_t EventChannel::drainInto(std::vector<InputEvent> &out) {
  std::deque<InputEvent> taken;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    taken.swap(m_queue);
  }
  out.insert(out.end(), std::make_move_iterator(taken.begin()),
             std::make_move_iterator(taken.end()));
  return taken.size();
}

std::size_t EventChannel::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_queue.size();
}

uint64_t EventChannel::droppedCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_dropped;
}

} // namespace keycast::input
