/**
 * @file input/event_source_factory.cpp
 * @brief Runtime selection of the capture backend.
 */

#include <keycast/input/event_source.hpp>
#include <keycast/input/libinput_event_source.hpp>
#include <keycast/input/x11_event_source.hpp>
#include <keycast/log.hpp>

namespace keycast::input {

KEYCAST_API std::unique_ptr<KeyEventSource>
createEventSource(EventSourceKind kind) {
  EventSourceKind resolved = resolveEventSourceKind(kind);
  KEYCAST_LOG_DEBUG("createEventSource: requested=%s resolved=%s",
                    eventSourceKindName(kind), eventSourceKindName(resolved));
  switch (resolved) {
  case EventSourceKind::X11:
    return std::make_unique<X11EventSource>();
  case EventSourceKind::Libinput:
    return std::make_unique<LibinputEventSource>();
  case EventSourceKind::Auto:
    break;
  }
  return std::make_unique<LibinputEventSource>();
}

} // namespace keycast::input
