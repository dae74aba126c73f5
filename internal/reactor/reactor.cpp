#include "reactor.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace fleet::reactor {

using fleet::observability::StringField;

const char* EventName(Event event) {
  switch (event) {
    case Event::kPreExchange:
      return "pre-exchange";
    case Event::kExchangeDone:
      return "exchange-done";
    case Event::kExchangeFailed:
      return "exchange-failed";
    case Event::kResynchronize:
      return "resynchronize";
    case Event::kRegistrationDone:
      return "registration-done";
    case Event::kRegistrationFailed:
      return "registration-failed";
    case Event::kMessageTypeAcceptanceChanged:
      return "message-type-acceptance-changed";
    case Event::kServerUuidChanged:
      return "server-uuid-changed";
    case Event::kIdentityRejected:
      return "identity-rejected";
  }
  return "unknown";
}

Reactor::ListenerId Reactor::CallOn(Event event, EventHandler handler) {
  const auto id = next_listener_id_++;
  listeners_.emplace(id, Listener{event, std::move(handler)});
  return id;
}

void Reactor::RemoveListener(ListenerId id) {
  listeners_.erase(id);
}

void Reactor::Fire(Event event, const EventData& data) {
  // handlers may add or remove listeners while we iterate
  std::vector<EventHandler> handlers;
  for (const auto& [_, listener] : listeners_) {
    if (listener.event == event) handlers.push_back(listener.handler);
  }

  for (const auto& handler : handlers) {
    try {
      handler(data);
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("Event handler failed", {StringField("event", EventName(event)), StringField("error", e.what())});
    }
  }
}

} // namespace fleet::reactor
