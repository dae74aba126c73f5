#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace fleet::reactor {

/*
  Broker-wide notifications delivered on the loop thread.
*/
enum class Event {
  kPreExchange,
  kExchangeDone,
  kExchangeFailed,
  kResynchronize,
  kRegistrationDone,
  kRegistrationFailed,
  kMessageTypeAcceptanceChanged,
  kServerUuidChanged,
  kIdentityRejected,
};

const char* EventName(Event event);

struct EventData {
  std::string type;    // message type, for acceptance changes
  bool        flag = false;
  std::string detail;  // free text (failure reason, new uuid)
};

/*
  Single-threaded scheduler.

  Every callback runs on the loop thread. CallFromThread is the only member
  that may be called from another thread.
*/
class Reactor {
 public:
  using Callback     = std::function<void()>;
  using EventHandler = std::function<void(const EventData&)>;
  using CallId       = std::uint64_t;
  using ListenerId   = std::uint64_t;

  virtual ~Reactor() = default;

  virtual util::TimePoint Now() const = 0;

  virtual CallId CallLater(util::Duration delay, Callback callback) = 0;
  virtual CallId CallEvery(util::Duration interval, Callback callback) = 0;

  // Unknown or already fired ids are ignored.
  virtual void Cancel(CallId id) = 0;

  virtual void CallFromThread(Callback callback) = 0;

  ListenerId CallOn(Event event, EventHandler handler);
  void       RemoveListener(ListenerId id);

  // Handlers run in registration order; a throwing handler is logged and
  // does not stop the others.
  void Fire(Event event, const EventData& data = {});

 private:
  struct Listener {
    Event        event;
    EventHandler handler;
  };

  std::map<ListenerId, Listener> listeners_;
  ListenerId                     next_listener_id_ = 1;
};

} // namespace fleet::reactor
