#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <unordered_map>

#include "reactor.hpp"

namespace fleet::reactor {

/*
  Production reactor.

  Run() blocks the calling thread, which becomes the loop thread. Timers are
  ordered on the steady clock; Now() reports wall time for message stamps.
*/
class EventLoop final : public Reactor {
 public:
  EventLoop() = default;

  EventLoop(const EventLoop&)            = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  util::TimePoint Now() const override;

  CallId CallLater(util::Duration delay, Callback callback) override;
  CallId CallEvery(util::Duration interval, Callback callback) override;
  void   Cancel(CallId id) override;
  void   CallFromThread(Callback callback) override;

  void Run();

  // Thread-safe; Run() returns after the current callback.
  void Stop();

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct Timer {
    SteadyClock::time_point due;
    util::Duration          interval{0};
    Callback                callback;
  };

  CallId Schedule(util::Duration delay, util::Duration interval, Callback callback);

  std::mutex              mutex_;
  std::condition_variable cv_;

  std::multimap<SteadyClock::time_point, CallId> due_;
  std::unordered_map<CallId, Timer>              timers_;
  std::deque<Callback>                           posted_;

  CallId next_call_id_ = 1;
  bool   running_      = false;
};

} // namespace fleet::reactor
