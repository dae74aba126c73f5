#pragma once

#include <deque>
#include <map>
#include <unordered_map>

#include "reactor.hpp"

namespace fleet::reactor {

/*
  Deterministic reactor for tests. Time only moves through Advance().
*/
class FakeReactor final : public Reactor {
 public:
  FakeReactor();

  util::TimePoint Now() const override {
    return now_;
  }

  CallId CallLater(util::Duration delay, Callback callback) override;
  CallId CallEvery(util::Duration interval, Callback callback) override;
  void   Cancel(CallId id) override;
  void   CallFromThread(Callback callback) override;

  // Runs every call due within the window, in due order, with Now() set to
  // each call's due time. Posted callbacks run first.
  void Advance(util::Duration delta);

  // Runs posted callbacks without moving time.
  void RunPosted();

  std::size_t PendingCalls() const {
    return timers_.size();
  }

  // Due time of the earliest pending call; Now() when nothing is scheduled.
  util::TimePoint NextCallTime() const;

 private:
  struct Timer {
    util::TimePoint due;
    util::Duration  interval{0};
    Callback        callback;
  };

  CallId Schedule(util::Duration delay, util::Duration interval, Callback callback);

  util::TimePoint                                now_;
  std::multimap<util::TimePoint, CallId>         due_;
  std::unordered_map<CallId, Timer>              timers_;
  std::deque<Callback>                           posted_;
  CallId                                         next_call_id_ = 1;
};

} // namespace fleet::reactor
