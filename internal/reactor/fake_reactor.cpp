#include "fake_reactor.hpp"

#include <utility>

namespace fleet::reactor {

FakeReactor::FakeReactor() : now_(util::TimePoint{} + std::chrono::hours(24 * 365 * 50)) {
}

FakeReactor::CallId FakeReactor::Schedule(util::Duration delay, util::Duration interval, Callback callback) {
  const auto id  = next_call_id_++;
  const auto due = now_ + delay;
  timers_.emplace(id, Timer{due, interval, std::move(callback)});
  due_.emplace(due, id);
  return id;
}

FakeReactor::CallId FakeReactor::CallLater(util::Duration delay, Callback callback) {
  return Schedule(delay, util::Duration{0}, std::move(callback));
}

FakeReactor::CallId FakeReactor::CallEvery(util::Duration interval, Callback callback) {
  return Schedule(interval, interval, std::move(callback));
}

void FakeReactor::Cancel(CallId id) {
  timers_.erase(id);
}

void FakeReactor::CallFromThread(Callback callback) {
  posted_.push_back(std::move(callback));
}

void FakeReactor::RunPosted() {
  while (!posted_.empty()) {
    auto callback = std::move(posted_.front());
    posted_.pop_front();
    callback();
  }
}

util::TimePoint FakeReactor::NextCallTime() const {
  for (const auto& [due, id] : due_) {
    if (timers_.count(id)) return due;
  }
  return now_;
}

void FakeReactor::Advance(util::Duration delta) {
  RunPosted();

  const auto until = now_ + delta;
  while (!due_.empty() && due_.begin()->first <= until) {
    auto next = due_.begin();
    const auto due = next->first;
    const auto id  = next->second;
    due_.erase(next);

    auto timer_it = timers_.find(id);
    if (timer_it == timers_.end()) continue;

    now_ = due;

    Callback callback;
    if (timer_it->second.interval.count() > 0) {
      timer_it->second.due += timer_it->second.interval;
      due_.emplace(timer_it->second.due, id);
      callback = timer_it->second.callback;
    } else {
      callback = std::move(timer_it->second.callback);
      timers_.erase(timer_it);
    }

    callback();
    RunPosted();
  }

  now_ = until;
}

} // namespace fleet::reactor
