#include "event_loop.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace fleet::reactor {

using fleet::observability::StringField;

namespace {

void RunGuarded(const Reactor::Callback& callback) {
  try {
    callback();
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Unhandled error in scheduled call", {StringField("error", e.what())});
  }
}

} // namespace

util::TimePoint EventLoop::Now() const {
  return util::Now();
}

EventLoop::CallId EventLoop::Schedule(util::Duration delay, util::Duration interval, Callback callback) {
  std::lock_guard lock(mutex_);

  const auto id  = next_call_id_++;
  const auto due = SteadyClock::now() + delay;
  timers_.emplace(id, Timer{due, interval, std::move(callback)});
  due_.emplace(due, id);

  cv_.notify_one();
  return id;
}

EventLoop::CallId EventLoop::CallLater(util::Duration delay, Callback callback) {
  return Schedule(delay, util::Duration{0}, std::move(callback));
}

EventLoop::CallId EventLoop::CallEvery(util::Duration interval, Callback callback) {
  return Schedule(interval, interval, std::move(callback));
}

void EventLoop::Cancel(CallId id) {
  std::lock_guard lock(mutex_);
  // the entry left in due_ is skipped when it comes up
  timers_.erase(id);
}

void EventLoop::CallFromThread(Callback callback) {
  {
    std::lock_guard lock(mutex_);
    posted_.push_back(std::move(callback));
  }
  cv_.notify_one();
}

void EventLoop::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
}

void EventLoop::Run() {
  std::unique_lock lock(mutex_);
  running_ = true;

  while (running_) {
    if (!posted_.empty()) {
      auto callback = std::move(posted_.front());
      posted_.pop_front();
      lock.unlock();
      RunGuarded(callback);
      lock.lock();
      continue;
    }

    if (due_.empty()) {
      cv_.wait(lock, [&] { return !running_ || !posted_.empty() || !due_.empty(); });
      continue;
    }

    auto next = due_.begin();
    if (next->first > SteadyClock::now()) {
      const auto wake_at = next->first;
      cv_.wait_until(lock, wake_at, [&] { return !running_ || !posted_.empty() || (!due_.empty() && due_.begin()->first < wake_at); });
      continue;
    }

    const auto id = next->second;
    due_.erase(next);

    auto timer_it = timers_.find(id);
    if (timer_it == timers_.end()) continue; // cancelled

    Callback callback;
    if (timer_it->second.interval.count() > 0) {
      timer_it->second.due += timer_it->second.interval;
      due_.emplace(timer_it->second.due, id);
      callback = timer_it->second.callback;
    } else {
      callback = std::move(timer_it->second.callback);
      timers_.erase(timer_it);
    }

    lock.unlock();
    RunGuarded(callback);
    lock.lock();
  }
}

} // namespace fleet::reactor
