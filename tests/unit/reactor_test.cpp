#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/reactor/event_loop.hpp"
#include "internal/reactor/fake_reactor.hpp"

namespace {

using namespace std::chrono_literals;

using fleet::reactor::Event;
using fleet::reactor::EventData;
using fleet::reactor::EventLoop;
using fleet::reactor::FakeReactor;

void TestListenersRunInOrderAndSurviveFailures() {
  FakeReactor              reactor;
  std::vector<std::string> seen;

  reactor.CallOn(Event::kExchangeDone, [&](const EventData&) { seen.push_back("first"); });
  reactor.CallOn(Event::kExchangeDone, [&](const EventData&) { throw std::runtime_error("listener failure"); });
  const auto removed = reactor.CallOn(Event::kExchangeDone, [&](const EventData&) { seen.push_back("removed"); });
  reactor.CallOn(Event::kExchangeDone, [&](const EventData& d) { seen.push_back("last:" + d.detail); });
  reactor.CallOn(Event::kExchangeFailed, [&](const EventData&) { seen.push_back("other-event"); });

  reactor.RemoveListener(removed);

  EventData data;
  data.detail = "ok";
  reactor.Fire(Event::kExchangeDone, data);
  assert((seen == std::vector<std::string>{"first", "last:ok"}));
  assert(std::string(fleet::reactor::EventName(Event::kIdentityRejected)) == "identity-rejected");
}

void TestFakeReactorRunsDueCallsInOrder() {
  FakeReactor              reactor;
  std::vector<std::string> seen;
  const auto               start = reactor.Now();

  reactor.CallLater(20s, [&] { seen.push_back("b"); });
  reactor.CallLater(10s, [&] {
    seen.push_back("a");
    assert(reactor.Now() == start + 10s);
    reactor.CallFromThread([&] { seen.push_back("posted"); });
  });
  const auto cancelled = reactor.CallLater(15s, [&] { seen.push_back("cancelled"); });
  reactor.Cancel(cancelled);

  assert(reactor.NextCallTime() == start + 10s);
  reactor.Advance(30s);
  assert((seen == std::vector<std::string>{"a", "posted", "b"}));
  assert(reactor.Now() == start + 30s);
  assert(reactor.PendingCalls() == 0);
}

void TestEventLoopRunsTimersAndStops() {
  EventLoop                loop;
  std::vector<std::string> seen;
  int                      ticks = 0;

  loop.CallLater(30ms, [&] { seen.push_back("later"); });
  loop.CallLater(5ms, [&] { seen.push_back("sooner"); });
  const auto cancelled = loop.CallLater(10ms, [&] { seen.push_back("cancelled"); });
  loop.Cancel(cancelled);
  loop.CallLater(1ms, [] { throw std::runtime_error("callback failure"); });

  const auto every = loop.CallEvery(5ms, [&] { ++ticks; });
  loop.CallLater(60ms, [&] {
    loop.Cancel(every);
    loop.Stop();
  });

  loop.Run();
  assert((seen == std::vector<std::string>{"sooner", "later"}));
  assert(ticks >= 2);
}

void TestCallFromThreadWakesTheLoop() {
  EventLoop        loop;
  std::atomic<int> calls{0};

  // keeps Run() from exiting early if the worker is slow
  loop.CallLater(5s, [&] { loop.Stop(); });

  std::thread worker([&] {
    std::this_thread::sleep_for(10ms);
    loop.CallFromThread([&] {
      ++calls;
      loop.Stop();
    });
  });

  const auto started = std::chrono::steady_clock::now();
  loop.Run();
  worker.join();

  assert(calls == 1);
  assert(std::chrono::steady_clock::now() - started < 4s);
}

} // namespace

int main() {
  TestListenersRunInOrderAndSurviveFailures();
  TestFakeReactorRunsDueCallsInOrder();
  TestEventLoopRunsTimersAndStops();
  TestCallFromThreadWakesTheLoop();

  std::cout << "fleet_agent_unit_reactor: pass\n";
  return 0;
}
