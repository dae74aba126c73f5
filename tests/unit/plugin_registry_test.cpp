#include "internal/plugin/plugin_registry.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/persist/persist.hpp"
#include "internal/reactor/fake_reactor.hpp"
#include "internal/store/message.hpp"
#include "internal/util/time.hpp"
#include "tests/unit/support/exchange_harness.hpp"
#include "tests/unit/support/fake_sink.hpp"

namespace {

using namespace std::chrono_literals;

using fleet::plugin::Plugin;
using fleet::plugin::PluginRegistry;
using fleet::reactor::Event;

// Appends "<name>:<hook>" to a shared journal.
class RecordingPlugin final : public Plugin {
 public:
  RecordingPlugin(std::string name, unsigned capabilities, std::vector<std::string>* journal, bool throws = false)
      : name_(std::move(name)), capabilities_(capabilities), journal_(journal), throws_(throws) {}

  std::string Name() const override {
    return name_;
  }
  unsigned Capabilities() const override {
    return capabilities_;
  }

  void Run() override {
    Record("run");
  }
  void Exchange() override {
    Record("exchange");
  }
  void Resynchronize() override {
    Record("resynchronize");
  }

  bool Attached() const {
    return context_.has_value();
  }
  fleet::persist::PersistView& Persist() {
    return context_->persist;
  }

 private:
  void Record(const char* hook) {
    journal_->push_back(name_ + ":" + hook);
    if (throws_) throw std::runtime_error("plugin failure");
  }

  std::string               name_;
  unsigned                  capabilities_;
  std::vector<std::string>* journal_;
  bool                      throws_;
};

struct Fixture {
  fleet::reactor::FakeReactor           reactor;
  fleet::testing::FakeSink              sink;
  fleet::persist::Persist               persist;
  fleet::runtime::config::RuntimeConfig config;
  std::vector<std::string>              journal;

  Fixture() {
    *config.mutable_monitor()->mutable_run_interval() = fleet::util::ToProto(std::chrono::seconds(30));
  }
};

void TestHooksRunInRegistrationOrderByCapability() {
  Fixture        f;
  PluginRegistry registry(f.reactor, f.sink, f.persist, f.config);

  using fleet::plugin::kExchange;
  using fleet::plugin::kResynchronize;
  using fleet::plugin::kRun;

  registry.Add(std::make_unique<RecordingPlugin>("a", kRun | kExchange, &f.journal));
  registry.Add(std::make_unique<RecordingPlugin>("b", kRun | kResynchronize, &f.journal));
  registry.Add(std::make_unique<RecordingPlugin>("c", kExchange | kResynchronize, &f.journal));
  assert(registry.Size() == 3);

  registry.RunAll();
  assert((f.journal == std::vector<std::string>{"a:run", "b:run"}));

  f.journal.clear();
  f.reactor.Fire(Event::kPreExchange);
  assert((f.journal == std::vector<std::string>{"a:exchange", "c:exchange"}));

  f.journal.clear();
  f.reactor.Fire(Event::kResynchronize);
  assert((f.journal == std::vector<std::string>{"b:resynchronize", "c:resynchronize"}));
}

void TestThrowingPluginDoesNotStopOthers() {
  Fixture        f;
  PluginRegistry registry(f.reactor, f.sink, f.persist, f.config);

  registry.Add(std::make_unique<RecordingPlugin>("bad", fleet::plugin::kRun, &f.journal, true));
  registry.Add(std::make_unique<RecordingPlugin>("good", fleet::plugin::kRun, &f.journal));

  registry.RunAll();
  assert((f.journal == std::vector<std::string>{"bad:run", "good:run"}));
}

void TestRunTimerFollowsConfiguredInterval() {
  Fixture        f;
  PluginRegistry registry(f.reactor, f.sink, f.persist, f.config);
  registry.Add(std::make_unique<RecordingPlugin>("a", fleet::plugin::kRun, &f.journal));

  registry.Start();
  registry.Start();
  assert(f.reactor.PendingCalls() == 1);

  f.reactor.Advance(29s);
  assert(f.journal.empty());
  f.reactor.Advance(1s);
  assert(f.journal.size() == 1);
  f.reactor.Advance(60s);
  assert(f.journal.size() == 3);

  registry.Stop();
  f.reactor.Advance(60s);
  assert(f.journal.size() == 3);
  assert(f.reactor.PendingCalls() == 0);
}

void TestPluginsGetScopedPersistViews() {
  Fixture        f;
  PluginRegistry registry(f.reactor, f.sink, f.persist, f.config);

  auto  owned  = std::make_unique<RecordingPlugin>("scoped", fleet::plugin::kRun, &f.journal);
  auto* plugin = owned.get();
  registry.Add(std::move(owned));

  assert(plugin->Attached());
  assert(registry.Get("scoped") == plugin);
  assert(registry.Get("missing") == nullptr);

  plugin->Persist().SetString("marker", "x");
  assert(f.persist.GetString("plugin.scoped.marker") == "x");
}

void TestDestroyedRegistryStopsListening() {
  Fixture f;
  {
    PluginRegistry registry(f.reactor, f.sink, f.persist, f.config);
    registry.Add(std::make_unique<RecordingPlugin>("a", fleet::plugin::kExchange, &f.journal));
    registry.Start();
  }

  f.reactor.Fire(Event::kPreExchange);
  f.reactor.Advance(120s);
  assert(f.journal.empty());
}

void TestServerResynchronizeReachesPluginsOnceBeforeNextRun() {
  fleet::testing::ExchangeHarness       h;
  fleet::testing::FakeSink              sink;
  fleet::runtime::config::RuntimeConfig config;
  std::vector<std::string>              journal;
  *config.mutable_monitor()->mutable_run_interval() = fleet::util::ToProto(std::chrono::seconds(30));

  using fleet::plugin::kExchange;
  using fleet::plugin::kResynchronize;
  using fleet::plugin::kRun;

  PluginRegistry registry(h.reactor, sink, h.persist, config);
  registry.Add(std::make_unique<RecordingPlugin>("watcher", kRun | kExchange | kResynchronize, &journal));
  registry.Add(std::make_unique<RecordingPlugin>("counter", kRun | kResynchronize, &journal));
  registry.Start();
  h.exchange.Start();

  h.reactor.Advance(10s);
  h.exchange.Exchange();
  assert((journal == std::vector<std::string>{"watcher:exchange"}));

  // flag and pushed message both ask for it; plugins still see one call
  auto response = fleet::testing::ExchangeHarness::Ack(1);
  response.set_resynchronize(true);
  *response.add_messages() = fleet::store::MakeMessage("resynchronize");
  h.Respond(response);
  assert((journal == std::vector<std::string>{"watcher:exchange", "watcher:resynchronize", "counter:resynchronize"}));

  h.reactor.Advance(20s);
  assert((journal == std::vector<std::string>{
              "watcher:exchange", "watcher:resynchronize", "counter:resynchronize", "watcher:run", "counter:run"}));
}

} // namespace

int main() {
  TestHooksRunInRegistrationOrderByCapability();
  TestThrowingPluginDoesNotStopOthers();
  TestRunTimerFollowsConfiguredInterval();
  TestPluginsGetScopedPersistViews();
  TestDestroyedRegistryStopsListening();
  TestServerResynchronizeReachesPluginsOnceBeforeNextRun();

  std::cout << "fleet_agent_unit_plugin_registry: pass\n";
  return 0;
}
