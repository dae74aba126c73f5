#include "plugin_registry.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace fleet::plugin {

using fleet::observability::IntField;
using fleet::observability::StringField;
using reactor::Event;

template <typename Hook>
void PluginRegistry::ForEach(unsigned capability, const char* hook_name, Hook hook) {
  for (auto& plugin : plugins_) {
    if ((plugin->Capabilities() & capability) == 0) continue;
    try {
      hook(*plugin);
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("Plugin hook failed", {StringField("plugin", plugin->Name()), StringField("hook", hook_name), StringField("error", e.what())});
    }
  }
}

PluginRegistry::PluginRegistry(reactor::Reactor&                     reactor,
                               MessageSink&                          sink,
                               persist::Persist&                     persist,
                               const runtime::config::RuntimeConfig& config)
    : reactor_(reactor), sink_(sink), persist_(persist), config_(config) {
  exchange_listener_ = reactor_.CallOn(Event::kPreExchange, [this](const reactor::EventData&) {
    ForEach(kExchange, "exchange", [](Plugin& p) { p.Exchange(); });
  });
  resync_listener_ = reactor_.CallOn(Event::kResynchronize, [this](const reactor::EventData&) {
    ForEach(kResynchronize, "resynchronize", [](Plugin& p) { p.Resynchronize(); });
  });
}

PluginRegistry::~PluginRegistry() {
  Stop();
  reactor_.RemoveListener(exchange_listener_);
  reactor_.RemoveListener(resync_listener_);
}

void PluginRegistry::Add(std::unique_ptr<Plugin> plugin) {
  PluginContext context;
  context.reactor = &reactor_;
  context.sink    = &sink_;
  context.persist = persist_.RootAt("plugin." + plugin->Name());
  context.config  = &config_;
  plugin->Attach(std::move(context));

  FLEET_LOG_INFO("Plugin registered", {StringField("plugin", plugin->Name()), IntField("capabilities", plugin->Capabilities())});
  plugins_.push_back(std::move(plugin));
}

Plugin* PluginRegistry::Get(const std::string& name) const {
  for (const auto& p : plugins_) {
    if (p->Name() == name) return p.get();
  }
  return nullptr;
}

void PluginRegistry::Start() {
  if (run_call_) return;
  const auto interval = util::FromProtoOr(config_.monitor().run_interval(), std::chrono::seconds(60));
  run_call_           = reactor_.CallEvery(interval, [this] { RunAll(); });
}

void PluginRegistry::Stop() {
  if (!run_call_) return;
  reactor_.Cancel(*run_call_);
  run_call_.reset();
}

void PluginRegistry::RunAll() {
  ForEach(kRun, "run", [](Plugin& p) { p.Run(); });
}

} // namespace fleet::plugin
