#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/plugin/plugin.hpp"

namespace fleet::plugin {

/*
  Owns the monitor plugins and drives their hooks:

    run_interval timer  -> Run()            (kRun)
    pre-exchange event  -> Exchange()       (kExchange)
    resynchronize event -> Resynchronize()  (kResynchronize)

  Plugins are called in registration order. A throwing plugin is logged
  and skipped; the rest still run.
*/
class PluginRegistry {
 public:
  PluginRegistry(reactor::Reactor&                     reactor,
                 MessageSink&                          sink,
                 persist::Persist&                     persist,
                 const runtime::config::RuntimeConfig& config);
  ~PluginRegistry();

  PluginRegistry(const PluginRegistry&)            = delete;
  PluginRegistry& operator=(const PluginRegistry&) = delete;

  void Add(std::unique_ptr<Plugin> plugin);

  // nullptr if absent
  Plugin* Get(const std::string& name) const;

  std::size_t Size() const {
    return plugins_.size();
  }

  // Starts the shared run timer.
  void Start();
  void Stop();

  // One pass of Run() over every kRun plugin.
  void RunAll();

 private:
  template <typename Hook>
  void ForEach(unsigned capability, const char* hook_name, Hook hook);

  reactor::Reactor&                     reactor_;
  MessageSink&                          sink_;
  persist::Persist&                     persist_;
  const runtime::config::RuntimeConfig& config_;

  std::vector<std::unique_ptr<Plugin>> plugins_;

  std::optional<reactor::Reactor::CallId> run_call_;
  reactor::Reactor::ListenerId            exchange_listener_ = 0;
  reactor::Reactor::ListenerId            resync_listener_   = 0;
};

} // namespace fleet::plugin
