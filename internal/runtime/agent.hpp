#pragma once

#include <memory>
#include <optional>

#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/reactor/reactor.hpp"

namespace fleet::runtime {

/*
  Agent

  Process lifecycle around the component graph: starts the exchange and
  the plugins, registers when there is no identity, checkpoints the
  persisted store periodically and once more on Stop().
*/
class Agent {
 public:
  Agent(fleet::runtime::config::RuntimeConfig config,
        reactor::Reactor&                     reactor,
        std::unique_ptr<exchange::Transport>  transport = nullptr);
  ~Agent();

  Agent(const Agent&)            = delete;
  Agent& operator=(const Agent&) = delete;

  void Start();
  void Stop();

  // Saves the persisted store; failures are logged.
  void Checkpoint();

  factory::Application& App() {
    return app_;
  }

 private:
  fleet::runtime::config::RuntimeConfig config_;
  reactor::Reactor&                     reactor_;
  factory::Application                  app_;

  bool                                    started_ = false;
  std::optional<reactor::Reactor::CallId> checkpoint_call_;
};

} // namespace fleet::runtime
