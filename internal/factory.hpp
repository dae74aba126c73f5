#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/exchange/exchange_store.hpp"
#include "internal/exchange/message_exchange.hpp"
#include "internal/exchange/transport.hpp"
#include "internal/persist/persist.hpp"
#include "internal/plugin/plugin_registry.hpp"
#include "internal/reactor/reactor.hpp"
#include "internal/registration/identity.hpp"
#include "internal/registration/registration_handler.hpp"
#include "internal/store/message_store.hpp"

namespace fleet::factory {

/*
  Application

  Owns every long-lived component of the agent. Members are declared in
  dependency order so destruction runs dependents first.
*/
struct Application {
  std::unique_ptr<persist::Persist> persist;
  persist::LoadStatus               persist_status = persist::LoadStatus::kFresh;

  std::shared_ptr<db::Repository>                    repository;
  std::unique_ptr<store::MessageStore>               message_store;
  std::unique_ptr<exchange::ExchangeStore>           exchange_store;
  std::unique_ptr<registration::Identity>            identity;
  std::unique_ptr<exchange::Transport>               transport;
  std::unique_ptr<exchange::MessageExchange>         exchange;
  std::unique_ptr<registration::RegistrationHandler> registration;
  std::unique_ptr<plugin::MessageSink>               sink;
  std::unique_ptr<plugin::PluginRegistry>            plugins;
};

// sqlite when configured, in-memory otherwise.
std::shared_ptr<db::Repository> BuildRepository(const fleet::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete backends. A null
  transport means gRPC to transport.endpoint. `config` and `reactor` must
  outlive the result.
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config,
                  reactor::Reactor&                           reactor,
                  std::unique_ptr<exchange::Transport>        transport = nullptr);

} // namespace fleet::factory
