#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/persist/persist.hpp"
#include "internal/reactor/reactor.hpp"
#include "internal/store/message.hpp"

namespace fleet::plugin {

enum Capability : unsigned {
  kRun           = 1u << 0,
  kExchange      = 1u << 1,
  kResynchronize = 1u << 2,
};

/*
  Where plugins put messages. Implemented over the exchange engine in
  production.
*/
class MessageSink {
 public:
  virtual ~MessageSink() = default;

  // nullopt when the message was dropped. Throws util::TypeRejected.
  virtual std::optional<std::uint64_t> Send(store::Message message, bool urgent = false) = 0;

  virtual bool Accepts(const std::string& type) const = 0;
};

struct PluginContext {
  reactor::Reactor*                     reactor = nullptr;
  MessageSink*                          sink    = nullptr;
  persist::PersistView                  persist{nullptr, ""};
  const runtime::config::RuntimeConfig* config = nullptr;
};

/*
  Monitor plugin contract. Hooks run on the loop thread and only when the
  matching capability bit is set.
*/
class Plugin {
 public:
  virtual ~Plugin() = default;

  virtual std::string Name() const = 0;

  virtual unsigned Capabilities() const = 0;

  // Called once by the registry before any hook.
  virtual void Attach(PluginContext context) {
    context_.emplace(std::move(context));
  }

  virtual void Run() {}
  virtual void Exchange() {}
  virtual void Resynchronize() {}

 protected:
  std::optional<PluginContext> context_;
};

} // namespace fleet::plugin
