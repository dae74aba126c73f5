#pragma once

#include <google/protobuf/struct.pb.h>

#include <exception>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

#include "internal/exchange/message_exchange.hpp"
#include "internal/reactor/reactor.hpp"
#include "internal/registration/identity.hpp"

namespace fleet::registration {

/*
  Drives registration of this computer with the server.

  While a registration is pending every exchange carries the registration
  payload; the server answers with one of:

      set-id         -> ids persisted, registration-done
      registration   -> info "unknown-account" / "max-pending-computers":
                        RegistrationError, registration-failed, no retry
      unknown-id     -> identity cleared, registration restarted

  A transport-level identity rejection behaves like unknown-id.
*/
class RegistrationHandler {
 public:
  // Empty exception_ptr on success, util::RegistrationError otherwise.
  using Callback = std::function<void(std::exception_ptr)>;

  RegistrationHandler(reactor::Reactor& reactor, exchange::MessageExchange& exchange, Identity& identity, std::filesystem::path root_path = "/");
  ~RegistrationHandler();

  RegistrationHandler(const RegistrationHandler&)            = delete;
  RegistrationHandler& operator=(const RegistrationHandler&) = delete;

  // Joins the pending registration if there is one.
  void Register(Callback done = {});

  // Forgets the identity; messages stay queued until the next registration.
  void Unregister();

  // No secure id, an account to register with and nothing pending yet.
  bool ShouldRegister() const;

  bool Pending() const {
    return pending_;
  }

  // Registration message body; empty when nothing is pending.
  std::optional<google::protobuf::Struct> Payload() const;

 private:
  void HandleSetId(const store::Message& message);
  void HandleRegistration(const store::Message& message);
  void HandleUnknownId(const store::Message& message);
  void OnIdentityRejected(const reactor::EventData& data);
  void Complete(std::exception_ptr error);

  reactor::Reactor&          reactor_;
  exchange::MessageExchange& exchange_;
  Identity&                  identity_;
  std::filesystem::path      root_path_;

  bool                  pending_ = false;
  std::vector<Callback> waiting_;

  reactor::Reactor::ListenerId rejected_listener_ = 0;
};

} // namespace fleet::registration
