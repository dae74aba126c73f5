#pragma once

#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/exchange/exchange_store.hpp"
#include "internal/exchange/message_exchange.hpp"
#include "internal/persist/persist.hpp"
#include "internal/reactor/fake_reactor.hpp"
#include "internal/registration/identity.hpp"
#include "internal/store/message_store.hpp"
#include "tests/unit/support/fake_transport.hpp"

namespace fleet::testing {

inline runtime::config::ClientConfig DefaultClient() {
  runtime::config::ClientConfig client;
  client.set_account_name("acme");
  client.set_computer_title("web-01");
  return client;
}

/*
  Exchange engine over an in-memory store, a fake reactor and a scripted
  transport. Starts registered (secure id "secure-1") unless told not to.
  `backend` replaces the in-memory repository.
*/
struct ExchangeHarness {
  explicit ExchangeHarness(exchange::ExchangeSettings      settings   = {},
                           runtime::config::ClientConfig   client     = DefaultClient(),
                           bool                            registered = true,
                           std::shared_ptr<db::Repository> backend    = nullptr)
      : repository(backend ? std::move(backend) : std::make_shared<db::memory::MemoryRepository>()),
        store(repository, persist.RootAt("message-store")),
        exchange_store(repository),
        identity(persist.RootAt("registration"), client),
        exchange(reactor, store, exchange_store, identity, transport, std::move(settings), persist.RootAt("exchange")) {
    if (registered) identity.SetIds("secure-1", "insecure-1");
  }

  void Accept(const std::vector<std::string>& types) {
    store.SetAcceptedTypes(types);
  }

  // Answers the outstanding exchange and lets the engine apply it.
  void Respond(const exchange::v1::ExchangeResponse& response) {
    transport.Respond(response);
    reactor.RunPosted();
  }

  // Moves the clock to the armed exchange and fires it.
  void RunNextExchange() {
    auto next = exchange.NextExchangeTime();
    assert(next.has_value());
    reactor.Advance(std::chrono::duration_cast<util::Duration>(*next - reactor.Now()));
  }

  static exchange::v1::ExchangeResponse Ack(std::int64_t next_expected) {
    exchange::v1::ExchangeResponse response;
    response.set_next_expected_sequence(next_expected);
    return response;
  }

  reactor::FakeReactor            reactor;
  persist::Persist                persist;
  std::shared_ptr<db::Repository> repository;
  store::MessageStore             store;
  exchange::ExchangeStore         exchange_store;
  registration::Identity          identity;
  FakeTransport                   transport;
  exchange::MessageExchange       exchange;
};

} // namespace fleet::testing
