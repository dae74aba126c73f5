#pragma once

#include "internal/exchange/message_exchange.hpp"
#include "internal/plugin/plugin.hpp"
#include "internal/store/message_store.hpp"

namespace fleet::plugin {

// MessageSink over the exchange engine and its store.
class ExchangeSink final : public MessageSink {
 public:
  ExchangeSink(exchange::MessageExchange& exchange, const store::MessageStore& store) : exchange_(exchange), store_(store) {}

  std::optional<std::uint64_t> Send(store::Message message, bool urgent = false) override {
    return exchange_.Send(std::move(message), urgent);
  }

  bool Accepts(const std::string& type) const override {
    return store_.Accepts(type);
  }

 private:
  exchange::MessageExchange& exchange_;
  const store::MessageStore& store_;
};

} // namespace fleet::plugin
