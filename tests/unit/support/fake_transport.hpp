#pragma once

#include <cassert>
#include <deque>
#include <exception>
#include <utility>
#include <vector>

#include "internal/exchange/transport.hpp"

namespace fleet::testing {

/*
  Records requests and completes them only when told to.
*/
class FakeTransport final : public exchange::Transport {
 public:
  void Exchange(const exchange::v1::ExchangeRequest& request, Callback done) override {
    requests.push_back(request);
    outstanding.push_back(std::move(done));
  }

  // Completes the oldest outstanding call.
  void Respond(const exchange::v1::ExchangeResponse& response) {
    assert(!outstanding.empty());
    auto done = std::move(outstanding.front());
    outstanding.pop_front();
    exchange::TransportResult result;
    result.response = response;
    done(std::move(result));
  }

  void Fail(std::exception_ptr error) {
    assert(!outstanding.empty());
    auto done = std::move(outstanding.front());
    outstanding.pop_front();
    exchange::TransportResult result;
    result.error = std::move(error);
    done(std::move(result));
  }

  const exchange::v1::ExchangeRequest& LastRequest() const {
    assert(!requests.empty());
    return requests.back();
  }

  std::vector<exchange::v1::ExchangeRequest> requests;
  std::deque<Callback>                       outstanding;
};

} // namespace fleet::testing
