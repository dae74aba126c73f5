#pragma once

#include <exception>
#include <functional>

#include "api/fleet/exchange/v1.hpp"

namespace fleet::exchange {

struct TransportResult {
  v1::ExchangeResponse response;

  // Set on failure: util::TransmissionFailure, util::MalformedResponse or
  // util::IdentityRejected.
  std::exception_ptr error;
};

/*
  Carries one exchange to the server.

  The callback may run on any thread, exactly once per call.
*/
class Transport {
 public:
  using Callback = std::function<void(TransportResult)>;

  virtual ~Transport() = default;

  virtual void Exchange(const v1::ExchangeRequest& request, Callback done) = 0;
};

} // namespace fleet::exchange
