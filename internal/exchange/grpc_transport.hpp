#pragma once

#include <grpcpp/generic/generic_stub.h>
#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/exchange/transport.hpp"
#include "internal/util/time.hpp"

namespace fleet::exchange {

/*
  Unary gRPC call to MessageExchange/Exchange.

  Uses the generic callback stub, so no generated service code is needed;
  the request and response types are the protobuf messages themselves.

  Status mapping:
    OK               -> response
    UNAUTHENTICATED  -> util::IdentityRejected
    INTERNAL on an unparseable body -> util::MalformedResponse
    anything else    -> util::TransmissionFailure
*/
class GrpcTransport final : public Transport {
 public:
  static constexpr const char* kMethod = "/fleet.exchange.v1.MessageExchange/Exchange";

  GrpcTransport(std::shared_ptr<grpc::Channel> channel, util::Duration deadline);

  void Exchange(const v1::ExchangeRequest& request, Callback done) override;

  static std::shared_ptr<grpc::Channel> MakeChannel(const runtime::config::TransportConfig& config);

 private:
  using Stub = grpc::TemplatedGenericStub<v1::ExchangeRequest, v1::ExchangeResponse>;

  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<Stub>          stub_;
  util::Duration                 deadline_;
};

} // namespace fleet::exchange
