#include "grpc_transport.hpp"

#include <grpcpp/impl/codegen/proto_utils.h>

#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::exchange {

using fleet::observability::IntField;
using fleet::observability::StringField;

namespace {

// Owns everything the in-flight call points at until completion.
struct PendingCall {
  grpc::ClientContext  context;
  v1::ExchangeRequest  request;
  v1::ExchangeResponse response;
  Transport::Callback  done;
};

std::exception_ptr MapStatus(const grpc::Status& status) {
  const std::string what = "exchange rpc failed (" + std::to_string(static_cast<int>(status.error_code())) + "): " + status.error_message();
  switch (status.error_code()) {
    case grpc::StatusCode::UNAUTHENTICATED:
      return std::make_exception_ptr(util::IdentityRejected(what));
    case grpc::StatusCode::INTERNAL:
      // the library reports an unparseable response body this way
      if (status.error_message().find("parse") != std::string::npos) {
        return std::make_exception_ptr(util::MalformedResponse(what));
      }
      return std::make_exception_ptr(util::TransmissionFailure(what));
    default:
      return std::make_exception_ptr(util::TransmissionFailure(what));
  }
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw util::ConfigError("cannot read CA certificate: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace

GrpcTransport::GrpcTransport(std::shared_ptr<grpc::Channel> channel, util::Duration deadline)
    : channel_(std::move(channel)), stub_(std::make_unique<Stub>(channel_)), deadline_(deadline) {}

std::shared_ptr<grpc::Channel> GrpcTransport::MakeChannel(const runtime::config::TransportConfig& config) {
  if (!config.use_tls()) {
    return grpc::CreateChannel(config.endpoint(), grpc::InsecureChannelCredentials());
  }

  grpc::SslCredentialsOptions ssl;
  if (!config.ca_cert_path().empty()) ssl.pem_root_certs = ReadFile(config.ca_cert_path());
  return grpc::CreateChannel(config.endpoint(), grpc::SslCredentials(ssl));
}

void GrpcTransport::Exchange(const v1::ExchangeRequest& request, Callback done) {
  auto call     = std::make_shared<PendingCall>();
  call->request = request;
  call->done    = std::move(done);
  call->context.set_deadline(std::chrono::system_clock::now() + deadline_);

  FLEET_LOG_DEBUG("Exchange rpc started",
                  {IntField("messages", call->request.messages_size()), IntField("sequence", call->request.sequence())});

  stub_->UnaryCall(&call->context, kMethod, grpc::StubOptions(), &call->request, &call->response,
                   [call](grpc::Status status) {
                     TransportResult result;
                     if (status.ok()) {
                       result.response = std::move(call->response);
                     } else {
                       result.error = MapStatus(status);
                     }
                     call->done(std::move(result));
                   });
}

} // namespace fleet::exchange
