#include "registration_handler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/store/message.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/host_info.hpp"

namespace fleet::registration {

using fleet::observability::StringField;
using reactor::Event;

RegistrationHandler::RegistrationHandler(reactor::Reactor&          reactor,
                                         exchange::MessageExchange& exchange,
                                         Identity&                  identity,
                                         std::filesystem::path      root_path)
    : reactor_(reactor), exchange_(exchange), identity_(identity), root_path_(std::move(root_path)) {
  exchange_.RegisterMessage("set-id", [this](const store::Message& m) { HandleSetId(m); });
  exchange_.RegisterMessage("registration", [this](const store::Message& m) { HandleRegistration(m); });
  exchange_.RegisterMessage("unknown-id", [this](const store::Message& m) { HandleUnknownId(m); });
  exchange_.SetRegistrationProvider([this] { return Payload(); });

  rejected_listener_ = reactor_.CallOn(Event::kIdentityRejected, [this](const reactor::EventData& data) { OnIdentityRejected(data); });
}

RegistrationHandler::~RegistrationHandler() {
  reactor_.RemoveListener(rejected_listener_);
  exchange_.SetRegistrationProvider({});
}

bool RegistrationHandler::ShouldRegister() const {
  return !identity_.Registered() && !identity_.AccountName().empty() && !pending_;
}

void RegistrationHandler::Register(Callback done) {
  if (identity_.Registered()) {
    if (done) done(nullptr);
    return;
  }

  if (identity_.AccountName().empty()) {
    FLEET_LOG_WARN("Cannot register without an account name");
    if (done) done(std::make_exception_ptr(util::RegistrationError("no account name configured")));
    return;
  }

  if (done) waiting_.push_back(std::move(done));
  if (pending_) return;

  pending_ = true;
  FLEET_LOG_INFO("Registering computer", {StringField("account", identity_.AccountName()), StringField("title", identity_.ComputerTitle())});
  exchange_.ScheduleExchange(true);
}

void RegistrationHandler::Unregister() {
  FLEET_LOG_INFO("Clearing computer identity");
  identity_.Clear();
}

std::optional<google::protobuf::Struct> RegistrationHandler::Payload() const {
  if (!pending_) return std::nullopt;

  auto payload = store::MakeMessage("register");
  store::SetString(payload, "computer-title", identity_.ComputerTitle());
  store::SetString(payload, "account-name", identity_.AccountName());
  if (!identity_.RegistrationKey().empty()) store::SetString(payload, "registration-password", identity_.RegistrationKey());
  if (!identity_.Tags().empty()) store::SetStringList(payload, "tags", identity_.Tags());
  store::SetString(payload, "hostname", util::Hostname());
  store::SetString(payload, "vm-info", util::DetectVmInfo(root_path_));
  return payload;
}

// ------------------------------------------------------------------
// Server messages
// ------------------------------------------------------------------

void RegistrationHandler::HandleSetId(const store::Message& message) {
  const auto secure_id = store::GetString(message, "id");
  if (!secure_id || secure_id->empty()) {
    FLEET_LOG_ERROR("set-id message without an id");
    return;
  }

  identity_.SetIds(*secure_id, store::GetString(message, "insecure-id").value_or(""));
  pending_ = false;

  FLEET_LOG_INFO("Registration accepted", {StringField("insecure_id", identity_.InsecureId())});

  reactor_.Fire(Event::kRegistrationDone);
  Complete(nullptr);

  // the server knows nothing about this computer yet
  exchange_.RequestResynchronize("registered");
}

void RegistrationHandler::HandleRegistration(const store::Message& message) {
  const std::string info = store::GetString(message, "info").value_or("");
  if (info != "unknown-account" && info != "max-pending-computers") {
    FLEET_LOG_INFO("Registration notice from server", {StringField("info", info)});
    return;
  }

  FLEET_LOG_ERROR("Registration refused", {StringField("info", info), StringField("account", identity_.AccountName())});
  pending_ = false;

  reactor::EventData data;
  data.detail = info;
  reactor_.Fire(Event::kRegistrationFailed, data);
  Complete(std::make_exception_ptr(util::RegistrationError("registration refused: " + info)));
}

void RegistrationHandler::HandleUnknownId(const store::Message& message) {
  const std::string clone_of = store::GetString(message, "clone-of").value_or("");
  FLEET_LOG_WARN("Server does not know this computer", {StringField("clone_of", clone_of)});
  identity_.Clear();
  if (ShouldRegister()) Register();
}

void RegistrationHandler::OnIdentityRejected(const reactor::EventData& data) {
  FLEET_LOG_WARN("Identity rejected by server", {StringField("detail", data.detail)});
  identity_.Clear();
  if (ShouldRegister()) Register();
}

void RegistrationHandler::Complete(std::exception_ptr error) {
  auto waiting = std::move(waiting_);
  waiting_.clear();

  for (auto& done : waiting) {
    try {
      done(error);
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("Registration callback failed", {StringField("error", e.what())});
    }
  }
}

} // namespace fleet::registration
