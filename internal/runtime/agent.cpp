#include "agent.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace fleet::runtime {

using fleet::observability::StringField;

Agent::Agent(fleet::runtime::config::RuntimeConfig config, reactor::Reactor& reactor, std::unique_ptr<exchange::Transport> transport)
    : config_(std::move(config)), reactor_(reactor), app_(factory::Build(config_, reactor_, std::move(transport))) {}

Agent::~Agent() {
  Stop();
}

void Agent::Start() {
  if (started_) return;
  started_ = true;

  switch (app_.persist_status) {
    case persist::LoadStatus::kRecoveredFromBackup:
      FLEET_LOG_WARN("Persisted state restored from backup", {StringField("path", app_.persist->Path().string())});
      break;
    case persist::LoadStatus::kReset:
      FLEET_LOG_WARN("Persisted state unreadable; starting fresh", {StringField("path", app_.persist->Path().string())});
      break;
    default:
      break;
  }

  app_.exchange->Start();
  app_.plugins->Start();

  const auto interval = util::FromProtoOr(config_.persist().checkpoint_interval(), std::chrono::seconds(300));
  checkpoint_call_    = reactor_.CallEvery(interval, [this] { Checkpoint(); });

  if (app_.registration->ShouldRegister()) {
    app_.registration->Register([](std::exception_ptr error) {
      if (!error) return;
      try {
        std::rethrow_exception(error);
      } catch (const std::exception& e) {
        FLEET_LOG_ERROR("Registration failed", {StringField("error", e.what())});
      }
    });
  }

  FLEET_LOG_INFO("Agent started",
                 {StringField("endpoint", config_.transport().endpoint()),
                  StringField("persist_state", persist::LoadStatusName(app_.persist_status))});
}

void Agent::Stop() {
  if (!started_) return;
  started_ = false;

  if (checkpoint_call_) {
    reactor_.Cancel(*checkpoint_call_);
    checkpoint_call_.reset();
  }
  app_.plugins->Stop();
  app_.exchange->Stop();
  Checkpoint();

  FLEET_LOG_INFO("Agent stopped");
}

void Agent::Checkpoint() {
  try {
    app_.persist->Save();
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Checkpoint failed", {StringField("error", e.what())});
  }
}

} // namespace fleet::runtime
