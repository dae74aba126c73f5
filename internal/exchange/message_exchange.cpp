#include "message_exchange.hpp"

#include <algorithm>
#include <exception>

#include "api/fleet/exchange/v1.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::exchange {

using fleet::observability::BoolField;
using fleet::observability::IntField;
using fleet::observability::StringField;
using reactor::Event;
using reactor::EventData;

namespace {

constexpr const char* kExchangeIntervalKey       = "exchange-interval";
constexpr const char* kUrgentExchangeIntervalKey = "urgent-exchange-interval";

std::int64_t Ms(util::Duration d) {
  return static_cast<std::int64_t>(d.count());
}

EventData Detail(std::string detail) {
  EventData data;
  data.detail = std::move(detail);
  return data;
}

} // namespace

ExchangeSettings ExchangeSettings::FromConfig(const runtime::config::ExchangeConfig& config) {
  ExchangeSettings s;
  s.exchange_interval        = util::FromProtoOr(config.exchange_interval(), s.exchange_interval);
  s.urgent_exchange_interval = util::FromProtoOr(config.urgent_exchange_interval(), s.urgent_exchange_interval);
  s.minimum_exchange_spacing = util::FromProtoOr(config.minimum_exchange_spacing(), s.minimum_exchange_spacing);
  s.max_backoff              = util::FromProtoOr(config.max_backoff(), s.max_backoff);
  s.exchange_timeout         = util::FromProtoOr(config.exchange_timeout(), s.exchange_timeout);
  if (config.max_messages_per_exchange() > 0) s.max_messages = config.max_messages_per_exchange();
  if (config.has_heartbeat()) s.heartbeat = config.heartbeat();
  if (config.urgent_message_types_size() > 0) {
    s.urgent_types = std::set<std::string>(config.urgent_message_types().begin(), config.urgent_message_types().end());
  }
  return s;
}

MessageExchange::MessageExchange(reactor::Reactor&       reactor,
                                 store::MessageStore&    store,
                                 ExchangeStore&          exchange_store,
                                 registration::Identity& identity,
                                 Transport&              transport,
                                 ExchangeSettings        settings,
                                 persist::PersistView    persist)
    : reactor_(reactor),
      store_(store),
      exchange_store_(exchange_store),
      identity_(identity),
      transport_(transport),
      settings_(std::move(settings)),
      persist_(std::move(persist)) {
  // server-sent overrides survive restarts
  if (auto s = persist_.GetInt(kExchangeIntervalKey, 0); s > 0) settings_.exchange_interval = std::chrono::seconds(s);
  if (auto s = persist_.GetInt(kUrgentExchangeIntervalKey, 0); s > 0) settings_.urgent_exchange_interval = std::chrono::seconds(s);

  RegisterMessage("set-intervals", [this](const store::Message& m) { HandleSetIntervals(m); });
  RegisterMessage("resynchronize", [this](const store::Message&) { RequestResynchronize("requested by server"); });
}

MessageExchange::~MessageExchange() {
  Stop();
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

void MessageExchange::Start() {
  if (started_) return;
  started_ = true;
  if (store_.HasPendingOfType(settings_.urgent_types)) urgent_ = true;

  FLEET_LOG_INFO("Message exchange started",
                 {IntField("exchange_interval_ms", Ms(settings_.exchange_interval)),
                  IntField("urgent_exchange_interval_ms", Ms(settings_.urgent_exchange_interval)),
                  BoolField("urgent", urgent_)});
  ScheduleNext();
}

void MessageExchange::Stop() {
  started_ = false;
  Disarm();
  if (timeout_call_) {
    reactor_.Cancel(*timeout_call_);
    timeout_call_.reset();
  }
  if (exchanging_) {
    exchanging_ = false;
    ++attempt_id_;
  }
}

// ------------------------------------------------------------------
// Sending
// ------------------------------------------------------------------

std::optional<std::uint64_t> MessageExchange::Send(store::Message message, bool urgent) {
  const std::string type = store::MessageType(message);

  if (type == "operation-result") {
    if (auto operation_id = store::GetInt(message, "operation-id")) {
      auto context = exchange_store_.GetMessageContext(*operation_id);
      if (context && context->secure_id != identity_.SecureId()) {
        FLEET_LOG_INFO("Dropping operation result received under a previous identity", {IntField("operation_id", *operation_id)});
        exchange_store_.RemoveMessageContext(*operation_id);
        return std::nullopt;
      }
    }
  }

  const auto sequence = store_.Add(std::move(message));
  if (urgent || settings_.urgent_types.count(type) > 0) ScheduleExchange(true);
  return sequence;
}

void MessageExchange::RegisterMessage(const std::string& type, MessageHandler handler) {
  handlers_[type] = std::move(handler);
}

std::vector<std::string> MessageExchange::ClientAcceptedTypes() const {
  std::vector<std::string> types;
  types.reserve(handlers_.size());
  for (const auto& [type, _] : handlers_) types.push_back(type);
  return types;
}

// ------------------------------------------------------------------
// Scheduling
// ------------------------------------------------------------------

util::Duration MessageExchange::Backoff(util::Duration interval, util::Duration max_backoff, int failures) {
  const util::Duration cap = std::max(max_backoff, interval);

  util::Duration delay = interval;
  for (int i = 0; i < failures; ++i) {
    if (delay >= cap) break;
    delay *= 2;
  }
  return std::min(delay, cap);
}

void MessageExchange::ScheduleExchange(bool urgent) {
  if (urgent) {
    urgent_ = true;
    urgent_requested_ = true;
  }

  // an in-flight exchange or an active backoff reschedules on its own
  if (!started_ || exchanging_ || failure_count_ > 0) return;

  const auto now     = reactor_.Now();
  auto       fire_at = now + settings_.exchange_interval;
  if (urgent_) {
    fire_at = now + settings_.urgent_exchange_interval;
    if (last_exchange_) fire_at = std::max(fire_at, *last_exchange_ + settings_.minimum_exchange_spacing);
  }

  if (next_exchange_time_ && *next_exchange_time_ <= fire_at) return;
  Arm(fire_at);
}

void MessageExchange::ScheduleNext() {
  if (!started_) return;

  const auto      now = reactor_.Now();
  util::TimePoint fire_at;

  if (failure_count_ > 0) {
    const auto base = urgent_ ? settings_.urgent_exchange_interval : settings_.exchange_interval;
    fire_at         = now + Backoff(base, settings_.max_backoff, failure_count_);
  } else if (urgent_) {
    fire_at = now + settings_.urgent_exchange_interval;
    if (last_exchange_) fire_at = std::max(fire_at, *last_exchange_ + settings_.minimum_exchange_spacing);
  } else {
    fire_at = now + settings_.exchange_interval;
  }

  Arm(fire_at);
}

void MessageExchange::Arm(util::TimePoint fire_at) {
  Disarm();

  const auto delay    = std::max(util::Duration(0), std::chrono::duration_cast<util::Duration>(fire_at - reactor_.Now()));
  next_exchange_time_ = fire_at;
  next_call_          = reactor_.CallLater(delay, [this] {
    next_call_.reset();
    next_exchange_time_.reset();
    OnTimer();
  });

  FLEET_LOG_DEBUG("Next exchange scheduled", {IntField("delay_ms", Ms(delay)), BoolField("urgent", urgent_)});
}

void MessageExchange::Disarm() {
  if (next_call_) reactor_.Cancel(*next_call_);
  next_call_.reset();
  next_exchange_time_.reset();
}

void MessageExchange::OnTimer() {
  const bool registering = !identity_.Registered() && registration_provider_ && registration_provider_().has_value();

  if (!urgent_ && !settings_.heartbeat && !registering && store_.CountPending() == 0) {
    FLEET_LOG_DEBUG("Nothing to exchange");
    ScheduleNext();
    return;
  }
  Exchange();
}

// ------------------------------------------------------------------
// Exchange
// ------------------------------------------------------------------

v1::ExchangeRequest MessageExchange::BuildRequest(std::size_t* sent) {
  v1::ExchangeRequest request;
  request.set_api(v1::kApiVersion);
  request.set_next_expected_sequence(store_.NextServerSequence());
  for (const auto& type : ClientAcceptedTypes()) request.add_client_accepted_types(type);

  const std::string secure_id = identity_.SecureId();
  *sent                       = 0;

  if (secure_id.empty()) {
    // queued messages wait for an identity
    if (registration_provider_) {
      if (auto payload = registration_provider_()) *request.mutable_registration() = std::move(*payload);
    }
    // held-back messages stay unacknowledged
    const auto first = store_.GetPendingMessages(1);
    request.set_sequence(static_cast<std::int64_t>(first.empty() ? store_.NextSequence() : first.front().sequence));
    request.set_total_messages(static_cast<std::int64_t>(store_.CountPending()));
    return request;
  }

  request.set_secure_id(secure_id);
  request.set_insecure_id(identity_.InsecureId());

  auto batch = store_.GetPendingMessages(settings_.max_messages);
  request.set_sequence(static_cast<std::int64_t>(batch.empty() ? store_.NextSequence() : batch.front().sequence));
  for (auto& pending : batch) *request.add_messages() = std::move(pending.message);

  *sent            = batch.size();
  const auto total = store_.CountPending();
  request.set_total_messages(static_cast<std::int64_t>(total - std::min<std::uint64_t>(total, batch.size())));
  return request;
}

void MessageExchange::Exchange() {
  if (exchanging_) return;

  Disarm();
  exchanging_ = true;

  // plugins flush into the store before the batch is taken
  reactor_.Fire(Event::kPreExchange);
  urgent_requested_ = false;

  v1::ExchangeRequest request;
  try {
    request = BuildRequest(&in_flight_sent_);
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Failed to build exchange request", {StringField("error", e.what())});
    Fail(e.what());
    return;
  }

  const std::uint64_t attempt = ++attempt_id_;
  last_exchange_              = reactor_.Now();

  FLEET_LOG_INFO("Starting message exchange",
                 {IntField("attempt", static_cast<std::int64_t>(attempt)),
                  IntField("messages", request.messages_size()),
                  IntField("sequence", request.sequence()),
                  BoolField("registering", request.has_registration())});

  timeout_call_ = reactor_.CallLater(settings_.exchange_timeout, [this, attempt] {
    timeout_call_.reset();
    OnTimeout(attempt);
  });

  std::weak_ptr<bool> alive   = alive_;
  reactor::Reactor*   reactor = &reactor_;
  transport_.Exchange(request, [this, attempt, alive, reactor](TransportResult result) {
    reactor->CallFromThread([this, attempt, alive, result = std::move(result)]() mutable {
      if (alive.expired()) return;
      OnResult(attempt, std::move(result));
    });
  });
}

void MessageExchange::OnTimeout(std::uint64_t attempt) {
  if (attempt != attempt_id_ || !exchanging_) return;
  FLEET_LOG_WARN("Exchange timed out", {IntField("attempt", static_cast<std::int64_t>(attempt)), IntField("timeout_ms", Ms(settings_.exchange_timeout))});
  Fail("exchange timed out");
}

void MessageExchange::OnResult(std::uint64_t attempt, TransportResult result) {
  if (attempt != attempt_id_ || !exchanging_) {
    FLEET_LOG_DEBUG("Discarding response of an abandoned exchange", {IntField("attempt", static_cast<std::int64_t>(attempt))});
    return;
  }

  if (timeout_call_) {
    reactor_.Cancel(*timeout_call_);
    timeout_call_.reset();
  }

  if (result.error) {
    try {
      std::rethrow_exception(result.error);
    } catch (const util::IdentityRejected& e) {
      Fail(e.what());
      reactor_.Fire(Event::kIdentityRejected, Detail(e.what()));
    } catch (const std::exception& e) {
      Fail(e.what());
    }
    return;
  }

  try {
    Validate(result.response);
  } catch (const util::MalformedResponse& e) {
    Fail(e.what());
    return;
  }

  try {
    Apply(result.response, in_flight_sent_);
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Failed to apply exchange response", {StringField("error", e.what())});
    Fail(e.what());
    return;
  }

  Succeed(in_flight_sent_);
}

void MessageExchange::Validate(const v1::ExchangeResponse& response) const {
  if (response.has_next_expected_sequence() && response.next_expected_sequence() < 0) {
    throw util::MalformedResponse("negative next_expected_sequence " + std::to_string(response.next_expected_sequence()));
  }
  for (const auto& type : response.accepted_types().types()) {
    if (type.empty()) throw util::MalformedResponse("empty accepted type");
  }
  for (int i = 0; i < response.messages_size(); ++i) {
    if (store::MessageType(response.messages(i)).empty()) {
      throw util::MalformedResponse("server message " + std::to_string(i) + " has no type");
    }
  }
}

// Each step is durable on its own and safe to repeat. If a later step throws,
// the acknowledgment stays, and pushed messages not yet counted in
// next_server_sequence are sent again by the server.
void MessageExchange::Apply(const v1::ExchangeResponse& response, std::size_t sent) {
  if (response.has_next_expected_sequence()) {
    const auto          next_expected = response.next_expected_sequence();
    const std::uint64_t acknowledged  = next_expected > 0 ? static_cast<std::uint64_t>(next_expected - 1) : 0;

    if (acknowledged < store_.ServerAckSequence()) {
      // already deleted locally; only a resynchronize can rebuild the state
      FLEET_LOG_WARN("Server expects messages that were already acknowledged",
                     {IntField("next_expected_sequence", next_expected),
                      IntField("server_ack_sequence", static_cast<std::int64_t>(store_.ServerAckSequence()))});
      RequestResynchronize("server behind acknowledged sequence");
    } else {
      store_.Acknowledge(acknowledged);
    }
  }

  if (response.has_accepted_types()) {
    const std::vector<std::string> types(response.accepted_types().types().begin(), response.accepted_types().types().end());
    const auto                     diff = store_.SetAcceptedTypes(types);
    for (const auto& type : diff.added) {
      EventData data;
      data.type = type;
      data.flag = true;
      reactor_.Fire(Event::kMessageTypeAcceptanceChanged, data);
    }
    for (const auto& type : diff.removed) {
      EventData data;
      data.type = type;
      data.flag = false;
      reactor_.Fire(Event::kMessageTypeAcceptanceChanged, data);
    }
  }

  if (!response.server_uuid().empty() && response.server_uuid() != store_.ServerUuid()) {
    const std::string previous = store_.ServerUuid();
    store_.SetServerUuid(response.server_uuid());
    if (!previous.empty()) {
      FLEET_LOG_INFO("Server uuid changed", {StringField("previous", previous), StringField("current", response.server_uuid())});
      reactor_.Fire(Event::kServerUuidChanged, Detail(response.server_uuid()));
      RequestResynchronize("server uuid changed");
    }
  }

  for (const auto& message : response.messages()) {
    Dispatch(message);
    store_.SetNextServerSequence(store_.NextServerSequence() + 1);
  }

  if (response.resynchronize()) RequestResynchronize("requested by server");
  if (!resync_reason_.empty()) {
    const std::string reason = resync_reason_;
    Resynchronize(reason);
  }

  FLEET_LOG_DEBUG("Exchange response applied",
                  {IntField("sent", static_cast<std::int64_t>(sent)),
                   IntField("received", response.messages_size()),
                   IntField("server_ack_sequence", static_cast<std::int64_t>(store_.ServerAckSequence()))});
}

void MessageExchange::Dispatch(const store::Message& message) {
  const std::string type = store::MessageType(message);

  if (auto operation_id = store::GetInt(message, "operation-id")) {
    exchange_store_.AddMessageContext(*operation_id, identity_.SecureId(), type);
  }

  auto it = handlers_.find(type);
  if (it == handlers_.end()) {
    FLEET_LOG_WARN("No handler for server message", {StringField("type", type)});
    return;
  }

  try {
    it->second(message);
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("Server message handler failed", {StringField("type", type), StringField("error", e.what())});
  }
}

void MessageExchange::Resynchronize(const std::string& reason) {
  FLEET_LOG_INFO("Resynchronizing", {StringField("reason", reason)});
  resync_reason_.clear();
  reactor_.Fire(Event::kResynchronize, Detail(reason));
  ScheduleExchange(true);
}

void MessageExchange::RequestResynchronize(const std::string& reason) {
  if (!exchanging_) {
    Resynchronize(reason);
    return;
  }
  if (resync_reason_.empty()) resync_reason_ = reason;
}

void MessageExchange::Succeed(std::size_t sent) {
  exchanging_    = false;
  failure_count_ = 0;

  const bool registered   = identity_.Registered();
  const bool registering  = !registered && registration_provider_ && registration_provider_().has_value();
  const auto pending      = store_.CountPending();
  const bool more_waiting = registered && sent >= settings_.max_messages && pending > 0;

  urgent_ = urgent_requested_ || registering || more_waiting || (registered && store_.HasPendingOfType(settings_.urgent_types));
  urgent_requested_ = false;

  FLEET_LOG_INFO("Message exchange completed",
                 {IntField("sent", static_cast<std::int64_t>(sent)),
                  IntField("pending", static_cast<std::int64_t>(pending)),
                  BoolField("urgent", urgent_)});

  reactor_.Fire(Event::kExchangeDone);
  ScheduleNext();
}

void MessageExchange::Fail(const std::string& reason) {
  exchanging_ = false;
  ++failure_count_;

  FLEET_LOG_WARN("Message exchange failed", {StringField("reason", reason), IntField("failure_count", failure_count_)});

  reactor_.Fire(Event::kExchangeFailed, Detail(reason));
  ScheduleNext();
}

// ------------------------------------------------------------------
// Built-in server messages
// ------------------------------------------------------------------

void MessageExchange::HandleSetIntervals(const store::Message& message) {
  if (auto s = store::GetInt(message, "exchange"); s && *s > 0) {
    settings_.exchange_interval = std::chrono::seconds(*s);
    persist_.SetInt(kExchangeIntervalKey, *s);
  }
  if (auto s = store::GetInt(message, "urgent-exchange"); s && *s > 0) {
    settings_.urgent_exchange_interval = std::chrono::seconds(*s);
    persist_.SetInt(kUrgentExchangeIntervalKey, *s);
  }
  FLEET_LOG_INFO("Exchange intervals updated by server",
                 {IntField("exchange_interval_ms", Ms(settings_.exchange_interval)),
                  IntField("urgent_exchange_interval_ms", Ms(settings_.urgent_exchange_interval))});
}

} // namespace fleet::exchange
